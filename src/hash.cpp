#include "bluxguard/hash.hpp"

// DESIGN INVARIANTS:
//   1. BLAKE3 is the only digest primitive. HMAC for signatures lives in mac.cpp
//      and is never used for chaining.
//   2. Domain prefixes are part of the on-disk format. Changing one invalidates
//      every stored chain anchor and record key.

#include <array>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace bluxguard {
namespace {

// Hashes the concatenation of `parts` and returns lowercase hex.
std::string digest_parts(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (const std::string_view part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  std::array<unsigned char, BLAKE3_OUT_LEN> raw{};
  blake3_hasher_finalize(&hasher, raw.data(), raw.size());

  static constexpr char kNibbles[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(raw.size() * 2);
  for (const unsigned char byte : raw) {
    hex.push_back(kNibbles[byte >> 4]);
    hex.push_back(kNibbles[byte & 0x0f]);
  }
  return hex;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  return HashRuntimeInfo{"blake3", blake3_version()};
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return digest_parts({domain, payload});
}

std::string chain_digest(std::string_view previous_digest, std::string_view canonical_line) {
  return digest_parts({"chain:", previous_digest, canonical_line});
}

std::string constraints_hash(std::string_view canonical_constraints) {
  return hash_domain("cons:", canonical_constraints);
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (const char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace bluxguard
