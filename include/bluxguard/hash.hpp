#pragma once

// bluxguard/hash.hpp - BLAKE3 digests for the audit chain and record store.
//
// Domain prefixes ("chain:", "cons:") separate the two uses of the
// primitive so a digest from one context can never be replayed in another.

#include <string>
#include <string_view>

namespace bluxguard {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// BLAKE3 of domain || payload (lowercase hex, 64 chars). An empty domain
// gives the plain BLAKE3 digest.
std::string hash_domain(std::string_view domain, std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// digest_n = H("chain:" || digest_{n-1} || line_n). The chain seed is the
// empty string, so the first entry hashes "chain:" || line_0.
std::string chain_digest(std::string_view previous_digest, std::string_view canonical_line);

// Hash recorded in the audit entry instead of the full constraint object.
std::string constraints_hash(std::string_view canonical_constraints);

// True for a 64-char lowercase hex digest.
bool is_hex_digest(std::string_view s);

}  // namespace bluxguard
