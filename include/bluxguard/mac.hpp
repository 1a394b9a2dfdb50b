#pragma once

// bluxguard/mac.hpp - Keyed MAC, framing and identifier primitives (OpenSSL).
//
// INVARIANTS:
//   - The MAC input is always the canonical JSON byte form (jsonlite::to_json).
//     Callers never sign pretty-printed or re-ordered text.
//   - Tag comparison is constant time (CRYPTO_memcmp) and length-checked first.

#include <optional>
#include <string>
#include <string_view>

namespace bluxguard {

inline constexpr const char* kSignatureAlg = "HMAC-SHA256";

// Raw 32-byte tag. Empty on library failure.
std::string hmac_sha256(std::string_view key, std::string_view message);
// Lowercase hex tag (64 chars). Empty on library failure.
std::string hmac_sha256_hex(std::string_view key, std::string_view message);

// Constant-time equality for tags of equal length; unequal lengths are false.
bool constant_time_equals(std::string_view a, std::string_view b);

// Standard base64 with padding, no line breaks.
std::string base64_encode(std::string_view bytes);
std::optional<std::string> base64_decode(std::string_view text);

// Random RFC 4122 version-4 identifier from the OpenSSL CSPRNG.
std::string random_id();

}  // namespace bluxguard
