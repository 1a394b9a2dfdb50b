#pragma once

// bluxguard/version.hpp - Version manifest for every persisted or signed format.
//
// Any change to what a verifier or a chain replay reads must bump the matching
// constant. A receipt or log line written under one version is never silently
// reinterpreted under another.

#include <cstdint>
#include <string>

namespace bluxguard {
namespace version {

// Receipt field set and the canonical bytes the signature covers.
// Version 1 = {"$schema", receipt_id, ..., signature{alg, value}} with
// HMAC-SHA256 over the canonical JSON of the receipt minus "signature".
constexpr uint32_t RECEIPT_FORMAT_VERSION = 1;

// Version 1 = BLAKE3, 32-byte output, lowercase hex, domain-prefixed input.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Audit chain lines: canonical JSON with seq/ts/level/actor/action/stream/
// correlation_id/payload/prev; digest_n = H("chain:" || digest_{n-1} || line_n).
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// Record store: AB/CD/<digest> objects plus index.ndjson.
constexpr uint32_t RECORD_STORE_VERSION = 1;

// incidents.jsonl lines and compact alerts.
constexpr uint32_t INCIDENT_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t receipt_format{RECEIPT_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t record_store{RECORD_STORE_VERSION};
  uint32_t incident_format{INCIDENT_FORMAT_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string signature_alg;    // "HMAC-SHA256"
  std::string build_timestamp;  // __DATE__ / __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

// Compact JSON, keys sorted.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace bluxguard
