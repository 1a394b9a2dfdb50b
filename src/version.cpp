#include "bluxguard/version.hpp"

#include "bluxguard/hash.hpp"
#include "bluxguard/jsonlite.hpp"
#include "bluxguard/mac.hpp"

#ifndef BLUXGUARD_VERSION
#define BLUXGUARD_VERSION "0.0.0"
#endif

namespace bluxguard {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? BLUXGUARD_VERSION : semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.signature_alg = kSignatureAlg;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["receipt_format_version"] = static_cast<std::uint64_t>(m.receipt_format);
  o["hash_algorithm_version"] = static_cast<std::uint64_t>(m.hash_algorithm);
  o["audit_log_version"] = static_cast<std::uint64_t>(m.audit_log);
  o["record_store_version"] = static_cast<std::uint64_t>(m.record_store);
  o["incident_format_version"] = static_cast<std::uint64_t>(m.incident_format);
  o["semver"] = m.semver;
  o["hash_primitive"] = m.hash_primitive;
  o["signature_alg"] = m.signature_alg;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace bluxguard
