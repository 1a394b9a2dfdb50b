#pragma once

// bluxguard/config.hpp - Environment-sourced configuration and MAC keys.
//
// Every knob is an environment variable so the guard can be dropped into a
// service unit or a shell session without a config file:
//
//   BLUXGUARD_RECEIPT_SECRET          HMAC key for receipts
//   BLUXGUARD_TRIP_SECRET             HMAC key for trip incidents/alerts
//                                     (falls back to the receipt key)
//   BLUXGUARD_LOG_DIR                 audit.jsonl, incidents.jsonl, records/
//   BLUXGUARD_VERIFIER                token authority executable
//   BLUXGUARD_VERIFIER_TIMEOUT_MS     per-token authority deadline
//   BLUXGUARD_NO_DISCERNMENT_DECISION decision when no report is supplied
//   BLUXGUARD_RULES                   trip rules file
//   BLUXGUARD_EVENT_LOG / BLUXGUARD_QUIET   see observability.hpp
//
// Malformed values never abort startup: the default is kept and the problem
// is recorded in GuardConfig::warnings (and emitted as a warn event).

#include <cstdint>
#include <string>
#include <vector>

#include "bluxguard/types.hpp"

namespace bluxguard {

inline constexpr const char* kDevSecret = "blux-guard-dev-secret";

struct GuardConfig {
  std::string log_dir;
  std::string verifier{"blux-reg"};
  std::uint64_t verifier_timeout_ms{5000};
  Decision no_discernment_decision{Decision::allow};
  std::string rules_path;
  std::vector<std::string> warnings;

  static GuardConfig from_env();

  std::string audit_log_path() const;
  std::string incident_log_path() const;
  std::string record_store_dir() const;
};

// Source of the MAC key. Implementations must be safe to call concurrently.
class KeyProvider {
 public:
  virtual ~KeyProvider() = default;
  virtual std::string current_key() const = 0;
};

// Reads the environment on every call, so a rotated key takes effect on the
// next signature without a restart. Falls back to `fallback_var`, then to the
// development secret (with a one-time warn event).
class EnvKeyProvider : public KeyProvider {
 public:
  explicit EnvKeyProvider(std::string var, std::string fallback_var = "");
  std::string current_key() const override;

 private:
  std::string var_;
  std::string fallback_var_;
};

class StaticKeyProvider : public KeyProvider {
 public:
  explicit StaticKeyProvider(std::string key) : key_(std::move(key)) {}
  std::string current_key() const override { return key_; }

 private:
  std::string key_;
};

}  // namespace bluxguard
