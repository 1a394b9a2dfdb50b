#include "bluxguard/config.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>

#include "bluxguard/observability.hpp"

namespace fs = std::filesystem;

namespace bluxguard {

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return def;
  return v;
}

std::string home_dir() {
  const char* home = std::getenv("HOME");
  return (home && home[0]) ? home : ".";
}

std::atomic<bool> g_dev_secret_warned{false};

}  // namespace

GuardConfig GuardConfig::from_env() {
  GuardConfig cfg;
  const std::string base = home_dir() + "/.config/blux-guard";
  cfg.log_dir = env_or("BLUXGUARD_LOG_DIR", base + "/logs");
  cfg.rules_path = env_or("BLUXGUARD_RULES", base + "/rules.json");
  cfg.verifier = env_or("BLUXGUARD_VERIFIER", "blux-reg");

  const std::string timeout = env_or("BLUXGUARD_VERIFIER_TIMEOUT_MS", "");
  if (!timeout.empty()) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(timeout.c_str(), &end, 10);
    if (end && *end == '\0' && v > 0) {
      cfg.verifier_timeout_ms = v;
    } else {
      cfg.warnings.push_back("BLUXGUARD_VERIFIER_TIMEOUT_MS is not a positive integer");
    }
  }

  const std::string decision = env_or("BLUXGUARD_NO_DISCERNMENT_DECISION", "");
  if (!decision.empty()) {
    if (auto d = decision_from_string(decision)) {
      cfg.no_discernment_decision = *d;
    } else {
      cfg.warnings.push_back("BLUXGUARD_NO_DISCERNMENT_DECISION is not a decision");
    }
  }

  for (const auto& w : cfg.warnings) {
    emit_event(GuardEvent{"config", "config.invalid_value", "warn", "", {{"message", w}}});
  }
  return cfg;
}

std::string GuardConfig::audit_log_path() const {
  return (fs::path(log_dir) / "audit.jsonl").string();
}

std::string GuardConfig::incident_log_path() const {
  return (fs::path(log_dir) / "incidents.jsonl").string();
}

std::string GuardConfig::record_store_dir() const {
  return (fs::path(log_dir) / "records").string();
}

EnvKeyProvider::EnvKeyProvider(std::string var, std::string fallback_var)
    : var_(std::move(var)), fallback_var_(std::move(fallback_var)) {}

std::string EnvKeyProvider::current_key() const {
  if (const char* v = std::getenv(var_.c_str()); v && v[0]) return v;
  if (!fallback_var_.empty()) {
    if (const char* v = std::getenv(fallback_var_.c_str()); v && v[0]) return v;
  }
  if (!g_dev_secret_warned.exchange(true)) {
    emit_event(GuardEvent{"config", "config.dev_secret", "warn", "",
                          {{"message", var_ + " unset; using development secret"}}});
  }
  return kDevSecret;
}

}  // namespace bluxguard
