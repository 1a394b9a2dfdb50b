#include "bluxguard/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace bluxguard {

namespace {

std::optional<std::string> opt_string(const jsonlite::Object& obj, const std::string& key) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || !v->is_string()) return std::nullopt;
  return v->as_string();
}

std::optional<std::uint64_t> opt_u64(const jsonlite::Object& obj, const std::string& key) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return std::nullopt;
  if (const auto* u = std::get_if<std::uint64_t>(&v->v)) return *u;
  // The schema accepts 600.0 as an integer, so it must not fall back to the default.
  if (const auto* d = std::get_if<double>(&v->v)) {
    if (std::isfinite(*d) && *d >= 0.0 && *d < 18446744073709551616.0 && std::floor(*d) == *d) {
      return static_cast<std::uint64_t>(*d);
    }
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> opt_strings(const jsonlite::Object& obj,
                                                    const std::string& key) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || !v->is_array()) return std::nullopt;
  return jsonlite::get_string_array(obj, key);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::schema_violation: return "schema_violation";
    case ErrorCode::token_unavailable: return "token_unavailable";
    case ErrorCode::signature_mismatch: return "signature_mismatch";
    case ErrorCode::invalid_signature_metadata: return "invalid_signature_metadata";
    case ErrorCode::missing_fields: return "missing_fields";
    case ErrorCode::log_unavailable: return "log_unavailable";
    case ErrorCode::rule_malformed: return "rule_malformed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::quota_exceeded: return "quota_exceeded";
    case ErrorCode::record_integrity_failed: return "record_integrity_failed";
  }
  return "";
}

std::string to_string(Decision decision) {
  switch (decision) {
    case Decision::allow: return "ALLOW";
    case Decision::warn: return "WARN";
    case Decision::require_confirm: return "REQUIRE_CONFIRM";
    case Decision::block: return "BLOCK";
  }
  return "BLOCK";
}

std::optional<Decision> decision_from_string(std::string_view s) {
  if (s == "ALLOW") return Decision::allow;
  if (s == "WARN") return Decision::warn;
  if (s == "REQUIRE_CONFIRM") return Decision::require_confirm;
  if (s == "BLOCK") return Decision::block;
  return std::nullopt;
}

jsonlite::Value schema_issues_to_json(const std::vector<SchemaIssue>& issues) {
  jsonlite::Array out;
  out.reserve(issues.size());
  for (const auto& issue : issues) {
    jsonlite::Object o;
    o["document"] = issue.document;
    o["path"] = issue.path;
    o["keyword"] = issue.keyword;
    o["message"] = issue.message;
    out.push_back(std::move(o));
  }
  return out;
}

RequestEnvelope envelope_from_json(const jsonlite::Object& obj) {
  RequestEnvelope env;
  env.trace_id = jsonlite::get_string(obj, "trace_id");
  env.working_dir = opt_string(obj, "working_dir");
  env.command = opt_string(obj, "command");
  env.allowed_commands = opt_strings(obj, "allowed_commands");
  env.allowed_paths = opt_strings(obj, "allowed_paths");
  env.sandbox_profile = opt_string(obj, "sandbox_profile");
  env.timeout_s = opt_u64(obj, "timeout_s");

  if (const jsonlite::Object* limits = jsonlite::find_object(obj, "resource_limits")) {
    env.cpu_seconds = opt_u64(*limits, "cpu_seconds");
    env.memory_mb = opt_u64(*limits, "memory_mb");
    env.processes = opt_u64(*limits, "processes");
  }

  if (const jsonlite::Object* net = jsonlite::find_object(obj, "network")) {
    NetworkPolicy policy;
    if (auto egress = opt_string(*net, "egress")) policy.egress = *egress;
    policy.allowed_hosts = jsonlite::get_string_array(*net, "allowed_hosts");
    env.network = std::move(policy);
  }

  // Nested form takes precedence over the flat env_* keys.
  env.env_allowlist = opt_strings(obj, "env_allowlist");
  env.env_denylist = opt_strings(obj, "env_denylist");
  if (const jsonlite::Object* e = jsonlite::find_object(obj, "environment")) {
    if (auto allow = opt_strings(*e, "allowlist")) env.env_allowlist = std::move(allow);
    if (auto deny = opt_strings(*e, "denylist")) env.env_denylist = std::move(deny);
  }

  env.capability_token_ref = opt_string(obj, "capability_token_ref");
  env.capability_refs = jsonlite::get_string_array(obj, "capability_refs");
  env.capability_tokens = jsonlite::get_string_array(obj, "capability_tokens");
  if (env.capability_tokens.empty()) {
    if (auto single = opt_string(obj, "capability_token"); single && !single->empty()) {
      env.capability_tokens.push_back(*single);
    }
  }
  env.envelope_hash = opt_string(obj, "envelope_hash");
  return env;
}

DiscernmentReport discernment_from_json(const jsonlite::Object& obj) {
  DiscernmentReport report;
  // risk_level is the current field name; band is accepted from older producers.
  if (auto level = opt_string(obj, "risk_level")) {
    report.risk_level = lower(*level);
  } else if (auto band = opt_string(obj, "band")) {
    report.risk_level = lower(*band);
  }
  report.uncertainty = opt_string(obj, "uncertainty");
  if (auto posture = opt_string(obj, "posture")) report.posture = lower(*posture);
  report.requires_confirmation = jsonlite::get_bool(obj, "requires_confirmation", false);
  report.summary = opt_string(obj, "summary");
  return report;
}

}  // namespace bluxguard
