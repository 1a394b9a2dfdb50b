#pragma once

// bluxguard/types.hpp - Shared value types for the guard trust core.
//
// Inputs arrive as JSON documents and are checked against their structural
// contract (schema.hpp) before being lifted into these structs. Once lifted, a
// RequestEnvelope or DiscernmentReport is immutable for the rest of the
// evaluation that owns it.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bluxguard/jsonlite.hpp"

namespace bluxguard {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  missing_input,
  schema_violation,
  token_unavailable,
  signature_mismatch,
  invalid_signature_metadata,
  missing_fields,
  log_unavailable,
  rule_malformed,
  spawn_failed,
  timeout,
  quota_exceeded,
  record_integrity_failed,
};

std::string to_string(ErrorCode code);

// Ordered by severity; the numeric order is what the decision engine compares.
enum class Decision {
  allow = 0,
  warn = 1,
  require_confirm = 2,
  block = 3,
};

std::string to_string(Decision decision);
std::optional<Decision> decision_from_string(std::string_view s);

// One failing field from a structural check. `document` names the contract
// ("request_envelope", "discernment_report", "guard_receipt"), `path` is a
// slash-joined JSON pointer without the leading slash, and `keyword` is the
// schema keyword that failed ("required", "type", ...).
struct SchemaIssue {
  std::string document;
  std::string path;
  std::string keyword;
  std::string message;
};

jsonlite::Value schema_issues_to_json(const std::vector<SchemaIssue>& issues);

struct ResourceLimits {
  std::uint64_t cpu_seconds{120};
  std::uint64_t memory_mb{512};
  std::uint64_t processes{64};
};

struct NetworkPolicy {
  std::string egress{"restricted"};
  std::vector<std::string> allowed_hosts;
};

struct EnvironmentPolicy {
  std::vector<std::string> allowlist;
  std::vector<std::string> denylist;
};

// The action under evaluation. Optional members stay empty when the envelope
// does not name them; defaults are applied by the constraint resolver.
struct RequestEnvelope {
  std::string trace_id;
  std::optional<std::string> working_dir;
  std::optional<std::string> command;
  std::optional<std::vector<std::string>> allowed_commands;
  std::optional<std::vector<std::string>> allowed_paths;
  std::optional<std::string> sandbox_profile;
  std::optional<std::uint64_t> timeout_s;
  // Partial override: only keys present in the envelope replace defaults.
  std::optional<std::uint64_t> cpu_seconds;
  std::optional<std::uint64_t> memory_mb;
  std::optional<std::uint64_t> processes;
  std::optional<NetworkPolicy> network;
  std::optional<std::vector<std::string>> env_allowlist;
  std::optional<std::vector<std::string>> env_denylist;
  std::optional<std::string> capability_token_ref;
  std::vector<std::string> capability_refs;
  std::vector<std::string> capability_tokens;
  std::optional<std::string> envelope_hash;
};

struct DiscernmentReport {
  std::optional<std::string> risk_level;  // lowercase band
  std::optional<std::string> uncertainty;
  std::optional<std::string> posture;
  bool requires_confirmation{false};
  std::optional<std::string> summary;
};

// Lift a schema-valid document into its struct. Callers validate first; these
// only read fields of the expected type and ignore anything else.
RequestEnvelope envelope_from_json(const jsonlite::Object& obj);
DiscernmentReport discernment_from_json(const jsonlite::Object& obj);

}  // namespace bluxguard
