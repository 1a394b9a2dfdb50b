#pragma once

// bluxguard/constraints.hpp - Enforceable execution envelope for a decision.
//
// resolve_constraints() is pure apart from reading the current directory
// when the envelope names no working_dir (or a relative one). Paths are
// normalized lexically; symlinks are not followed, so the result does not
// depend on filesystem state.
//
// NARROWEST-SURFACE RULE: when the envelope names neither commands nor paths
// and the decision is ALLOW, allowed_paths becomes [working_dir] and nothing
// else.

#include <string>
#include <vector>

#include "bluxguard/jsonlite.hpp"
#include "bluxguard/types.hpp"

namespace bluxguard {

struct Constraints {
  bool receipt_required{true};
  bool allowlist_execution{true};
  std::string working_dir;
  std::string sandbox_profile{"userland"};
  std::uint64_t timeout_s{300};
  ResourceLimits resource_limits;
  std::vector<std::string> allowed_commands;
  std::vector<std::string> allowed_paths;
  NetworkPolicy network;
  EnvironmentPolicy environment;
  bool confirmation_required{false};

  // Empty lists are omitted rather than emitted as null or [].
  jsonlite::Object to_json_object() const;
};

const std::vector<std::string>& default_env_allowlist();
const std::vector<std::string>& default_env_denylist();

// Credential-shaped variable names (*_TOKEN, *_SECRET, *_KEY, AWS_SECRET*, ...).
bool is_secret_env_name(const std::string& name);

Constraints resolve_constraints(const RequestEnvelope& envelope, Decision decision);

}  // namespace bluxguard
