#include "bluxguard/constraints.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace bluxguard {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string normalize_path(const fs::path& base, const std::string& p) {
  fs::path in(p);
  if (in.is_relative()) in = base / in;
  std::string out = in.lexically_normal().string();
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

fs::path current_dir() {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) return fs::path("/");
  return cwd;
}

jsonlite::Array to_array(const std::vector<std::string>& v) {
  jsonlite::Array out;
  out.reserve(v.size());
  for (const auto& s : v) out.push_back(s);
  return out;
}

}  // namespace

const std::vector<std::string>& default_env_allowlist() {
  static const std::vector<std::string> kAllow = {"PATH", "LANG", "LC_ALL", "LC_CTYPE", "HOME"};
  return kAllow;
}

const std::vector<std::string>& default_env_denylist() {
  static const std::vector<std::string> kDeny = {"AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN",
                                                 "GITHUB_TOKEN", "GH_TOKEN", "NPM_TOKEN"};
  return kDeny;
}

bool is_secret_env_name(const std::string& name) {
  if (ends_with(name, "_TOKEN") || ends_with(name, "_SECRET") || ends_with(name, "_KEY") ||
      ends_with(name, "_PASSWORD") || ends_with(name, "_CREDENTIAL"))
    return true;
  if (starts_with(name, "AWS_SECRET") || starts_with(name, "GH_TOKEN") ||
      starts_with(name, "GITHUB_TOKEN") || starts_with(name, "NPM_TOKEN"))
    return true;
  return false;
}

Constraints resolve_constraints(const RequestEnvelope& envelope, Decision decision) {
  Constraints c;
  const fs::path cwd = current_dir();
  c.working_dir = normalize_path(cwd, envelope.working_dir.value_or(cwd.string()));
  if (envelope.sandbox_profile) c.sandbox_profile = *envelope.sandbox_profile;
  if (envelope.timeout_s) c.timeout_s = *envelope.timeout_s;
  if (envelope.cpu_seconds) c.resource_limits.cpu_seconds = *envelope.cpu_seconds;
  if (envelope.memory_mb) c.resource_limits.memory_mb = *envelope.memory_mb;
  if (envelope.processes) c.resource_limits.processes = *envelope.processes;

  if (envelope.allowed_commands) {
    c.allowed_commands = *envelope.allowed_commands;
  } else if (envelope.command && !envelope.command->empty()) {
    c.allowed_commands = {*envelope.command};
  }

  if (envelope.allowed_paths) {
    for (const auto& p : *envelope.allowed_paths) {
      c.allowed_paths.push_back(normalize_path(c.working_dir, p));
    }
  }
  if (c.allowed_commands.empty() && c.allowed_paths.empty() && decision == Decision::allow) {
    c.allowed_paths = {c.working_dir};
  }

  if (envelope.network) c.network = *envelope.network;
  if (c.network.egress.empty()) c.network.egress = "restricted";

  c.environment.denylist = envelope.env_denylist.value_or(default_env_denylist());
  const std::vector<std::string> allow = envelope.env_allowlist.value_or(default_env_allowlist());
  // Deny wins: a name on both lists, or shaped like a credential, is never passed through.
  for (const auto& name : allow) {
    const bool denied = std::find(c.environment.denylist.begin(), c.environment.denylist.end(), name) !=
                        c.environment.denylist.end();
    if (!denied && !is_secret_env_name(name)) c.environment.allowlist.push_back(name);
  }

  c.confirmation_required = decision == Decision::require_confirm;
  return c;
}

jsonlite::Object Constraints::to_json_object() const {
  jsonlite::Object o;
  o["receipt_required"] = receipt_required;
  o["allowlist_execution"] = allowlist_execution;
  o["working_dir"] = working_dir;
  o["sandbox_profile"] = sandbox_profile;
  o["timeout_s"] = timeout_s;

  jsonlite::Object limits;
  limits["cpu_seconds"] = resource_limits.cpu_seconds;
  limits["memory_mb"] = resource_limits.memory_mb;
  limits["processes"] = resource_limits.processes;
  o["resource_limits"] = std::move(limits);

  if (!allowed_commands.empty()) o["allowed_commands"] = to_array(allowed_commands);
  if (!allowed_paths.empty()) o["allowed_paths"] = to_array(allowed_paths);

  jsonlite::Object net;
  net["egress"] = network.egress;
  if (!network.allowed_hosts.empty()) net["allowed_hosts"] = to_array(network.allowed_hosts);
  o["network"] = std::move(net);

  jsonlite::Object env;
  if (!environment.allowlist.empty()) env["allowlist"] = to_array(environment.allowlist);
  if (!environment.denylist.empty()) env["denylist"] = to_array(environment.denylist);
  o["environment"] = std::move(env);

  o["confirmation_required"] = confirmation_required;
  return o;
}

}  // namespace bluxguard
