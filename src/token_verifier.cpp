#include "bluxguard/token_verifier.hpp"

#include "bluxguard/observability.hpp"
#include "bluxguard/process.hpp"

namespace bluxguard {

namespace {

constexpr const char* kReasonUnavailable = "token.verifier_unavailable";

std::string scalar_text(const jsonlite::Value& v) {
  if (v.is_string()) return v.as_string();
  return jsonlite::to_json(v);
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

bool TokenVerification::authority_unavailable() const {
  return !valid && reason_codes.size() == 1 && reason_codes[0] == kReasonUnavailable;
}

TokenVerification unavailable_verification(const std::string& token, const std::string& detail) {
  TokenVerification v;
  v.token = token;
  v.valid = false;
  v.token_ref = token;
  v.reason_codes = {kReasonUnavailable};
  v.metadata = {{"status", "unavailable"}};
  GuardEvent ev{"token", "token.verifier_unavailable", "warn", "", {{"reason", detail}}};
  emit_event(ev);
  return v;
}

TokenVerification parse_authority_response(const std::string& token, const std::string& stdout_text) {
  const std::string body = trim(stdout_text);
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object payload = jsonlite::parse(body.empty() ? "{}" : body, &err);
  if (err) {
    payload.clear();
    payload["status"] = "unknown";
    payload["message"] = body;
  }

  TokenVerification v;
  v.token = token;
  const jsonlite::Value* valid = jsonlite::find(payload, "valid");
  // Only a JSON boolean true counts; "false" or 1 must not pass as valid.
  v.valid = (valid && valid->is_bool() && valid->as_bool()) ||
            jsonlite::get_string(payload, "status") == "valid" ||
            jsonlite::get_string(payload, "state") == "active";

  for (const char* key : {"token_ref", "id", "ref"}) {
    const std::string ref = jsonlite::get_string(payload, key);
    if (!ref.empty()) {
      v.token_ref = ref;
      break;
    }
  }
  if (v.token_ref.empty()) v.token_ref = token;

  if (const jsonlite::Value* reasons = jsonlite::find(payload, "reason_codes")) {
    if (reasons->is_string() && !reasons->as_string().empty()) {
      v.reason_codes.push_back(reasons->as_string());
    } else if (reasons->is_array()) {
      for (const auto& r : reasons->as_array()) v.reason_codes.push_back(scalar_text(r));
    }
  }
  if (v.reason_codes.empty()) v.reason_codes.push_back(v.valid ? "token.valid" : "token.invalid");

  for (const auto& [k, val] : payload) {
    if (k == "reason_codes") continue;
    v.metadata[k] = scalar_text(val);
  }
  return v;
}

ProcessTokenAuthority::ProcessTokenAuthority(std::string executable, std::uint64_t timeout_ms)
    : executable_(std::move(executable)), timeout_ms_(timeout_ms) {}

TokenVerification ProcessTokenAuthority::verify(const std::string& token) {
  ProcessSpec spec;
  spec.command = executable_;
  spec.argv = {"verify", "--token", token};
  spec.timeout_ms = timeout_ms_;

  const ProcessResult r = run_process(spec);
  if (r.error == ErrorCode::spawn_failed) {
    return unavailable_verification(token, r.error_message);
  }
  if (r.timed_out) {
    return unavailable_verification(token, "timeout after " + std::to_string(timeout_ms_) + "ms");
  }
  if (r.exit_code != 0) {
    TokenVerification v;
    v.token = token;
    v.token_ref = token;
    v.reason_codes = {"token.verify_failed"};
    v.metadata = {{"status", "failed"}, {"exit_code", std::to_string(r.exit_code)},
                  {"stderr", trim(r.stderr_text)}};
    emit_event(GuardEvent{"token", "token.verify_failed", "warn", "",
                          {{"exit_code", std::to_string(r.exit_code)}}});
    return v;
  }
  return parse_authority_response(token, r.stdout_text);
}

void InMemoryTokenAuthority::add_valid(const std::string& token, const std::string& token_ref) {
  std::lock_guard<std::mutex> lock(mu_);
  TokenVerification v;
  v.token = token;
  v.valid = true;
  v.token_ref = token_ref;
  v.reason_codes = {"token.valid"};
  table_[token] = std::move(v);
}

void InMemoryTokenAuthority::add_invalid(const std::string& token,
                                         const std::vector<std::string>& reason_codes) {
  std::lock_guard<std::mutex> lock(mu_);
  TokenVerification v;
  v.token = token;
  v.token_ref = token;
  v.reason_codes = reason_codes.empty() ? std::vector<std::string>{"token.invalid"} : reason_codes;
  table_[token] = std::move(v);
}

void InMemoryTokenAuthority::set_available(bool available) {
  std::lock_guard<std::mutex> lock(mu_);
  available_ = available;
}

std::size_t InMemoryTokenAuthority::calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_;
}

TokenVerification InMemoryTokenAuthority::verify(const std::string& token) {
  std::unique_lock<std::mutex> lock(mu_);
  ++calls_;
  if (!available_) {
    lock.unlock();
    return unavailable_verification(token, "authority offline");
  }
  auto it = table_.find(token);
  if (it != table_.end()) return it->second;
  TokenVerification v;
  v.token = token;
  v.token_ref = token;
  v.reason_codes = {"token.invalid"};
  return v;
}

std::vector<TokenVerification> verify_tokens(const std::vector<std::string>& tokens,
                                             const std::set<std::string>& revocations,
                                             TokenAuthority& authority) {
  std::vector<TokenVerification> out;
  if (tokens.empty()) {
    TokenVerification v;
    v.reason_codes = {"token.missing"};
    v.metadata = {{"status", "missing"}};
    out.push_back(std::move(v));
    return out;
  }
  out.reserve(tokens.size());
  for (const auto& token : tokens) {
    if (revocations.contains(token)) {
      TokenVerification v;
      v.token = token;
      v.token_ref = token;
      v.reason_codes = {"token.revoked"};
      v.metadata = {{"status", "revoked"}};
      out.push_back(std::move(v));
      continue;
    }
    TokenVerification v = authority.verify(token);
    // The authority may resolve a token to a reference that is itself revoked.
    if (v.valid && v.token_ref != token && revocations.contains(v.token_ref)) {
      v.valid = false;
      v.reason_codes = {"token.revoked"};
      v.metadata["status"] = "revoked";
    }
    out.push_back(std::move(v));
  }
  return out;
}

std::string summarize_token_status(const std::vector<std::string>& tokens,
                                   const std::vector<TokenVerification>& results) {
  if (tokens.empty()) return "missing";
  bool all_valid = !results.empty();
  bool any_unavailable = false;
  bool any_other_failure = false;
  for (const auto& r : results) {
    if (r.valid) continue;
    all_valid = false;
    if (r.authority_unavailable()) any_unavailable = true;
    else any_other_failure = true;
  }
  if (all_valid) return "valid";
  if (any_unavailable && !any_other_failure) return "unavailable";
  return "invalid";
}

std::set<std::string> parse_revocations(const jsonlite::Value& doc) {
  std::set<std::string> out;
  const jsonlite::Array* items = nullptr;
  if (doc.is_array()) {
    items = &doc.as_array();
  } else if (doc.is_object()) {
    const jsonlite::Value* list = jsonlite::find(doc.as_object(), "revoked_tokens");
    if (list && list->is_array()) items = &list->as_array();
  }
  if (!items) return out;
  for (const auto& item : *items) {
    out.insert(scalar_text(item));
  }
  return out;
}

}  // namespace bluxguard
