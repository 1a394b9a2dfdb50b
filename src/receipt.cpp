#include "bluxguard/receipt.hpp"

#include <chrono>
#include <cmath>

#include "bluxguard/hash.hpp"
#include "bluxguard/mac.hpp"
#include "bluxguard/observability.hpp"

namespace bluxguard {

namespace {

// Millisecond resolution keeps issued_at stable through format_double's
// six-decimal rendering, so a parsed receipt re-serializes to signed bytes.
double now_unix_seconds() {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  return static_cast<double>(ms) / 1000.0;
}

jsonlite::Array to_array(const std::vector<std::string>& v) {
  jsonlite::Array out;
  out.reserve(v.size());
  for (const auto& s : v) out.push_back(s);
  return out;
}

jsonlite::Object discernment_echo(const DiscernmentReport& report) {
  jsonlite::Object o;
  if (report.risk_level) o["risk_level"] = *report.risk_level;
  if (report.uncertainty) o["uncertainty"] = *report.uncertainty;
  if (report.posture) o["posture"] = *report.posture;
  if (report.summary) o["summary"] = *report.summary;
  return o;
}

bool has_required_issue(const std::vector<SchemaIssue>& issues) {
  for (const auto& i : issues) {
    if (i.keyword == "required") return true;
  }
  return false;
}

}  // namespace

std::string sign_payload(const jsonlite::Object& payload, const std::string& key) {
  return hmac_sha256_hex(key, jsonlite::to_json(payload));
}

jsonlite::Object GuardReceipt::unsigned_object() const {
  jsonlite::Object o;
  o["$schema"] = kReceiptSchemaId;
  o["receipt_id"] = receipt_id;
  o["issued_at"] = issued_at;
  o["decision"] = to_string(decision);
  o["trace_id"] = trace_id;
  o["capability_token_ref"] = capability_token_ref;
  o["token_status"] = token_status;
  o["reason_codes"] = to_array(reason_codes);
  o["constraints"] = constraints.to_json_object();
  o["discernment"] = discernment;
  o["bindings"] = bindings;
  return o;
}

jsonlite::Object GuardReceipt::to_object() const {
  jsonlite::Object o = unsigned_object();
  jsonlite::Object sig;
  sig["alg"] = signature_alg;
  sig["value"] = signature_value;
  o["signature"] = std::move(sig);
  return o;
}

std::string VerifyResult::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  o["reason"] = reason;
  if (!violations.empty()) o["violations"] = schema_issues_to_json(violations);
  return jsonlite::to_json(o);
}

GuardEngine::GuardEngine(const SchemaRegistry& schemas, TokenAuthority& authority,
                         const KeyProvider& keys, AuditLog* audit, DecisionPolicy policy)
    : schemas_(schemas), authority_(authority), keys_(keys), audit_(audit), policy_(policy) {}

EvaluationResult GuardEngine::evaluate(const EvaluationRequest& request) const {
  EvaluationResult result;

  // Structural checks run before any decision logic; every failing field of
  // both documents is reported.
  result.violations = schemas_.validate(Contract::request_envelope, request.envelope);
  if (request.discernment) {
    auto more = schemas_.validate(Contract::discernment_report, *request.discernment);
    result.violations.insert(result.violations.end(), more.begin(), more.end());
  }
  if (!result.violations.empty()) {
    result.error_code = ErrorCode::schema_violation;
    result.message = std::to_string(result.violations.size()) + " schema violation(s)";
    emit_event(GuardEvent{"guard", "receipt.rejected", "warn",
                          jsonlite::get_string(request.envelope, "trace_id"),
                          {{"error", to_string(result.error_code)},
                           {"violations", std::to_string(result.violations.size())}}});
    return result;
  }

  const RequestEnvelope envelope = envelope_from_json(request.envelope);
  std::optional<DiscernmentReport> report;
  if (request.discernment) report = discernment_from_json(*request.discernment);

  GuardReceipt& r = result.receipt;
  r.trace_id = envelope.trace_id.empty() ? random_id() : envelope.trace_id;

  const std::vector<std::string>& tokens = request.tokens.empty() ? envelope.capability_tokens : request.tokens;
  result.token_results = verify_tokens(tokens, request.revocations, authority_);
  r.token_status = summarize_token_status(tokens, result.token_results);

  DecisionInput input;
  input.tokens_missing = tokens.empty();
  input.tokens_valid = r.token_status == "valid";
  if (!tokens.empty()) {
    for (const auto& v : result.token_results) {
      input.token_reason_codes.insert(input.token_reason_codes.end(), v.reason_codes.begin(),
                                      v.reason_codes.end());
    }
  }
  input.discernment = report;
  const DecisionOutcome outcome = decide(input, policy_);

  r.decision = outcome.decision;
  r.reason_codes = outcome.reason_codes.empty() ? std::vector<std::string>{"unspecified"}
                                                : outcome.reason_codes;
  r.constraints = resolve_constraints(envelope, r.decision);

  if (!tokens.empty() && !result.token_results.front().token_ref.empty()) {
    r.capability_token_ref = result.token_results.front().token_ref;
  } else if (envelope.capability_token_ref) {
    r.capability_token_ref = *envelope.capability_token_ref;
  } else {
    r.capability_token_ref = "unknown";
  }

  if (report) r.discernment = discernment_echo(*report);
  r.bindings["trace_id"] = r.trace_id;
  if (envelope.envelope_hash) r.bindings["envelope_hash"] = *envelope.envelope_hash;
  if (!envelope.capability_refs.empty()) r.bindings["capability_refs"] = to_array(envelope.capability_refs);

  r.receipt_id = random_id();
  r.issued_at = now_unix_seconds();
  r.signature_alg = kSignatureAlg;
  r.signature_value = sign_payload(r.unsigned_object(), keys_.current_key());
  if (r.signature_value.empty()) {
    result.error_code = ErrorCode::invalid_signature_metadata;
    result.message = "HMAC computation failed";
    return result;
  }

  // Self-check: an issued receipt must satisfy its own contract.
  auto self_issues = schemas_.validate(Contract::guard_receipt, r.to_object());
  if (!self_issues.empty()) {
    result.violations = std::move(self_issues);
    result.error_code = ErrorCode::schema_violation;
    result.message = "issued receipt failed its contract";
    return result;
  }

  if (audit_) {
    AuditEntry entry;
    entry.actor = "guard";
    entry.action = "guard.receipt.issued";
    entry.stream = "guard";
    entry.correlation_id = r.trace_id;
    entry.payload["decision"] = to_string(r.decision);
    entry.payload["trace_id"] = r.trace_id;
    entry.payload["receipt_id"] = r.receipt_id;
    entry.payload["capability_token_ref"] = r.capability_token_ref;
    entry.payload["constraints_hash"] = constraints_hash(jsonlite::to_json(r.constraints.to_json_object()));
    result.audit_recorded = audit_->append(entry).ok;
  }

  result.ok = true;
  emit_event(GuardEvent{"guard", "receipt.issued", "info", r.trace_id,
                        {{"decision", to_string(r.decision)},
                         {"receipt_id", r.receipt_id},
                         {"token_status", r.token_status},
                         {"audit_recorded", result.audit_recorded ? "true" : "false"}}});
  return result;
}

VerifyResult GuardEngine::verify(const jsonlite::Object& receipt) const {
  VerifyResult result;
  auto fail = [&](const std::string& reason) {
    result.ok = false;
    result.reason = reason;
    emit_event(GuardEvent{"guard", "receipt.verify_failed", "warn",
                          jsonlite::get_string(receipt, "trace_id"), {{"reason", reason}}});
    return result;
  };

  result.violations = schemas_.validate(Contract::guard_receipt, receipt);
  if (!result.violations.empty()) {
    return fail(has_required_issue(result.violations) ? "missing_fields" : "schema_violation");
  }

  const jsonlite::Object* sig = jsonlite::find_object(receipt, "signature");
  const jsonlite::Value* value = sig ? jsonlite::find(*sig, "value") : nullptr;
  if (!sig || jsonlite::get_string(*sig, "alg") != kSignatureAlg || !value || !value->is_string() ||
      value->as_string().empty()) {
    return fail("invalid_signature_metadata");
  }

  jsonlite::Object payload = receipt;
  payload.erase("signature");
  const std::string expected = sign_payload(payload, keys_.current_key());
  if (expected.empty() || !constant_time_equals(expected, value->as_string())) {
    return fail("signature_mismatch");
  }

  result.ok = true;
  result.reason = "ok";
  emit_event(GuardEvent{"guard", "receipt.verified", "info", jsonlite::get_string(receipt, "trace_id"), {}});
  return result;
}

}  // namespace bluxguard
