#pragma once

// bluxguard/receipt.hpp - Guard receipt issuance and verification.
//
// GuardEngine is the top-level entry point of the trust core:
//
//   evaluate(request)  validate -> verify tokens -> decide -> constrain ->
//                      sign -> audit -> receipt
//   verify(receipt)    structure -> signature metadata -> MAC
//
// SIGNATURE: value = HMAC-SHA256(key, canonical_json(receipt minus
// "signature")), hex. Every other field, including $schema and bindings, is
// covered.
//
// DEGRADE POLICY: an unwritable audit sink does not block issuance. The
// receipt is still returned, EvaluationResult::audit_recorded is false, and
// an audit.append_failed event is emitted. Losing audit durability for one
// receipt is preferred over blocking every action on the host.
//
// THREAD SAFETY: evaluate() and verify() are const and may be called
// concurrently, provided the TokenAuthority and KeyProvider are themselves
// thread-safe (all shipped implementations are).

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bluxguard/audit.hpp"
#include "bluxguard/config.hpp"
#include "bluxguard/constraints.hpp"
#include "bluxguard/decision.hpp"
#include "bluxguard/jsonlite.hpp"
#include "bluxguard/schema.hpp"
#include "bluxguard/token_verifier.hpp"
#include "bluxguard/types.hpp"

namespace bluxguard {

struct EvaluationRequest {
  jsonlite::Object envelope;
  std::optional<jsonlite::Object> discernment;
  // Explicit tokens win; when empty, the envelope's capability_tokens or
  // capability_token is used.
  std::vector<std::string> tokens;
  std::set<std::string> revocations;
};

struct GuardReceipt {
  std::string receipt_id;
  double issued_at{0.0};
  Decision decision{Decision::block};
  std::string trace_id;
  std::string capability_token_ref;
  std::string token_status;
  std::vector<std::string> reason_codes;
  Constraints constraints;
  jsonlite::Object discernment;
  jsonlite::Object bindings;
  std::string signature_alg;
  std::string signature_value;

  // Everything the signature covers.
  jsonlite::Object unsigned_object() const;
  jsonlite::Object to_object() const;
};

struct EvaluationResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
  std::vector<SchemaIssue> violations;
  GuardReceipt receipt;
  std::vector<TokenVerification> token_results;
  bool audit_recorded{false};
};

struct VerifyResult {
  bool ok{false};
  std::string reason;  // "ok" | "missing_fields" | "schema_violation" |
                       // "invalid_signature_metadata" | "signature_mismatch"
  std::vector<SchemaIssue> violations;

  std::string to_json() const;
};

class GuardEngine {
 public:
  GuardEngine(const SchemaRegistry& schemas, TokenAuthority& authority, const KeyProvider& keys,
              AuditLog* audit = nullptr, DecisionPolicy policy = {});

  EvaluationResult evaluate(const EvaluationRequest& request) const;
  VerifyResult verify(const jsonlite::Object& receipt) const;

 private:
  const SchemaRegistry& schemas_;
  TokenAuthority& authority_;
  const KeyProvider& keys_;
  AuditLog* audit_;
  DecisionPolicy policy_;
};

// HMAC-SHA256 hex over the canonical form of `payload`.
std::string sign_payload(const jsonlite::Object& payload, const std::string& key);

}  // namespace bluxguard
