#include "bluxguard/decision.hpp"

#include <algorithm>

namespace bluxguard {

namespace {

struct RiskRule {
  const char* band;
  bool needs_weak_posture;
  Decision decision;
  const char* reason;
};

// First match wins. Order matters: the posture-qualified medium row must
// precede the plain medium row.
static const RiskRule kRiskTable[] = {
  { "critical", false, Decision::block,           "risk.critical" },
  { "high",     false, Decision::require_confirm, "risk.high" },
  { "medium",   true,  Decision::require_confirm, "posture.low" },
  { "medium",   false, Decision::warn,            "risk.medium" },
};

bool weak_posture(const std::optional<std::string>& posture) {
  return posture && (*posture == "low" || *posture == "degraded");
}

void add_reason(std::vector<std::string>& reasons, const std::string& code) {
  if (std::find(reasons.begin(), reasons.end(), code) == reasons.end()) {
    reasons.push_back(code);
  }
}

}  // namespace

DecisionOutcome decide(const DecisionInput& input, const DecisionPolicy& policy) {
  DecisionOutcome out;
  out.decision = Decision::allow;
  bool fired = false;

  for (const auto& r : input.token_reason_codes) add_reason(out.reason_codes, r);

  // 1. token
  if (input.tokens_missing) {
    out.decision = Decision::block;
    add_reason(out.reason_codes, "token.missing");
    fired = true;
  } else if (!input.tokens_valid) {
    out.decision = Decision::block;
    add_reason(out.reason_codes, "token.invalid");
    fired = true;
  }

  if (!input.discernment) {
    out.decision = fired ? most_severe(out.decision, policy.no_discernment_decision)
                         : policy.no_discernment_decision;
    // The default ALLOW carries its usual reason; discernment.none follows it.
    if (out.decision == Decision::allow) add_reason(out.reason_codes, "risk.low");
    add_reason(out.reason_codes, "discernment.none");
    return out;
  }
  const DiscernmentReport& report = *input.discernment;

  // 2. risk
  if (report.risk_level) {
    for (const auto& rule : kRiskTable) {
      if (*report.risk_level != rule.band) continue;
      if (rule.needs_weak_posture && !weak_posture(report.posture)) continue;
      out.decision = most_severe(out.decision, rule.decision);
      add_reason(out.reason_codes, rule.reason);
      fired = true;
      break;
    }
  }

  // 3. confirmation
  if (report.requires_confirmation) {
    out.decision = most_severe(out.decision, Decision::require_confirm);
    add_reason(out.reason_codes, "discernment.confirmation");
    fired = true;
  }

  // 4. fallback
  if (!fired) {
    out.decision = Decision::allow;
    add_reason(out.reason_codes, "risk.low");
  }
  return out;
}

}  // namespace bluxguard
