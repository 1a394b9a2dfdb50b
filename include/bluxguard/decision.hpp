#pragma once

// bluxguard/decision.hpp - Fixed decision mapping for guard receipts.
//
// The decision is a pure function of (token validity, risk band, posture,
// requires_confirmation) plus the configured no-discernment default. There
// is no hidden state: identical inputs always give identical decisions and
// identical reason_codes, so decide() may run concurrently from any thread.
//
// STAGES (each contributes at most one decision; the most severe wins and
// every stage's reason codes are kept, in stage order):
//   1. token        not all tokens valid          -> BLOCK  token.missing | token.invalid
//   2. risk         critical                      -> BLOCK  risk.critical
//                   high                          -> REQUIRE_CONFIRM risk.high
//                   medium + posture low|degraded -> REQUIRE_CONFIRM posture.low
//                   medium                        -> WARN   risk.medium
//   3. confirmation requires_confirmation         -> REQUIRE_CONFIRM discernment.confirmation
//   4. fallback     nothing above fired           -> ALLOW  risk.low
// Without a discernment report, stages 2-4 are replaced by the policy default
// decision and reason discernment.none.
//
// `uncertainty` is echoed into the receipt but does not move the decision.

#include <optional>
#include <string>
#include <vector>

#include "bluxguard/types.hpp"

namespace bluxguard {

struct DecisionPolicy {
  Decision no_discernment_decision{Decision::allow};
};

struct DecisionInput {
  bool tokens_missing{true};
  bool tokens_valid{false};
  // Reason codes reported by token verification, in token order.
  std::vector<std::string> token_reason_codes;
  std::optional<DiscernmentReport> discernment;
};

struct DecisionOutcome {
  Decision decision{Decision::block};
  std::vector<std::string> reason_codes;
};

DecisionOutcome decide(const DecisionInput& input, const DecisionPolicy& policy);

inline Decision most_severe(Decision a, Decision b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

}  // namespace bluxguard
