#pragma once

// bluxguard/token_verifier.hpp - Capability token verification.
//
// FAIL-CLOSED CONTRACT:
//   - A revoked token is invalid before the authority is consulted.
//   - An unreachable, missing, or timed-out authority yields
//     {valid:false, reason_codes:["token.verifier_unavailable"]}.
//   - A non-zero authority exit yields token.verify_failed.
//   - An empty token list yields a single {valid:false, ["token.missing"]}.
// No path through this module returns valid=true without an authority
// response that says so.

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "bluxguard/jsonlite.hpp"

namespace bluxguard {

struct TokenVerification {
  std::string token;
  bool valid{false};
  std::string token_ref;
  std::vector<std::string> reason_codes;
  std::map<std::string, std::string> metadata;

  bool authority_unavailable() const;
};

// External authority boundary. verify() must be safe to call from several
// evaluations at once.
class TokenAuthority {
 public:
  virtual ~TokenAuthority() = default;
  virtual TokenVerification verify(const std::string& token) = 0;
};

// Runs `<executable> verify --token <token>` with a deadline.
class ProcessTokenAuthority : public TokenAuthority {
 public:
  ProcessTokenAuthority(std::string executable, std::uint64_t timeout_ms);
  TokenVerification verify(const std::string& token) override;

 private:
  std::string executable_;
  std::uint64_t timeout_ms_;
};

// Fixed table of responses, for embedding and tests. Unknown tokens are
// invalid; set_available(false) simulates an unreachable authority.
class InMemoryTokenAuthority : public TokenAuthority {
 public:
  void add_valid(const std::string& token, const std::string& token_ref);
  void add_invalid(const std::string& token, const std::vector<std::string>& reason_codes);
  void set_available(bool available);
  TokenVerification verify(const std::string& token) override;
  std::size_t calls() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, TokenVerification> table_;
  bool available_{true};
  std::size_t calls_{0};
};

// Interpret one authority stdout payload.
TokenVerification parse_authority_response(const std::string& token, const std::string& stdout_text);

TokenVerification unavailable_verification(const std::string& token, const std::string& detail);

std::vector<TokenVerification> verify_tokens(const std::vector<std::string>& tokens,
                                             const std::set<std::string>& revocations,
                                             TokenAuthority& authority);

// "missing" | "valid" | "unavailable" | "invalid". A failure for any other
// reason outranks unavailability.
std::string summarize_token_status(const std::vector<std::string>& tokens,
                                   const std::vector<TokenVerification>& results);

// Accepts a JSON array of strings or {"revoked_tokens": [...]}.
std::set<std::string> parse_revocations(const jsonlite::Value& doc);

}  // namespace bluxguard
