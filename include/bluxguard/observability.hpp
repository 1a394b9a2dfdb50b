#pragma once

// bluxguard/observability.hpp - Structured diagnostic events and counters.
//
// GuardEvent is the observable unit for everything the trust core does that
// an operator may need to see: receipts issued, verifications, trips, and the
// degrade paths (audit sink unwritable, token authority unreachable, malformed
// rules or events).
//
// Routing, in order of precedence:
//   1. A hook registered with set_event_hook() receives every event.
//   2. Otherwise, BLUXGUARD_EVENT_LOG=/path appends one JSON line per event.
//   3. Otherwise, warn/error events are echoed to stderr as one JSON line,
//      unless BLUXGUARD_QUIET=1.
// GuardStats is updated before routing, for every event.
//
// Invariant: emission never throws and never blocks on anything but a local
// file append. Event detail carries identifiers and reason codes only, never
// secrets, tokens or MAC keys.

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

namespace bluxguard {

struct GuardEvent {
  std::string component;  // "guard", "audit", "token", "trip"
  std::string action;     // e.g. "receipt.issued", "audit.append_failed"
  std::string level{"info"};
  std::string trace_id;
  std::map<std::string, std::string> detail;

  std::string to_json() const;
};

// Process-global counters. All fields are atomics; to_json() is a snapshot.
class GuardStats {
 public:
  void record(const GuardEvent& ev);
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> receipts_issued{0};
  std::atomic<uint64_t> decisions_allow{0};
  std::atomic<uint64_t> decisions_warn{0};
  std::atomic<uint64_t> decisions_require_confirm{0};
  std::atomic<uint64_t> decisions_block{0};
  std::atomic<uint64_t> schema_rejections{0};
  std::atomic<uint64_t> verify_passed{0};
  std::atomic<uint64_t> verify_failed{0};
  std::atomic<uint64_t> token_verifier_unavailable{0};
  std::atomic<uint64_t> audit_appends{0};
  std::atomic<uint64_t> audit_append_failures{0};
  std::atomic<uint64_t> events_ingested{0};
  std::atomic<uint64_t> events_malformed{0};
  std::atomic<uint64_t> rules_malformed{0};
  std::atomic<uint64_t> trips{0};
};

GuardStats& global_guard_stats();

void emit_event(const GuardEvent& ev);

using GuardEventHook = void (*)(const GuardEvent&);
void set_event_hook(GuardEventHook hook);

}  // namespace bluxguard
