#include "bluxguard/observability.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "bluxguard/jsonlite.hpp"

namespace bluxguard {

namespace {

std::atomic<GuardEventHook> g_event_hook{nullptr};

std::uint64_t now_ms() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

bool quiet() {
  const char* q = std::getenv("BLUXGUARD_QUIET");
  return q && std::strcmp(q, "1") == 0;
}

}  // namespace

std::string GuardEvent::to_json() const {
  jsonlite::Object o;
  o["ts_ms"] = now_ms();
  o["component"] = component;
  o["action"] = action;
  o["level"] = level;
  if (!trace_id.empty()) o["trace_id"] = trace_id;
  if (!detail.empty()) {
    jsonlite::Object d;
    for (const auto& [k, v] : detail) d[k] = v;
    o["detail"] = std::move(d);
  }
  return jsonlite::to_json(o);
}

void GuardStats::record(const GuardEvent& ev) {
  const std::string& a = ev.action;
  if (a == "receipt.issued") {
    receipts_issued.fetch_add(1, std::memory_order_relaxed);
    auto it = ev.detail.find("decision");
    if (it != ev.detail.end()) {
      if (it->second == "ALLOW") decisions_allow.fetch_add(1, std::memory_order_relaxed);
      else if (it->second == "WARN") decisions_warn.fetch_add(1, std::memory_order_relaxed);
      else if (it->second == "REQUIRE_CONFIRM") decisions_require_confirm.fetch_add(1, std::memory_order_relaxed);
      else if (it->second == "BLOCK") decisions_block.fetch_add(1, std::memory_order_relaxed);
    }
  } else if (a == "receipt.rejected") {
    schema_rejections.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "receipt.verified") {
    verify_passed.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "receipt.verify_failed") {
    verify_failed.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "token.verifier_unavailable") {
    token_verifier_unavailable.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "audit.appended") {
    audit_appends.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "audit.append_failed") {
    audit_append_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "trip.event_ingested") {
    events_ingested.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "trip.event_malformed") {
    events_malformed.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "trip.rule_malformed") {
    rules_malformed.fetch_add(1, std::memory_order_relaxed);
  } else if (a == "trip.triggered") {
    trips.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string GuardStats::to_json() const {
  jsonlite::Object o;
  o["receipts_issued"] = receipts_issued.load(std::memory_order_relaxed);
  jsonlite::Object decisions;
  decisions["ALLOW"] = decisions_allow.load(std::memory_order_relaxed);
  decisions["WARN"] = decisions_warn.load(std::memory_order_relaxed);
  decisions["REQUIRE_CONFIRM"] = decisions_require_confirm.load(std::memory_order_relaxed);
  decisions["BLOCK"] = decisions_block.load(std::memory_order_relaxed);
  o["decisions"] = std::move(decisions);
  o["schema_rejections"] = schema_rejections.load(std::memory_order_relaxed);
  o["verify_passed"] = verify_passed.load(std::memory_order_relaxed);
  o["verify_failed"] = verify_failed.load(std::memory_order_relaxed);
  o["token_verifier_unavailable"] = token_verifier_unavailable.load(std::memory_order_relaxed);
  o["audit_appends"] = audit_appends.load(std::memory_order_relaxed);
  o["audit_append_failures"] = audit_append_failures.load(std::memory_order_relaxed);
  o["events_ingested"] = events_ingested.load(std::memory_order_relaxed);
  o["events_malformed"] = events_malformed.load(std::memory_order_relaxed);
  o["rules_malformed"] = rules_malformed.load(std::memory_order_relaxed);
  o["trips"] = trips.load(std::memory_order_relaxed);
  return jsonlite::to_json(o);
}

void GuardStats::reset() {
  for (auto* c : {&receipts_issued, &decisions_allow, &decisions_warn, &decisions_require_confirm,
                  &decisions_block, &schema_rejections, &verify_passed, &verify_failed,
                  &token_verifier_unavailable, &audit_appends, &audit_append_failures,
                  &events_ingested, &events_malformed, &rules_malformed, &trips}) {
    c->store(0, std::memory_order_relaxed);
  }
}

GuardStats& global_guard_stats() {
  static GuardStats inst;
  return inst;
}

void set_event_hook(GuardEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const GuardEvent& ev) {
  global_guard_stats().record(ev);

  GuardEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("BLUXGUARD_EVENT_LOG");
  if (log_path && log_path[0]) {
    const std::string line = ev.to_json() + "\n";
    // O_APPEND writes below PIPE_BUF are atomic on POSIX.
    if (FILE* f = std::fopen(log_path, "a")) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fclose(f);
      return;
    }
    // Unwritable event log: fall through to the stderr echo.
  }

  if ((ev.level == "warn" || ev.level == "error") && !quiet()) {
    const std::string line = ev.to_json() + "\n";
    std::fwrite(line.data(), 1, line.size(), stderr);
  }
}

}  // namespace bluxguard
