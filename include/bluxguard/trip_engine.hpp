#pragma once

// bluxguard/trip_engine.hpp - Declarative rule evaluation over event streams.
//
// Rules file:
//   {"rules": [{"id": ..., "name": ..., "condition": <condition>}]}
// Conditions (tagged by "type"):
//   threshold {field, op = gt|gte|eq|lt|lte (default gt), value, window = 60}
//   match     {field, value}      dotted-path lookup equals value
//   exists    {field}             dotted-path lookup present and not null
//   and       {clauses: [...]}    short-circuit
//   or        {clauses: [...]}    short-circuit
//
// Per event, each rule runs IDLE -> EVALUATING -> MATCHED | NOT_MATCHED.
//
// SLIDING WINDOWS: keyed by (subject, field), where subject is the event's
// "uid" ("<unknown>" when absent). An event is recorded in a window when the
// field is present and truthy. Each window is updated exactly once per event
// and all counts the event needs are taken under that window's lock, so a
// concurrent event for the same key can neither be missed nor double counted.
// Condition evaluation afterwards only reads those per-event counts.
//
// MALFORMED RULES are reported once at load (trip.rule_malformed) and never
// match. They never abort evaluation of the other rules.
//
// On a match, the incident is
//   1. appended to incidents.jsonl as "<canonical json>  <hex hmac>",
//   2. appended to the audit chain as action "trip.incident",
//   3. returned as a compact alert "base64(canonical).base64(hmac)".

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bluxguard/audit.hpp"
#include "bluxguard/channel.hpp"
#include "bluxguard/config.hpp"
#include "bluxguard/jsonlite.hpp"

namespace bluxguard {

enum class ConditionType { threshold, match, exists, all_of, any_of };
enum class CompareOp { gt, gte, eq, lt, lte };

struct Condition {
  ConditionType type{ConditionType::exists};
  std::string field;
  CompareOp op{CompareOp::gt};
  double limit{0.0};     // threshold
  double window_s{60.0};  // threshold
  jsonlite::Value value;  // match
  std::vector<Condition> clauses;
};

struct Rule {
  jsonlite::Value id;
  jsonlite::Value name;
  Condition condition;
  bool valid{false};
  std::string error;  // why the rule is malformed
};

// Parse one rule definition. Never fails: a malformed definition yields a
// Rule with valid=false and `error` set.
Rule parse_rule(const jsonlite::Value& def);

struct RuleSet {
  std::vector<Rule> rules;

  std::size_t valid_count() const;

  // Emits trip.rule_malformed for every invalid rule.
  static RuleSet from_json(const jsonlite::Value& doc);
  // Missing or unreadable file: warn event and an empty rule set.
  static RuleSet load_file(const std::string& path);
};

struct TripOutcome {
  bool malformed{false};  // event line was not a JSON object
  std::string error;
  std::vector<jsonlite::Object> incidents;
  std::vector<std::string> alerts;
};

class TripEngine {
 public:
  TripEngine(RuleSet rules, const KeyProvider& keys, AuditLog* audit = nullptr,
             std::string incident_log_path = "");

  TripEngine(const TripEngine&) = delete;
  TripEngine& operator=(const TripEngine&) = delete;

  // Thread-safe. `now` is unix seconds.
  TripOutcome process_event(const jsonlite::Object& event, double now);
  TripOutcome process_event(const jsonlite::Object& event);
  // Parse and process one stdin-protocol line.
  TripOutcome process_line(const std::string& line);

  const RuleSet& rules() const { return rules_; }
  // Current entry count of a window, for diagnostics and tests.
  std::size_t window_size(const std::string& subject, const std::string& field) const;
  // Live (subject, field) windows. Windows pruned to empty are dropped.
  std::size_t window_count() const;

 private:
  struct Window {
    std::mutex mu;
    std::vector<double> stamps;  // sorted ascending
  };
  using WindowKey = std::pair<std::string, std::string>;
  using CountKey = std::pair<std::string, double>;  // (field, window_s)

  std::shared_ptr<Window> window_for(const WindowKey& key);
  void release_if_empty(const WindowKey& key, const std::shared_ptr<Window>& window);
  std::map<CountKey, std::size_t> update_windows(const std::string& subject,
                                                 const jsonlite::Object& event, double now);
  bool evaluate(const Condition& c, const jsonlite::Object& event,
                const std::map<CountKey, std::size_t>& counts) const;
  void record_incident(const jsonlite::Object& incident, TripOutcome& out);

  RuleSet rules_;
  const KeyProvider& keys_;
  AuditLog* audit_;
  std::string incident_log_path_;
  // field -> distinct windows used by valid threshold conditions.
  std::map<std::string, std::set<double>> tracked_fields_;

  mutable std::mutex windows_mu_;
  std::map<WindowKey, std::shared_ptr<Window>> windows_;
  std::mutex incident_mu_;
};

std::string compact_alert(const jsonlite::Object& incident, const std::string& key);
// Returns the incident when the alert's MAC verifies under `key`.
std::optional<jsonlite::Object> open_compact_alert(const std::string& alert, const std::string& key);
std::string incident_log_line(const jsonlite::Object& incident, const std::string& key);

// Single consumer of a BoundedChannel of event lines. Calls `sink` with each
// outcome in channel order. join() returns once the channel is closed and
// drained.
class IngestWorker {
 public:
  using Sink = std::function<void(const TripOutcome&)>;

  IngestWorker(TripEngine& engine, BoundedChannel<std::string>& channel, Sink sink);
  ~IngestWorker();

  void start();
  void join();

 private:
  void run();

  TripEngine& engine_;
  BoundedChannel<std::string>& channel_;
  Sink sink_;
  std::thread worker_;
};

}  // namespace bluxguard
