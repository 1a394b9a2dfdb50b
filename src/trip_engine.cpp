#include "bluxguard/trip_engine.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>

#include "bluxguard/document.hpp"
#include "bluxguard/mac.hpp"
#include "bluxguard/observability.hpp"

namespace fs = std::filesystem;

namespace bluxguard {

namespace {

constexpr const char* kUnknownSubject = "<unknown>";

double now_seconds() {
  return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool parse_op(const std::string& s, CompareOp& out) {
  if (s == "gt") out = CompareOp::gt;
  else if (s == "gte") out = CompareOp::gte;
  else if (s == "eq") out = CompareOp::eq;
  else if (s == "lt") out = CompareOp::lt;
  else if (s == "lte") out = CompareOp::lte;
  else return false;
  return true;
}

bool compare(CompareOp op, double count, double limit) {
  switch (op) {
    case CompareOp::gt: return count > limit;
    case CompareOp::gte: return count >= limit;
    case CompareOp::eq: return count == limit;
    case CompareOp::lt: return count < limit;
    case CompareOp::lte: return count <= limit;
  }
  return false;
}

bool required_field(const jsonlite::Object& def, std::string& field, std::string& error) {
  field = jsonlite::get_string(def, "field");
  if (field.empty()) {
    error = "condition requires a non-empty string \"field\"";
    return false;
  }
  return true;
}

bool parse_condition(const jsonlite::Value& v, Condition& out, std::string& error, int depth) {
  if (depth > 32) {
    error = "condition nesting too deep";
    return false;
  }
  if (!v.is_object()) {
    error = "condition must be an object";
    return false;
  }
  const auto& def = v.as_object();
  const std::string type = jsonlite::get_string(def, "type");

  if (type == "threshold") {
    out.type = ConditionType::threshold;
    if (!required_field(def, out.field, error)) return false;
    const jsonlite::Value* op = jsonlite::find(def, "op");
    if (op && (!op->is_string() || !parse_op(op->as_string(), out.op))) {
      error = "threshold op must be one of gt, gte, eq, lt, lte";
      return false;
    }
    const jsonlite::Value* limit = jsonlite::find(def, "value");
    if (!limit || !limit->is_number()) {
      error = "threshold requires a numeric \"value\"";
      return false;
    }
    out.limit = limit->as_double();
    // "window_s" is the documented key; "window" is accepted as an alias.
    const jsonlite::Value* window_s = jsonlite::find(def, "window_s");
    const jsonlite::Value* window = jsonlite::find(def, "window");
    if (window_s && window && *window_s != *window) {
      error = "threshold has conflicting \"window_s\" and \"window\"";
      return false;
    }
    if (const jsonlite::Value* w = window_s ? window_s : window) {
      if (!w->is_number() || w->as_double() <= 0) {
        error = "threshold window must be a positive number of seconds";
        return false;
      }
      out.window_s = w->as_double();
    }
    return true;
  }
  if (type == "match") {
    out.type = ConditionType::match;
    if (!required_field(def, out.field, error)) return false;
    if (const jsonlite::Value* value = jsonlite::find(def, "value")) out.value = *value;
    return true;
  }
  if (type == "exists") {
    out.type = ConditionType::exists;
    return required_field(def, out.field, error);
  }
  if (type == "and" || type == "or") {
    out.type = type == "and" ? ConditionType::all_of : ConditionType::any_of;
    const jsonlite::Value* clauses = jsonlite::find(def, "clauses");
    if (!clauses || !clauses->is_array() || clauses->as_array().empty()) {
      error = type + " requires a non-empty \"clauses\" array";
      return false;
    }
    for (const auto& c : clauses->as_array()) {
      Condition child;
      if (!parse_condition(c, child, error, depth + 1)) return false;
      out.clauses.push_back(std::move(child));
    }
    return true;
  }
  error = type.empty() ? "condition has no \"type\"" : "unknown condition type: " + type;
  return false;
}

void collect_thresholds(const Condition& c, std::map<std::string, std::set<double>>& out) {
  if (c.type == ConditionType::threshold) out[c.field].insert(c.window_s);
  for (const auto& child : c.clauses) collect_thresholds(child, out);
}

std::string rule_label(const Rule& r) {
  if (r.id.is_string()) return r.id.as_string();
  return jsonlite::to_json(r.id);
}

std::string subject_of(const jsonlite::Object& event) {
  const jsonlite::Value* uid = jsonlite::find(event, "uid");
  if (!uid || uid->is_null()) return kUnknownSubject;
  if (uid->is_string()) return uid->as_string();
  return jsonlite::to_json(*uid);
}

TripOutcome malformed_outcome(std::string error) {
  emit_event(GuardEvent{"trip", "trip.event_malformed", "warn", "", {{"error", error}}});
  TripOutcome out;
  out.malformed = true;
  out.error = std::move(error);
  return out;
}

}  // namespace

Rule parse_rule(const jsonlite::Value& def) {
  Rule rule;
  if (!def.is_object()) {
    rule.error = "rule must be an object";
    return rule;
  }
  const auto& obj = def.as_object();
  if (const jsonlite::Value* id = jsonlite::find(obj, "id")) rule.id = *id;
  if (const jsonlite::Value* name = jsonlite::find(obj, "name")) rule.name = *name;
  const jsonlite::Value* cond = jsonlite::find(obj, "condition");
  if (!cond || cond->is_null()) {
    rule.error = "rule has no condition";
    return rule;
  }
  rule.valid = parse_condition(*cond, rule.condition, rule.error, 0);
  return rule;
}

std::size_t RuleSet::valid_count() const {
  return static_cast<std::size_t>(
      std::count_if(rules.begin(), rules.end(), [](const Rule& r) { return r.valid; }));
}

RuleSet RuleSet::from_json(const jsonlite::Value& doc) {
  RuleSet set;
  const jsonlite::Value* rules = doc.is_object() ? jsonlite::find(doc.as_object(), "rules") : nullptr;
  if (!rules || !rules->is_array()) {
    emit_event(GuardEvent{"trip", "trip.rules_invalid", "warn", "",
                          {{"error", "rules document must be {\"rules\": [...]}"}}});
    return set;
  }
  for (const auto& def : rules->as_array()) {
    Rule rule = parse_rule(def);
    if (!rule.valid) {
      emit_event(GuardEvent{"trip", "trip.rule_malformed", "warn", "",
                            {{"rule_id", rule_label(rule)}, {"error", rule.error}}});
    }
    set.rules.push_back(std::move(rule));
  }
  return set;
}

RuleSet RuleSet::load_file(const std::string& path) {
  const LoadedDocument doc = load_json_file(path);
  if (!doc.ok()) {
    const bool missing = doc.error == ErrorCode::missing_input;
    emit_event(GuardEvent{"trip", missing ? "trip.rules_missing" : "trip.rules_invalid", "warn", "",
                          {{"path", path}, {"error", to_string(doc.error)}, {"message", doc.message}}});
    return {};
  }
  return from_json(*doc.value);
}

TripEngine::TripEngine(RuleSet rules, const KeyProvider& keys, AuditLog* audit,
                       std::string incident_log_path)
    : rules_(std::move(rules)),
      keys_(keys),
      audit_(audit),
      incident_log_path_(std::move(incident_log_path)) {
  for (const auto& r : rules_.rules) {
    if (r.valid) collect_thresholds(r.condition, tracked_fields_);
  }
}

std::shared_ptr<TripEngine::Window> TripEngine::window_for(const WindowKey& key) {
  std::lock_guard<std::mutex> lock(windows_mu_);
  auto& slot = windows_[key];
  if (!slot) slot = std::make_shared<Window>();
  return slot;
}

std::map<TripEngine::CountKey, std::size_t> TripEngine::update_windows(
    const std::string& subject, const jsonlite::Object& event, double now) {
  std::map<CountKey, std::size_t> counts;
  for (const auto& [field, windows] : tracked_fields_) {
    const WindowKey key{subject, field};
    auto window = window_for(key);
    bool drained = false;
    {
      std::lock_guard<std::mutex> lock(window->mu);
      auto& stamps = window->stamps;

      const jsonlite::Value* value = jsonlite::get_path(event, field);
      if (value && jsonlite::truthy(*value)) {
        stamps.insert(std::upper_bound(stamps.begin(), stamps.end(), now), now);
      }
      // Keep what the widest window on this field can still see.
      const double horizon = now - *windows.rbegin();
      stamps.erase(stamps.begin(), std::lower_bound(stamps.begin(), stamps.end(), horizon));

      const auto upper = std::upper_bound(stamps.begin(), stamps.end(), now);
      for (double w : windows) {
        const auto lower = std::lower_bound(stamps.begin(), stamps.end(), now - w);
        counts[{field, w}] = lower < upper ? static_cast<std::size_t>(upper - lower) : 0;
      }
      drained = stamps.empty();
    }
    if (drained) release_if_empty(key, window);
  }
  return counts;
}

void TripEngine::release_if_empty(const WindowKey& key, const std::shared_ptr<Window>& window) {
  std::lock_guard<std::mutex> lock(windows_mu_);
  auto it = windows_.find(key);
  if (it == windows_.end() || it->second != window) return;
  // Map slot plus the caller's reference: nobody else can be about to write,
  // since new references are only handed out under windows_mu_.
  if (window.use_count() != 2) return;
  std::lock_guard<std::mutex> window_lock(window->mu);
  if (window->stamps.empty()) windows_.erase(it);
}

bool TripEngine::evaluate(const Condition& c, const jsonlite::Object& event,
                          const std::map<CountKey, std::size_t>& counts) const {
  switch (c.type) {
    case ConditionType::threshold: {
      auto it = counts.find({c.field, c.window_s});
      const double count = it == counts.end() ? 0.0 : static_cast<double>(it->second);
      return compare(c.op, count, c.limit);
    }
    case ConditionType::match: {
      const jsonlite::Value* v = jsonlite::get_path(event, c.field);
      return v ? *v == c.value : c.value.is_null();
    }
    case ConditionType::exists: {
      const jsonlite::Value* v = jsonlite::get_path(event, c.field);
      return v && !v->is_null();
    }
    case ConditionType::all_of:
      for (const auto& child : c.clauses) {
        if (!evaluate(child, event, counts)) return false;
      }
      return true;
    case ConditionType::any_of:
      for (const auto& child : c.clauses) {
        if (evaluate(child, event, counts)) return true;
      }
      return false;
  }
  return false;
}

void TripEngine::record_incident(const jsonlite::Object& incident, TripOutcome& out) {
  const std::string key = keys_.current_key();

  if (!incident_log_path_.empty()) {
    const std::string line = incident_log_line(incident, key) + "\n";
    std::lock_guard<std::mutex> lock(incident_mu_);
    std::error_code ec;
    const fs::path parent = fs::path(incident_log_path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    FILE* f = std::fopen(incident_log_path_.c_str(), "a");
    bool written = false;
    if (f) {
      written = std::fwrite(line.data(), 1, line.size(), f) == line.size() && std::fflush(f) == 0 &&
                ::fsync(fileno(f)) == 0;
      std::fclose(f);
    }
    if (!written) {
      emit_event(GuardEvent{"trip", "trip.incident_log_failed", "error", "",
                            {{"path", incident_log_path_}}});
    }
  }

  if (audit_) {
    AuditEntry entry;
    entry.level = "warn";
    entry.actor = "trip";
    entry.action = "trip.incident";
    entry.stream = "trip";
    entry.payload = incident;
    // append() reports its own failures; the alert is still emitted.
    audit_->append(entry);
  }

  out.alerts.push_back(compact_alert(incident, key));
  out.incidents.push_back(incident);
}

TripOutcome TripEngine::process_event(const jsonlite::Object& event, double now) {
  TripOutcome out;
  const std::string subject = subject_of(event);
  const auto counts = update_windows(subject, event, now);

  for (const auto& rule : rules_.rules) {
    if (!rule.valid) continue;
    if (!evaluate(rule.condition, event, counts)) continue;

    jsonlite::Object incident;
    incident["rule_id"] = rule.id;
    incident["rule_name"] = rule.name;
    incident["timestamp"] = now >= 0 ? jsonlite::Value(static_cast<std::uint64_t>(now))
                                     : jsonlite::Value(static_cast<std::int64_t>(now));
    const jsonlite::Value* uid = jsonlite::find(event, "uid");
    incident["uid"] = uid ? *uid : jsonlite::Value();
    incident["event_snapshot"] = event;
    incident["meta"] = jsonlite::Object{{"note", "rule_triggered"}};

    record_incident(incident, out);
    emit_event(GuardEvent{"trip", "trip.triggered", "info", "",
                          {{"rule_id", rule_label(rule)}, {"subject", subject}}});
  }

  emit_event(GuardEvent{"trip", "trip.event_ingested", "info", "",
                        {{"subject", subject}, {"trips", std::to_string(out.incidents.size())}}});
  return out;
}

TripOutcome TripEngine::process_event(const jsonlite::Object& event) {
  return process_event(event, now_seconds());
}

TripOutcome TripEngine::process_line(const std::string& line) {
  const std::string body = trim(line);
  if (body.empty()) return malformed_outcome("empty line");
  const LoadedDocument doc = parse_json_document(body);
  if (!doc.ok()) return malformed_outcome(to_string(doc.error) + ": " + doc.message);
  if (!doc.value->is_object()) return malformed_outcome("event is not a JSON object");
  return process_event(doc.value->as_object());
}

std::size_t TripEngine::window_size(const std::string& subject, const std::string& field) const {
  std::shared_ptr<Window> window;
  {
    std::lock_guard<std::mutex> lock(windows_mu_);
    auto it = windows_.find({subject, field});
    if (it == windows_.end()) return 0;
    window = it->second;
  }
  std::lock_guard<std::mutex> lock(window->mu);
  return window->stamps.size();
}

std::size_t TripEngine::window_count() const {
  std::lock_guard<std::mutex> lock(windows_mu_);
  return windows_.size();
}

std::string compact_alert(const jsonlite::Object& incident, const std::string& key) {
  const std::string canonical = jsonlite::to_json(incident);
  return base64_encode(canonical) + "." + base64_encode(hmac_sha256(key, canonical));
}

std::optional<jsonlite::Object> open_compact_alert(const std::string& alert, const std::string& key) {
  const auto dot = alert.find('.');
  if (dot == std::string::npos || alert.find('.', dot + 1) != std::string::npos) return std::nullopt;
  const auto payload = base64_decode(alert.substr(0, dot));
  const auto tag = base64_decode(alert.substr(dot + 1));
  if (!payload || !tag) return std::nullopt;
  const std::string expected = hmac_sha256(key, *payload);
  if (expected.empty() || !constant_time_equals(expected, *tag)) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  auto value = jsonlite::parse_value(*payload, &err);
  if (err || !value || !value->is_object()) return std::nullopt;
  return value->as_object();
}

std::string incident_log_line(const jsonlite::Object& incident, const std::string& key) {
  const std::string canonical = jsonlite::to_json(incident);
  return canonical + "  " + hmac_sha256_hex(key, canonical);
}

IngestWorker::IngestWorker(TripEngine& engine, BoundedChannel<std::string>& channel, Sink sink)
    : engine_(engine), channel_(channel), sink_(std::move(sink)) {}

IngestWorker::~IngestWorker() {
  channel_.close();
  join();
}

void IngestWorker::start() {
  if (worker_.joinable()) return;
  worker_ = std::thread([this] { run(); });
}

void IngestWorker::join() {
  if (worker_.joinable()) worker_.join();
}

void IngestWorker::run() {
  while (auto line = channel_.pop()) {
    if (trim(*line).empty()) continue;
    TripOutcome out = engine_.process_line(*line);
    if (sink_) sink_(out);
  }
}

}  // namespace bluxguard
