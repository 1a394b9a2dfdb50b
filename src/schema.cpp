#include "bluxguard/schema.hpp"

#include <cmath>
#include <cstdint>

namespace bluxguard {

namespace {

constexpr const char* kRequestEnvelopeSchema = R"json({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "blux://contracts/request_envelope.schema.json",
  "title": "Guard request envelope v1",
  "type": "object",
  "additionalProperties": false,
  "properties": {
    "$schema": {"type": "string"},
    "trace_id": {"type": "string", "minLength": 1},
    "working_dir": {"type": "string", "minLength": 1},
    "command": {"type": "string", "minLength": 1},
    "allowed_commands": {"type": "array", "items": {"type": "string", "minLength": 1}},
    "allowed_paths": {"type": "array", "items": {"type": "string", "minLength": 1}},
    "sandbox_profile": {"type": "string", "minLength": 1},
    "timeout_s": {"type": "integer", "minimum": 1},
    "resource_limits": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "cpu_seconds": {"type": "integer", "minimum": 1},
        "memory_mb": {"type": "integer", "minimum": 1},
        "processes": {"type": "integer", "minimum": 1}
      }
    },
    "network": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "egress": {"type": "string", "enum": ["restricted", "allowed", "denied"]},
        "allowed_hosts": {"type": "array", "items": {"type": "string", "minLength": 1}}
      }
    },
    "environment": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "allowlist": {"type": "array", "items": {"type": "string", "minLength": 1}},
        "denylist": {"type": "array", "items": {"type": "string", "minLength": 1}}
      }
    },
    "env_allowlist": {"type": "array", "items": {"type": "string", "minLength": 1}},
    "env_denylist": {"type": "array", "items": {"type": "string", "minLength": 1}},
    "capability_token_ref": {"type": "string", "minLength": 1},
    "capability_refs": {"type": "array", "uniqueItems": true, "items": {"type": "string", "minLength": 1}},
    "capability_token": {"type": "string"},
    "capability_tokens": {"type": "array", "items": {"type": "string", "minLength": 1}},
    "envelope_hash": {"type": "string", "minLength": 1}
  }
})json";

constexpr const char* kDiscernmentSchema = R"json({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "blux://contracts/discernment_report.schema.json",
  "title": "Discernment report v1",
  "type": "object",
  "properties": {
    "$schema": {"type": "string"},
    "trace_id": {"type": "string"},
    "risk_level": {"type": "string", "enum": ["low", "medium", "high", "critical"]},
    "band": {"type": "string", "enum": ["low", "medium", "high", "critical"]},
    "uncertainty": {"type": "string", "enum": ["low", "medium", "high"]},
    "posture": {"type": "string", "minLength": 1},
    "requires_confirmation": {"type": "boolean"},
    "summary": {"type": "string"}
  }
})json";

constexpr const char* kReceiptSchema = R"json({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "blux://contracts/guard_receipt.schema.json",
  "title": "Guard receipt v1",
  "type": "object",
  "additionalProperties": false,
  "required": ["$schema", "receipt_id", "issued_at", "decision", "trace_id",
               "capability_token_ref", "token_status", "reason_codes",
               "constraints", "discernment", "signature", "bindings"],
  "properties": {
    "$schema": {"const": "blux://contracts/guard_receipt.schema.json"},
    "receipt_id": {"type": "string", "minLength": 1},
    "issued_at": {"type": "number", "minimum": 0},
    "decision": {"type": "string", "enum": ["ALLOW", "WARN", "REQUIRE_CONFIRM", "BLOCK"]},
    "trace_id": {"type": "string", "minLength": 1},
    "capability_token_ref": {"type": "string", "minLength": 1},
    "token_status": {"type": "string", "enum": ["missing", "valid", "invalid", "unavailable"]},
    "reason_codes": {"type": "array", "minItems": 1, "items": {"type": "string", "minLength": 1}},
    "constraints": {
      "type": "object",
      "additionalProperties": false,
      "required": ["receipt_required", "allowlist_execution", "working_dir",
                   "sandbox_profile", "timeout_s", "resource_limits", "network",
                   "environment", "confirmation_required"],
      "properties": {
        "receipt_required": {"type": "boolean"},
        "allowlist_execution": {"type": "boolean"},
        "working_dir": {"type": "string", "minLength": 1},
        "sandbox_profile": {"type": "string", "minLength": 1},
        "timeout_s": {"type": "integer", "minimum": 1},
        "resource_limits": {
          "type": "object",
          "additionalProperties": false,
          "required": ["cpu_seconds", "memory_mb", "processes"],
          "properties": {
            "cpu_seconds": {"type": "integer", "minimum": 1},
            "memory_mb": {"type": "integer", "minimum": 1},
            "processes": {"type": "integer", "minimum": 1}
          }
        },
        "allowed_commands": {"type": "array", "minItems": 1, "items": {"type": "string"}},
        "allowed_paths": {"type": "array", "minItems": 1, "items": {"type": "string"}},
        "network": {
          "type": "object",
          "required": ["egress"],
          "additionalProperties": false,
          "properties": {
            "egress": {"type": "string"},
            "allowed_hosts": {"type": "array", "minItems": 1, "items": {"type": "string"}}
          }
        },
        "environment": {
          "type": "object",
          "additionalProperties": false,
          "properties": {
            "allowlist": {"type": "array", "items": {"type": "string"}},
            "denylist": {"type": "array", "items": {"type": "string"}}
          }
        },
        "confirmation_required": {"type": "boolean"}
      }
    },
    "discernment": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "risk_level": {"type": "string"},
        "uncertainty": {"type": "string"},
        "posture": {"type": "string"},
        "summary": {"type": "string"}
      }
    },
    "signature": {"type": "object"},
    "bindings": {
      "type": "object",
      "additionalProperties": false,
      "required": ["trace_id"],
      "properties": {
        "trace_id": {"type": "string", "minLength": 1},
        "envelope_hash": {"type": "string", "minLength": 1},
        "capability_refs": {"type": "array", "items": {"type": "string"}}
      }
    }
  }
})json";

const char* contract_text(Contract c) {
  switch (c) {
    case Contract::request_envelope: return kRequestEnvelopeSchema;
    case Contract::discernment_report: return kDiscernmentSchema;
    case Contract::guard_receipt: return kReceiptSchema;
  }
  return "{}";
}

std::string join_path(const std::string& base, const std::string& segment) {
  return base.empty() ? segment : base + "/" + segment;
}

std::string type_name(const jsonlite::Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return "boolean";
  if (v.is_integer()) return "integer";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_object()) return "object";
  return "array";
}

bool matches_type(const std::string& type, const jsonlite::Value& v) {
  if (type == "null") return v.is_null();
  if (type == "boolean") return v.is_bool();
  if (type == "string") return v.is_string();
  if (type == "object") return v.is_object();
  if (type == "array") return v.is_array();
  if (type == "number") return v.is_number();
  if (type == "integer") {
    if (v.is_integer()) return true;
    // 2020-12: a number with a zero fractional part is an integer.
    if (std::holds_alternative<double>(v.v)) {
      const double d = std::get<double>(v.v);
      return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
  }
  return false;
}

std::size_t utf8_length(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

class Validator {
 public:
  Validator(std::string document, std::vector<SchemaIssue>& issues)
      : document_(std::move(document)), issues_(issues) {}

  void check(const jsonlite::Object& schema, const jsonlite::Value& v, const std::string& path) {
    if (!check_type(schema, v, path)) return;

    if (const jsonlite::Value* c = jsonlite::find(schema, "const")) {
      if (*c != v) add(path, "const", "must equal " + jsonlite::to_json(*c));
    }
    if (const jsonlite::Value* e = jsonlite::find(schema, "enum"); e && e->is_array()) {
      bool found = false;
      for (const auto& candidate : e->as_array()) {
        if (candidate == v) { found = true; break; }
      }
      if (!found) add(path, "enum", jsonlite::to_json(v) + " is not one of " + jsonlite::to_json(*e));
    }

    if (v.is_string()) {
      if (const jsonlite::Value* m = jsonlite::find(schema, "minLength"); m && m->is_number()) {
        if (static_cast<double>(utf8_length(v.as_string())) < m->as_double()) {
          add(path, "minLength", "string is shorter than " + jsonlite::to_json(*m));
        }
      }
    }
    if (v.is_number()) {
      if (const jsonlite::Value* m = jsonlite::find(schema, "minimum"); m && m->is_number()) {
        const bool below = std::holds_alternative<std::int64_t>(v.v)
                               ? static_cast<double>(std::get<std::int64_t>(v.v)) < m->as_double()
                               : v.as_double() < m->as_double();
        if (below) add(path, "minimum", jsonlite::to_json(v) + " is less than " + jsonlite::to_json(*m));
      }
    }
    if (v.is_object()) check_object(schema, v.as_object(), path);
    if (v.is_array()) check_array(schema, v.as_array(), path);
  }

 private:
  void add(const std::string& path, const std::string& keyword, const std::string& message) {
    issues_.push_back(SchemaIssue{document_, path, keyword, message});
  }

  bool check_type(const jsonlite::Object& schema, const jsonlite::Value& v, const std::string& path) {
    const jsonlite::Value* t = jsonlite::find(schema, "type");
    if (!t) return true;
    bool ok = false;
    if (t->is_string()) {
      ok = matches_type(t->as_string(), v);
    } else if (t->is_array()) {
      for (const auto& alt : t->as_array()) {
        if (alt.is_string() && matches_type(alt.as_string(), v)) { ok = true; break; }
      }
    }
    if (!ok) add(path, "type", type_name(v) + " is not of type " + jsonlite::to_json(*t));
    return ok;
  }

  void check_object(const jsonlite::Object& schema, const jsonlite::Object& obj, const std::string& path) {
    if (const jsonlite::Value* req = jsonlite::find(schema, "required"); req && req->is_array()) {
      for (const auto& name : req->as_array()) {
        if (name.is_string() && !obj.contains(name.as_string())) {
          add(join_path(path, name.as_string()), "required", "required property missing");
        }
      }
    }
    const jsonlite::Object* props = jsonlite::find_object(schema, "properties");
    const jsonlite::Value* additional = jsonlite::find(schema, "additionalProperties");
    for (const auto& [key, value] : obj) {
      const std::string child = join_path(path, key);
      if (props) {
        if (const jsonlite::Object* sub = jsonlite::find_object(*props, key)) {
          check(*sub, value, child);
          continue;
        }
      }
      if (!additional) continue;
      if (additional->is_bool() && !additional->as_bool()) {
        add(child, "additionalProperties", "additional property not allowed");
      } else if (additional->is_object()) {
        check(additional->as_object(), value, child);
      }
    }
  }

  void check_array(const jsonlite::Object& schema, const jsonlite::Array& arr, const std::string& path) {
    if (const jsonlite::Value* m = jsonlite::find(schema, "minItems"); m && m->is_number()) {
      if (static_cast<double>(arr.size()) < m->as_double()) {
        add(path, "minItems", "array has fewer than " + jsonlite::to_json(*m) + " items");
      }
    }
    if (jsonlite::get_bool(schema, "uniqueItems", false)) {
      for (std::size_t i = 0; i < arr.size(); ++i) {
        for (std::size_t j = i + 1; j < arr.size(); ++j) {
          if (arr[i] == arr[j]) {
            add(path, "uniqueItems", "array has non-unique elements");
            i = arr.size();
            break;
          }
        }
      }
    }
    if (const jsonlite::Object* items = jsonlite::find_object(schema, "items")) {
      for (std::size_t i = 0; i < arr.size(); ++i) {
        check(*items, arr[i], join_path(path, std::to_string(i)));
      }
    }
  }

  std::string document_;
  std::vector<SchemaIssue>& issues_;
};

}  // namespace

std::string contract_name(Contract c) {
  switch (c) {
    case Contract::request_envelope: return "request_envelope";
    case Contract::discernment_report: return "discernment_report";
    case Contract::guard_receipt: return "guard_receipt";
  }
  return "unknown";
}

SchemaRegistry::SchemaRegistry() {
  for (Contract c : {Contract::request_envelope, Contract::discernment_report, Contract::guard_receipt}) {
    std::optional<jsonlite::JsonError> err;
    jsonlite::Object schema = jsonlite::parse(contract_text(c), &err);
    // A contract that fails to load stays absent; validate() then rejects
    // every document for it.
    if (!err) schemas_[c] = std::move(schema);
  }
}

std::vector<SchemaIssue> SchemaRegistry::validate(Contract contract, const jsonlite::Value& document) const {
  std::vector<SchemaIssue> issues;
  auto it = schemas_.find(contract);
  if (it == schemas_.end()) {
    issues.push_back(SchemaIssue{contract_name(contract), "", "$id", "contract unavailable"});
    return issues;
  }
  Validator validator(contract_name(contract), issues);
  validator.check(it->second, document, "");
  return issues;
}

std::string SchemaRegistry::schema_json(Contract contract) const {
  auto it = schemas_.find(contract);
  if (it == schemas_.end()) return {};
  return jsonlite::to_json(it->second);
}

}  // namespace bluxguard
