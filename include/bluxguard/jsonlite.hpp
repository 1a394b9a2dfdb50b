#pragma once

// bluxguard/jsonlite.hpp - Minimal strict JSON DOM with canonical serialization.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so to_json() always emits keys in byte order.
//   - No whitespace is emitted. Doubles use format_double() (fixed, trimmed).
//   - Non-negative integers are kept as uint64 and printed without a fraction;
//     negative integers are held as int64.
//
// These guarantees are what make canonical_bytes() usable as MAC input: a
// receipt parsed back from disk re-serializes to the exact bytes that were
// signed.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bluxguard::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, std::int64_t, double,
               std::string, Object, Array>
      v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(std::int64_t i) : v(i) {}
  Value(int i) {
    if (i < 0) v = static_cast<std::int64_t>(i);
    else v = static_cast<std::uint64_t>(i);
  }
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_integer() const {
    return std::holds_alternative<std::uint64_t>(v) ||
           std::holds_alternative<std::int64_t>(v);
  }
  bool is_number() const {
    return is_integer() || std::holds_alternative<double>(v);
  }

  const std::string& as_string() const { return std::get<std::string>(v); }
  const Object& as_object() const { return std::get<Object>(v); }
  const Array& as_array() const { return std::get<Array>(v); }
  bool as_bool() const { return std::get<bool>(v); }
  double as_double() const;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

struct JsonError {
  std::string code;
  std::string message;
};

// Strict parsing: duplicate keys, trailing data and NaN/Infinity are errors.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);
Object parse(const std::string& text, std::optional<JsonError>* error);

// Canonical (sorted, compact) serialization.
std::string to_json(const Value& v);

// Indented output for humans (CLI). Keys are still sorted.
std::string to_pretty_json(const Value& v, int indent = 2);

std::string format_double(double d);

// Type-safe extractors. Missing or mistyped keys yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

// Pointer-returning lookups; nullptr when absent.
const Value* find(const Object& obj, const std::string& key);
const Object* find_object(const Object& obj, const std::string& key);

// Dotted-path lookup ("network.remote_ips_count"). Returns nullptr when any
// segment is missing or a non-object is traversed.
const Value* get_path(const Object& obj, const std::string& dotted_path);

// JSON truthiness: null/false/0/""/{}/[] are false.
bool truthy(const Value& v);

}  // namespace bluxguard::jsonlite
