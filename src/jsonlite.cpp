#include "bluxguard/jsonlite.hpp"

// DETERMINISM NOTES:
//   - Compact output walks std::map in key order; that byte form is what
//     receipt signatures, alert framing and audit chaining are computed over.
//   - Doubles are printed "%.6f" with trailing zeros trimmed, never in
//     exponent form, and always with at least one fractional digit.
//   - Integers are scanned with std::from_chars (locale-free). Only values
//     with a fraction or exponent go through strtod.
//
// Duplicate keys are rejected at parse time: a signed document with two
// "decision" keys would otherwise verify against whichever one survived.

#include <charconv>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace bluxguard::jsonlite {

namespace {

// Nesting limit for untrusted input (events arrive from other processes).
constexpr int kMaxDepth = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  }
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

// Recursive-descent reader. The first error sticks; every production checks
// `failed()` and unwinds without consuming further input.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  std::optional<Value> document() {
    Value v = value();
    skip_ws();
    if (!failed() && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    if (failed()) return std::nullopt;
    return v;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  bool failed() const { return error_.has_value(); }
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void fail(const char* code, std::string message) {
    if (!error_) error_ = JsonError{code, std::move(message) + " at offset " + std::to_string(pos_)};
  }

  void skip_ws() {
    while (!at_end()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word) {
    const std::string_view w(word);
    if (text_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  Value value() {
    skip_ws();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{':
      case '[': {
        if (++depth_ > kMaxDepth) {
          fail("json_parse_error", "nesting deeper than " + std::to_string(kMaxDepth));
          return {};
        }
        Value nested = peek() == '{' ? Value(object()) : Value(array());
        --depth_;
        return nested;
      }
      case '"':
        return Value(string());
      case 't':
        if (literal("true")) return Value(true);
        break;
      case 'f':
        if (literal("false")) return Value(false);
        break;
      case 'n':
        if (literal("null")) return Value(nullptr);
        break;
      default:
        if (peek() == '-' || is_digit(peek())) return number();
        break;
    }
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Object object() {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    for (;;) {
      skip_ws();
      std::string key = string();
      if (failed()) break;
      if (out.find(key) != out.end()) {
        fail("json_duplicate_key", "duplicate key \"" + key + "\"");
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        break;
      }
      Value member = value();
      if (failed()) break;
      out.emplace(std::move(key), std::move(member));
      if (consume('}')) break;
      if (!consume(',')) {
        fail("json_parse_error", "expected ',' or '}'");
        break;
      }
    }
    return out;
  }

  Array array() {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    for (;;) {
      Value item = value();
      if (failed()) break;
      out.push_back(std::move(item));
      if (consume(']')) break;
      if (!consume(',')) {
        fail("json_parse_error", "expected ',' or ']'");
        break;
      }
    }
    return out;
  }

  bool read_code_unit(std::uint32_t& out) {
    if (pos_ + 4 > text_.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_++]);
      if (h < 0) return false;
      out = (out << 4) | static_cast<std::uint32_t>(h);
    }
    return true;
  }

  std::string string() {
    if (peek() != '"') {
      fail("json_parse_error", "expected string");
      return {};
    }
    ++pos_;
    std::string out;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "raw control character in string");
        return {};
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!read_code_unit(cp)) {
            fail("json_parse_error", "bad \\u escape");
            return {};
          }
          if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("json_parse_error", "lone low surrogate");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t low = 0;
            if (!literal("\\u") || !read_code_unit(low) || low < 0xDC00 || low > 0xDFFF) {
              fail("json_parse_error", "unpaired high surrogate");
              return {};
            }
            cp = 0x10000 + (((cp - 0xD800) << 10) | (low - 0xDC00));
          }
          put_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("unknown escape \\") + esc);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  void digits() {
    while (!at_end() && is_digit(text_[pos_])) ++pos_;
  }

  Value number() {
    const std::size_t start = pos_;
    const bool negative = peek() == '-';
    if (negative) ++pos_;
    if (!is_digit(peek())) {
      fail("json_parse_error", "expected digit");
      return {};
    }
    digits();

    bool integral = true;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "expected digit after '.'");
        return {};
      }
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "expected exponent digits");
        return {};
      }
      digits();
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
      if (negative) {
        std::int64_t n = 0;
        if (std::from_chars(first, last, n).ec == std::errc()) return Value(n);
      } else {
        std::uint64_t n = 0;
        if (std::from_chars(first, last, n).ec == std::errc()) return Value(n);
      }
      // Wider than 64 bits: keep the magnitude as a double.
    }
    const std::string token(first, last);
    errno = 0;
    const double d = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(d)) {
      fail("json_parse_error", "number out of range");
      return {};
    }
    return Value(d);
  }

  const std::string& text_;
  std::size_t pos_{0};
  int depth_{0};
  std::optional<JsonError> error_;
};

void append_escaped(std::string& out, const std::string& s) {
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
}

void append_quoted(std::string& out, const std::string& s) {
  out.push_back('"');
  append_escaped(out, s);
  out.push_back('"');
}

void append_scalar(std::string& out, const Value& v) {
  if (v.is_null()) {
    out += "null";
  } else if (v.is_bool()) {
    out += v.as_bool() ? "true" : "false";
  } else if (v.is_string()) {
    append_quoted(out, v.as_string());
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* i = std::get_if<std::int64_t>(&v.v)) {
    out += std::to_string(*i);
  } else {
    out += format_double(std::get<double>(v.v));
  }
}

void append_compact(std::string& out, const Value& v) {
  if (v.is_object()) {
    out.push_back('{');
    const char* sep = "";
    for (const auto& [key, member] : v.as_object()) {
      out += sep;
      append_quoted(out, key);
      out.push_back(':');
      append_compact(out, member);
      sep = ",";
    }
    out.push_back('}');
  } else if (v.is_array()) {
    out.push_back('[');
    const char* sep = "";
    for (const auto& item : v.as_array()) {
      out += sep;
      append_compact(out, item);
      sep = ",";
    }
    out.push_back(']');
  } else {
    append_scalar(out, v);
  }
}

void append_pretty(std::string& out, const Value& v, int indent, int level) {
  const bool is_obj = v.is_object();
  if (!is_obj && !v.is_array()) {
    append_scalar(out, v);
    return;
  }
  const bool empty = is_obj ? v.as_object().empty() : v.as_array().empty();
  if (empty) {
    out += is_obj ? "{}" : "[]";
    return;
  }
  const std::string inner(static_cast<std::size_t>(indent * (level + 1)), ' ');
  out += is_obj ? "{\n" : "[\n";
  bool first = true;
  auto next = [&]() {
    if (!first) out += ",\n";
    first = false;
    out += inner;
  };
  if (is_obj) {
    for (const auto& [key, member] : v.as_object()) {
      next();
      append_quoted(out, key);
      out += ": ";
      append_pretty(out, member, indent, level + 1);
    }
  } else {
    for (const auto& item : v.as_array()) {
      next();
      append_pretty(out, item, indent, level + 1);
    }
  }
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * level), ' ');
  out.push_back(is_obj ? '}' : ']');
}

template <typename T>
const T* member_as(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  return v ? std::get_if<T>(&v->v) : nullptr;
}

}  // namespace

double Value::as_double() const {
  if (const auto* d = std::get_if<double>(&v)) return *d;
  if (const auto* u = std::get_if<std::uint64_t>(&v)) return static_cast<double>(*u);
  if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  return 0.0;
}

bool operator==(const Value& a, const Value& b) {
  // 1 and 1.0 compare equal: rule "match" conditions compare event fields
  // whose producers may emit either form.
  if (a.is_number() && b.is_number()) {
    if (a.is_integer() && b.is_integer()) {
      if (a.v.index() != b.v.index()) return false;  // one negative, one non-negative
      return a.v == b.v;
    }
    return a.as_double() == b.as_double();
  }
  return a.v == b.v;
}

std::string format_double(double d) {
  if (!std::isfinite(d)) return "0.0";
  char buf[400];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string text(buf, static_cast<std::size_t>(n));
  const auto last = text.find_last_not_of('0');
  text.erase(last + 1);
  if (text.back() == '.') text.push_back('0');
  return text;
}

std::string to_json(const Value& v) {
  std::string out;
  append_compact(out, v);
  return out;
}

std::string to_pretty_json(const Value& v, int indent) {
  std::string out;
  append_pretty(out, v, indent, 0);
  return out;
}

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  std::optional<Value> v = reader.document();
  if (error) *error = reader.error();
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<Value> v = parse_value(text, error);
  if (!v) return {};
  if (auto* obj = std::get_if<Object>(&v->v)) return std::move(*obj);
  if (error) *error = JsonError{"json_parse_error", "top-level value is not an object"};
  return {};
}

const Value* find(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

const Object* find_object(const Object& obj, const std::string& key) {
  return member_as<Object>(obj, key);
}

const Value* get_path(const Object& obj, const std::string& dotted_path) {
  const Object* scope = &obj;
  std::size_t begin = 0;
  for (;;) {
    const std::size_t dot = dotted_path.find('.', begin);
    const std::string segment =
        dotted_path.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
    const Value* hit = find(*scope, segment);
    if (!hit || dot == std::string::npos) return hit;
    scope = std::get_if<Object>(&hit->v);
    if (!scope) return nullptr;
    begin = dot + 1;
  }
}

bool truthy(const Value& v) {
  if (v.is_bool()) return v.as_bool();
  if (v.is_number()) return v.as_double() != 0.0;
  if (v.is_string()) return !v.as_string().empty();
  if (v.is_object()) return !v.as_object().empty();
  if (v.is_array()) return !v.as_array().empty();
  return false;  // null
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = member_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = member_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* u = member_as<std::uint64_t>(obj, key);
  return u ? *u : def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = member_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (item.is_string()) out.push_back(item.as_string());
    }
  }
  return out;
}

}  // namespace bluxguard::jsonlite
