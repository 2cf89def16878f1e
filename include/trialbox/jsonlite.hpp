#pragma once

// trialbox/jsonlite.hpp - Minimal strict JSON value model, parser and writer.
//
// Used for every on-disk format the harness produces: attempts.jsonl lines,
// run.json, events.jsonl and tool results.
//
// DETERMINISM:
//   - Object is a std::map, so to_json() always emits keys in sorted order.
//   - format_double() is locale-independent (snprintf "%.6f", trimmed).
//
// STRICTNESS:
//   - Duplicate keys, trailing data, NaN/Infinity are parse errors.
//   - Readers ignore keys they do not know; unknown fields are never an error.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trialbox::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double,
               std::string, Object, Array>
      v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Strict parse of a single JSON document whose root must be an object.
// On error returns an empty object and sets *error (when non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Strict parse of any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Compact single-line serialization with sorted keys.
std::string to_json(const Value& v);

std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or mismatched types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
// String elements of an array; other element types are skipped.
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);

}  // namespace trialbox::jsonlite
