#pragma once

// pine/jsonlite.hpp: Minimal strict JSON value model, parser and serializer.
//
// Used for event payloads, configuration files and state snapshots.
// Objects are std::map so serialization is always key-sorted (canonical).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pine::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  // Non-negative integers are kept as uint64; negative and fractional
  // numbers as double.
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }

  bool operator==(const Value& other) const { return v == other.v; }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. On failure (or non-object input) returns {} and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Compact canonical serialization (sorted keys, no whitespace).
std::string to_json(const Value& v);

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string escape(const std::string& s);

// Round-trip safe double formatting ("%.17g", always carries '.' or exponent).
std::string format_double(double d);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

// Resolve a dotted path ("a.b.c") through nested objects. Array elements are
// addressed by decimal index ("items.0.price").
const Value* find_path(const Value& root, const std::string& dotted_path);

// Numeric view of a value (uint64 or double). nullopt for anything else.
std::optional<double> as_number(const Value& v);

}  // namespace pine::jsonlite
