#pragma once

// sieve/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for problem files, EnvConfig files and the C ABI payloads. Objects are
// std::map-backed, so serialization iterates keys in sorted order and
// to_json() output is canonical.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sieve::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v{nullptr};
};

struct JsonError {
  std::string code;
  std::string message;
};

// Returns the error for text that is not exactly one JSON value.
std::optional<JsonError> validate_strict(const std::string& text);

// Parse a top-level object. On failure returns an empty object and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any top-level value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Type queries on a looked-up member. nullptr when the key is absent.
const Value* find(const Object& obj, const std::string& key);
inline bool is_string(const Value& v) { return std::holds_alternative<std::string>(v.v); }
inline bool is_array(const Value& v) { return std::holds_alternative<Array>(v.v); }
inline bool is_object(const Value& v) { return std::holds_alternative<Object>(v.v); }
inline bool is_bool(const Value& v) { return std::holds_alternative<bool>(v.v); }
inline bool is_number(const Value& v) {
  return std::holds_alternative<std::uint64_t>(v.v) || std::holds_alternative<double>(v.v);
}

// def when the key is absent or not a string.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace sieve::jsonlite
