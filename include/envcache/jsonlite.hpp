#pragma once

// envcache/jsonlite.hpp: Minimal strict JSON reader plus string escaping.
//
// Reads the cache archive headers and record files, the config file and the audit log.
// Everything envcache writes is rendered by hand with escape(), so there is no
// generic writer. Duplicate keys, raw control characters inside strings,
// leading zeros and NaN/Infinity are rejected.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace envcache::jsonlite {

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key | json_too_deep
  std::string message;  // includes "line L col C"
  std::size_t offset{0};
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Nesting deeper than this is refused.
constexpr int kMaxDepth = 32;

// Parse a document whose top level is an object. Returns an empty object and
// sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Check that `text` is exactly one JSON value.
std::optional<JsonError> validate_strict(const std::string& text);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);

// String-valued members of a nested object; other members are skipped.
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Body of a JSON string literal (no surrounding quotes).
std::string escape(const std::string& s);

}  // namespace envcache::jsonlite
