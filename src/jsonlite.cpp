#include "envcache/jsonlite.hpp"

#include <cstdio>
#include <stdexcept>

namespace envcache::jsonlite {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {}

  // One complete document: a value followed only by whitespace.
  Value document() {
    Value v = value(0);
    skip_ws();
    if (!err_ && pos_ != s_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(const char* code, const std::string& what) {
    if (err_) return;
    std::size_t line = 1, col = 1;
    for (std::size_t k = 0; k < pos_ && k < s_.size(); ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    err_ = JsonError{code, what + " at line " + std::to_string(line) + " col " + std::to_string(col),
                     pos_};
  }

  void skip_ws() {
    while (pos_ < s_.size() && is_ws(s_[pos_])) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word) {
    const std::string w(word);
    if (s_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  bool hex4(std::uint32_t* out) {
    if (s_.size() - pos_ < 4) return false;
    std::uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s_[pos_++];
      cp <<= 4;
      if (h >= '0' && h <= '9') cp |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') cp |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') cp |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return false;
    }
    *out = cp;
    return true;
  }

  std::string string_literal() {
    std::string out;
    if (!consume('"')) {
      fail("json_parse_error", "expected string");
      return out;
    }
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "control character in string");
        return out;
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      const char e = s_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!hex4(&cp)) {
            fail("json_parse_error", "bad \\u escape");
            return out;
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t lo = 0;
            if (!literal("\\u") || !hex4(&lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "unpaired surrogate");
              return out;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("bad escape \\") + e);
          return out;
      }
    }
    fail("json_parse_error", "unterminated string");
    return out;
  }

  Value number() {
    const std::size_t start = pos_;
    bool integral = true;
    if (s_[pos_] == '-') {
      integral = false;
      ++pos_;
    }
    if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
      fail("json_parse_error", "unexpected token");
      return {};
    }
    if (s_[pos_] == '0' && pos_ + 1 < s_.size() && is_digit(s_[pos_ + 1])) {
      fail("json_parse_error", "leading zero");
      return {};
    }
    while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    if (pos_ < s_.size() && s_[pos_] == '.') {
      integral = false;
      ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("json_parse_error", "digit expected after '.'");
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
      integral = false;
      ++pos_;
      if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("json_parse_error", "digit expected in exponent");
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }
    const std::string text = s_.substr(start, pos_ - start);
    try {
      if (integral) return Value{static_cast<std::uint64_t>(std::stoull(text))};
      return Value{std::stod(text)};
    } catch (const std::out_of_range&) {
      fail("json_parse_error", "number out of range: " + text);
    } catch (const std::invalid_argument&) {
      fail("json_parse_error", "bad number: " + text);
    }
    return {};
  }

  Value value(int depth) {
    skip_ws();
    if (pos_ >= s_.size()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    const char c = s_[pos_];
    if (c == '{' || c == '[') {
      if (depth >= kMaxDepth) {
        fail("json_too_deep", "nesting deeper than " + std::to_string(kMaxDepth));
        return {};
      }
      return c == '{' ? Value{object(depth + 1)} : Value{array(depth + 1)};
    }
    if (c == '"') return Value{string_literal()};
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    return number();
  }

  Object object(int depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    while (!err_) {
      skip_ws();
      const std::size_t key_pos = pos_;
      std::string key = string_literal();
      if (err_) break;
      if (out.contains(key)) {
        pos_ = key_pos;
        fail("json_duplicate_key", "duplicate key '" + key + "'");
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        break;
      }
      Value v = value(depth);
      if (err_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or '}'");
    }
    return out;
  }

  Array array(int depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    while (!err_) {
      out.push_back(value(depth));
      if (err_) break;
      if (consume(']')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or ']'");
    }
    return out;
  }

  const std::string& s_;
  std::size_t pos_{0};
  std::optional<JsonError> err_;
};

template <typename T>
const T* member(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  std::optional<JsonError> err = r.error();
  if (!err && !std::holds_alternative<Object>(v.v))
    err = JsonError{"json_parse_error", "top level is not an object", 0};
  if (error) *error = err;
  if (err) return {};
  return std::move(std::get<Object>(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Reader r(text);
  r.document();
  return r.error();
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* p = member<std::string>(obj, key);
  return p ? *p : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* p = member<bool>(obj, key);
  return p ? *p : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* p = member<std::uint64_t>(obj, key);
  return p ? *p : def;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  const auto* nested = member<Object>(obj, key);
  if (!nested) return out;
  for (const auto& [k, v] : *nested) {
    if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
  }
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
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
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace envcache::jsonlite
