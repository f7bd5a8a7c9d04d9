#include "varclip/jsonlite.hpp"

// DETERMINISM NOTES:
//   - to_json() walks Object in std::map order, so output is canonical.
//   - Numbers go through std::to_chars / std::from_chars in both directions.
//     The C locale is never consulted.

#include <charconv>
#include <cmath>

namespace varclip::jsonlite {

namespace {

// Bounds recursion on hostile input. Deeper than anything the truncator
// accepts (its estimator stops at 20), so no legitimate payload hits it.
constexpr int kMaxParseDepth = 256;

constexpr char kHex[] = "0123456789abcdef";

bool is_digit(char c) { return c >= '0' && c <= '9'; }

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
  explicit Reader(std::string_view in) : in_(in) {}

  bool read_document(Value& out) {
    if (!read_value(out)) return false;
    skip_ws();
    if (pos_ != in_.size()) return fail("json_parse_error", "trailing data");
    return true;
  }

  std::optional<JsonError> error() const { return err_; }

 private:
  bool fail(const char* code, std::string message) {
    if (!err_) err_ = JsonError{code, std::move(message) + " at offset " + std::to_string(pos_)};
    return false;
  }

  bool at_end() const { return pos_ >= in_.size(); }
  char peek() const { return at_end() ? '\0' : in_[pos_]; }

  void skip_ws() {
    while (!at_end()) {
      const char c = in_[pos_];
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

  bool consume_literal(std::string_view word) {
    if (in_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  std::size_t skip_digits() {
    const std::size_t start = pos_;
    while (!at_end() && is_digit(in_[pos_])) ++pos_;
    return pos_ - start;
  }

  bool read_value(Value& out) {
    skip_ws();
    if (at_end()) return fail("json_parse_error", "unexpected end of input");
    switch (peek()) {
      case '{': {
        Object obj;
        if (!read_object(obj)) return false;
        out = Value{std::move(obj)};
        return true;
      }
      case '[': {
        Array arr;
        if (!read_array(arr)) return false;
        out = Value{std::move(arr)};
        return true;
      }
      case '"': {
        std::string s;
        if (!read_string(s)) return false;
        out = Value{std::move(s)};
        return true;
      }
      default:
        break;
    }
    if (consume_literal("true")) { out = Value{true}; return true; }
    if (consume_literal("false")) { out = Value{false}; return true; }
    if (consume_literal("null")) { out = Value{nullptr}; return true; }
    if (consume_literal("NaN") || consume_literal("Infinity") || consume_literal("-Infinity")) {
      return fail("json_parse_error", "NaN and Infinity are not JSON");
    }
    return read_number(out);
  }

  bool read_hex4(std::uint32_t& out) {
    if (pos_ + 4 > in_.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = in_[pos_++];
      std::uint32_t nibble = 0;
      if (is_digit(c)) nibble = static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') nibble = static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') nibble = static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
      out = (out << 4) | nibble;
    }
    return true;
  }

  bool read_escape(std::string& out) {
    if (at_end()) return fail("json_parse_error", "unterminated escape");
    const char e = in_[pos_++];
    switch (e) {
      case '"':  out += '"'; return true;
      case '\\': out += '\\'; return true;
      case '/':  out += '/'; return true;
      case 'b':  out += '\b'; return true;
      case 'f':  out += '\f'; return true;
      case 'n':  out += '\n'; return true;
      case 'r':  out += '\r'; return true;
      case 't':  out += '\t'; return true;
      case 'u':  break;
      default:   return fail("json_parse_error", std::string("invalid escape \\") + e);
    }
    std::uint32_t cp = 0;
    if (!read_hex4(cp)) return fail("json_parse_error", "invalid \\u escape");
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      std::uint32_t low = 0;
      if (!consume_literal("\\u") || !read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
        return fail("json_parse_error", "unpaired surrogate");
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      return fail("json_parse_error", "unpaired surrogate");
    }
    append_utf8(out, cp);
    return true;
  }

  bool read_string(std::string& out) {
    if (!consume('"')) return fail("json_parse_error", "expected string");
    while (!at_end()) {
      const char c = in_[pos_++];
      if (c == '"') return true;
      if (c == '\\') {
        if (!read_escape(out)) return false;
      } else if (static_cast<unsigned char>(c) < 0x20) {
        return fail("json_parse_error", "unescaped control character in string");
      } else {
        out += c;
      }
    }
    return fail("json_parse_error", "unterminated string");
  }

  bool read_number(Value& out) {
    const std::size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (skip_digits() == 0) {
      pos_ = start;
      return fail("json_parse_error", "unexpected token");
    }
    bool integral = true;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (skip_digits() == 0) return fail("json_parse_error", "digits expected after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (skip_digits() == 0) return fail("json_parse_error", "digits expected in exponent");
    }

    const char* first = in_.data() + start;
    const char* last = in_.data() + pos_;
    if (integral) {
      std::int64_t n = 0;
      const auto res = std::from_chars(first, last, n);
      if (res.ec == std::errc() && res.ptr == last) {
        out = Value{n};
        return true;
      }
      // Beyond int64: fall through and keep the magnitude as a double.
    }
    double d = 0.0;
    const auto res = std::from_chars(first, last, d);
    if (res.ec != std::errc() || res.ptr != last) return fail("json_parse_error", "number out of range");
    out = Value{d};
    return true;
  }

  bool enter() {
    if (++depth_ > kMaxParseDepth) return fail("json_too_deep", "nesting deeper than " + std::to_string(kMaxParseDepth));
    return true;
  }

  bool read_array(Array& out) {
    consume('[');
    if (!enter()) return false;
    if (!consume(']')) {
      do {
        Value item;
        if (!read_value(item)) return false;
        out.push_back(std::move(item));
      } while (consume(','));
      if (!consume(']')) return fail("json_parse_error", "expected ',' or ']'");
    }
    --depth_;
    return true;
  }

  bool read_object(Object& out) {
    consume('{');
    if (!enter()) return false;
    if (!consume('}')) {
      do {
        std::string key;
        if (!read_string(key)) return false;
        if (out.count(key) != 0) return fail("json_duplicate_key", "duplicate key: " + key);
        if (!consume(':')) return fail("json_parse_error", "expected ':'");
        Value value;
        if (!read_value(value)) return false;
        out.emplace(std::move(key), std::move(value));
      } while (consume(','));
      if (!consume('}')) return fail("json_parse_error", "expected ',' or '}'");
    }
    --depth_;
    return true;
  }

  std::string_view in_;
  std::size_t pos_{0};
  int depth_{0};
  std::optional<JsonError> err_;
};

bool needs_escape(std::string_view s) {
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) return true;
  }
  return false;
}

void append_escaped(std::string& out, std::string_view s) {
  // MICRO_OPT: strings without special characters (nearly all) are appended
  // in one call.
  if (!needs_escape(s)) {
    out.append(s);
    return;
  }
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += "\\u00";
          out += kHex[(static_cast<unsigned char>(c) >> 4) & 0x0f];
          out += kHex[static_cast<unsigned char>(c) & 0x0f];
        } else {
          out += c;
        }
    }
  }
}

struct Writer {
  std::string& out;

  void operator()(std::nullptr_t) const { out += "null"; }
  // File references have no JSON form.
  void operator()(const FileRef&) const { out += "null"; }
  void operator()(bool b) const { out += b ? "true" : "false"; }
  void operator()(std::int64_t n) const {
    char buf[24];
    const auto res = std::to_chars(buf, buf + sizeof(buf), n);
    out.append(buf, res.ptr);
  }
  void operator()(double d) const { out += format_double(d); }
  void operator()(const std::string& s) const {
    out += '"';
    append_escaped(out, s);
    out += '"';
  }
  void operator()(const Array& items) const {
    out += '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i != 0) out += ',';
      std::visit(*this, items[i].v);
    }
    out += ']';
  }
  void operator()(const Object& entries) const {
    out += '{';
    bool first = true;
    for (const auto& [key, value] : entries) {
      if (!first) out += ',';
      first = false;
      (*this)(key);
      out += ':';
      std::visit(*this, value.v);
    }
    out += '}';
  }
};

}  // namespace

// Shortest round-trip representation. Integral values keep a trailing ".0" so
// that a float never reads back as an integer.
std::string format_double(double d) {
  if (std::isnan(d)) return "NaN";
  if (std::isinf(d)) return d < 0 ? "-Infinity" : "Infinity";
  char buf[32];
  const auto res = std::to_chars(buf, buf + sizeof(buf), d);
  std::string text(buf, res.ptr);
  if (text.find_first_of(".eE") == std::string::npos) text += ".0";
  return text;
}

std::string to_json(const Value& v) {
  std::string out;
  std::visit(Writer{out}, v.v);
  return out;
}

std::string escape(const std::string& s) {
  if (!needs_escape(s)) return s;
  std::string out;
  out.reserve(s.size() + s.size() / 4 + 4);
  append_escaped(out, s);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v;
  const bool ok = reader.read_document(v);
  if (error) *error = reader.error();
  if (!ok) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> local;
  Value v = parse_value(text, &local);
  if (!local && !v.is_object()) local = JsonError{"json_parse_error", "root is not an object"};
  if (error) *error = local;
  if (local) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  (void)parse_value(text, &err);
  return err;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* s = std::get_if<std::string>(&it->second.v);
  return s ? *s : def;
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  const auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* n = std::get_if<std::int64_t>(&it->second.v);
  return n ? *n : def;
}

std::optional<Object> get_object(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  const auto* o = std::get_if<Object>(&it->second.v);
  if (!o) return std::nullopt;
  return *o;
}

}  // namespace varclip::jsonlite
