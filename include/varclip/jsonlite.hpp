#pragma once

// varclip/jsonlite.hpp — Minimal JSON value model, strict parser and compact
// serializer.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map: iteration is always lexicographic by key (UTF-8
//     byte order, which equals code point order). Every consumer that walks an
//     Object therefore sees the same canonical order regardless of how the
//     mapping was built.
//   - to_json() emits compact JSON (no whitespace) and is the single encoder
//     used for offload uploads and for the truncator's string fallback.
//   - format_double() produces the shortest round-trip representation via
//     std::to_chars, which is locale independent.
//
// FileRef is an opaque reference to an externally stored file. It lives in
// the variant so that file-carrying segments can be expressed, but it has no
// JSON form: to_json() renders it as null and the size estimator rejects it.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace varclip::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct FileRef {
  std::string id;
  std::string filename;
  std::string mime_type;
  std::uint64_t size{0};
  std::string storage_key;

  bool operator==(const FileRef&) const = default;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array,
               Object, FileRef>
      v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(FileRef f) : v(std::move(f)) {}

  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
};

inline bool operator==(const Value& a, const Value& b) { return a.v == b.v; }

// Strict parse of a single JSON document. Integers that fit in int64 become
// std::int64_t, everything else numeric becomes double.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key,
                       const std::string& def = "");
std::int64_t get_i64(const Object& obj, const std::string& key,
                     std::int64_t def = 0);
std::optional<Object> get_object(const Object& obj, const std::string& key);

}  // namespace varclip::jsonlite
