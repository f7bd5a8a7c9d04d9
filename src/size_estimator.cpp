#include "varclip/size_estimator.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <type_traits>

#include "varclip/types.hpp"

namespace varclip {

namespace {

std::size_t integer_size(std::int64_t v) {
  char buf[24];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  return static_cast<std::size_t>(res.ptr - buf);
}

// Mirrors jsonlite::format_double without building a std::string.
std::size_t float_size(double d) {
  if (std::isnan(d)) return 3;
  if (std::isinf(d)) return d < 0 ? 9 : 8;
  char buf[64];
  auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  if (ec != std::errc()) return 3;
  const std::string_view text(buf, static_cast<std::size_t>(p - buf));
  return text.size() + (text.find_first_of(".eE") == std::string_view::npos ? 2 : 0);
}

void check_depth(int depth) {
  if (depth > kMaxEstimateDepth) {
    throw MaxDepthExceededError("nesting deeper than " + std::to_string(kMaxEstimateDepth));
  }
}

}  // namespace

std::size_t utf8_length(std::string_view text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

std::size_t estimate_string_size(std::string_view text) { return text.size() + 2; }

std::size_t estimate_json_size(const jsonlite::Array& items, int depth) {
  check_depth(depth);
  std::size_t total = 2;
  for (const auto& item : items) total += estimate_json_size(item, depth + 1);
  if (!items.empty()) total += items.size() - 1;
  return total;
}

std::size_t estimate_json_size(const jsonlite::Object& entries, int depth) {
  check_depth(depth);
  std::size_t total = 2;
  for (const auto& [key, value] : entries) {
    total += estimate_string_size(key) + 1 + estimate_json_size(value, depth + 1);
  }
  if (!entries.empty()) total += entries.size() - 1;
  return total;
}

std::size_t estimate_json_size(const jsonlite::Value& value, int depth) {
  check_depth(depth);
  return std::visit(
      [depth](const auto& x) -> std::size_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return 4;
        } else if constexpr (std::is_same_v<T, bool>) {
          return x ? 4 : 5;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return integer_size(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return float_size(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return estimate_string_size(x);
        } else if constexpr (std::is_same_v<T, jsonlite::Array>) {
          return estimate_json_size(x, depth);
        } else if constexpr (std::is_same_v<T, jsonlite::Object>) {
          return estimate_json_size(x, depth);
        } else {
          throw UnknownTypeError("file reference has no JSON size: " + x.id);
        }
      },
      value.v);
}

}  // namespace varclip
