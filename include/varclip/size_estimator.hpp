#pragma once

// varclip/size_estimator.hpp — Exact compact-JSON byte size without encoding.
//
// COUNTING RULES (all additive):
//   - String:  UTF-8 byte length + 2 quotes. Escape overhead is not counted.
//   - Integer: decimal length, sign included.
//   - Float:   shortest round-trip length, ".0" appended for integral values,
//              non-finite values counted as NaN / Infinity / -Infinity.
//   - Boolean: 4 (true) / 5 (false). Null: 4.
//   - Array:   2 + sum(elements) + (n - 1) commas.
//   - Object:  2 + sum(key + 1 colon + value) + (n - 1) commas.
//
// The estimator never guesses. Nesting deeper than kMaxEstimateDepth raises
// MaxDepthExceededError; a FileRef raises UnknownTypeError. Both propagate.
//
// The result matches jsonlite::to_json(v).size() for every value whose strings
// contain no characters needing escapes.

#include <cstddef>
#include <string_view>

#include "varclip/jsonlite.hpp"

namespace varclip {

inline constexpr int kMaxEstimateDepth = 20;

std::size_t estimate_json_size(const jsonlite::Value& value, int depth = 0);
std::size_t estimate_json_size(const jsonlite::Array& items, int depth = 0);
std::size_t estimate_json_size(const jsonlite::Object& entries, int depth = 0);

std::size_t estimate_string_size(std::string_view text);

// Number of Unicode code points in a UTF-8 string. Continuation bytes are not
// counted, so malformed input degrades to a byte-ish count instead of failing.
std::size_t utf8_length(std::string_view text);

}  // namespace varclip
