#include "varclip/truncator.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

#include "varclip/size_estimator.hpp"
#include "varclip/types.hpp"

namespace varclip {

namespace {

constexpr std::size_t kQuoteBytes = 2;
// Encoded size of "..." including quotes. Budget helpers never clip below it.
constexpr std::size_t kMinClippedBytes = kEllipsis.size() + kQuoteBytes;

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Byte length of the code point starting at `pos`: the lead byte plus every
// continuation byte that follows it.
std::size_t sequence_length(std::string_view text, std::size_t pos) {
  std::size_t len = 1;
  while (pos + len < text.size() && is_continuation(static_cast<unsigned char>(text[pos + len]))) {
    ++len;
  }
  return len;
}

// True when a value carries no content: a bare "...", or a container that
// is empty or holds only hollow values. Atomics always count as content.
bool is_hollow(const jsonlite::Value& value) {
  if (const auto* s = std::get_if<std::string>(&value.v)) return *s == kEllipsis;
  if (const auto* arr = std::get_if<jsonlite::Array>(&value.v)) {
    return std::all_of(arr->begin(), arr->end(), is_hollow);
  }
  if (const auto* obj = std::get_if<jsonlite::Object>(&value.v)) {
    return std::all_of(obj->begin(), obj->end(),
                       [](const auto& entry) { return is_hollow(entry.second); });
  }
  return false;
}

void require_min(const char* name, std::size_t value, std::size_t min) {
  if (value < min) {
    throw ConfigError(std::string(name) + " must be >= " + std::to_string(min) + ", got " +
                      std::to_string(value));
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void TruncatorConfig::validate() const {
  require_min("string_length_limit", string_length_limit, kEllipsis.size() + 1);
  require_min("array_element_limit", array_element_limit, 1);
  require_min("max_size_bytes", max_size_bytes, 1);
  require_min("array_char_limit", array_char_limit, kEllipsis.size() + 1);
  require_min("object_char_limit", object_char_limit, kEllipsis.size() + 1);
}

std::size_t parse_limit(std::string_view name, std::string_view text) {
  std::size_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [p, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || p != last) {
    throw ConfigError(std::string(name) + ": not a non-negative integer: '" + std::string(text) + "'");
  }
  return value;
}

TruncatorConfig TruncatorConfig::from_env() {
  TruncatorConfig cfg;
  if (const char* e = std::getenv("VARCLIP_TRUNCATION_MAX_SIZE")) {
    cfg.max_size_bytes = parse_limit("VARCLIP_TRUNCATION_MAX_SIZE", e);
  }
  if (const char* e = std::getenv("VARCLIP_TRUNCATION_STRING_LENGTH")) {
    cfg.string_length_limit = parse_limit("VARCLIP_TRUNCATION_STRING_LENGTH", e);
  }
  if (const char* e = std::getenv("VARCLIP_TRUNCATION_ARRAY_LENGTH")) {
    cfg.array_element_limit = parse_limit("VARCLIP_TRUNCATION_ARRAY_LENGTH", e);
  }
  return cfg;
}

// ---------------------------------------------------------------------------
// String clipping
// ---------------------------------------------------------------------------

Clipped<std::string> clip_string(std::string_view text, std::size_t char_limit,
                                 std::size_t byte_budget) {
  if (utf8_length(text) <= char_limit && text.size() + kQuoteBytes <= byte_budget) {
    return {std::string(text), false};
  }

  const std::size_t byte_room = byte_budget > kQuoteBytes ? byte_budget - kQuoteBytes : 0;
  std::string out;
  if (char_limit <= kEllipsis.size() || byte_room <= kEllipsis.size()) {
    // No room for any prefix: keep as much of the ellipsis as fits.
    out = std::string(kEllipsis.substr(0, std::min({char_limit, byte_room, kEllipsis.size()})));
  } else {
    const std::size_t max_chars = char_limit - kEllipsis.size();
    const std::size_t max_bytes = byte_room - kEllipsis.size();
    std::size_t pos = 0;
    std::size_t chars = 0;
    while (pos < text.size() && chars < max_chars) {
      const std::size_t len = sequence_length(text, pos);
      if (pos + len > max_bytes) break;
      pos += len;
      ++chars;
    }
    out.reserve(pos + kEllipsis.size());
    out.append(text.substr(0, pos));
    out.append(kEllipsis);
  }
  const bool changed = std::string_view(out) != text;
  return {std::move(out), changed};
}

// ---------------------------------------------------------------------------
// VariableTruncator
// ---------------------------------------------------------------------------

VariableTruncator::VariableTruncator(TruncatorConfig config) : config_(config) {
  config_.validate();
}

Clipped<std::string> VariableTruncator::truncate_string(std::string_view text) const {
  return clip_string(text, config_.string_length_limit, static_cast<std::size_t>(-1));
}

Clipped<jsonlite::Array> VariableTruncator::truncate_array(const jsonlite::Array& items,
                                                          std::size_t byte_budget) const {
  // Estimate first so depth and type errors surface even when the element
  // limit alone would decide the outcome.
  const std::size_t size = estimate_json_size(items);
  const std::size_t limit = config_.array_element_limit;
  if (items.size() <= limit && size <= byte_budget) return {items, false};

  const std::size_t keep = std::min(items.size(), limit);
  bool truncated = keep < items.size();
  jsonlite::Array out;
  out.reserve(keep);

  std::size_t used = kQuoteBytes;  // brackets
  for (std::size_t i = 0; i < keep; ++i) {
    const std::size_t comma = out.empty() ? 0 : 1;
    if (used + comma >= byte_budget) {
      truncated = true;
      break;
    }
    const std::size_t room = byte_budget - used - comma;
    const std::size_t target =
        estimate_json_size(items[i]) <= room ? room : room / (keep - i);
    auto fitted = truncate_item_to_budget(items[i], target);
    const std::size_t fitted_size = estimate_json_size(fitted.value);
    if (fitted_size > room) {
      // Dropped elements are always a trailing suffix.
      truncated = true;
      break;
    }
    used += comma + fitted_size;
    truncated = truncated || fitted.truncated;
    out.push_back(std::move(fitted.value));
  }
  return {std::move(out), truncated};
}

Clipped<jsonlite::Object> VariableTruncator::truncate_object(const jsonlite::Object& entries,
                                                            std::size_t byte_budget) const {
  const std::size_t size = estimate_json_size(entries);
  if (size <= byte_budget) return {entries, false};

  jsonlite::Object out;
  std::size_t used = kQuoteBytes;  // braces
  std::size_t keys_left = entries.size();
  for (const auto& [key, value] : entries) {
    const std::size_t share_count = keys_left--;
    const std::size_t comma = out.empty() ? 0 : 1;
    const std::size_t key_cost = estimate_string_size(key) + 1 + comma;
    // Every value needs at least one byte.
    if (used + key_cost >= byte_budget) continue;
    const std::size_t room = byte_budget - used - key_cost;
    const std::size_t target =
        estimate_json_size(value) <= room ? room : room / share_count;
    auto fitted = truncate_value_to_budget(value, target);
    const std::size_t fitted_size = estimate_json_size(fitted.value);
    if (fitted_size > room) continue;
    used += key_cost + fitted_size;
    out.emplace(key, std::move(fitted.value));
  }
  return {std::move(out), true};
}

Clipped<jsonlite::Value> VariableTruncator::truncate_item_to_budget(const jsonlite::Value& item,
                                                                  std::size_t budget) const {
  return fit_to_budget(item, budget, config_.array_char_limit);
}

Clipped<jsonlite::Value> VariableTruncator::truncate_value_to_budget(const jsonlite::Value& value,
                                                                   std::size_t budget) const {
  return fit_to_budget(value, budget, config_.object_char_limit);
}

Clipped<jsonlite::Value> VariableTruncator::fit_to_budget(const jsonlite::Value& value,
                                                          std::size_t budget,
                                                          std::size_t char_ceiling) const {
  const std::size_t byte_budget = std::max(budget, kMinClippedBytes);

  if (const auto* s = std::get_if<std::string>(&value.v)) {
    auto clipped = clip_string(*s, char_ceiling, byte_budget);
    return {jsonlite::Value{std::move(clipped.value)}, clipped.truncated};
  }
  if (const auto* arr = std::get_if<jsonlite::Array>(&value.v)) {
    auto clipped = truncate_array(*arr, budget);
    return {jsonlite::Value{std::move(clipped.value)}, clipped.truncated};
  }
  if (const auto* obj = std::get_if<jsonlite::Object>(&value.v)) {
    auto clipped = truncate_object(*obj, budget);
    return {jsonlite::Value{std::move(clipped.value)}, clipped.truncated};
  }

  // Atomics. The estimator rejects file references here.
  if (estimate_json_size(value) <= budget) return {value, false};
  auto clipped = clip_string(jsonlite::to_json(value), char_ceiling, byte_budget);
  return {jsonlite::Value{std::move(clipped.value)}, true};
}

Clipped<std::string> VariableTruncator::collapse_to_string(const jsonlite::Value& value) const {
  const std::size_t char_limit = std::min(config_.max_size_bytes, config_.string_length_limit);
  return clip_string(jsonlite::to_json(value), char_limit, config_.max_size_bytes);
}

TruncationResult VariableTruncator::truncate(const Segment& segment) const {
  const auto mismatch = [&segment]() {
    return UnknownTypeError("segment tagged " + to_string(segment.type) +
                            " does not carry a matching payload");
  };

  switch (segment.type) {
    case SegmentType::integer:
      if (const auto* b = std::get_if<bool>(&segment.value.v)) {
        return {Segment{SegmentType::integer, jsonlite::Value{static_cast<std::int64_t>(*b ? 1 : 0)}},
                false};
      }
      return {segment, false};

    case SegmentType::floating:
    case SegmentType::none:
    case SegmentType::file:
    case SegmentType::array_file:
      return {segment, false};

    case SegmentType::string: {
      const auto* s = std::get_if<std::string>(&segment.value.v);
      if (s == nullptr) throw mismatch();
      auto clipped = clip_string(*s, config_.string_length_limit, config_.max_size_bytes);
      return {Segment{SegmentType::string, jsonlite::Value{std::move(clipped.value)}},
              clipped.truncated};
    }

    case SegmentType::array:
    case SegmentType::object: {
      TruncationResult out;
      if (const auto* arr = std::get_if<jsonlite::Array>(&segment.value.v);
          arr != nullptr && segment.type == SegmentType::array) {
        auto clipped = truncate_array(*arr, config_.max_size_bytes);
        out = {Segment{SegmentType::array, jsonlite::Value{std::move(clipped.value)}},
               clipped.truncated};
      } else if (const auto* obj = std::get_if<jsonlite::Object>(&segment.value.v);
                 obj != nullptr && segment.type == SegmentType::object) {
        auto clipped = truncate_object(*obj, config_.max_size_bytes);
        out = {Segment{SegmentType::object, jsonlite::Value{std::move(clipped.value)}},
               clipped.truncated};
      } else {
        throw mismatch();
      }

      // Final-size fallback: a result that still overflows is replaced by its
      // own compact JSON, clipped as a string. A result that kept nothing but
      // ellipses and empty containers is replaced by a preview of the input.
      const jsonlite::Value* source = nullptr;
      if (estimate_json_size(out.result.value) > config_.max_size_bytes) {
        source = &out.result.value;
      } else if (out.truncated && is_hollow(out.result.value) && !is_hollow(segment.value)) {
        source = &segment.value;
      }
      if (source != nullptr) {
        auto collapsed = collapse_to_string(*source);
        return {Segment{SegmentType::string, jsonlite::Value{std::move(collapsed.value)}}, true};
      }
      return out;
    }
  }
  // Unreachable: every SegmentType is handled above.
  return {segment, false};
}

}  // namespace varclip
