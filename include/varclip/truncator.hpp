#pragma once

// varclip/truncator.hpp — Budget-driven truncation of JSON-compatible values.
//
// DESIGN INVARIANTS (must not be broken):
//   1. Size bound: for every valid config, estimate_json_size(truncate(s).result)
//      <= max_size_bytes unless the result tag is exempt (integer, float, none,
//      file, array[file]). The only arithmetic exception is max_size_bytes == 1,
//      where a string or container collapses to "" (2 bytes).
//      A container result that kept no content (only "..." leaves and empty
//      containers) collapses to a string preview of the input.
//   2. Honest flag: `truncated` is true iff the result differs from the input.
//      Callers must rely on the flag, never on deep equality.
//   3. Fixed point: truncating an already truncated result changes nothing and
//      reports truncated == false.
//   4. Order: kept array elements are a prefix of the input. Object keys are
//      visited in std::map order (lexicographic) and key names are never cut.
//   5. Purity: a VariableTruncator is immutable after construction. Every call
//      is a function of (input, config) and allocates fresh values.
//
// PRECEDENCE (strings): the character limit applies first, then the byte
// budget is re-checked against the already clipped text. Slicing always ends
// on a UTF-8 sequence boundary, so a multi-byte character is either kept whole
// or dropped whole.
//
// EXTENSION_POINT: semantic_truncation
//   Current: every key and element is treated alike.
//   Upgrade path: accept a priority function that reorders which keys receive
//   budget first. Invariant 4 must still hold for the emitted mapping.

#include <cstddef>
#include <string>
#include <string_view>

#include "varclip/jsonlite.hpp"
#include "varclip/segment.hpp"

namespace varclip {

inline constexpr std::size_t kLargeVariableThreshold = 10 * 1024;
inline constexpr std::size_t kDefaultStringLengthLimit = 5000;
inline constexpr std::size_t kDefaultArrayElementLimit = 100;

// Character ceilings for strings nested in containers, independent of how much
// byte budget the surrounding container still has.
inline constexpr std::size_t kArrayCharLimit = 1000;
inline constexpr std::size_t kObjectCharLimit = 5000;

inline constexpr std::string_view kEllipsis = "...";

struct TruncatorConfig {
  std::size_t string_length_limit{kDefaultStringLengthLimit};  // >= 4
  std::size_t array_element_limit{kDefaultArrayElementLimit};  // >= 1
  std::size_t max_size_bytes{kLargeVariableThreshold};         // >= 1
  std::size_t array_char_limit{kArrayCharLimit};               // >= 4
  std::size_t object_char_limit{kObjectCharLimit};             // >= 4

  // Throws ConfigError naming the first limit below its minimum.
  void validate() const;

  // Defaults overridden by VARCLIP_TRUNCATION_MAX_SIZE,
  // VARCLIP_TRUNCATION_STRING_LENGTH and VARCLIP_TRUNCATION_ARRAY_LENGTH.
  // An unparseable value throws ConfigError.
  static TruncatorConfig from_env();
};

// Output of every leaf and budget helper.
template <typename T>
struct Clipped {
  T value;
  bool truncated{false};
};

struct TruncationResult {
  Segment result;
  bool truncated{false};
};

// Keeps at most `char_limit` code points and at most `byte_budget` encoded
// bytes (content + 2 quotes). A clipped string ends in "..."; budgets too small
// for a prefix yield a prefix of "..." itself.
Clipped<std::string> clip_string(std::string_view text, std::size_t char_limit,
                                 std::size_t byte_budget);

// Parses a positive decimal limit as read from the environment.
std::size_t parse_limit(std::string_view name, std::string_view text);

class VariableTruncator {
 public:
  // Throws ConfigError; no instance exists with an invalid config.
  explicit VariableTruncator(TruncatorConfig config = {});

  const TruncatorConfig& config() const noexcept { return config_; }

  // Public entry point. Strategy is selected by the segment tag.
  TruncationResult truncate(const Segment& segment) const;

  Clipped<std::string> truncate_string(std::string_view text) const;
  Clipped<jsonlite::Array> truncate_array(const jsonlite::Array& items,
                                          std::size_t byte_budget) const;
  Clipped<jsonlite::Object> truncate_object(const jsonlite::Object& entries,
                                            std::size_t byte_budget) const;

  // Budget shaping for one array element (ceiling: array_char_limit) and one
  // object value (ceiling: object_char_limit).
  Clipped<jsonlite::Value> truncate_item_to_budget(const jsonlite::Value& item,
                                                   std::size_t budget) const;
  Clipped<jsonlite::Value> truncate_value_to_budget(const jsonlite::Value& value,
                                                    std::size_t budget) const;

  // Last-resort fallback: compact JSON of `value`, clipped to
  // min(max_size_bytes, string_length_limit) characters and max_size_bytes
  // bytes.
  Clipped<std::string> collapse_to_string(const jsonlite::Value& value) const;

 private:
  Clipped<jsonlite::Value> fit_to_budget(const jsonlite::Value& value, std::size_t budget,
                                         std::size_t char_ceiling) const;

  TruncatorConfig config_;
};

}  // namespace varclip
