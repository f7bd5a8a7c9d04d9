#include "varclip/segment.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace varclip {

std::string to_string(SegmentType type) {
  switch (type) {
    case SegmentType::integer: return "integer";
    case SegmentType::floating: return "float";
    case SegmentType::none: return "none";
    case SegmentType::file: return "file";
    case SegmentType::array_file: return "array[file]";
    case SegmentType::string: return "string";
    case SegmentType::array: return "array";
    case SegmentType::object: return "object";
  }
  return "none";
}

bool is_exempt(SegmentType type) {
  switch (type) {
    case SegmentType::integer:
    case SegmentType::floating:
    case SegmentType::none:
    case SegmentType::file:
    case SegmentType::array_file:
      return true;
    case SegmentType::string:
    case SegmentType::array:
    case SegmentType::object:
      return false;
  }
  return false;
}

Segment build_segment(jsonlite::Value value) {
  const SegmentType type = std::visit(
      [](const auto& x) -> SegmentType {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return SegmentType::none;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t>) {
          return SegmentType::integer;
        } else if constexpr (std::is_same_v<T, double>) {
          return SegmentType::floating;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return SegmentType::string;
        } else if constexpr (std::is_same_v<T, jsonlite::FileRef>) {
          return SegmentType::file;
        } else if constexpr (std::is_same_v<T, jsonlite::Object>) {
          return SegmentType::object;
        } else {
          const bool all_files =
              !x.empty() && std::all_of(x.begin(), x.end(), [](const jsonlite::Value& item) {
                return std::holds_alternative<jsonlite::FileRef>(item.v);
              });
          return all_files ? SegmentType::array_file : SegmentType::array;
        }
      },
      value.v);
  return Segment{type, std::move(value)};
}

}  // namespace varclip
