#pragma once

// varclip/segment.hpp — Tagged value handed to the truncation entry point.
//
// The tag selects the truncation strategy. It normally matches the payload
// (see build_segment), but callers may tag explicitly: an Integer segment that
// carries a boolean is legal and is coerced to 0/1 by the dispatcher.

#include <string>

#include "varclip/jsonlite.hpp"

namespace varclip {

enum class SegmentType {
  integer,
  floating,
  none,
  file,
  array_file,
  string,
  array,
  object,
};

std::string to_string(SegmentType type);

// Integer, Float, None, File and ArrayOfFile pass through truncation verbatim.
bool is_exempt(SegmentType type);

struct Segment {
  SegmentType type{SegmentType::none};
  jsonlite::Value value;

  bool operator==(const Segment& other) const {
    return type == other.type && value == other.value;
  }
};

// Infers the tag from the payload: bool and int64 -> integer, double ->
// floating, null -> none, FileRef -> file, a non-empty array holding only
// FileRefs -> array_file, any other array -> array, object -> object.
Segment build_segment(jsonlite::Value value);

}  // namespace varclip
