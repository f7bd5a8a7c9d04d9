#include "varclip/types.hpp"

namespace varclip {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::max_depth_exceeded: return "max_depth_exceeded";
    case ErrorCode::unknown_type: return "unknown_type";
    case ErrorCode::storage_upload_failed: return "storage_upload_failed";
    case ErrorCode::cas_integrity_failed: return "cas_integrity_failed";
  }
  return "";
}

Error::Error(ErrorCode code, const std::string& detail)
    : std::runtime_error(to_string(code) + ": " + detail), code_(code) {}

}  // namespace varclip
