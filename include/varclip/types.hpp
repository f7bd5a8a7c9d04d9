#pragma once

// varclip/types.hpp — Error vocabulary shared by every varclip module.
//
// ERROR MODEL:
//   - Truncation and size estimation raise typed exceptions. A failed estimate
//     must never be mistaken for a small one, so there is no sentinel size.
//   - CAS operations stay fail-closed (empty digest / nullopt). The blob
//     storage adapter is the point where an empty digest becomes StorageError.
//   - JSON parsing reports through std::optional<JsonError> out-parameters.
//
// Every exception carries an ErrorCode so that callers (CLI, event log) can
// report a stable machine-readable code without string matching.

#include <stdexcept>
#include <string>

namespace varclip {

enum class ErrorCode {
  none,
  json_parse_error,
  config_invalid,
  max_depth_exceeded,
  unknown_type,
  storage_upload_failed,
  cas_integrity_failed,
};

std::string to_string(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& detail);

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Raised when a limit is below its minimum. The offending instance is never
// constructed.
class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& detail)
      : Error(ErrorCode::config_invalid, detail) {}
};

class MaxDepthExceededError : public Error {
 public:
  explicit MaxDepthExceededError(const std::string& detail)
      : Error(ErrorCode::max_depth_exceeded, detail) {}
};

class UnknownTypeError : public Error {
 public:
  explicit UnknownTypeError(const std::string& detail)
      : Error(ErrorCode::unknown_type, detail) {}
};

// Blob storage failures. Not retried; the caller decides whether the owning
// record is persisted.
class StorageError : public Error {
 public:
  explicit StorageError(const std::string& detail)
      : Error(ErrorCode::storage_upload_failed, detail) {}
};

}  // namespace varclip
