#pragma once

// varclip/version.hpp — Version manifest for every persisted format.
//
// INVARIANT:
//   All format constants are compile-time. A reader that finds data written
//   under a newer format version than it was compiled against must refuse it.

#include <cstdint>
#include <string>

namespace varclip {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte digest, hex-encoded to 64 chars, "cas:" domain.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CAS_FORMAT_VERSION
// Version 1 = objects/AB/CD/<digest> sharding, JSON .meta sidecars and an
// append-only journal.ndjson of put/remove lines. Changing any of these
// requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t CAS_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// INLINE_ENVELOPE_VERSION
// Version 1 = offloaded payloads keep their truncated keys plus
// "__truncated__": true, or collapse to {"__truncated__": "<preview>"}.
// ---------------------------------------------------------------------------
constexpr uint32_t INLINE_ENVELOPE_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Version 1 = NDJSON, one TruncationEvent object per line.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t inline_envelope{INLINE_ENVELOPE_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // __DATE__ "T" __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

// Compact JSON, keys in sorted order.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace varclip
