#include "varclip/version.hpp"

#include "varclip/hash.hpp"
#include "varclip/jsonlite.hpp"

namespace varclip {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["hash_algorithm"] = static_cast<std::int64_t>(m.hash_algorithm);
  o["cas_format"] = static_cast<std::int64_t>(m.cas_format);
  o["inline_envelope"] = static_cast<std::int64_t>(m.inline_envelope);
  o["event_log"] = static_cast<std::int64_t>(m.event_log);
  o["semver"] = m.semver;
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace varclip
