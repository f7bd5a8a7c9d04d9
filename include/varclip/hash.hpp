#pragma once

// varclip/hash.hpp — BLAKE3 digests for blob keys and integrity checks.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the only primitive. There is no fallback hash.
//   2. Blob keys are domain separated: content_key(b) = BLAKE3("cas:" + b).
//      Integrity hashes over stored (possibly compressed) bytes carry no
//      domain, so a key can never collide with an integrity hash.
//   3. Digests are 64 lowercase hex characters.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace varclip {

inline constexpr std::size_t kDigestHexLength = 64;
inline constexpr std::string_view kContentKeyDomain = "cas:";

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Incremental BLAKE3. Owns the hasher state; one digest per instance.
class ContentHasher {
 public:
  ContentHasher();
  explicit ContentHasher(std::string_view domain);
  ~ContentHasher();

  ContentHasher(const ContentHasher&) = delete;
  ContentHasher& operator=(const ContentHasher&) = delete;

  void update(std::string_view bytes);
  std::string hex_digest();

 private:
  struct State;
  std::unique_ptr<State> state_;
};

std::string blake3_hex(std::string_view payload);
std::string domain_hash(std::string_view domain, std::string_view payload);
std::string content_key(std::string_view raw_bytes);

bool is_hex_digest(std::string_view text);

HashRuntimeInfo hash_runtime_info();

}  // namespace varclip
