#include "varclip/hash.hpp"

// MICRO_DOCUMENTED: hex encoding goes through a nibble table; snprintf("%02x")
// would parse a format string per byte.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace varclip {

namespace {

constexpr char kNibbles[] = "0123456789abcdef";

bool is_lower_hex(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

}  // namespace

struct ContentHasher::State {
  blake3_hasher hasher;
};

ContentHasher::ContentHasher() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

ContentHasher::ContentHasher(std::string_view domain) : ContentHasher() { update(domain); }

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(std::string_view bytes) {
  if (!bytes.empty()) blake3_hasher_update(&state_->hasher, bytes.data(), bytes.size());
}

std::string ContentHasher::hex_digest() {
  std::array<unsigned char, BLAKE3_OUT_LEN> raw{};
  blake3_hasher_finalize(&state_->hasher, raw.data(), raw.size());
  std::string hex(raw.size() * 2, '0');
  for (std::size_t i = 0; i < raw.size(); ++i) {
    hex[2 * i] = kNibbles[raw[i] >> 4];
    hex[2 * i + 1] = kNibbles[raw[i] & 0x0f];
  }
  return hex;
}

std::string blake3_hex(std::string_view payload) {
  ContentHasher h;
  h.update(payload);
  return h.hex_digest();
}

std::string domain_hash(std::string_view domain, std::string_view payload) {
  ContentHasher h(domain);
  h.update(payload);
  return h.hex_digest();
}

std::string content_key(std::string_view raw_bytes) {
  return domain_hash(kContentKeyDomain, raw_bytes);
}

bool is_hex_digest(std::string_view text) {
  if (text.size() != kDigestHexLength) return false;
  for (char c : text) {
    if (!is_lower_hex(c)) return false;
  }
  return true;
}

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.backend = "system";
  info.version = blake3_version();
  return info;
}

}  // namespace varclip
