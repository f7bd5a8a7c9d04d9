#pragma once

// varclip/cas.hpp — Content-addressed blob store for offloaded payloads.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Key = content_key(original bytes). A blob's key never depends on the
//      codec it is stored with.
//   2. Blob and sidecar writes are atomic (tmp file + rename, same directory).
//   3. Reads are fail-closed: the stored bytes must match their integrity
//      hash, and the decoded bytes must re-key to the requested digest.
//      Anything else reads as nullopt, never as partial data.
//   4. put() is idempotent. Storing known content returns its key without
//      rewriting the blob.
//
// EXTENSION_POINT: remote_blob_backend
//   Current: local filesystem (CasStore).
//   Upgrade path: implement ICASBackend over an object store using the same
//   objects/AB/CD/<digest> key layout. Offload pointers persisted by callers
//   are digests, so the key scheme is frozen.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace varclip {

enum class CasCodec {
  identity,
  zstd,
};

std::string to_string(CasCodec codec);
// Accepts "off"/"identity" and "zstd". Throws ConfigError otherwise, and for
// "zstd" in a build without zstd support.
CasCodec parse_codec(std::string_view text);
bool cas_zstd_available();

struct CasEntry {
  std::string digest;
  CasCodec codec{CasCodec::identity};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_hash;  // blake3_hex over the bytes on disk
  std::uint64_t created_at{0};
};

// ---------------------------------------------------------------------------
// ICASBackend — storage seam used by CasBlobStorage
// ---------------------------------------------------------------------------
// Implementations must be safe for concurrent calls.
class ICASBackend {
 public:
  virtual ~ICASBackend() = default;

  // Returns the digest, or "" when the blob could not be written or the
  // existing copy failed verification.
  virtual std::string put(std::string_view data, CasCodec codec = CasCodec::identity) = 0;
  virtual std::optional<std::string> get(const std::string& digest) const = 0;
  virtual std::optional<CasEntry> entry(const std::string& digest) const = 0;
  virtual bool contains(const std::string& digest) const = 0;

  // True when the digest is gone afterwards, including when it never existed.
  virtual bool remove(const std::string& digest) = 0;

  // Entries in digest order. limit 0 means no limit.
  virtual std::vector<CasEntry> list(std::size_t limit = 0,
                                     const std::string& start_after = "") const = 0;
  virtual std::size_t count() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore — local filesystem backend
// ---------------------------------------------------------------------------
// Layout under root:
//   objects/AB/CD/<digest>        stored bytes
//   objects/AB/CD/<digest>.meta   CasEntry as JSON
//   journal.ndjson                {"op":"put",...} / {"op":"remove",...}
//
// The journal is replayed on first use. compact() rewrites it with one put
// line per live entry. A digest missing from the journal is still readable
// through its sidecar; list() and count() see journaled entries only.
class CasStore : public ICASBackend {
 public:
  explicit CasStore(std::filesystem::path root = ".varclip/cas/v1");

  std::string put(std::string_view data, CasCodec codec = CasCodec::identity) override;
  std::optional<std::string> get(const std::string& digest) const override;
  std::optional<CasEntry> entry(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  bool remove(const std::string& digest) override;
  std::vector<CasEntry> list(std::size_t limit = 0,
                             const std::string& start_after = "") const override;
  std::size_t count() const override;
  std::string backend_id() const override { return "local_fs"; }

  // Returns false when the new journal could not be written; the old one is
  // then left in place.
  bool compact();

  std::filesystem::path blob_path(const std::string& digest) const;

 private:
  std::filesystem::path sidecar_path(const std::string& digest) const;
  std::filesystem::path journal_path() const;

  // Callers hold mu_.
  void replay_journal_locked() const;
  bool append_journal_locked(std::string_view op, const CasEntry& e) const;
  // Index first, then the blob's sidecar. A sidecar hit is cached.
  const CasEntry* lookup_locked(const std::string& digest) const;

  std::filesystem::path root_;
  mutable std::mutex mu_;
  mutable std::map<std::string, CasEntry> entries_;
  mutable bool replayed_{false};
};

}  // namespace varclip
