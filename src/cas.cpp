#include "varclip/cas.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

#if defined(VARCLIP_WITH_ZSTD)
#include <zstd.h>
#endif

#include "varclip/hash.hpp"
#include "varclip/jsonlite.hpp"
#include "varclip/types.hpp"

namespace fs = std::filesystem;

namespace varclip {

namespace {

#if defined(VARCLIP_WITH_ZSTD)
constexpr int kZstdLevel = 3;
#endif

// Stored bytes for `data` under `codec`; nullopt when the codec is
// unavailable or compression failed.
std::optional<std::string> encode(CasCodec codec, std::string_view data) {
  switch (codec) {
    case CasCodec::identity:
      return std::string(data);
    case CasCodec::zstd: {
#if defined(VARCLIP_WITH_ZSTD)
      std::string out(ZSTD_compressBound(data.size()), '\0');
      const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), kZstdLevel);
      if (ZSTD_isError(n)) return std::nullopt;
      out.resize(n);
      return out;
#else
      return std::nullopt;
#endif
    }
  }
  return std::nullopt;
}

std::optional<std::string> decode(const CasEntry& e, std::string stored) {
  switch (e.codec) {
    case CasCodec::identity:
      return stored;
    case CasCodec::zstd: {
#if defined(VARCLIP_WITH_ZSTD)
      std::string out(e.original_size, '\0');
      const size_t n = ZSTD_decompress(out.data(), out.size(), stored.data(), stored.size());
      if (ZSTD_isError(n) || n != e.original_size) return std::nullopt;
      return out;
#else
      // Written by a zstd-enabled build.
      return std::nullopt;
#endif
    }
  }
  return std::nullopt;
}

std::optional<std::string> read_bytes(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Temp names carry a process-wide counter and a per-process random tag so two
// writers in the same directory never share one.
fs::path temp_sibling(const fs::path& target) {
  static std::atomic<std::uint64_t> counter{0};
  static const std::uint64_t tag = std::random_device{}();
  fs::path tmp = target.parent_path();
  tmp /= "." + target.filename().string() + ".tmp" + std::to_string(tag) + "-" +
         std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  return tmp;
}

bool write_atomically(const fs::path& target, std::string_view bytes) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;

  const fs::path tmp = temp_sibling(target);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs) {
      fs::remove(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

std::uint64_t unix_now() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

jsonlite::Object entry_to_object(const CasEntry& e) {
  jsonlite::Object o;
  o["digest"] = e.digest;
  o["codec"] = to_string(e.codec);
  o["original_size"] = static_cast<std::int64_t>(e.original_size);
  o["stored_size"] = static_cast<std::int64_t>(e.stored_size);
  o["stored_hash"] = e.stored_hash;
  o["created_at"] = static_cast<std::int64_t>(e.created_at);
  return o;
}

std::optional<CasEntry> entry_from_object(const jsonlite::Object& o) {
  CasEntry e;
  e.digest = jsonlite::get_string(o, "digest");
  if (!is_hex_digest(e.digest)) return std::nullopt;
  const std::string codec = jsonlite::get_string(o, "codec");
  if (codec == "zstd") {
    e.codec = CasCodec::zstd;
  } else if (codec != "identity") {
    return std::nullopt;
  }
  const auto original = jsonlite::get_i64(o, "original_size", -1);
  const auto stored = jsonlite::get_i64(o, "stored_size", -1);
  if (original < 0 || stored < 0) return std::nullopt;
  e.original_size = static_cast<std::size_t>(original);
  e.stored_size = static_cast<std::size_t>(stored);
  e.stored_hash = jsonlite::get_string(o, "stored_hash");
  e.created_at = static_cast<std::uint64_t>(jsonlite::get_i64(o, "created_at"));
  return e;
}

// Fail-closed read: stored bytes must match their hash, decoded bytes must
// re-key to the digest.
std::optional<std::string> read_verified(const fs::path& blob, const CasEntry& e) {
  auto stored = read_bytes(blob);
  if (!stored || blake3_hex(*stored) != e.stored_hash) return std::nullopt;
  auto original = decode(e, std::move(*stored));
  if (!original || content_key(*original) != e.digest) return std::nullopt;
  return original;
}

}  // namespace

std::string to_string(CasCodec codec) {
  switch (codec) {
    case CasCodec::identity: return "identity";
    case CasCodec::zstd:     return "zstd";
  }
  return "identity";
}

CasCodec parse_codec(std::string_view text) {
  if (text == "off" || text == "identity") return CasCodec::identity;
  if (text == "zstd") {
    if (!cas_zstd_available()) {
      throw ConfigError("zstd compression requested but this build has no zstd support");
    }
    return CasCodec::zstd;
  }
  throw ConfigError("unknown compression '" + std::string(text) + "', expected off|zstd");
}

bool cas_zstd_available() {
#if defined(VARCLIP_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

// ---------------------------------------------------------------------------
// CasStore
// ---------------------------------------------------------------------------

CasStore::CasStore(fs::path root) : root_(std::move(root)) {
  fs::create_directories(root_ / "objects");
}

fs::path CasStore::blob_path(const std::string& digest) const {
  return root_ / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest;
}

fs::path CasStore::sidecar_path(const std::string& digest) const {
  fs::path p = blob_path(digest);
  p += ".meta";
  return p;
}

fs::path CasStore::journal_path() const { return root_ / "journal.ndjson"; }

void CasStore::replay_journal_locked() const {
  if (replayed_) return;
  replayed_ = true;

  std::ifstream ifs(journal_path());
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto o = jsonlite::parse(line, &err);
    if (err) continue;  // torn tail line after a crash
    const std::string op = jsonlite::get_string(o, "op");
    if (op == "put") {
      if (auto e = entry_from_object(o)) entries_[e->digest] = std::move(*e);
    } else if (op == "remove") {
      entries_.erase(jsonlite::get_string(o, "digest"));
    }
  }

  // Blobs deleted behind the store's back are not live.
  for (auto it = entries_.begin(); it != entries_.end();) {
    std::error_code ec;
    if (!fs::exists(blob_path(it->first), ec)) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

bool CasStore::append_journal_locked(std::string_view op, const CasEntry& e) const {
  jsonlite::Object o;
  if (op == "put") o = entry_to_object(e);
  o["op"] = std::string(op);
  o["digest"] = e.digest;
  std::ofstream ofs(journal_path(), std::ios::binary | std::ios::app);
  ofs << jsonlite::to_json(o) << '\n';
  ofs.flush();
  return static_cast<bool>(ofs);
}

const CasEntry* CasStore::lookup_locked(const std::string& digest) const {
  replay_journal_locked();
  if (auto it = entries_.find(digest); it != entries_.end()) return &it->second;

  const auto meta = read_bytes(sidecar_path(digest));
  if (!meta) return nullptr;
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(*meta, &err);
  if (err) return nullptr;
  auto e = entry_from_object(o);
  std::error_code ec;
  if (!e || e->digest != digest || !fs::exists(blob_path(digest), ec)) return nullptr;
  return &entries_.emplace(digest, std::move(*e)).first->second;
}

std::string CasStore::put(std::string_view data, CasCodec codec) {
  const std::string digest = content_key(data);

  std::lock_guard<std::mutex> lk(mu_);

  if (const CasEntry* known = lookup_locked(digest)) {
    // Known content: trust the existing blob only after verifying it.
    const auto existing = read_verified(blob_path(digest), *known);
    return existing && *existing == data ? digest : std::string();
  }

  auto stored = encode(codec, data);
  if (!stored) {
    codec = CasCodec::identity;
    stored = std::string(data);
  }

  CasEntry e;
  e.digest = digest;
  e.codec = codec;
  e.original_size = data.size();
  e.stored_size = stored->size();
  e.stored_hash = blake3_hex(*stored);
  e.created_at = unix_now();

  const fs::path blob = blob_path(digest);
  if (!write_atomically(blob, *stored)) return {};
  if (!write_atomically(sidecar_path(digest), jsonlite::to_json(entry_to_object(e)))) {
    std::error_code ec;
    fs::remove(blob, ec);
    return {};
  }

  if (!append_journal_locked("put", e)) {
    // An unjournaled blob would be invisible to list() and count().
    std::error_code ec;
    fs::remove(blob, ec);
    fs::remove(sidecar_path(digest), ec);
    return {};
  }
  entries_[digest] = e;
  return digest;
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  const auto e = entry(digest);
  if (!e) return std::nullopt;
  return read_verified(blob_path(digest), *e);
}

std::optional<CasEntry> CasStore::entry(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  const CasEntry* e = lookup_locked(digest);
  if (e == nullptr) return std::nullopt;
  return *e;
}

bool CasStore::contains(const std::string& digest) const {
  if (!entry(digest)) return false;
  std::error_code ec;
  return fs::exists(blob_path(digest), ec);
}

bool CasStore::remove(const std::string& digest) {
  if (!is_hex_digest(digest)) return false;

  std::lock_guard<std::mutex> lk(mu_);
  // Journal before deleting: a remove that cannot be recorded leaves the
  // blob in place.
  if (const CasEntry* known = lookup_locked(digest)) {
    if (!append_journal_locked("remove", *known)) return false;
    entries_.erase(digest);
  }

  std::error_code ec;
  fs::remove(blob_path(digest), ec);
  if (ec) return false;
  fs::remove(sidecar_path(digest), ec);
  return !ec;
}

std::vector<CasEntry> CasStore::list(std::size_t limit, const std::string& start_after) const {
  std::lock_guard<std::mutex> lk(mu_);
  replay_journal_locked();
  std::vector<CasEntry> out;
  auto it = start_after.empty() ? entries_.begin() : entries_.upper_bound(start_after);
  for (; it != entries_.end() && (limit == 0 || out.size() < limit); ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::size_t CasStore::count() const {
  std::lock_guard<std::mutex> lk(mu_);
  replay_journal_locked();
  return entries_.size();
}

bool CasStore::compact() {
  std::lock_guard<std::mutex> lk(mu_);
  replay_journal_locked();
  std::ostringstream journal;
  for (const auto& [digest, e] : entries_) {
    jsonlite::Object o = entry_to_object(e);
    o["op"] = "put";
    journal << jsonlite::to_json(o) << '\n';
  }
  return write_atomically(journal_path(), journal.str());
}

}  // namespace varclip
