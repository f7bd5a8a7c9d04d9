#pragma once

// varclip/offload.hpp — Offload boundary between executions and persistence.
//
// DATA FLOW (write side):
//   NodeExecution.inputs / .outputs
//     -> estimate each field independently
//     -> over threshold: truncate inline copy (with "__truncated__" marker)
//                        and upload compact JSON of the original, once
//     -> PersistedExecution {inline payloads, optional OffloadRecord}
//
// DATA FLOW (read side):
//   PersistedExecution -> NodeExecution. A field counts as truncated exactly
//   when its file id is present in the OffloadRecord.
//
// DESIGN INVARIANTS:
//   1. All-or-nothing: every upload for an execution completes before the
//      execution is touched or a record is returned. A failing upload throws
//      StorageError and the caller persists nothing.
//   2. The OffloadRecord exists iff at least one field was offloaded.
//   3. Inline payloads stay within truncator.max_size_bytes. The marker entry
//      is paid for by shrinking the truncation budget by kMarkerReserve.
//   4. Uploads are synchronous and never retried here.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "varclip/cas.hpp"
#include "varclip/jsonlite.hpp"
#include "varclip/truncator.hpp"

namespace varclip {

inline constexpr std::string_view kTruncatedMarker = "__truncated__";

// Encoded cost of `,"__truncated__":true`.
inline constexpr std::size_t kMarkerReserve = 1 + kTruncatedMarker.size() + 2 + 1 + 4;

// ---------------------------------------------------------------------------
// IBlobStorage — external blob collaborator
// ---------------------------------------------------------------------------
class IBlobStorage {
 public:
  virtual ~IBlobStorage() = default;

  // Persist raw bytes and return an opaque file id. Throws StorageError.
  virtual std::string upload(const std::string& raw_bytes) = 0;

  // nullopt when the id is unknown or the blob fails integrity checks.
  virtual std::optional<std::string> fetch(const std::string& file_id) const = 0;
};

// File id = CAS digest of the uploaded bytes.
class CasBlobStorage : public IBlobStorage {
 public:
  explicit CasBlobStorage(std::shared_ptr<ICASBackend> backend,
                          CasCodec codec = CasCodec::identity);

  std::string upload(const std::string& raw_bytes) override;
  std::optional<std::string> fetch(const std::string& file_id) const override;

 private:
  std::shared_ptr<ICASBackend> backend_;
  CasCodec codec_;
};

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------
struct OffloadRecord {
  std::string execution_id;
  std::optional<std::string> inputs_file_id;
  std::optional<std::string> outputs_file_id;
};

struct NodeExecution {
  std::string id;
  std::string node_id;
  std::string title;
  std::optional<jsonlite::Object> inputs;
  std::optional<jsonlite::Object> outputs;

  // Set by the coordinator; present only for fields that were offloaded.
  std::optional<jsonlite::Object> truncated_inputs;
  std::optional<jsonlite::Object> truncated_outputs;
};

struct PersistedExecution {
  std::string id;
  std::string node_id;
  std::string title;
  std::optional<jsonlite::Object> inputs;   // inline, possibly truncated
  std::optional<jsonlite::Object> outputs;  // inline, possibly truncated
  std::optional<OffloadRecord> offload;

  bool inputs_truncated() const { return offload && offload->inputs_file_id.has_value(); }
  bool outputs_truncated() const { return offload && offload->outputs_file_id.has_value(); }
};

struct OffloadConfig {
  std::size_t threshold_bytes{kLargeVariableThreshold};
  TruncatorConfig truncator;

  // TruncatorConfig::from_env() plus VARCLIP_OFFLOAD_THRESHOLD.
  static OffloadConfig from_env();
};

// ---------------------------------------------------------------------------
// OffloadCoordinator
// ---------------------------------------------------------------------------
// Immutable after construction; safe to share across threads as long as the
// storage implementation is.
class OffloadCoordinator {
 public:
  // Throws ConfigError when the truncator config is invalid or leaves no room
  // for the marker (max_size_bytes <= kMarkerReserve).
  OffloadCoordinator(std::shared_ptr<IBlobStorage> storage, OffloadConfig config = {});

  const OffloadConfig& config() const noexcept { return config_; }

  // Inline-safe copy of one payload field. Unchanged when within threshold.
  Clipped<jsonlite::Object> truncate_payload(const jsonlite::Object& payload) const;

  // On success also sets execution.truncated_inputs / truncated_outputs.
  PersistedExecution to_persisted(NodeExecution& execution) const;

  NodeExecution to_domain(const PersistedExecution& record) const;

  // The untruncated original behind a file id.
  std::optional<jsonlite::Object> recover(const std::string& file_id) const;

 private:
  struct Shrunk {
    jsonlite::Object value;
    bool truncated{false};
    bool collapsed{false};
  };
  Shrunk shrink(const jsonlite::Object& payload) const;

  std::shared_ptr<IBlobStorage> storage_;
  OffloadConfig config_;
  VariableTruncator inline_truncator_;
};

}  // namespace varclip
