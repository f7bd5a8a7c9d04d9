#pragma once

// varclip/execution_store.hpp — In-memory execution table with offload records.
//
// Models the persistence layer's contract: an execution row and its offload
// row are written together, and deleting the execution deletes its offload
// row (cascade). Blobs in storage are content addressed and may be shared
// between executions, so they are not removed.

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "varclip/offload.hpp"

namespace varclip {

class ExecutionStore {
 public:
  explicit ExecutionStore(std::shared_ptr<const OffloadCoordinator> coordinator);

  // Runs the coordinator and commits the record and its offload record
  // together. Nothing is stored when an upload throws. Replaces any existing
  // record with the same id.
  void save(NodeExecution& execution);

  std::optional<NodeExecution> get(const std::string& id) const;
  std::optional<PersistedExecution> get_persisted(const std::string& id) const;
  std::optional<OffloadRecord> offload_record(const std::string& id) const;

  // Returns false when the id is unknown.
  bool remove(const std::string& id);

  std::optional<jsonlite::Object> recover_inputs(const std::string& id) const;
  std::optional<jsonlite::Object> recover_outputs(const std::string& id) const;

  std::size_t size() const;
  std::size_t offload_record_count() const;
  std::vector<std::string> ids() const;

 private:
  std::shared_ptr<const OffloadCoordinator> coordinator_;
  mutable std::mutex mu_;
  std::map<std::string, PersistedExecution> executions_;
  std::map<std::string, OffloadRecord> offloads_;  // keyed by execution id
};

}  // namespace varclip
