#include "varclip/execution_store.hpp"

#include <utility>

namespace varclip {

ExecutionStore::ExecutionStore(std::shared_ptr<const OffloadCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {}

void ExecutionStore::save(NodeExecution& execution) {
  // Uploads happen outside the lock; they may be slow and may throw.
  PersistedExecution record = coordinator_->to_persisted(execution);

  std::lock_guard<std::mutex> lock(mu_);
  offloads_.erase(record.id);
  if (record.offload) offloads_[record.id] = *record.offload;
  executions_[record.id] = std::move(record);
}

std::optional<NodeExecution> ExecutionStore::get(const std::string& id) const {
  auto record = get_persisted(id);
  if (!record) return std::nullopt;
  return coordinator_->to_domain(*record);
}

std::optional<PersistedExecution> ExecutionStore::get_persisted(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = executions_.find(id);
  if (it == executions_.end()) return std::nullopt;
  return it->second;
}

std::optional<OffloadRecord> ExecutionStore::offload_record(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = offloads_.find(id);
  if (it == offloads_.end()) return std::nullopt;
  return it->second;
}

bool ExecutionStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (executions_.erase(id) == 0) return false;
  offloads_.erase(id);
  return true;
}

std::optional<jsonlite::Object> ExecutionStore::recover_inputs(const std::string& id) const {
  const auto rec = offload_record(id);
  if (!rec || !rec->inputs_file_id) return std::nullopt;
  return coordinator_->recover(*rec->inputs_file_id);
}

std::optional<jsonlite::Object> ExecutionStore::recover_outputs(const std::string& id) const {
  const auto rec = offload_record(id);
  if (!rec || !rec->outputs_file_id) return std::nullopt;
  return coordinator_->recover(*rec->outputs_file_id);
}

std::size_t ExecutionStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return executions_.size();
}

std::size_t ExecutionStore::offload_record_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return offloads_.size();
}

std::vector<std::string> ExecutionStore::ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(executions_.size());
  for (const auto& [id, record] : executions_) out.push_back(id);
  return out;
}

}  // namespace varclip
