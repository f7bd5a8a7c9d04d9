#include "varclip/offload.hpp"

#include <cstdlib>
#include <utility>

#include "varclip/observability.hpp"
#include "varclip/size_estimator.hpp"
#include "varclip/types.hpp"

namespace varclip {

namespace {

TruncatorConfig inline_config(const OffloadConfig& config) {
  config.truncator.validate();
  if (config.truncator.max_size_bytes <= kMarkerReserve) {
    throw ConfigError("max_size_bytes must be > " + std::to_string(kMarkerReserve) +
                      " to fit the truncation marker, got " +
                      std::to_string(config.truncator.max_size_bytes));
  }
  TruncatorConfig cfg = config.truncator;
  cfg.max_size_bytes -= kMarkerReserve;
  return cfg;
}

// Per-field plan computed before any side effect.
struct FieldPlan {
  const char* name;
  const std::optional<jsonlite::Object>* original;
  bool offload{false};
  jsonlite::Object inline_value;
  bool collapsed{false};
  std::size_t original_bytes{0};
  uint64_t duration_ns{0};
  std::string file_id;
};

TruncationEvent make_event(const FieldPlan& plan) {
  TruncationEvent ev;
  ev.field = plan.name;
  ev.segment_type = to_string(SegmentType::object);
  ev.original_bytes = plan.original_bytes;
  ev.truncated = plan.offload;
  ev.collapsed = plan.collapsed;
  ev.offloaded = !plan.file_id.empty();
  ev.file_id = plan.file_id;
  ev.duration_ns = plan.duration_ns;
  return ev;
}

}  // namespace

// ---------------------------------------------------------------------------
// CasBlobStorage
// ---------------------------------------------------------------------------

CasBlobStorage::CasBlobStorage(std::shared_ptr<ICASBackend> backend, CasCodec codec)
    : backend_(std::move(backend)), codec_(codec) {}

std::string CasBlobStorage::upload(const std::string& raw_bytes) {
  const std::string digest = backend_->put(raw_bytes, codec_);
  if (digest.empty()) {
    throw StorageError(backend_->backend_id() + ": put failed for " +
                       std::to_string(raw_bytes.size()) + " bytes");
  }
  return digest;
}

std::optional<std::string> CasBlobStorage::fetch(const std::string& file_id) const {
  return backend_->get(file_id);
}

// ---------------------------------------------------------------------------
// OffloadConfig
// ---------------------------------------------------------------------------

OffloadConfig OffloadConfig::from_env() {
  OffloadConfig cfg;
  cfg.truncator = TruncatorConfig::from_env();
  if (const char* e = std::getenv("VARCLIP_OFFLOAD_THRESHOLD")) {
    cfg.threshold_bytes = parse_limit("VARCLIP_OFFLOAD_THRESHOLD", e);
  }
  return cfg;
}

// ---------------------------------------------------------------------------
// OffloadCoordinator
// ---------------------------------------------------------------------------

OffloadCoordinator::OffloadCoordinator(std::shared_ptr<IBlobStorage> storage,
                                       OffloadConfig config)
    : storage_(std::move(storage)),
      config_(std::move(config)),
      inline_truncator_(inline_config(config_)) {}

OffloadCoordinator::Shrunk OffloadCoordinator::shrink(const jsonlite::Object& payload) const {
  jsonlite::Object source = payload;
  // A caller-supplied marker key would be overwritten below; drop it first so
  // its size is not counted twice.
  source.erase(std::string(kTruncatedMarker));

  const auto res = inline_truncator_.truncate(
      Segment{SegmentType::object, jsonlite::Value{std::move(source)}});

  Shrunk out;
  out.truncated = true;
  if (const auto* obj = std::get_if<jsonlite::Object>(&res.result.value.v)) {
    out.value = *obj;
    out.value[std::string(kTruncatedMarker)] = true;
  } else {
    // Collapsed to a string preview.
    out.collapsed = true;
    out.value[std::string(kTruncatedMarker)] = res.result.value;
  }
  return out;
}

Clipped<jsonlite::Object> OffloadCoordinator::truncate_payload(
    const jsonlite::Object& payload) const {
  if (estimate_json_size(payload) <= config_.threshold_bytes) return {payload, false};
  auto shrunk = shrink(payload);
  return {std::move(shrunk.value), shrunk.truncated};
}

PersistedExecution OffloadCoordinator::to_persisted(NodeExecution& execution) const {
  FieldPlan plans[] = {
      {"inputs", &execution.inputs},
      {"outputs", &execution.outputs},
  };

  // 1. Plan: estimates and inline copies. No side effects yet.
  for (auto& plan : plans) {
    if (!plan.original->has_value()) continue;
    ScopeTimer timer(plan.duration_ns);
    const jsonlite::Object& original = **plan.original;
    plan.original_bytes = estimate_json_size(original);
    if (plan.original_bytes <= config_.threshold_bytes) continue;
    auto shrunk = shrink(original);
    plan.offload = true;
    plan.collapsed = shrunk.collapsed;
    plan.inline_value = std::move(shrunk.value);
  }

  // 2. Upload every offloaded original, exactly once each.
  for (auto& plan : plans) {
    if (!plan.offload) continue;
    try {
      plan.file_id = storage_->upload(jsonlite::to_json(jsonlite::Value{**plan.original}));
    } catch (const Error& e) {
      TruncationEvent ev = make_event(plan);
      ev.error_code = to_string(e.code());
      emit_truncation_event(ev);
      throw;
    }
  }

  // 3. Commit: nothing below can fail.
  PersistedExecution record;
  record.id = execution.id;
  record.node_id = execution.node_id;
  record.title = execution.title;

  OffloadRecord offload;
  offload.execution_id = execution.id;
  std::optional<jsonlite::Object>* inline_fields[] = {&record.inputs, &record.outputs};
  std::optional<std::string>* file_ids[] = {&offload.inputs_file_id, &offload.outputs_file_id};
  std::optional<jsonlite::Object>* truncated_fields[] = {&execution.truncated_inputs,
                                                         &execution.truncated_outputs};

  for (std::size_t i = 0; i < 2; ++i) {
    FieldPlan& plan = plans[i];
    if (!plan.original->has_value()) continue;
    TruncationEvent ev = make_event(plan);
    if (plan.offload) {
      *file_ids[i] = plan.file_id;
      *truncated_fields[i] = plan.inline_value;
      *inline_fields[i] = std::move(plan.inline_value);
    } else {
      *inline_fields[i] = **plan.original;
      truncated_fields[i]->reset();
    }
    ev.result_bytes = estimate_json_size(**inline_fields[i]);
    emit_truncation_event(ev);
  }

  if (offload.inputs_file_id || offload.outputs_file_id) {
    record.offload = std::move(offload);
  }
  return record;
}

NodeExecution OffloadCoordinator::to_domain(const PersistedExecution& record) const {
  NodeExecution execution;
  execution.id = record.id;
  execution.node_id = record.node_id;
  execution.title = record.title;
  execution.inputs = record.inputs;
  execution.outputs = record.outputs;
  if (record.inputs_truncated()) execution.truncated_inputs = record.inputs;
  if (record.outputs_truncated()) execution.truncated_outputs = record.outputs;
  return execution;
}

std::optional<jsonlite::Object> OffloadCoordinator::recover(const std::string& file_id) const {
  const auto raw = storage_->fetch(file_id);
  if (!raw) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*raw, &err);
  if (err) return std::nullopt;
  return obj;
}

}  // namespace varclip
