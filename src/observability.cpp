#include "varclip/observability.hpp"

#include <bit>
#include <cstdlib>
#include <fstream>

#include "varclip/jsonlite.hpp"

namespace varclip {

namespace {

// MICRO_OPT: std::bit_width is a single CLZ/BSR; bucket = floor(log2(us)) + 1.
size_t bucket_index(uint64_t us) {
  const auto width = static_cast<size_t>(std::bit_width(us));
  return width < LatencyHistogram::kBuckets ? width : LatencyHistogram::kBuckets - 1;
}

double bucket_upper_us(size_t bucket) {
  return bucket == 0 ? 1.0 : static_cast<double>(uint64_t{1} << bucket);
}

jsonlite::Value counter(const std::atomic<uint64_t>& c) {
  return static_cast<std::int64_t>(c.load(std::memory_order_relaxed));
}

jsonlite::Object snapshot_object(const LatencySnapshot& s) {
  jsonlite::Object o;
  o["count"] = static_cast<std::int64_t>(s.count);
  o["mean_us"] = s.mean_us;
  o["p50_us"] = s.p50_us;
  o["p95_us"] = s.p95_us;
  o["p99_us"] = s.p99_us;
  return o;
}

std::atomic<TruncationEventHook> g_hook{nullptr};

void append_to_event_log(const TruncationEvent& ev) {
  const char* path = std::getenv("VARCLIP_EVENT_LOG");
  if (path == nullptr || *path == '\0') return;
  // One write per line; O_APPEND keeps concurrent small lines whole.
  std::ofstream log(path, std::ios::binary | std::ios::app);
  log << to_json(ev) << '\n';
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000;
  buckets_[bucket_index(us)].fetch_add(1, std::memory_order_relaxed);
  samples_.fetch_add(1, std::memory_order_relaxed);
  total_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count();
  return n == 0 ? 0.0
                : static_cast<double>(total_us_.load(std::memory_order_relaxed)) /
                      static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count();
  if (n == 0) return 0.0;
  // Rank of the sample that answers the query, 1-based.
  uint64_t rank = static_cast<uint64_t>(p * static_cast<double>(n));
  if (rank == 0) rank = 1;

  uint64_t seen = 0;
  for (size_t b = 0; b < kBuckets; ++b) {
    seen += buckets_[b].load(std::memory_order_relaxed);
    if (seen >= rank) return bucket_upper_us(b);
  }
  // Buckets were bumped before the sample counter caught up.
  return bucket_upper_us(kBuckets - 1);
}

LatencySnapshot LatencyHistogram::snapshot() const {
  LatencySnapshot s;
  s.count = count();
  s.mean_us = mean_us();
  s.p50_us = percentile(0.50);
  s.p95_us = percentile(0.95);
  s.p99_us = percentile(0.99);
  return s;
}

std::string LatencyHistogram::to_json() const {
  return jsonlite::to_json(snapshot_object(snapshot()));
}

// ---------------------------------------------------------------------------
// TruncationStats
// ---------------------------------------------------------------------------

void TruncationStats::record(const TruncationEvent& ev) {
  const auto bump = [](std::atomic<uint64_t>& c, uint64_t by = 1) {
    c.fetch_add(by, std::memory_order_relaxed);
  };
  bump(total_events);
  if (ev.truncated) bump(truncated_events);
  if (ev.collapsed) bump(collapsed_events);
  if (ev.offloaded) bump(offloaded_events);
  if (!ev.error_code.empty()) bump(failed_events);
  bump(bytes_in, ev.original_bytes);
  bump(bytes_out, ev.result_bytes);
  latency_histogram.record(ev.duration_ns);
}

std::string TruncationStats::to_json() const {
  const auto in = bytes_in.load(std::memory_order_relaxed);
  const auto out = bytes_out.load(std::memory_order_relaxed);

  jsonlite::Object bytes;
  bytes["in"] = static_cast<std::int64_t>(in);
  bytes["out"] = static_cast<std::int64_t>(out);
  bytes["reduction_ratio"] =
      in == 0 ? 0.0 : 1.0 - static_cast<double>(out) / static_cast<double>(in);

  jsonlite::Object o;
  o["total_events"] = counter(total_events);
  o["truncated_events"] = counter(truncated_events);
  o["collapsed_events"] = counter(collapsed_events);
  o["offloaded_events"] = counter(offloaded_events);
  o["failed_events"] = counter(failed_events);
  o["bytes"] = bytes;
  o["latency"] = snapshot_object(latency_histogram.snapshot());
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

TruncationStats& global_truncation_stats() {
  static TruncationStats stats;
  return stats;
}

void set_truncation_event_hook(TruncationEventHook hook) {
  g_hook.store(hook, std::memory_order_release);
}

std::string to_json(const TruncationEvent& ev) {
  jsonlite::Object o;
  o["field"] = ev.field;
  o["segment_type"] = ev.segment_type;
  o["original_bytes"] = static_cast<std::int64_t>(ev.original_bytes);
  o["result_bytes"] = static_cast<std::int64_t>(ev.result_bytes);
  o["truncated"] = ev.truncated;
  o["collapsed"] = ev.collapsed;
  o["offloaded"] = ev.offloaded;
  o["file_id"] = ev.file_id;
  o["duration_ns"] = static_cast<std::int64_t>(ev.duration_ns);
  o["error_code"] = ev.error_code;
  return jsonlite::to_json(o);
}

void emit_truncation_event(const TruncationEvent& ev) {
  global_truncation_stats().record(ev);
  if (const TruncationEventHook hook = g_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_to_event_log(ev);
}

}  // namespace varclip
