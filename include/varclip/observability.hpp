#pragma once

// varclip/observability.hpp — Structured truncation observability layer.
//
// DESIGN:
//   TruncationEvent is the canonical observable unit. The offload coordinator
//   emits one per payload field it persists, and the CLI emits one per
//   truncate command. The truncator itself stays pure and emits nothing.
//   Each event is:
//     - recorded into the process-wide TruncationStats (always);
//     - handed to a registered hook if one is set; otherwise
//     - appended as one JSONL line to $VARCLIP_EVENT_LOG when that is set.
//
// Events carry sizes, flags and digests only. Payload content never reaches
// the event sink.
//
// EXTENSION_POINT: metrics_exporter
//   Current: in-process atomics plus a JSONL file sink.
//   Upgrade path: register a hook that forwards events to a metrics pipeline.
//   Invariant: event emission must never throw into the persistence path.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace varclip {

// ---------------------------------------------------------------------------
// TruncationEvent — per-field observable unit
// ---------------------------------------------------------------------------
struct TruncationEvent {
  std::string field;            // "inputs", "outputs", or "value" for the CLI
  std::string segment_type;     // to_string(SegmentType) of the input

  // Sizes (estimated compact JSON bytes)
  std::size_t original_bytes{0};
  std::size_t result_bytes{0};

  // Outcome
  bool truncated{false};
  bool collapsed{false};        // structured result replaced by a string
  bool offloaded{false};        // original uploaded to blob storage
  std::string file_id;          // blob id when offloaded

  uint64_t duration_ns{0};
  std::string error_code;       // to_string(ErrorCode), empty on success
};

// ---------------------------------------------------------------------------
// LatencyHistogram — log2 microsecond buckets
// ---------------------------------------------------------------------------
// Bucket 0 holds sub-microsecond samples; bucket b > 0 holds [2^(b-1), 2^b) us.
// The last bucket absorbs everything above its lower bound.
struct LatencySnapshot {
  uint64_t count{0};
  double mean_us{0.0};
  double p50_us{0.0};
  double p95_us{0.0};
  double p99_us{0.0};
};

class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Upper bound of the bucket holding the p-quantile, p in [0, 1].
  // Microseconds; 0.0 when nothing was recorded.
  double percentile(double p) const;

  uint64_t count() const { return samples_.load(std::memory_order_relaxed); }
  double mean_us() const;
  LatencySnapshot snapshot() const;
  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  // MICRO_DOCUMENTED: the totals sit on their own cache line; every record()
  // touches them, while bucket writes spread across the array.
  alignas(64) std::atomic<uint64_t> samples_{0};
  std::atomic<uint64_t> total_us_{0};
};

// ---------------------------------------------------------------------------
// TruncationStats — global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic and relaxed; to_json() is a snapshot,
// not a consistent cut.
class TruncationStats {
 public:
  void record(const TruncationEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_events{0};
  alignas(64) std::atomic<uint64_t> truncated_events{0};
  alignas(64) std::atomic<uint64_t> collapsed_events{0};
  alignas(64) std::atomic<uint64_t> offloaded_events{0};
  alignas(64) std::atomic<uint64_t> failed_events{0};

  alignas(64) std::atomic<uint64_t> bytes_in{0};
  alignas(64) std::atomic<uint64_t> bytes_out{0};

  LatencyHistogram latency_histogram;
};

TruncationStats& global_truncation_stats();

// Record into global stats, then dispatch to the hook or the JSONL sink.
void emit_truncation_event(const TruncationEvent& ev);

// Replaces the JSONL sink while set. Pass nullptr to restore it.
using TruncationEventHook = void (*)(const TruncationEvent&);
void set_truncation_event_hook(TruncationEventHook hook);

std::string to_json(const TruncationEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer — writes the elapsed steady-clock time to a caller's field
// ---------------------------------------------------------------------------
class ScopeTimer {
 public:
  explicit ScopeTimer(uint64_t& sink_ns) : sink_ns_(sink_ns), started_(std::chrono::steady_clock::now()) {}
  ~ScopeTimer() { sink_ns_ = elapsed_ns(); }

  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;

  uint64_t elapsed_ns() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now() - started_)
                                     .count());
  }

 private:
  uint64_t& sink_ns_;
  std::chrono::steady_clock::time_point started_;
};

}  // namespace varclip
