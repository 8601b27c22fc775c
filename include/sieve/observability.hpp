#pragma once

// sieve/observability.hpp - Logging, per-step events and process statistics.
//
// DESIGN:
//   - Human-readable log lines go to stderr as "[component] message", filtered
//     by a process-wide LogLevel.
//   - Every EpisodeController::step() emits one EpisodeEvent. The event is
//     recorded in EnvStats, passed to the registered hook if any, and
//     otherwise appended as one JSONL line to the event log path taken from
//     EnvConfig. There is no environment-variable activation.
//   - Event emission never throws into step(). A failed log append is
//     reported on stderr and dropped.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "sieve/types.hpp"

namespace sieve {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
void set_log_level(LogLevel level);
// Returns false and leaves *out untouched for unknown names.
bool parse_log_level(const std::string& name, LogLevel* out);

void log_message(LogLevel level, const char* component, const std::string& message);

inline void log_debug(const char* component, const std::string& m) { log_message(LogLevel::debug, component, m); }
inline void log_info(const char* component, const std::string& m) { log_message(LogLevel::info, component, m); }
inline void log_warn(const char* component, const std::string& m) { log_message(LogLevel::warn, component, m); }
inline void log_error(const char* component, const std::string& m) { log_message(LogLevel::error, component, m); }

// ---------------------------------------------------------------------------
// EpisodeEvent - one per step() call, successful or not.
// ---------------------------------------------------------------------------
struct EpisodeEvent {
  std::string problem_id;
  std::string suite_digest;
  std::string result_digest;
  std::string backend;
  std::uint32_t turn{0};

  bool ok{false};             // false when step() raised
  std::string error_code;     // to_string(ErrorCode) when !ok

  double reward{0.0};
  bool passed_on_reference{false};
  std::size_t num_perturbations{0};
  std::size_t num_detected{0};

  // Outcome counts over all N+1 executions.
  std::size_t passed{0};
  std::size_t failed{0};
  std::size_t errored{0};
  std::size_t timed_out{0};

  std::uint64_t duration_ns{0};
  std::size_t suite_bytes{0};
};

std::string episode_event_to_json(const EpisodeEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets.
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) us; bucket 0 covers [0, 1) us.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 with no samples.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EnvStats - process-wide aggregated statistics. Thread-safe.
// ---------------------------------------------------------------------------
class EnvStats {
 public:
  void record(const EpisodeEvent& ev);
  std::string to_json() const;

  std::atomic<std::uint64_t> total_steps{0};
  std::atomic<std::uint64_t> scored_steps{0};
  std::atomic<std::uint64_t> gated_steps{0};        // suite failed on the reference
  std::atomic<std::uint64_t> perfect_steps{0};      // reward == 1.0
  std::atomic<std::uint64_t> episode_timeouts{0};
  std::atomic<std::uint64_t> infrastructure_errors{0};

  std::atomic<std::uint64_t> outcomes_passed{0};
  std::atomic<std::uint64_t> outcomes_failed{0};
  std::atomic<std::uint64_t> outcomes_errored{0};
  std::atomic<std::uint64_t> outcomes_timed_out{0};

  LatencyHistogram step_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  // Oldest first.
  std::vector<EpisodeEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<EpisodeEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

EnvStats& global_env_stats();

using EpisodeEventHook = void (*)(const EpisodeEvent&);
void set_episode_event_hook(EpisodeEventHook hook);

// Records ev in global_env_stats(), then forwards it to the hook, or appends it
// to event_log_path when no hook is set and the path is non-empty.
void emit_episode_event(const EpisodeEvent& ev, const std::string& event_log_path);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace sieve
