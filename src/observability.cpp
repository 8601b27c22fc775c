#include "sieve/observability.hpp"

#include <bit>
#include <cstdio>
#include <iostream>

#include "sieve/jsonlite.hpp"

namespace sieve {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::warn)};
std::mutex g_log_mu;
std::atomic<EpisodeEventHook> g_event_hook{nullptr};
std::mutex g_event_log_mu;

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

inline size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string to_string(LogLevel level) { return level_name(level); }

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool parse_log_level(const std::string& name, LogLevel* out) {
  for (LogLevel l : {LogLevel::debug, LogLevel::info, LogLevel::warn, LogLevel::error}) {
    if (name == level_name(l)) {
      *out = l;
      return true;
    }
  }
  return false;
}

void log_message(LogLevel level, const char* component, const std::string& message) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[" << component << "] " << level_name(level) << ": " << message << "\n";
}

std::string episode_event_to_json(const EpisodeEvent& ev) {
  std::string line;
  line.reserve(384);
  line += "{\"problem_id\":\"";
  line += jsonlite::escape(ev.problem_id);
  line += "\",\"suite_digest\":\"";
  line += ev.suite_digest;
  line += "\",\"result_digest\":\"";
  line += ev.result_digest;
  line += "\",\"backend\":\"";
  line += ev.backend;
  line += "\",\"turn\":";
  line += std::to_string(ev.turn);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"reward\":";
  line += jsonlite::format_double(ev.reward);
  line += ",\"passed_on_reference\":";
  line += ev.passed_on_reference ? "true" : "false";
  line += ",\"num_perturbations\":";
  line += std::to_string(ev.num_perturbations);
  line += ",\"num_detected\":";
  line += std::to_string(ev.num_detected);
  line += ",\"outcomes\":{\"passed\":";
  line += std::to_string(ev.passed);
  line += ",\"failed\":";
  line += std::to_string(ev.failed);
  line += ",\"errored\":";
  line += std::to_string(ev.errored);
  line += ",\"timed_out\":";
  line += std::to_string(ev.timed_out);
  line += "},\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"suite_bytes\":";
  line += std::to_string(ev.suite_bytes);
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", mean_us() / 1000.0);
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EnvStats
// ---------------------------------------------------------------------------

void EnvStats::record(const EpisodeEvent& ev) {
  total_steps.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    scored_steps.fetch_add(1, std::memory_order_relaxed);
    if (!ev.passed_on_reference) gated_steps.fetch_add(1, std::memory_order_relaxed);
    if (ev.reward >= 1.0) perfect_steps.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == to_string(ErrorCode::episode_timeout)) {
    episode_timeouts.fetch_add(1, std::memory_order_relaxed);
  } else {
    infrastructure_errors.fetch_add(1, std::memory_order_relaxed);
  }
  outcomes_passed.fetch_add(ev.passed, std::memory_order_relaxed);
  outcomes_failed.fetch_add(ev.failed, std::memory_order_relaxed);
  outcomes_errored.fetch_add(ev.errored, std::memory_order_relaxed);
  outcomes_timed_out.fetch_add(ev.timed_out, std::memory_order_relaxed);
  step_latency.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<EpisodeEvent> EnvStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<EpisodeEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EnvStats::to_json() const {
  std::string out;
  out.reserve(512);
  const std::uint64_t scored = scored_steps.load(std::memory_order_relaxed);
  const double gate_rate = scored > 0
      ? static_cast<double>(gated_steps.load(std::memory_order_relaxed)) / static_cast<double>(scored)
      : 0.0;

  out += "{\"total_steps\":";
  out += std::to_string(total_steps.load(std::memory_order_relaxed));
  out += ",\"scored_steps\":";
  out += std::to_string(scored);
  out += ",\"gated_steps\":";
  out += std::to_string(gated_steps.load(std::memory_order_relaxed));
  out += ",\"gate_rate\":";
  out += jsonlite::format_double(gate_rate);
  out += ",\"perfect_steps\":";
  out += std::to_string(perfect_steps.load(std::memory_order_relaxed));
  out += ",\"episode_timeouts\":";
  out += std::to_string(episode_timeouts.load(std::memory_order_relaxed));
  out += ",\"infrastructure_errors\":";
  out += std::to_string(infrastructure_errors.load(std::memory_order_relaxed));
  out += ",\"outcomes\":{\"passed\":";
  out += std::to_string(outcomes_passed.load(std::memory_order_relaxed));
  out += ",\"failed\":";
  out += std::to_string(outcomes_failed.load(std::memory_order_relaxed));
  out += ",\"errored\":";
  out += std::to_string(outcomes_errored.load(std::memory_order_relaxed));
  out += ",\"timed_out\":";
  out += std::to_string(outcomes_timed_out.load(std::memory_order_relaxed));
  out += "},\"step_latency\":";
  out += step_latency.to_json();
  out += "}";
  return out;
}

EnvStats& global_env_stats() {
  static EnvStats inst;
  return inst;
}

void set_episode_event_hook(EpisodeEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_episode_event(const EpisodeEvent& ev, const std::string& event_log_path) {
  global_env_stats().record(ev);

  EpisodeEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }
  if (event_log_path.empty()) return;

  const std::string line = episode_event_to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  FILE* f = std::fopen(event_log_path.c_str(), "a");
  if (!f) {
    log_warn("events", "cannot open event log " + event_log_path);
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    log_warn("events", "short write to event log " + event_log_path);
  }
  std::fclose(f);
}

}  // namespace sieve
