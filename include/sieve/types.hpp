#pragma once

// sieve/types.hpp - Core data structures for the sieve test-generation environment.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - ProblemRecord instances are owned by ProblemStore and handed out as const&.
//   - ExecutionOutcome / EpisodeResult / StepResult are returned by value.
//
// CONCURRENCY NOTES:
//   - ExecutionOutcome is written by exactly one worker (its own slot) and
//     read only after fan-in. No field is shared between workers.
//   - ProblemRecord is immutable after load, safe for concurrent reads.

#include <cstdint>
#include <string>
#include <vector>

namespace sieve {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  dataset_invalid,
  dataset_empty,
  invalid_state,
  invalid_input,
  episode_timeout,
  sandbox_unavailable,
  config_invalid,
  internal_error,
};

std::string to_string(ErrorCode code);

// Result of one test-suite run against one implementation variant.
enum class OutcomeStatus {
  passed,     // every collected test ran and all assertions held
  failed,     // the suite's assertions failed against the implementation
  errored,    // harness could not run the suite (import/syntax error, signal, memory cap)
  timed_out,  // wall-clock deadline or step cancellation
};

std::string to_string(OutcomeStatus status);

enum class EpisodeState {
  idle,
  awaiting_submission,
  scoring,
  closed,
};

std::string to_string(EpisodeState state);

struct ProblemRecord {
  std::string id;
  std::string source_path;
  std::string spec;
  std::string reference_code;
  std::vector<std::string> perturbations;
  std::string content_digest;  // BLAKE3 over the canonical record, provenance only
};

struct ExecutionOutcome {
  OutcomeStatus status{OutcomeStatus::errored};
  int exit_code{-1};
  int term_signal{0};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_tail;
  std::string stderr_tail;
  std::uint64_t duration_ms{0};
  std::string detail;
};

struct EpisodeResult {
  double reward{0.0};
  bool passed_on_reference{false};
  std::vector<bool> detections;
  double detection_rate{0.0};
  std::size_t num_detected{0};
  std::string result_digest;
};

// What the policy sees. Perturbation sources are never part of it.
struct Observation {
  std::string problem_id;
  std::string spec;
  std::string reference_code;
  std::size_t num_perturbations{0};
  std::uint32_t turn{0};
};

struct StepInfo {
  std::string problem_id;
  bool passed_on_reference{false};
  std::vector<bool> detections;
  double detection_rate{0.0};
  std::uint32_t turn{0};
  std::string suite_digest;
  std::string result_digest;
  ExecutionOutcome reference_outcome;
  std::vector<ExecutionOutcome> perturbation_outcomes;
};

struct StepResult {
  Observation observation;
  double reward{0.0};
  bool terminated{false};
  bool truncated{false};
  StepInfo info;
};

// Sandbox capabilities detected at runtime.
struct SandboxCapabilities {
  bool workspace_confinement{false};
  bool rlimits_cpu{false};
  bool rlimits_mem{false};
  bool rlimits_nproc{false};
  bool rlimits_fds{false};
  bool process_group_kill{false};
  bool user_namespace{false};
  bool network_namespace{false};
  bool mount_namespace{false};
  bool pid_namespace{false};

  std::vector<std::string> enforced() const;
  std::vector<std::string> unsupported() const;
};

std::string outcome_to_json(const ExecutionOutcome& outcome);
std::string observation_to_json(const Observation& obs);
std::string episode_result_to_json(const EpisodeResult& result);
std::string step_result_to_json(const StepResult& step);

// Canonical form used for result_digest. Excludes result_digest itself.
std::string canonicalize_result(const EpisodeResult& result);

}  // namespace sieve
