#pragma once

// sieve/coordinator.hpp - Fan-out of one suite to N+1 implementations.
//
// FAN-OUT / FAN-IN:
//   Slot 0 is the reference implementation, slots 1..N the perturbations in
//   record order. Each task writes only its own slot, so completion order
//   never affects the result. Every slot is populated; one failing execution
//   never cancels the others.
//
// STEP DEADLINE:
//   ceil((N+1) / parallelism) * execution_timeout + step_slack. On expiry the
//   shared CancelToken is raised, running sandboxes are killed through their
//   normal teardown path, queued tasks complete immediately as cancelled, and
//   run() throws EpisodeTimeoutError only after every task has drained.
//
// ERRORS:
//   Exceptions from a task (infrastructure, caller bugs) are captured per slot
//   and the lowest-index one is rethrown after fan-in.

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sieve/sandbox.hpp"
#include "sieve/types.hpp"
#include "sieve/worker_pool.hpp"

namespace sieve {

struct CoordinatedOutcomes {
  ExecutionOutcome reference;
  std::vector<ExecutionOutcome> perturbations;  // index-aligned with ProblemRecord::perturbations
};

struct CoordinatorOptions {
  std::chrono::milliseconds execution_timeout{30000};
  std::chrono::milliseconds step_slack{10000};
  std::size_t parallelism{4};
  std::size_t max_suite_bytes{1 * 1024 * 1024};

  static CoordinatorOptions from_config(const EnvConfig& config);
};

class ExecutionCoordinator {
 public:
  ExecutionCoordinator(std::shared_ptr<SandboxRunner> runner, CoordinatorOptions options);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // Throws InvalidInputError for a problem without perturbations,
  // EpisodeTimeoutError when the step deadline passes, InvalidStateError
  // after shutdown(), or whatever a task raised.
  CoordinatedOutcomes run(const std::string& test_suite, const ProblemRecord& problem);

  std::chrono::milliseconds step_budget(std::size_t executions) const;

  // Joins the worker threads. Idempotent.
  void shutdown();

  const CoordinatorOptions& options() const { return options_; }

 private:
  std::shared_ptr<SandboxRunner> runner_;
  CoordinatorOptions options_;
  WorkerPool pool_;
};

}  // namespace sieve
