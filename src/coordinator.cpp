#include "sieve/coordinator.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>

#include "sieve/errors.hpp"
#include "sieve/observability.hpp"

namespace sieve {

namespace {

// Shared between run() and its tasks. Tasks hold a reference count so the
// state stays valid even if a task is still unwinding when run() returns.
struct FanIn {
  std::string suite;
  CancelToken cancel;
  std::mutex mu;
  std::condition_variable cv;
  std::size_t remaining{0};
  std::vector<ExecutionOutcome> slots;
  std::vector<std::exception_ptr> errors;
};

ExecutionOutcome not_executed(const std::string& detail, OutcomeStatus status) {
  ExecutionOutcome o;
  o.status = status;
  o.detail = detail;
  return o;
}

}  // namespace

CoordinatorOptions CoordinatorOptions::from_config(const EnvConfig& c) {
  CoordinatorOptions o;
  o.execution_timeout = std::chrono::milliseconds(c.execution_timeout_ms);
  o.step_slack = std::chrono::milliseconds(c.step_timeout_slack_ms);
  o.parallelism = c.parallelism;
  o.max_suite_bytes = c.max_suite_bytes;
  return o;
}

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<SandboxRunner> runner,
                                           CoordinatorOptions options)
    : runner_(std::move(runner)), options_(options), pool_(options.parallelism) {
  if (!runner_) throw InvalidInputError("coordinator requires a sandbox runner");
}

ExecutionCoordinator::~ExecutionCoordinator() { shutdown(); }

void ExecutionCoordinator::shutdown() { pool_.shutdown(); }

std::chrono::milliseconds ExecutionCoordinator::step_budget(std::size_t executions) const {
  const std::size_t width = pool_.size();
  const std::size_t waves = (executions + width - 1) / width;
  return options_.execution_timeout * static_cast<long long>(waves) + options_.step_slack;
}

CoordinatedOutcomes ExecutionCoordinator::run(const std::string& test_suite,
                                              const ProblemRecord& problem) {
  const std::size_t n = problem.perturbations.size();
  if (n == 0) throw InvalidInputError("problem " + problem.id + " has no perturbations");

  CoordinatedOutcomes out;
  if (test_suite.size() > options_.max_suite_bytes) {
    log_info("coordinator", "suite of " + std::to_string(test_suite.size()) +
                                " bytes exceeds max_suite_bytes, not executed");
    out.reference = not_executed("suite_too_large", OutcomeStatus::errored);
    out.perturbations.assign(n, out.reference);
    return out;
  }

  const std::size_t total = n + 1;
  auto state = std::make_shared<FanIn>();
  state->suite = test_suite;
  state->remaining = total;
  state->slots.resize(total);
  state->errors.resize(total);

  const auto timeout = options_.execution_timeout;
  const auto deadline = std::chrono::steady_clock::now() + step_budget(total);

  std::size_t submitted = 0;
  for (std::size_t i = 0; i < total; ++i) {
    const std::string& code = (i == 0) ? problem.reference_code : problem.perturbations[i - 1];
    auto task = [state, runner = runner_, i, code, timeout]() {
      ExecutionOutcome outcome;
      std::exception_ptr error;
      if (state->cancel.cancelled()) {
        outcome = not_executed("cancelled", OutcomeStatus::timed_out);
      } else {
        try {
          outcome = runner->execute(state->suite, code, timeout, &state->cancel);
        } catch (...) {
          error = std::current_exception();
        }
      }
      std::lock_guard<std::mutex> lk(state->mu);
      state->slots[i] = std::move(outcome);
      state->errors[i] = error;
      if (--state->remaining == 0) state->cv.notify_all();
    };
    if (!pool_.submit(std::move(task))) break;
    ++submitted;
  }

  std::unique_lock<std::mutex> lk(state->mu);
  if (submitted < total) {
    state->remaining -= total - submitted;
    state->cancel.cancel();
    state->cv.wait(lk, [&] { return state->remaining == 0; });
    throw InvalidStateError("execution coordinator is shut down");
  }

  const bool finished = state->cv.wait_until(lk, deadline, [&] { return state->remaining == 0; });
  if (!finished) {
    log_warn("coordinator", "step deadline passed for problem " + problem.id + ", cancelling");
    state->cancel.cancel();
    state->cv.wait(lk, [&] { return state->remaining == 0; });
  }

  for (const auto& e : state->errors) {
    if (e) std::rethrow_exception(e);
  }
  if (!finished) {
    throw EpisodeTimeoutError("step exceeded " + std::to_string(step_budget(total).count()) +
                              " ms for problem " + problem.id);
  }

  out.reference = std::move(state->slots[0]);
  out.perturbations.reserve(n);
  for (std::size_t i = 1; i < total; ++i) out.perturbations.push_back(std::move(state->slots[i]));
  return out;
}

}  // namespace sieve
