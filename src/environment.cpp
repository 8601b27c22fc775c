#include "sieve/environment.hpp"

#include <chrono>

#include "sieve/errors.hpp"
#include "sieve/hash.hpp"
#include "sieve/observability.hpp"
#include "sieve/reward.hpp"

namespace sieve {

namespace {

void count_outcome(const ExecutionOutcome& o, EpisodeEvent& ev) {
  switch (o.status) {
    case OutcomeStatus::passed: ++ev.passed; break;
    case OutcomeStatus::failed: ++ev.failed; break;
    case OutcomeStatus::errored: ++ev.errored; break;
    case OutcomeStatus::timed_out: ++ev.timed_out; break;
  }
}

}  // namespace

EpisodeController::EpisodeController(EnvConfig config, std::shared_ptr<const ProblemStore> store,
                                     std::shared_ptr<SandboxRunner> runner)
    : config_(std::move(config)), store_(std::move(store)), runner_(std::move(runner)) {
  if (!store_) throw InvalidInputError("episode controller requires a problem store");
  if (!runner_) throw InvalidInputError("episode controller requires a sandbox runner");
  coordinator_ = std::make_unique<ExecutionCoordinator>(runner_, CoordinatorOptions::from_config(config_));
  if (config_.seed) {
    rng_.seed(*config_.seed);
  } else {
    std::random_device rd;
    rng_.seed((static_cast<std::uint64_t>(rd()) << 32) | rd());
  }
}

EpisodeController::~EpisodeController() { close(); }

EpisodeState EpisodeController::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

Observation EpisodeController::observation_locked() const {
  Observation obs;
  if (!problem_) return obs;
  obs.problem_id = problem_->id;
  obs.spec = problem_->spec;
  obs.reference_code = problem_->reference_code;
  obs.num_perturbations = problem_->perturbations.size();
  obs.turn = turn_;
  return obs;
}

Observation EpisodeController::begin_episode_locked(const ProblemRecord& problem) {
  problem_ = &problem;
  turn_ = 0;
  state_ = EpisodeState::awaiting_submission;
  log_debug("env", "episode started on problem " + problem.id);
  return observation_locked();
}

Observation EpisodeController::reset(std::optional<std::uint64_t> seed) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == EpisodeState::closed) throw InvalidStateError("reset() on a closed environment");
  if (state_ == EpisodeState::scoring) throw InvalidStateError("reset() while a step is scoring");
  if (seed) rng_.seed(*seed);
  return begin_episode_locked(store_->sample(rng_));
}

Observation EpisodeController::reset_to(const std::string& problem_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == EpisodeState::closed) throw InvalidStateError("reset() on a closed environment");
  if (state_ == EpisodeState::scoring) throw InvalidStateError("reset() while a step is scoring");
  const ProblemRecord* problem = store_->find(problem_id);
  if (!problem) throw InvalidInputError("unknown problem id: " + problem_id);
  return begin_episode_locked(*problem);
}

void EpisodeController::abandon_step() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != EpisodeState::closed) state_ = EpisodeState::idle;
  problem_ = nullptr;
  turn_ = 0;
}

StepResult EpisodeController::step(const std::string& test_suite) {
  const ProblemRecord* problem = nullptr;
  std::uint32_t turn = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != EpisodeState::awaiting_submission) {
      throw InvalidStateError("step() requires awaiting_submission, state is " + to_string(state_));
    }
    state_ = EpisodeState::scoring;
    problem = problem_;
    turn = turn_ + 1;
  }

  EpisodeEvent ev;
  ev.problem_id = problem->id;
  ev.suite_digest = suite_digest(test_suite);
  ev.backend = runner_->backend_name();
  ev.turn = turn;
  ev.num_perturbations = problem->perturbations.size();
  ev.suite_bytes = test_suite.size();

  const auto started = std::chrono::steady_clock::now();
  auto publish = [&]() {
    ev.duration_ns = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started).count());
    emit_episode_event(ev, config_.event_log_path);
  };

  StepResult out;
  try {
    CoordinatedOutcomes outcomes = coordinator_->run(test_suite, *problem);
    EpisodeResult result = score(outcomes.reference, outcomes.perturbations);

    count_outcome(outcomes.reference, ev);
    for (const auto& o : outcomes.perturbations) count_outcome(o, ev);
    ev.ok = true;
    ev.reward = result.reward;
    ev.passed_on_reference = result.passed_on_reference;
    ev.num_detected = result.num_detected;
    ev.result_digest = result.result_digest;

    out.reward = result.reward;
    out.info.problem_id = problem->id;
    out.info.passed_on_reference = result.passed_on_reference;
    out.info.detections = result.detections;
    out.info.detection_rate = result.detection_rate;
    out.info.turn = turn;
    out.info.suite_digest = ev.suite_digest;
    out.info.result_digest = result.result_digest;
    out.info.reference_outcome = std::move(outcomes.reference);
    out.info.perturbation_outcomes = std::move(outcomes.perturbations);

    std::lock_guard<std::mutex> lk(mu_);
    turn_ = turn;
    out.observation = observation_locked();
    if (!config_.multi_turn) {
      out.terminated = true;
    } else if (turn >= config_.max_turns) {
      out.truncated = true;
    }
    if (state_ != EpisodeState::closed) {
      state_ = (out.terminated || out.truncated) ? EpisodeState::idle
                                                 : EpisodeState::awaiting_submission;
    }
  } catch (const Error& e) {
    abandon_step();
    ev.error_code = to_string(e.code());
    log_warn("env", "step failed on problem " + problem->id + ": " + e.what());
    publish();
    throw;
  } catch (const std::exception& e) {
    abandon_step();
    ev.error_code = to_string(ErrorCode::internal_error);
    log_error("env", "step failed on problem " + problem->id + ": " + e.what());
    publish();
    throw;
  } catch (...) {
    abandon_step();
    ev.error_code = to_string(ErrorCode::internal_error);
    publish();
    throw;
  }

  publish();
  return out;
}

void EpisodeController::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == EpisodeState::closed) return;
    state_ = EpisodeState::closed;
    problem_ = nullptr;
  }
  coordinator_->shutdown();
  runner_->close();
}

std::unique_ptr<EpisodeController> make_environment(const EnvConfig& config) {
  ConfigValidationResult checked = validate_config(config);
  for (const auto& w : checked.warnings) log_warn("config", w);
  if (!checked.ok) {
    std::string msg = "invalid config:";
    for (const auto& e : checked.errors) msg += " " + e + ";";
    throw ConfigError(msg);
  }
  set_log_level(config.log_level);

  ProblemStoreOptions options;
  options.expected_perturbations = config.expected_perturbations;
  auto store = std::make_shared<const ProblemStore>(ProblemStore::load(config.dataset_path, options));
  auto runner = make_sandbox_runner(config);
  return std::make_unique<EpisodeController>(config, std::move(store), std::move(runner));
}

}  // namespace sieve
