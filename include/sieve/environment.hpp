#pragma once

// sieve/environment.hpp - Episode state machine over the scoring engine.
//
// STATES:
//   idle --reset--> awaiting_submission --step--> scoring
//   scoring --> idle                  single-shot, or multi-turn at max_turns
//   scoring --> awaiting_submission   multi-turn below max_turns
//   any --close--> closed             terminal, idempotent
//
// A failed step (EpisodeTimeoutError, infrastructure error) always leaves the
// controller in idle; the caller resets to continue. One episode is in flight
// per controller. Controllers may share a ProblemStore and a SandboxRunner.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "sieve/config.hpp"
#include "sieve/coordinator.hpp"
#include "sieve/problem_store.hpp"
#include "sieve/sandbox.hpp"
#include "sieve/types.hpp"

namespace sieve {

class EpisodeController {
 public:
  // Throws InvalidInputError for a null store or runner.
  EpisodeController(EnvConfig config, std::shared_ptr<const ProblemStore> store,
                    std::shared_ptr<SandboxRunner> runner);
  ~EpisodeController();

  EpisodeController(const EpisodeController&) = delete;
  EpisodeController& operator=(const EpisodeController&) = delete;

  // Samples a problem and starts a new episode, discarding any episode that
  // was awaiting a submission. A seed reseeds the controller's generator.
  Observation reset(std::optional<std::uint64_t> seed = std::nullopt);

  // Starts a new episode on a named problem. Throws InvalidInputError for an
  // unknown id.
  Observation reset_to(const std::string& problem_id);

  StepResult step(const std::string& test_suite);

  void close();

  EpisodeState state() const;
  const EnvConfig& config() const { return config_; }
  const ProblemStore& store() const { return *store_; }
  std::string backend_name() const { return runner_->backend_name(); }

 private:
  Observation begin_episode_locked(const ProblemRecord& problem);
  Observation observation_locked() const;
  void abandon_step();

  EnvConfig config_;
  std::shared_ptr<const ProblemStore> store_;
  std::shared_ptr<SandboxRunner> runner_;
  std::unique_ptr<ExecutionCoordinator> coordinator_;

  mutable std::mutex mu_;
  EpisodeState state_{EpisodeState::idle};
  const ProblemRecord* problem_{nullptr};
  std::uint32_t turn_{0};
  std::mt19937_64 rng_;
};

// Validates config, loads the dataset and builds the configured backend.
// Throws ConfigError, DatasetError or SandboxUnavailableError.
std::unique_ptr<EpisodeController> make_environment(const EnvConfig& config);

}  // namespace sieve
