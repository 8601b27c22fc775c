#pragma once

// sieve/reward.hpp - Reduction of N+1 outcomes to a scalar reward.
//
// GATE: a suite that does not pass on the reference implementation earns 0
// and detects nothing, regardless of how the perturbations behaved.
// Otherwise detections[i] = perturbation i did not pass, and
// reward = detection_rate = detected / N.
//
// Pure and deterministic: identical inputs give bit-identical results,
// result_digest included. Content failures (errored, timed_out) count the
// same as failed once the gate is open.

#include <vector>

#include "sieve/types.hpp"

namespace sieve {

// Throws InvalidInputError when perturbations is empty.
EpisodeResult score(const ExecutionOutcome& reference,
                    const std::vector<ExecutionOutcome>& perturbations);

}  // namespace sieve
