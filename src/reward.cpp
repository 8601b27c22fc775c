#include "sieve/reward.hpp"

#include "sieve/errors.hpp"
#include "sieve/hash.hpp"

namespace sieve {

EpisodeResult score(const ExecutionOutcome& reference,
                    const std::vector<ExecutionOutcome>& perturbations) {
  if (perturbations.empty()) throw InvalidInputError("cannot score against zero perturbations");

  EpisodeResult r;
  r.passed_on_reference = reference.status == OutcomeStatus::passed;
  r.detections.assign(perturbations.size(), false);
  if (r.passed_on_reference) {
    for (std::size_t i = 0; i < perturbations.size(); ++i) {
      r.detections[i] = perturbations[i].status != OutcomeStatus::passed;
      if (r.detections[i]) ++r.num_detected;
    }
    r.detection_rate =
        static_cast<double>(r.num_detected) / static_cast<double>(perturbations.size());
    r.reward = r.detection_rate;
  }
  r.result_digest = result_digest(canonicalize_result(r));
  return r;
}

}  // namespace sieve
