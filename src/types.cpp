#include "sieve/types.hpp"

#include "sieve/jsonlite.hpp"

namespace sieve {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::dataset_invalid: return "dataset_invalid";
    case ErrorCode::dataset_empty: return "dataset_empty";
    case ErrorCode::invalid_state: return "invalid_state";
    case ErrorCode::invalid_input: return "invalid_input";
    case ErrorCode::episode_timeout: return "episode_timeout";
    case ErrorCode::sandbox_unavailable: return "sandbox_unavailable";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "";
}

std::string to_string(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::passed: return "passed";
    case OutcomeStatus::failed: return "failed";
    case OutcomeStatus::errored: return "errored";
    case OutcomeStatus::timed_out: return "timed_out";
  }
  return "";
}

std::string to_string(EpisodeState state) {
  switch (state) {
    case EpisodeState::idle: return "idle";
    case EpisodeState::awaiting_submission: return "awaiting_submission";
    case EpisodeState::scoring: return "scoring";
    case EpisodeState::closed: return "closed";
  }
  return "";
}

std::vector<std::string> SandboxCapabilities::enforced() const {
  std::vector<std::string> result;
  if (workspace_confinement) result.push_back("workspace_confinement");
  if (rlimits_cpu) result.push_back("rlimits_cpu");
  if (rlimits_mem) result.push_back("rlimits_mem");
  if (rlimits_nproc) result.push_back("rlimits_nproc");
  if (rlimits_fds) result.push_back("rlimits_fds");
  if (process_group_kill) result.push_back("process_group_kill");
  if (user_namespace) result.push_back("user_namespace");
  if (network_namespace) result.push_back("network_namespace");
  if (mount_namespace) result.push_back("mount_namespace");
  if (pid_namespace) result.push_back("pid_namespace");
  return result;
}

std::vector<std::string> SandboxCapabilities::unsupported() const {
  std::vector<std::string> result;
  if (!workspace_confinement) result.push_back("workspace_confinement");
  if (!rlimits_cpu) result.push_back("rlimits_cpu");
  if (!rlimits_mem) result.push_back("rlimits_mem");
  if (!rlimits_nproc) result.push_back("rlimits_nproc");
  if (!rlimits_fds) result.push_back("rlimits_fds");
  if (!process_group_kill) result.push_back("process_group_kill");
  if (!user_namespace) result.push_back("user_namespace");
  if (!network_namespace) result.push_back("network_namespace");
  if (!mount_namespace) result.push_back("mount_namespace");
  if (!pid_namespace) result.push_back("pid_namespace");
  return result;
}

namespace {

void append_bool_array(std::string& out, const std::vector<bool>& values) {
  out += '[';
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ',';
    out += values[i] ? "true" : "false";
  }
  out += ']';
}

}  // namespace

std::string outcome_to_json(const ExecutionOutcome& o) {
  std::string out;
  out.reserve(128 + o.stdout_tail.size() + o.stderr_tail.size());
  out += "{\"status\":\"";
  out += to_string(o.status);
  out += "\",\"exit_code\":";
  out += std::to_string(o.exit_code);
  out += ",\"term_signal\":";
  out += std::to_string(o.term_signal);
  out += ",\"duration_ms\":";
  out += std::to_string(o.duration_ms);
  out += ",\"detail\":\"";
  out += jsonlite::escape(o.detail);
  out += "\",\"stdout_truncated\":";
  out += o.stdout_truncated ? "true" : "false";
  out += ",\"stderr_truncated\":";
  out += o.stderr_truncated ? "true" : "false";
  out += ",\"stdout_tail\":\"";
  out += jsonlite::escape(o.stdout_tail);
  out += "\",\"stderr_tail\":\"";
  out += jsonlite::escape(o.stderr_tail);
  out += "\"}";
  return out;
}

std::string observation_to_json(const Observation& obs) {
  std::string out;
  out.reserve(96 + obs.spec.size() + obs.reference_code.size());
  out += "{\"problem_id\":\"";
  out += jsonlite::escape(obs.problem_id);
  out += "\",\"spec\":\"";
  out += jsonlite::escape(obs.spec);
  out += "\",\"reference_code\":\"";
  out += jsonlite::escape(obs.reference_code);
  out += "\",\"num_perturbations\":";
  out += std::to_string(obs.num_perturbations);
  out += ",\"turn\":";
  out += std::to_string(obs.turn);
  out += "}";
  return out;
}

// Field order is fixed. Changing it changes every result_digest.
std::string canonicalize_result(const EpisodeResult& r) {
  std::string out;
  out += "{\"detection_rate\":";
  out += jsonlite::format_double(r.detection_rate);
  out += ",\"detections\":";
  append_bool_array(out, r.detections);
  out += ",\"num_detected\":";
  out += std::to_string(r.num_detected);
  out += ",\"passed_on_reference\":";
  out += r.passed_on_reference ? "true" : "false";
  out += ",\"reward\":";
  out += jsonlite::format_double(r.reward);
  out += "}";
  return out;
}

std::string episode_result_to_json(const EpisodeResult& r) {
  std::string out = canonicalize_result(r);
  out.pop_back();
  out += ",\"result_digest\":\"";
  out += r.result_digest;
  out += "\"}";
  return out;
}

std::string step_result_to_json(const StepResult& s) {
  std::string out;
  out.reserve(1024);
  out += "{\"observation\":";
  out += observation_to_json(s.observation);
  out += ",\"reward\":";
  out += jsonlite::format_double(s.reward);
  out += ",\"terminated\":";
  out += s.terminated ? "true" : "false";
  out += ",\"truncated\":";
  out += s.truncated ? "true" : "false";
  out += ",\"info\":{\"problem_id\":\"";
  out += jsonlite::escape(s.info.problem_id);
  out += "\",\"passed_on_reference\":";
  out += s.info.passed_on_reference ? "true" : "false";
  out += ",\"detections\":";
  append_bool_array(out, s.info.detections);
  out += ",\"detection_rate\":";
  out += jsonlite::format_double(s.info.detection_rate);
  out += ",\"turn\":";
  out += std::to_string(s.info.turn);
  out += ",\"suite_digest\":\"";
  out += s.info.suite_digest;
  out += "\",\"result_digest\":\"";
  out += s.info.result_digest;
  out += "\",\"reference_outcome\":";
  out += outcome_to_json(s.info.reference_outcome);
  out += ",\"perturbation_outcomes\":[";
  for (size_t i = 0; i < s.info.perturbation_outcomes.size(); ++i) {
    if (i > 0) out += ',';
    out += outcome_to_json(s.info.perturbation_outcomes[i]);
  }
  out += "]}}";
  return out;
}

}  // namespace sieve
