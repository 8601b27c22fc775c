#include "sieve/config.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <type_traits>

#include "sieve/errors.hpp"
#include "sieve/jsonlite.hpp"

namespace sieve {

std::string to_string(SandboxBackend backend) {
  switch (backend) {
    case SandboxBackend::process: return "process";
    case SandboxBackend::container: return "container";
  }
  return "";
}

ConfigValidationResult validate_config(const EnvConfig& c) {
  ConfigValidationResult r;
  if (c.dataset_path.empty()) r.errors.push_back("dataset_path is required");
  if (c.interpreter.empty()) r.errors.push_back("interpreter must not be empty");
  if (c.execution_timeout_ms == 0) r.errors.push_back("execution_timeout_ms must be > 0");
  if (c.parallelism == 0) r.errors.push_back("parallelism must be > 0");
  if (c.max_output_bytes == 0) r.errors.push_back("max_output_bytes must be > 0");
  if (c.max_suite_bytes == 0) r.errors.push_back("max_suite_bytes must be > 0");
  if (c.multi_turn && c.max_turns == 0) r.errors.push_back("max_turns must be > 0 in multi_turn mode");
  if (c.backend == SandboxBackend::container) {
    if (c.container_runtime.empty()) r.errors.push_back("container_runtime must not be empty");
    if (c.container_image.empty()) r.errors.push_back("container_image must not be empty");
  }

  if (c.parallelism > 64) r.warnings.push_back("parallelism > 64 oversubscribes most hosts");
  if (c.max_memory_bytes != 0 && c.max_memory_bytes < (128ULL << 20)) {
    r.warnings.push_back("max_memory_bytes below 128 MiB usually fails to start pytest");
  }
  if (c.max_processes != 0 && c.max_processes < 4) {
    r.warnings.push_back("max_processes below 4 may prevent the interpreter from starting");
  }
  if (!c.multi_turn && c.max_turns > 1) {
    r.warnings.push_back("max_turns is ignored unless multi_turn is true");
  }
  if (c.step_timeout_slack_ms == 0) {
    r.warnings.push_back("step_timeout_slack_ms of 0 may cancel steps at the budget boundary");
  }
  r.ok = r.errors.empty();
  return r;
}

EnvConfig parse_config_json(const std::string& json, ConfigValidationResult* result) {
  ConfigValidationResult local;
  ConfigValidationResult& r = result ? *result : local;
  EnvConfig c;

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    r.ok = false;
    r.errors.push_back(err->code + ": " + err->message);
    return c;
  }

  static const std::set<std::string> kKnownKeys = {
      "dataset_path", "backend", "interpreter", "execution_timeout_ms", "parallelism",
      "max_output_bytes", "step_timeout_slack_ms", "max_suite_bytes", "max_memory_bytes",
      "max_processes", "max_file_descriptors", "max_file_size_bytes", "network_isolation",
      "filesystem_isolation", "work_root", "seed", "expected_perturbations", "multi_turn",
      "max_turns", "container_runtime", "container_image", "event_log_path", "log_level"};
  for (const auto& [k, v] : obj) {
    (void)v;
    if (!kKnownKeys.contains(k)) r.warnings.push_back("unknown key: " + k);
  }

  auto read_string = [&](const char* key, std::string& out) {
    const jsonlite::Value* v = jsonlite::find(obj, key);
    if (!v) return;
    if (!jsonlite::is_string(*v)) {
      r.errors.push_back(std::string(key) + " must be a string");
      return;
    }
    out = std::get<std::string>(v->v);
  };
  auto read_u64 = [&](const char* key, auto& out) {
    const jsonlite::Value* v = jsonlite::find(obj, key);
    if (!v) return;
    if (!std::holds_alternative<std::uint64_t>(v->v)) {
      r.errors.push_back(std::string(key) + " must be a non-negative integer");
      return;
    }
    out = static_cast<std::remove_reference_t<decltype(out)>>(std::get<std::uint64_t>(v->v));
  };
  auto read_bool = [&](const char* key, bool& out) {
    const jsonlite::Value* v = jsonlite::find(obj, key);
    if (!v) return;
    if (!jsonlite::is_bool(*v)) {
      r.errors.push_back(std::string(key) + " must be a boolean");
      return;
    }
    out = std::get<bool>(v->v);
  };

  read_string("dataset_path", c.dataset_path);
  read_string("interpreter", c.interpreter);
  read_u64("execution_timeout_ms", c.execution_timeout_ms);
  read_u64("parallelism", c.parallelism);
  read_u64("max_output_bytes", c.max_output_bytes);
  read_u64("step_timeout_slack_ms", c.step_timeout_slack_ms);
  read_u64("max_suite_bytes", c.max_suite_bytes);
  read_u64("max_memory_bytes", c.max_memory_bytes);
  read_u64("max_processes", c.max_processes);
  read_u64("max_file_descriptors", c.max_file_descriptors);
  read_u64("max_file_size_bytes", c.max_file_size_bytes);
  read_bool("network_isolation", c.network_isolation);
  read_bool("filesystem_isolation", c.filesystem_isolation);
  read_string("work_root", c.work_root);
  read_u64("expected_perturbations", c.expected_perturbations);
  read_bool("multi_turn", c.multi_turn);
  read_u64("max_turns", c.max_turns);
  read_string("container_runtime", c.container_runtime);
  read_string("container_image", c.container_image);
  read_string("event_log_path", c.event_log_path);

  if (const jsonlite::Value* v = jsonlite::find(obj, "seed")) {
    if (std::holds_alternative<std::uint64_t>(v->v)) {
      c.seed = std::get<std::uint64_t>(v->v);
    } else if (!std::holds_alternative<std::nullptr_t>(v->v)) {
      r.errors.push_back("seed must be a non-negative integer or null");
    }
  }

  std::string backend;
  read_string("backend", backend);
  if (backend == "container") c.backend = SandboxBackend::container;
  else if (!backend.empty() && backend != "process") r.errors.push_back("unknown backend: " + backend);

  std::string level;
  read_string("log_level", level);
  if (!level.empty() && !parse_log_level(level, &c.log_level)) {
    r.errors.push_back("unknown log_level: " + level);
  }

  r.ok = r.errors.empty();
  return c;
}

EnvConfig load_config_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw ConfigError("cannot read config file: " + path);
  std::ostringstream buf;
  buf << ifs.rdbuf();

  ConfigValidationResult parsed;
  EnvConfig c = parse_config_json(buf.str(), &parsed);
  ConfigValidationResult checked = parsed.ok ? validate_config(c) : parsed;
  for (const auto& w : parsed.warnings) log_warn("config", path + ": " + w);
  if (parsed.ok) {
    for (const auto& w : checked.warnings) log_warn("config", path + ": " + w);
  }
  if (!checked.ok) {
    std::string msg = "invalid config " + path + ":";
    for (const auto& e : checked.errors) msg += " " + e + ";";
    throw ConfigError(msg);
  }
  return c;
}

std::string config_to_json(const EnvConfig& c) {
  std::ostringstream o;
  o << "{"
    << "\"dataset_path\":\"" << jsonlite::escape(c.dataset_path) << "\""
    << ",\"backend\":\"" << to_string(c.backend) << "\""
    << ",\"interpreter\":\"" << jsonlite::escape(c.interpreter) << "\""
    << ",\"execution_timeout_ms\":" << c.execution_timeout_ms
    << ",\"parallelism\":" << c.parallelism
    << ",\"max_output_bytes\":" << c.max_output_bytes
    << ",\"step_timeout_slack_ms\":" << c.step_timeout_slack_ms
    << ",\"max_suite_bytes\":" << c.max_suite_bytes
    << ",\"max_memory_bytes\":" << c.max_memory_bytes
    << ",\"max_processes\":" << c.max_processes
    << ",\"max_file_descriptors\":" << c.max_file_descriptors
    << ",\"max_file_size_bytes\":" << c.max_file_size_bytes
    << ",\"network_isolation\":" << (c.network_isolation ? "true" : "false")
    << ",\"filesystem_isolation\":" << (c.filesystem_isolation ? "true" : "false")
    << ",\"work_root\":\"" << jsonlite::escape(c.work_root) << "\""
    << ",\"seed\":";
  if (c.seed) o << *c.seed;
  else o << "null";
  o << ",\"expected_perturbations\":" << c.expected_perturbations
    << ",\"multi_turn\":" << (c.multi_turn ? "true" : "false")
    << ",\"max_turns\":" << c.max_turns
    << ",\"container_runtime\":\"" << jsonlite::escape(c.container_runtime) << "\""
    << ",\"container_image\":\"" << jsonlite::escape(c.container_image) << "\""
    << ",\"event_log_path\":\"" << jsonlite::escape(c.event_log_path) << "\""
    << ",\"log_level\":\"" << to_string(c.log_level) << "\""
    << "}";
  return o.str();
}

}  // namespace sieve
