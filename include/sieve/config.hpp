#pragma once

// sieve/config.hpp - Explicit environment configuration.
//
// Every policy constant the core needs is a field here and is passed at
// construction. The core never reads environment variables.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sieve/observability.hpp"

namespace sieve {

enum class SandboxBackend { process, container };

std::string to_string(SandboxBackend backend);

struct EnvConfig {
  std::string dataset_path;
  SandboxBackend backend{SandboxBackend::process};
  std::string interpreter{"python3"};

  std::uint64_t execution_timeout_ms{30000};
  std::uint32_t parallelism{4};
  std::size_t max_output_bytes{4096};
  // Added on top of the waves * execution_timeout_ms step budget.
  std::uint64_t step_timeout_slack_ms{10000};
  std::size_t max_suite_bytes{1 * 1024 * 1024};

  std::uint64_t max_memory_bytes{1ULL << 30};
  std::uint64_t max_processes{64};
  std::uint64_t max_file_descriptors{256};
  std::uint64_t max_file_size_bytes{16ULL << 20};
  bool network_isolation{true};
  bool filesystem_isolation{true};  // process backend: mount+pid namespaces
  std::string work_root;  // empty = std::filesystem::temp_directory_path()

  std::optional<std::uint64_t> seed;
  std::size_t expected_perturbations{0};  // 0 = any non-zero count
  bool multi_turn{false};
  std::uint32_t max_turns{1};

  std::string container_runtime{"docker"};
  std::string container_image{"testrunner:latest"};

  std::string event_log_path;
  LogLevel log_level{LogLevel::warn};
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const EnvConfig& config);

// Builds a config from a JSON object. Keys absent from the object keep their
// defaults; unknown keys and wrongly typed values are reported in *result.
EnvConfig parse_config_json(const std::string& json, ConfigValidationResult* result);

// Reads, parses and validates. Throws ConfigError on any error.
EnvConfig load_config_file(const std::string& path);

std::string config_to_json(const EnvConfig& config);

}  // namespace sieve
