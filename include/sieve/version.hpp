#pragma once

// sieve/version.hpp - Version manifest for every persisted or exchanged format.
//
// All constants are compile-time. Embedders call check_compatibility() with
// the ABI version they were built against; sieve_env_create() does this.

#include <cstdint>
#include <string>

namespace sieve {
namespace version {

// Bump when the C ABI (c_api.h) changes incompatibly. Mirrors SIEVE_ABI_VERSION.
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// 1 = BLAKE3, 32-byte output, lowercase hex, domain-prefixed payloads.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Problem file schema: {spec, problem, perturbations[], id?}.
constexpr uint32_t PROBLEM_FORMAT_VERSION = 1;

// Field set and order of canonicalize_result(). Any change alters every
// result_digest and requires a bump.
constexpr uint32_t RESULT_CANONICAL_VERSION = 1;

// One JSON object per line, fields as in episode_event_to_json().
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t engine_abi{ENGINE_ABI_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t problem_format{PROBLEM_FORMAT_VERSION};
  uint32_t result_canonical{RESULT_CANONICAL_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  uint32_t required_abi{ENGINE_ABI_VERSION};
  uint32_t actual_abi{ENGINE_ABI_VERSION};
};

// Never throws.
CompatibilityResult check_compatibility(uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace sieve
