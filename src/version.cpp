#include "sieve/version.hpp"

#include <sstream>

#include "sieve/hash.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace sieve {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver = engine_semver.empty() ? PROJECT_VERSION : engine_semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_abi\":" << m.engine_abi
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"problem_format\":" << m.problem_format
    << ",\"result_canonical\":" << m.result_canonical
    << ",\"event_log\":" << m.event_log
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ENGINE_ABI_VERSION) {
    r.ok = false;
    r.error_code = "abi_version_mismatch";
    r.description = "caller ABI version " + std::to_string(caller_abi_version) +
                    " != engine ABI version " + std::to_string(ENGINE_ABI_VERSION) +
                    "; rebuild the caller against the current headers";
    r.actual_abi = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace sieve
