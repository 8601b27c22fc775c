#pragma once

// sieve/hash.hpp - BLAKE3 digests for provenance and determinism checks.
//
// Domain prefixes ("problem:", "suite:", "result:") keep digests of different
// artifact kinds from colliding. They are part of the digest contract.

#include <string>
#include <string_view>

namespace sieve {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
HashRuntimeInfo hash_runtime_info();

inline std::string problem_digest(std::string_view canonical_record) {
  return hash_domain("problem:", canonical_record);
}
inline std::string suite_digest(std::string_view suite) {
  return hash_domain("suite:", suite);
}
inline std::string result_digest(std::string_view canonical_result) {
  return hash_domain("result:", canonical_result);
}

}  // namespace sieve
