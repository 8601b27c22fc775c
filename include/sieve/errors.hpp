#pragma once

// sieve/errors.hpp - Exception taxonomy.
//
// Only environment misuse and infrastructure problems are exceptions.
// Failures caused by the submitted suite (bad tests, crashes, hangs) are
// ExecutionOutcome statuses and never reach this header.

#include <stdexcept>
#include <string>

#include "sieve/types.hpp"

namespace sieve {

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Dataset location missing, unreadable, or zero valid records. Fatal at construction.
class DatasetError : public Error {
 public:
  explicit DatasetError(const std::string& message)
      : Error(ErrorCode::dataset_invalid, message) {}
};

// Sampling from a store with nothing loaded.
class EmptyDatasetError : public Error {
 public:
  explicit EmptyDatasetError(const std::string& message)
      : Error(ErrorCode::dataset_empty, message) {}
};

// API call in a state that does not accept it.
class InvalidStateError : public Error {
 public:
  explicit InvalidStateError(const std::string& message)
      : Error(ErrorCode::invalid_state, message) {}
};

// Malformed call arguments (caller bug).
class InvalidInputError : public Error {
 public:
  explicit InvalidInputError(const std::string& message)
      : Error(ErrorCode::invalid_input, message) {}
};

// Step exceeded its global budget. Recoverable: controller is back in idle.
class EpisodeTimeoutError : public Error {
 public:
  explicit EpisodeTimeoutError(const std::string& message)
      : Error(ErrorCode::episode_timeout, message) {}
};

// Interpreter, container runtime or image not usable.
class SandboxUnavailableError : public Error {
 public:
  explicit SandboxUnavailableError(const std::string& message)
      : Error(ErrorCode::sandbox_unavailable, message) {}
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message)
      : Error(ErrorCode::config_invalid, message) {}
};

}  // namespace sieve
