#pragma once

// sieve/sandbox.hpp - Isolated execution of one (test suite, implementation) pair.
//
// LAYERS:
//   run_process()          fork/exec with rlimits, namespaces, bounded output
//                          capture and a wall-clock deadline. Linux/POSIX only.
//
// FILESYSTEM AND PROCESS ISOLATION (ProcessSpec::filesystem_isolation):
//   The child enters fresh user, mount and PID namespaces. Every mount is
//   made read-only, /tmp, /var/tmp and /dev/shm get private tmpfs, and cwd is
//   bound back writable. Nothing written outside cwd survives the run. The
//   command runs as PID 1 of its namespace, so when it exits or is killed
//   every descendant goes with it, including ones that called setsid().
//   SandboxRunner          abstract backend: stage the two artifacts, run the
//                          pytest harness, classify the result.
//   ProcessSandboxRunner   backend built directly on run_process().
//   ContainerSandboxRunner backend that drives a container runtime CLI through
//                          run_process().
//
// HARNESS CONTRACT:
//   The workspace holds exactly two files: solution.py (implementation under
//   test) and test_generated.py (the submitted suite). The harness command is
//     <python> -m pytest test_generated.py -q --tb=short -p no:cacheprovider
//   with the workspace as working directory.
//
// CLASSIFICATION (classify_harness_exit):
//   deadline or cancellation  -> timed_out
//   killed by a signal        -> errored   (rlimit kills land here, signal kept)
//   exit 0                    -> passed
//   exit 1                    -> failed    (assertions failed)
//   exit 1 with MemoryError   -> errored   (memory cap hit, detail memory_limit)
//   exit 2..5                 -> errored   (collection/import/syntax error,
//                                           internal error, usage error,
//                                           no tests collected)
//   anything else             -> errored
//   spawn failure             -> errored here, but execute() throws
//                                SandboxUnavailableError before classifying
//
// CLEANUP:
//   Every execute() path releases its workspace, its process group and, for
//   the container backend, its named container before returning.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sieve/config.hpp"
#include "sieve/types.hpp"

namespace sieve {

// Cooperative cancellation flag shared between the coordinator and running
// sandboxes. Polled by run_process() at its 10 ms tick.
class CancelToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ProcessSpec {
  std::string command;  // absolute path, resolved by the caller
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  const CancelToken* cancel{nullptr};

  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_processes{0};         // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
  std::uint64_t max_file_size_bytes{0};   // 0 = unlimited
  bool cpu_limit{true};                   // RLIMIT_CPU = ceil(timeout) + 1 s
  bool network_isolation{false};          // best-effort user+net namespace
  bool filesystem_isolation{false};       // mount+pid namespace, only cwd writable
};

struct ProcessResult {
  int exit_code{-1};
  int term_signal{0};
  bool timed_out{false};
  bool cancelled{false};
  bool spawn_failed{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;  // last max_output_bytes bytes
  std::string stderr_text;
  std::uint64_t duration_ms{0};
  std::string error_message;
  bool network_isolated{false};
  bool filesystem_isolated{false};
  bool pid_isolated{false};
  bool rlimits_applied{false};
};

ProcessResult run_process(const ProcessSpec& spec);

// PATH lookup for a bare name; existence/executable check for a path.
// Returns an empty string when nothing executable is found.
std::string find_executable(const std::string& name);

SandboxCapabilities detect_platform_sandbox_capabilities();

// Appends src to a tail buffer holding at most limit bytes.
void append_tail(std::string& dst, const char* src, std::size_t n,
                 std::size_t limit, bool& truncated);

OutcomeStatus classify_harness_exit(const ProcessResult& result, std::string* detail);

// ---------------------------------------------------------------------------
// ScopedWorkspace - fresh private directory, removed on destruction.
// ---------------------------------------------------------------------------
class ScopedWorkspace {
 public:
  // Throws SandboxUnavailableError when the directory cannot be created.
  explicit ScopedWorkspace(const std::string& root);
  ~ScopedWorkspace();

  ScopedWorkspace(const ScopedWorkspace&) = delete;
  ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Returns false on I/O failure.
  bool write_file(const std::string& name, const std::string& content) const;

 private:
  std::filesystem::path path_;
};

inline constexpr const char* kSolutionFile = "solution.py";
inline constexpr const char* kSuiteFile = "test_generated.py";

std::vector<std::string> harness_pytest_args();

// Sanitized environment for the harness: PATH limited to the interpreter's
// directory plus system bins, HOME and TMPDIR inside the workspace, hash
// seed pinned, plugin autoload off.
std::map<std::string, std::string> harness_environment(const std::string& interpreter_path,
                                                       const std::filesystem::path& home);

// Throws SandboxUnavailableError when the harness never started.
ExecutionOutcome outcome_from_process(const ProcessResult& result);

// Container runtimes exit 125 (daemon/run error), 126 (not executable) and
// 127 (not found) for their own failures. Those throw SandboxUnavailableError
// instead of scoring as a detection.
ExecutionOutcome container_outcome_from_process(const ProcessResult& result);

// Copy of this process's environment, for helper commands that need it.
std::map<std::string, std::string> inherited_environment();

// Resolves an interpreter name to the real binary (through launcher shims)
// by asking it for sys.executable. Throws SandboxUnavailableError.
std::string resolve_interpreter(const std::string& name);

// ---------------------------------------------------------------------------
// SandboxRunner - one variant per isolation backend.
// ---------------------------------------------------------------------------
class SandboxRunner {
 public:
  virtual ~SandboxRunner() = default;

  // Never throws for anything the suite or implementation does. Throws
  // InvalidInputError for empty implementation code or a zero timeout, and
  // SandboxUnavailableError when the workspace cannot be staged or the
  // harness cannot be started.
  virtual ExecutionOutcome execute(const std::string& test_suite,
                                   const std::string& implementation_code,
                                   std::chrono::milliseconds timeout,
                                   const CancelToken* cancel = nullptr) = 0;

  virtual std::string backend_name() const = 0;

  // Releases backend handles. Idempotent.
  virtual void close() {}
};

struct SandboxLimits {
  std::size_t max_output_bytes{4096};
  std::uint64_t max_memory_bytes{1ULL << 30};
  std::uint64_t max_processes{64};
  std::uint64_t max_file_descriptors{256};
  std::uint64_t max_file_size_bytes{16ULL << 20};
  bool network_isolation{true};
  bool filesystem_isolation{true};
  std::string work_root;

  static SandboxLimits from_config(const EnvConfig& config);
};

class ProcessSandboxRunner : public SandboxRunner {
 public:
  // Resolves the interpreter and checks that it can import pytest. Throws
  // SandboxUnavailableError otherwise, or when filesystem isolation is
  // requested and the platform cannot provide it.
  ProcessSandboxRunner(const std::string& interpreter, SandboxLimits limits);

  ExecutionOutcome execute(const std::string& test_suite,
                           const std::string& implementation_code,
                           std::chrono::milliseconds timeout,
                           const CancelToken* cancel = nullptr) override;

  std::string backend_name() const override { return "process"; }

  const std::string& interpreter_path() const { return interpreter_path_; }

 private:
  std::string interpreter_path_;
  SandboxLimits limits_;
};

class ContainerSandboxRunner : public SandboxRunner {
 public:
  // Resolves the runtime CLI and checks that the image is present locally.
  // Throws SandboxUnavailableError otherwise. The image is never built here.
  ContainerSandboxRunner(const std::string& runtime, const std::string& image,
                         SandboxLimits limits);
  ~ContainerSandboxRunner() override;

  ExecutionOutcome execute(const std::string& test_suite,
                           const std::string& implementation_code,
                           std::chrono::milliseconds timeout,
                           const CancelToken* cancel = nullptr) override;

  std::string backend_name() const override { return "container"; }
  void close() override;

 private:
  std::string next_container_name();
  void remove_container(const std::string& name);

  std::string runtime_path_;
  std::string image_;
  SandboxLimits limits_;
  std::atomic<std::uint64_t> seq_{0};
  std::atomic<bool> closed_{false};
};

// Full `<runtime> run ...` argv: no network, read-only root with a tmpfs
// /tmp, no capabilities, and the caller's uid:gid.
std::vector<std::string> container_run_args(const std::string& name, const std::string& image,
                                            const std::string& workspace,
                                            const SandboxLimits& limits);

std::shared_ptr<SandboxRunner> make_sandbox_runner(const EnvConfig& config);

// Byte-compiles source with the interpreter inside a throwaway workspace.
// Returns an empty string when the source parses, else the compiler message.
std::string check_python_syntax(const std::string& interpreter_path,
                                const std::string& source,
                                std::uint64_t timeout_ms = 10000);

}  // namespace sieve
