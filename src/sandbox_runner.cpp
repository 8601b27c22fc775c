#include "sieve/sandbox.hpp"

#include "sieve/errors.hpp"
#include "sieve/observability.hpp"

namespace sieve {

namespace {

constexpr std::uint64_t kSetupTimeoutMs = 30000;

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::string failure_text(const ProcessResult& r) {
  if (!r.error_message.empty()) return r.error_message;
  if (r.timed_out) return "timed out";
  std::string err = trim(r.stderr_text);
  if (!err.empty()) return err;
  return "exit " + std::to_string(r.exit_code);
}

}  // namespace

std::map<std::string, std::string> harness_environment(const std::string& interpreter_path,
                                                       const std::filesystem::path& home) {
  std::string path = "/usr/local/bin:/usr/bin:/bin";
  const std::string dir = std::filesystem::path(interpreter_path).parent_path().string();
  if (!dir.empty()) path = dir + ":" + path;
  return {
      {"PATH", path},
      {"HOME", home.string()},
      {"TMPDIR", home.string()},
      {"LANG", "C.UTF-8"},
      {"PYTHONHASHSEED", "0"},
      {"PYTHONDONTWRITEBYTECODE", "1"},
      {"PYTHONUNBUFFERED", "1"},
      {"PYTEST_DISABLE_PLUGIN_AUTOLOAD", "1"},
  };
}

ExecutionOutcome outcome_from_process(const ProcessResult& r) {
  if (r.spawn_failed) throw SandboxUnavailableError("cannot start harness: " + r.error_message);
  ExecutionOutcome o;
  o.status = classify_harness_exit(r, &o.detail);
  o.exit_code = r.exit_code;
  o.term_signal = r.term_signal;
  o.stdout_tail = r.stdout_text;
  o.stderr_tail = r.stderr_text;
  o.stdout_truncated = r.stdout_truncated;
  o.stderr_truncated = r.stderr_truncated;
  o.duration_ms = r.duration_ms;
  return o;
}

SandboxLimits SandboxLimits::from_config(const EnvConfig& c) {
  SandboxLimits l;
  l.max_output_bytes = c.max_output_bytes;
  l.max_memory_bytes = c.max_memory_bytes;
  l.max_processes = c.max_processes;
  l.max_file_descriptors = c.max_file_descriptors;
  l.max_file_size_bytes = c.max_file_size_bytes;
  l.network_isolation = c.network_isolation;
  l.filesystem_isolation = c.filesystem_isolation;
  l.work_root = c.work_root;
  return l;
}

std::string resolve_interpreter(const std::string& name) {
  const std::string launcher = find_executable(name);
  if (launcher.empty()) throw SandboxUnavailableError("interpreter not found: " + name);

  // Launcher shims (pyenv, wrappers) need the caller's environment to
  // resolve; the sandbox then runs the real binary with a sanitized one.
  ProcessSpec resolve;
  resolve.command = launcher;
  resolve.argv = {"-c", "import sys; print(sys.executable)"};
  resolve.env = inherited_environment();
  resolve.timeout_ms = kSetupTimeoutMs;
  resolve.cpu_limit = false;
  ProcessResult r = run_process(resolve);
  if (r.spawn_failed || r.timed_out || r.exit_code != 0) {
    throw SandboxUnavailableError("cannot run interpreter " + launcher + ": " + failure_text(r));
  }
  std::string path = trim(r.stdout_text);
  if (path.empty() || find_executable(path).empty()) return launcher;
  return path;
}

// ---------------------------------------------------------------------------
// ProcessSandboxRunner
// ---------------------------------------------------------------------------

ProcessSandboxRunner::ProcessSandboxRunner(const std::string& interpreter, SandboxLimits limits)
    : limits_(std::move(limits)) {
  interpreter_path_ = resolve_interpreter(interpreter);

  ScopedWorkspace ws(limits_.work_root);
  ProcessSpec check;
  check.command = interpreter_path_;
  check.argv = {"-c", "import pytest"};
  check.env = harness_environment(interpreter_path_, ws.path());
  check.cwd = ws.path().string();
  check.timeout_ms = kSetupTimeoutMs;
  check.max_output_bytes = limits_.max_output_bytes;
  check.network_isolation = limits_.network_isolation;
  check.filesystem_isolation = limits_.filesystem_isolation;
  check.cpu_limit = false;
  ProcessResult r = run_process(check);
  if (r.spawn_failed) {
    throw SandboxUnavailableError("cannot start sandboxed interpreter " + interpreter_path_ + ": " +
                                  failure_text(r));
  }
  if (limits_.filesystem_isolation && !(r.filesystem_isolated && r.pid_isolated)) {
    throw SandboxUnavailableError(
        "mount/pid namespaces unavailable; set filesystem_isolation=false to run suites "
        "against the host filesystem");
  }
  if (r.timed_out || r.exit_code != 0) {
    throw SandboxUnavailableError("pytest is not importable by " + interpreter_path_ + ": " +
                                  failure_text(r));
  }
  if (limits_.network_isolation && !r.network_isolated) {
    log_warn("sandbox", "network namespaces unavailable; suites run with host networking");
  }
  if (!limits_.filesystem_isolation) {
    log_warn("sandbox", "filesystem isolation disabled; suites see and may modify host files");
  }
  log_info("sandbox", "process backend ready, interpreter " + interpreter_path_);
}

ExecutionOutcome ProcessSandboxRunner::execute(const std::string& test_suite,
                                               const std::string& implementation_code,
                                               std::chrono::milliseconds timeout,
                                               const CancelToken* cancel) {
  if (implementation_code.empty()) throw InvalidInputError("implementation code is empty");
  if (timeout.count() <= 0) throw InvalidInputError("execution timeout must be positive");

  ScopedWorkspace ws(limits_.work_root);
  if (!ws.write_file(kSolutionFile, implementation_code) || !ws.write_file(kSuiteFile, test_suite)) {
    throw SandboxUnavailableError("cannot stage files in " + ws.path().string());
  }

  ProcessSpec spec;
  spec.command = interpreter_path_;
  spec.argv = harness_pytest_args();
  spec.env = harness_environment(interpreter_path_, ws.path());
  spec.cwd = ws.path().string();
  spec.timeout_ms = static_cast<std::uint64_t>(timeout.count());
  spec.max_output_bytes = limits_.max_output_bytes;
  spec.cancel = cancel;
  spec.max_memory_bytes = limits_.max_memory_bytes;
  spec.max_processes = limits_.max_processes;
  spec.max_file_descriptors = limits_.max_file_descriptors;
  spec.max_file_size_bytes = limits_.max_file_size_bytes;
  spec.network_isolation = limits_.network_isolation;
  spec.filesystem_isolation = limits_.filesystem_isolation;

  ExecutionOutcome outcome = outcome_from_process(run_process(spec));
  if (outcome.status == OutcomeStatus::errored) {
    log_debug("sandbox", "harness errored: " + outcome.detail);
  }
  return outcome;
}

std::shared_ptr<SandboxRunner> make_sandbox_runner(const EnvConfig& config) {
  SandboxLimits limits = SandboxLimits::from_config(config);
  if (config.backend == SandboxBackend::container) {
    return std::make_shared<ContainerSandboxRunner>(config.container_runtime,
                                                    config.container_image, limits);
  }
  return std::make_shared<ProcessSandboxRunner>(config.interpreter, limits);
}

std::string check_python_syntax(const std::string& interpreter_path, const std::string& source,
                                std::uint64_t timeout_ms) {
  ScopedWorkspace ws("");
  if (!ws.write_file(kSolutionFile, source)) {
    throw SandboxUnavailableError("cannot stage files in " + ws.path().string());
  }
  ProcessSpec spec;
  spec.command = interpreter_path;
  spec.argv = {"-m", "py_compile", kSolutionFile};
  spec.env = harness_environment(interpreter_path, ws.path());
  spec.cwd = ws.path().string();
  spec.timeout_ms = timeout_ms;
  ProcessResult r = run_process(spec);
  if (r.spawn_failed || r.timed_out) {
    throw SandboxUnavailableError("syntax check failed to run: " + failure_text(r));
  }
  if (r.exit_code == 0 && r.term_signal == 0) return {};
  return failure_text(r);
}

}  // namespace sieve
