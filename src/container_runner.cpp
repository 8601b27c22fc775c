#include <unistd.h>

#include <functional>

#include "sieve/errors.hpp"
#include "sieve/observability.hpp"
#include "sieve/sandbox.hpp"

namespace sieve {

namespace {

constexpr std::uint64_t kRuntimeCommandTimeoutMs = 30000;
constexpr const char* kContainerWorkdir = "/workspace";
constexpr int kRuntimeErrorFirst = 125;
constexpr int kRuntimeErrorLast = 127;

ProcessSpec client_spec(const std::string& runtime_path, std::vector<std::string> args) {
  ProcessSpec spec;
  spec.command = runtime_path;
  spec.argv = std::move(args);
  spec.env = inherited_environment();
  spec.timeout_ms = kRuntimeCommandTimeoutMs;
  spec.cpu_limit = false;
  return spec;
}

struct OnExit {
  std::function<void()> fn;
  ~OnExit() { if (fn) fn(); }
};

}  // namespace

ExecutionOutcome container_outcome_from_process(const ProcessResult& r) {
  if (!r.timed_out && !r.cancelled && r.term_signal == 0 &&
      r.exit_code >= kRuntimeErrorFirst && r.exit_code <= kRuntimeErrorLast) {
    throw SandboxUnavailableError("container runtime failed with exit " +
                                  std::to_string(r.exit_code) + ": " + r.stderr_text);
  }
  return outcome_from_process(r);
}

std::vector<std::string> container_run_args(const std::string& name, const std::string& image,
                                            const std::string& workspace,
                                            const SandboxLimits& limits) {
  // Same uid/gid as the workspace owner, so whatever the suite creates stays
  // removable by ~ScopedWorkspace.
  const std::string user = std::to_string(getuid()) + ":" + std::to_string(getgid());
  std::vector<std::string> args = {
      "run", "--rm", "--name", name,
      "--user", user,
      "--network", "none",
      "--read-only",
      "--tmpfs", "/tmp:rw,nosuid,nodev,size=64m",
      "--cap-drop", "ALL",
      "--security-opt", "no-new-privileges",
      "--cpus", "1",
      "-e", std::string("HOME=") + kContainerWorkdir,
      "-e", "TMPDIR=/tmp",
      "-e", "PYTHONHASHSEED=0",
      "-e", "PYTHONDONTWRITEBYTECODE=1",
      "-e", "PYTEST_DISABLE_PLUGIN_AUTOLOAD=1",
      "-v", workspace + ":" + kContainerWorkdir,
      "-w", kContainerWorkdir,
  };
  if (limits.max_memory_bytes > 0) {
    args.insert(args.end(), {"--memory", std::to_string(limits.max_memory_bytes)});
  }
  if (limits.max_processes > 0) {
    args.insert(args.end(), {"--pids-limit", std::to_string(limits.max_processes)});
  }
  if (limits.max_file_descriptors > 0) {
    const std::string n = std::to_string(limits.max_file_descriptors);
    args.insert(args.end(), {"--ulimit", "nofile=" + n + ":" + n});
  }
  args.push_back(image);
  args.push_back("python");
  for (auto& a : harness_pytest_args()) args.push_back(std::move(a));
  return args;
}

ContainerSandboxRunner::ContainerSandboxRunner(const std::string& runtime, const std::string& image,
                                               SandboxLimits limits)
    : image_(image), limits_(std::move(limits)) {
  runtime_path_ = find_executable(runtime);
  if (runtime_path_.empty()) {
    throw SandboxUnavailableError("container runtime not found: " + runtime);
  }
  ProcessResult r = run_process(client_spec(runtime_path_, {"image", "inspect", image_}));
  if (r.spawn_failed || r.timed_out || r.exit_code != 0) {
    std::string why = r.spawn_failed ? r.error_message : r.stderr_text;
    throw SandboxUnavailableError("image " + image_ + " is not available to " + runtime_path_ +
                                  (why.empty() ? std::string{} : ": " + why));
  }
  log_info("sandbox", "container backend ready, image " + image_);
}

ContainerSandboxRunner::~ContainerSandboxRunner() { close(); }

void ContainerSandboxRunner::close() { closed_.store(true, std::memory_order_release); }

std::string ContainerSandboxRunner::next_container_name() {
  return "sieve-" + std::to_string(static_cast<long>(getpid())) + "-" +
         std::to_string(seq_.fetch_add(1, std::memory_order_relaxed));
}

void ContainerSandboxRunner::remove_container(const std::string& name) {
  ProcessResult r = run_process(client_spec(runtime_path_, {"rm", "-f", name}));
  if (r.spawn_failed || r.timed_out ||
      (r.exit_code != 0 && r.stderr_text.find("No such container") == std::string::npos)) {
    log_warn("sandbox", "failed to remove container " + name + ": " +
                            (r.spawn_failed ? r.error_message : r.stderr_text));
  }
}

ExecutionOutcome ContainerSandboxRunner::execute(const std::string& test_suite,
                                                 const std::string& implementation_code,
                                                 std::chrono::milliseconds timeout,
                                                 const CancelToken* cancel) {
  if (implementation_code.empty()) throw InvalidInputError("implementation code is empty");
  if (timeout.count() <= 0) throw InvalidInputError("execution timeout must be positive");
  if (closed_.load(std::memory_order_acquire)) {
    throw SandboxUnavailableError("container runner is closed");
  }

  ScopedWorkspace ws(limits_.work_root);
  if (!ws.write_file(kSolutionFile, implementation_code) || !ws.write_file(kSuiteFile, test_suite)) {
    throw SandboxUnavailableError("cannot stage files in " + ws.path().string());
  }

  const std::string name = next_container_name();
  std::vector<std::string> args = container_run_args(name, image_, ws.path().string(), limits_);

  // Killing the client does not stop the container; remove it on every path
  // where it may have outlived the client.
  bool needs_removal = true;
  OnExit guard{[&]() { if (needs_removal) remove_container(name); }};

  ProcessSpec spec = client_spec(runtime_path_, std::move(args));
  spec.timeout_ms = static_cast<std::uint64_t>(timeout.count());
  spec.max_output_bytes = limits_.max_output_bytes;
  spec.cancel = cancel;

  ProcessResult r = run_process(spec);
  if (!r.spawn_failed && !r.timed_out && !r.cancelled && r.term_signal == 0 &&
      (r.exit_code < kRuntimeErrorFirst || r.exit_code > kRuntimeErrorLast)) {
    needs_removal = false;
  }
  return container_outcome_from_process(r);
}

}  // namespace sieve
