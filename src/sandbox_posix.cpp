#include "sieve/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>
#include <thread>

#include "sieve/errors.hpp"

extern char** environ;

namespace fs = std::filesystem;

namespace sieve {

namespace {

constexpr unsigned kCloseRangeCloexec = 1U << 2;
constexpr int kPollTickMs = 10;

// Child -> parent setup report over a CLOEXEC pipe. The first byte is a mask
// of kIsolated* bits. The pipe reaches EOF at exec; anything after the first
// byte means the child died before exec.
constexpr unsigned char kIsolatedNet = 1U << 0;
constexpr unsigned char kIsolatedFs = 1U << 1;
constexpr unsigned char kIsolatedPids = 1U << 2;
constexpr char kReportExecFailed = 'E';

// mount_setattr(2); the libc headers may predate it.
constexpr unsigned kAtRecursive = 0x8000;
constexpr std::uint64_t kMountAttrRdonly = 0x1;
struct MountAttr {
  std::uint64_t attr_set;
  std::uint64_t attr_clr;
  std::uint64_t propagation;
  std::uint64_t userns_fd;
};

constexpr const char* kScratchDirs[] = {"/tmp", "/var/tmp", "/dev/shm"};
constexpr const char* kScratchOptions = "size=64m,mode=1777";

// Everything the child needs, prepared before fork: it must not allocate.
struct ChildPlan {
  const ProcessSpec* spec;
  char* const* argv;
  char* const* envp;
  int out_fd;
  int err_fd;
  int report_fd;
  std::string uid_map;
  std::string gid_map;
  std::vector<std::string> cwd_chain;  // every ancestor of cwd, then cwd
};

void set_limit(int resource, std::uint64_t value) {
  struct rlimit rl;
  rl.rlim_cur = static_cast<rlim_t>(value);
  rl.rlim_max = static_cast<rlim_t>(value);
  setrlimit(resource, &rl);
}

void mark_inherited_fds_cloexec() {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, 3U, ~0U, kCloseRangeCloexec) == 0) return;
#endif
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
  for (int fd = 3; fd < max_fd; ++fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}

[[noreturn]] void report_failure(int report_fd, int err) {
  char buf[1 + sizeof(int)];
  buf[0] = kReportExecFailed;
  std::memcpy(buf + 1, &err, sizeof(int));
  (void)!write(report_fd, buf, sizeof(buf));
  _exit(127);
}

// Failure before the isolation byte went out: send an empty mask first.
[[noreturn]] void setup_failed(int report_fd, int err) {
  const unsigned char none = 0;
  (void)!write(report_fd, &none, 1);
  report_failure(report_fd, err);
}

bool write_proc_file(const char* path, const char* data, std::size_t size) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  ssize_t n = write(fd, data, size);
  close(fd);
  return n == static_cast<ssize_t>(size);
}

// "/proc/self/fd/<fd>" without snprintf.
void fd_path(int fd, char (&out)[32]) {
  static constexpr char kPrefix[] = "/proc/self/fd/";
  std::memcpy(out, kPrefix, sizeof(kPrefix) - 1);
  char digits[12];
  int n = 0;
  do {
    digits[n++] = static_cast<char>('0' + fd % 10);
    fd /= 10;
  } while (fd > 0 && n < 11);
  std::size_t pos = sizeof(kPrefix) - 1;
  while (n > 0) out[pos++] = digits[--n];
  out[pos] = '\0';
}

int set_mount_readonly(const char* path, bool readonly, bool recursive) {
#ifdef SYS_mount_setattr
  MountAttr attr{};
  if (readonly) attr.attr_set = kMountAttrRdonly;
  else attr.attr_clr = kMountAttrRdonly;
  if (syscall(SYS_mount_setattr, AT_FDCWD, path, recursive ? kAtRecursive : 0U,
              &attr, sizeof(attr)) == 0) {
    return 0;
  }
#endif
  // Older kernels: only the mount at path itself changes.
  unsigned long flags = MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV;
  if (readonly) flags |= MS_RDONLY;
  return mount(nullptr, path, nullptr, flags, nullptr) == 0 ? 0 : errno;
}

// Returns 0 or the errno of the step that failed.
int confine_filesystem(const ChildPlan& plan) {
  const std::string& cwd = plan.spec->cwd;
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return errno;

  // Held across the read-only flip and the scratch mounts that may hide cwd.
  int ws = -1;
  if (!cwd.empty()) {
    ws = open(cwd.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC);
    if (ws < 0) return errno;
  }

  int err = set_mount_readonly("/", true, true);
  for (const char* dir : kScratchDirs) {
    if (err != 0) break;
    if (mount("tmpfs", dir, "tmpfs", MS_NOSUID | MS_NODEV, kScratchOptions) != 0 &&
        errno != ENOENT) {
      err = errno;
    }
  }
  if (err == 0 && ws >= 0) {
    for (const auto& dir : plan.cwd_chain) mkdir(dir.c_str(), 0700);
    char src[32];
    fd_path(ws, src);
    if (mount(src, cwd.c_str(), nullptr, MS_BIND, nullptr) != 0) {
      err = errno;
    } else if (access(cwd.c_str(), W_OK) != 0) {
      err = set_mount_readonly(cwd.c_str(), false, false);
      if (err == 0 && access(cwd.c_str(), W_OK) != 0) err = errno;
    }
  }
  if (ws >= 0) close(ws);
  return err;
}

// Returns the namespaces entered (CLONE_* bits) and sets *user_ns.
int enter_namespaces(const ProcessSpec& spec, bool* user_ns) {
  const int net = spec.network_isolation ? CLONE_NEWNET : 0;
  if (spec.filesystem_isolation) {
    const int wanted = CLONE_NEWNS | CLONE_NEWPID | net;
    if (unshare(CLONE_NEWUSER | wanted) == 0) {
      *user_ns = true;
      return wanted;
    }
    if (unshare(wanted) == 0) return wanted;
  }
  if (net != 0) {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
      *user_ns = true;
      return CLONE_NEWNET;
    }
    if (unshare(CLONE_NEWNET) == 0) return CLONE_NEWNET;
  }
  return 0;
}

// Final stage: redirect, confine resources, exec.
[[noreturn]] void exec_target(const ChildPlan& plan) {
  const ProcessSpec& spec = *plan.spec;
  int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    dup2(devnull, STDIN_FILENO);
    close(devnull);
  }
  dup2(plan.out_fd, STDOUT_FILENO);
  dup2(plan.err_fd, STDERR_FILENO);
  close(plan.out_fd);
  close(plan.err_fd);

  if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) report_failure(plan.report_fd, errno);
  if (spec.max_memory_bytes > 0) set_limit(RLIMIT_AS, spec.max_memory_bytes);
  if (spec.max_processes > 0) set_limit(RLIMIT_NPROC, spec.max_processes);
  if (spec.max_file_descriptors > 0) set_limit(RLIMIT_NOFILE, spec.max_file_descriptors);
  if (spec.max_file_size_bytes > 0) set_limit(RLIMIT_FSIZE, spec.max_file_size_bytes);
  if (spec.cpu_limit && spec.timeout_ms > 0) {
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>((spec.timeout_ms + 999) / 1000 + 1);
    rl.rlim_max = rl.rlim_cur + 1;
    setrlimit(RLIMIT_CPU, &rl);
  }
  mark_inherited_fds_cloexec();
  execve(spec.command.c_str(), plan.argv, plan.envp);
  report_failure(plan.report_fd, errno);
}

// Waits for the namespace's PID 1 and leaves the same way it did.
[[noreturn]] void mirror_exit(pid_t init) {
  int status = 0;
  while (waitpid(init, &status, 0) < 0) {
    if (errno != EINTR) _exit(127);
  }
  if (WIFEXITED(status)) _exit(WEXITSTATUS(status));
  const int sig = WIFSIGNALED(status) ? WTERMSIG(status) : SIGKILL;
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SIG_DFL;
  sigaction(sig, &sa, nullptr);
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, sig);
  sigprocmask(SIG_UNBLOCK, &set, nullptr);
  kill(getpid(), sig);
  _exit(128 + sig);
}

// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const ChildPlan& plan) {
  const ProcessSpec& spec = *plan.spec;
  setsid();
  set_limit(RLIMIT_CORE, 0);

  bool user_ns = false;
  const int entered = enter_namespaces(spec, &user_ns);
  if (user_ns) {
    if (!write_proc_file("/proc/self/setgroups", "deny", 4) ||
        !write_proc_file("/proc/self/uid_map", plan.uid_map.data(), plan.uid_map.size()) ||
        !write_proc_file("/proc/self/gid_map", plan.gid_map.data(), plan.gid_map.size())) {
      setup_failed(plan.report_fd, errno);
    }
  }

  unsigned char isolated = 0;
  if (entered & CLONE_NEWNET) isolated |= kIsolatedNet;
  if (entered & CLONE_NEWNS) {
    const int err = confine_filesystem(plan);
    if (err != 0) setup_failed(plan.report_fd, err);
    isolated |= kIsolatedFs;
  }
  if (entered & CLONE_NEWPID) isolated |= kIsolatedPids;
  (void)!write(plan.report_fd, &isolated, 1);

  if (!(entered & CLONE_NEWPID)) exec_target(plan);

  // The first child after unshare(CLONE_NEWPID) is PID 1 of the namespace.
  // Its exit tears down every process left inside.
  pid_t init = fork();
  if (init < 0) report_failure(plan.report_fd, errno);
  if (init == 0) {
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    // Fresh /proc so the suite sees only its own namespace.
    mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);
    exec_target(plan);
  }
  close(plan.report_fd);
  close(plan.out_fd);
  close(plan.err_fd);
  mirror_exit(init);
}

// Drains whatever is readable right now. Returns false once the fd hit EOF.
bool drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_tail(dst, buf, static_cast<std::size_t>(n), limit, truncated);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return true;  // EAGAIN: open but empty
  }
}

void finalize_tail(std::string& dst, std::size_t limit, bool& truncated) {
  if (dst.size() > limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

std::string random_suffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::string s(12, 'x');
  for (char& c : s) c = kAlphabet[rng() % (sizeof(kAlphabet) - 1)];
  return s;
}

}  // namespace

void append_tail(std::string& dst, const char* src, std::size_t n,
                 std::size_t limit, bool& truncated) {
  if (n == 0) return;
  dst.append(src, n);
  // Compact lazily so that steady streaming stays amortized O(n).
  if (dst.size() > 2 * limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  // argv/envp are built before fork: the child must not allocate.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  ChildPlan plan{&spec, argv.data(), envp.data(), -1, -1, -1, {}, {}, {}};
  if (spec.filesystem_isolation || spec.network_isolation) {
    plan.uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    plan.gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
  }
  if (spec.filesystem_isolation && !spec.cwd.empty()) {
    fs::path chain;
    for (const auto& part : fs::path(spec.cwd)) {
      chain /= part;
      if (chain.has_relative_path()) plan.cwd_chain.push_back(chain.string());
    }
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int report_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {out_pipe, err_pipe, report_pipe}) {
      for (int k = 0; k < 2; ++k) {
        if (p[k] >= 0) close(p[k]);
        p[k] = -1;
      }
    }
  };
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(report_pipe, O_CLOEXEC) != 0) {
    result.spawn_failed = true;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    close_all();
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.spawn_failed = true;
    result.error_message = std::string("fork: ") + std::strerror(errno);
    close_all();
    return result;
  }
  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    close(report_pipe[0]);
    plan.out_fd = out_pipe[1];
    plan.err_fd = err_pipe[1];
    plan.report_fd = report_pipe[1];
    exec_child(plan);
  }

  close(out_pipe[1]);
  out_pipe[1] = -1;
  close(err_pipe[1]);
  err_pipe[1] = -1;
  close(report_pipe[1]);
  report_pipe[1] = -1;

  // Blocks only until the child execs or dies; the write end is CLOEXEC.
  std::string report;
  {
    char buf[16];
    while (true) {
      ssize_t n = read(report_pipe[0], buf, sizeof(buf));
      if (n > 0) { report.append(buf, static_cast<size_t>(n)); continue; }
      if (n < 0 && errno == EINTR) continue;
      break;
    }
  }
  const unsigned char isolated = report.empty() ? 0 : static_cast<unsigned char>(report[0]);
  result.network_isolated = (isolated & kIsolatedNet) != 0;
  result.filesystem_isolated = (isolated & kIsolatedFs) != 0;
  result.pid_isolated = (isolated & kIsolatedPids) != 0;
  if (report.size() >= 1 + 1 + sizeof(int) && report[1] == kReportExecFailed) {
    int child_errno = 0;
    std::memcpy(&child_errno, report.data() + 2, sizeof(int));
    result.spawn_failed = true;
    result.error_message = std::string("exec ") + spec.command + ": " + std::strerror(child_errno);
    result.network_isolated = result.filesystem_isolated = result.pid_isolated = false;
  }
  result.rlimits_applied = !result.spawn_failed;

  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  bool out_open = true;
  bool err_open = true;
  bool reaped = false;
  while (!reaped) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
    if (nfds > 0) {
      poll(fds, nfds, kPollTickMs);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollTickMs));
    }
    if (out_open) out_open = drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    if (err_open) err_open = drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      reaped = true;
      break;
    }
    const bool cancelled = spec.cancel && spec.cancel->cancelled();
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
      result.timed_out = !cancelled;
      result.cancelled = cancelled;
      reaped = true;
    }
  }

  // Stragglers left in the session still hold the pipes open.
  kill(-pid, SIGKILL);
  if (out_open) drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  if (err_open) drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
  close_all();

  finalize_tail(result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  finalize_tail(result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

  result.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started).count());

  if (result.timed_out || result.cancelled) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
  return result;
}

std::map<std::string, std::string> inherited_environment() {
  std::map<std::string, std::string> env;
  for (char** e = environ; e && *e; ++e) {
    const char* eq = std::strchr(*e, '=');
    const char* entry = *e;
    if (eq) env[std::string(entry, eq)] = std::string(eq + 1);
  }
  return env;
}

std::string find_executable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : std::string{};
  }
  const char* path_env = std::getenv("PATH");
  std::string path = (path_env && path_env[0]) ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    if (end == std::string::npos) end = path.size();
    std::string dir = path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate)) return candidate;
    start = end + 1;
  }
  return {};
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.workspace_confinement = true;
  caps.rlimits_cpu = true;
  caps.rlimits_mem = true;
  caps.rlimits_nproc = true;
  caps.rlimits_fds = true;
  caps.process_group_kill = true;

  // Try namespace support in a throwaway child, in the order run_process
  // tries them. The exit status is a mask of what unshare() accepted.
  enum : int { kUser = 1, kNet = 2, kMount = 4, kPid = 8 };
  pid_t pid = fork();
  if (pid == 0) {
    const int all = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWNET;
    if (unshare(CLONE_NEWUSER | all) == 0) _exit(kUser | kNet | kMount | kPid);
    if (unshare(all) == 0) _exit(kNet | kMount | kPid);
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) _exit(kUser | kNet);
    if (unshare(CLONE_NEWNET) == 0) _exit(kNet);
    _exit(0);
  }
  if (pid > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status)) {
      const int mask = WEXITSTATUS(status);
      caps.user_namespace = (mask & kUser) != 0;
      caps.network_namespace = (mask & kNet) != 0;
      caps.mount_namespace = (mask & kMount) != 0;
      caps.pid_namespace = (mask & kPid) != 0;
    }
  }
  return caps;
}

OutcomeStatus classify_harness_exit(const ProcessResult& r, std::string* detail) {
  auto set = [&](std::string d) { if (detail) *detail = std::move(d); };
  if (r.cancelled) { set("cancelled"); return OutcomeStatus::timed_out; }
  if (r.timed_out) { set("timeout"); return OutcomeStatus::timed_out; }
  if (r.spawn_failed) { set("spawn_failed"); return OutcomeStatus::errored; }
  if (r.term_signal != 0) {
    set("signal_" + std::to_string(r.term_signal));
    return OutcomeStatus::errored;
  }
  if (r.exit_code == 0) { set(""); return OutcomeStatus::passed; }
  // RLIMIT_AS surfaces as a Python MemoryError, which pytest reports as an
  // ordinary test failure.
  if (r.exit_code == 1 && (r.stdout_text.find("MemoryError") != std::string::npos ||
                           r.stderr_text.find("MemoryError") != std::string::npos)) {
    set("memory_limit");
    return OutcomeStatus::errored;
  }
  set("pytest_exit_" + std::to_string(r.exit_code));
  // 2 collection/import error, 3 internal, 4 usage, 5 nothing collected.
  return r.exit_code == 1 ? OutcomeStatus::failed : OutcomeStatus::errored;
}

// ---------------------------------------------------------------------------
// ScopedWorkspace
// ---------------------------------------------------------------------------

ScopedWorkspace::ScopedWorkspace(const std::string& root) {
  std::error_code ec;
  const fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
  if (ec) throw SandboxUnavailableError("no temp directory: " + ec.message());
  fs::create_directories(base, ec);
  if (ec) throw SandboxUnavailableError("cannot create work root " + base.string() + ": " + ec.message());

  std::string tmpl = (base / ("sieve-" + random_suffix() + "-XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw SandboxUnavailableError("mkdtemp under " + base.string() + ": " + std::strerror(errno));
  }
  path_ = fs::path(buf.data());
}

ScopedWorkspace::~ScopedWorkspace() {
  std::error_code ec;
  // The suite may have dropped write permission on what it created.
  for (auto it = fs::recursive_directory_iterator(path_, fs::directory_options::skip_permission_denied, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_directory(ec)) {
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
    }
  }
  fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
  fs::remove_all(path_, ec);
}

bool ScopedWorkspace::write_file(const std::string& name, const std::string& content) const {
  std::ofstream ofs(path_ / name, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(ofs);
}

std::vector<std::string> harness_pytest_args() {
  return {"-m", "pytest", kSuiteFile, "-q", "--tb=short", "-p", "no:cacheprovider"};
}

}  // namespace sieve
