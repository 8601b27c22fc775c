#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "sieve/c_api.h"
#include "sieve/config.hpp"
#include "sieve/coordinator.hpp"
#include "sieve/environment.hpp"
#include "sieve/errors.hpp"
#include "sieve/hash.hpp"
#include "sieve/jsonlite.hpp"
#include "sieve/observability.hpp"
#include "sieve/problem_store.hpp"
#include "sieve/reward.hpp"
#include "sieve/sandbox.hpp"
#include "sieve/version.hpp"
#include "sieve/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void skip_test(const std::string& name, const std::string& why) {
  std::cout << "  " << name << "... SKIPPED (" << why << ")\n";
  g_tests_skipped++;
}

template <typename E, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
  fs::path path;
  TempDir() {
    static std::atomic<int> seq{0};
    path = fs::temp_directory_path() /
           ("sieve_test_" + std::to_string(::getpid()) + "_" + std::to_string(seq++));
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  void write(const std::string& name, const std::string& content) const {
    std::ofstream ofs(path / name, std::ios::binary | std::ios::trunc);
    ofs << content;
  }
};

std::string problem_json(const std::string& spec, const std::string& problem,
                         const std::vector<std::string>& perturbations,
                         const std::string& id = "") {
  std::string out = "{";
  if (!id.empty()) out += "\"id\":\"" + sieve::jsonlite::escape(id) + "\",";
  out += "\"spec\":\"" + sieve::jsonlite::escape(spec) + "\",\"problem\":\"" +
         sieve::jsonlite::escape(problem) + "\",\"perturbations\":[";
  for (size_t i = 0; i < perturbations.size(); ++i) {
    if (i) out += ",";
    out += "\"" + sieve::jsonlite::escape(perturbations[i]) + "\"";
  }
  return out + "]}";
}

sieve::ProblemRecord make_record(const std::string& id, const std::string& reference,
                                 const std::vector<std::string>& perturbations) {
  sieve::ProblemRecord r;
  r.id = id;
  r.spec = "spec for " + id;
  r.reference_code = reference;
  r.perturbations = perturbations;
  return r;
}

sieve::ExecutionOutcome outcome(sieve::OutcomeStatus s) {
  sieve::ExecutionOutcome o;
  o.status = s;
  return o;
}

// ---------------------------------------------------------------------------
// FakeRunner - scripted SandboxRunner keyed by implementation code.
// ---------------------------------------------------------------------------
class FakeRunner : public sieve::SandboxRunner {
 public:
  std::map<std::string, sieve::OutcomeStatus> status_by_code;
  std::map<std::string, int> delay_ms_by_code;
  bool hang_until_cancel{false};
  std::atomic<int> calls{0};
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  std::atomic<bool> closed{false};

  sieve::ExecutionOutcome execute(const std::string& test_suite,
                                  const std::string& implementation_code,
                                  std::chrono::milliseconds timeout,
                                  const sieve::CancelToken* cancel) override {
    (void)test_suite;
    if (implementation_code.empty()) throw sieve::InvalidInputError("empty implementation");
    if (timeout.count() <= 0) throw sieve::InvalidInputError("bad timeout");
    calls++;
    struct Active {
      FakeRunner& r;
      explicit Active(FakeRunner& runner) : r(runner) {
        int now = ++r.active;
        int prev = r.max_active.load();
        while (now > prev && !r.max_active.compare_exchange_weak(prev, now)) {}
      }
      ~Active() { --r.active; }
    } guard(*this);

    if (implementation_code == "boom") throw sieve::SandboxUnavailableError("runner exploded");

    sieve::ExecutionOutcome o;
    o.detail = implementation_code;
    if (hang_until_cancel) {
      while (!(cancel && cancel->cancelled())) std::this_thread::sleep_for(2ms);
      o.status = sieve::OutcomeStatus::timed_out;
      o.detail = "cancelled";
      return o;
    }
    auto d = delay_ms_by_code.find(implementation_code);
    if (d != delay_ms_by_code.end()) std::this_thread::sleep_for(std::chrono::milliseconds(d->second));
    auto s = status_by_code.find(implementation_code);
    o.status = (s == status_by_code.end()) ? sieve::OutcomeStatus::passed : s->second;
    return o;
  }

  std::string backend_name() const override { return "fake"; }
  void close() override { closed = true; }
};

sieve::EnvConfig fake_config() {
  sieve::EnvConfig c;
  c.dataset_path = "unused";
  c.execution_timeout_ms = 2000;
  c.step_timeout_slack_ms = 2000;
  c.parallelism = 3;
  c.seed = 11;
  return c;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(sieve::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(sieve::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "def test_x(): pass";
  expect(sieve::suite_digest(payload) != sieve::problem_digest(payload), "suite vs problem domain");
  expect(sieve::suite_digest(payload) != sieve::result_digest(payload), "suite vs result domain");
  expect(sieve::suite_digest(payload) == sieve::hash_domain("suite:", payload), "suite domain prefix");
  expect(sieve::suite_digest(payload).size() == 64, "digest is 64 hex chars");
  expect(sieve::hash_runtime_info().primitive == "blake3", "hash primitive");
}

// ============================================================================
// JSON
// ============================================================================

void test_json_unicode_escapes() {
  std::optional<sieve::jsonlite::JsonError> err;
  auto obj = sieve::jsonlite::parse("{\"a\":\"caf\\u00e9\",\"b\":\"\\ud83d\\ude00\",\"c\":\"tab\\there\"}", &err);
  expect(!err, "unicode escapes parse");
  expect(sieve::jsonlite::get_string(obj, "a") == "caf\xc3\xa9", "BMP escape decoded to UTF-8");
  expect(sieve::jsonlite::get_string(obj, "b") == "\xf0\x9f\x98\x80", "surrogate pair decoded");
  expect(sieve::jsonlite::get_string(obj, "c") == "tab\there", "tab escape decoded");
}

void test_json_duplicate_key_rejected() {
  std::optional<sieve::jsonlite::JsonError> err;
  sieve::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value(), "duplicate key must fail");
  expect(err->code == "json_duplicate_key", "duplicate key error code");
}

void test_json_canonical_and_escape() {
  std::optional<sieve::jsonlite::JsonError> err;
  const std::string canon = sieve::jsonlite::canonicalize_json(R"({ "b": [1, true, null], "a": "x" })", &err);
  expect(!err, "canonicalize parses");
  expect(canon == R"({"a":"x","b":[1,true,null]})", "keys sorted, whitespace dropped");
  expect(sieve::jsonlite::escape(std::string("a\x01" "b")) == "a\\u0001b", "control chars escaped");
  expect(sieve::jsonlite::format_double(0.6) == "0.6", "trailing zeros trimmed");
  expect(sieve::jsonlite::format_double(1.0) == "1.0", "integral double");
}

void test_json_rejects_trailing_garbage() {
  expect(sieve::jsonlite::validate_strict("{} x").has_value(), "trailing garbage rejected");
  std::optional<sieve::jsonlite::JsonError> err;
  sieve::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "top-level array is not an object");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults() {
  sieve::EnvConfig c;
  expect(c.execution_timeout_ms == 30000, "default execution timeout");
  expect(c.parallelism == 4, "default parallelism");
  expect(c.max_output_bytes == 4096, "default output cap");
  expect(!c.multi_turn && c.max_turns == 1, "single-shot by default");
  expect(!validate_config(c).ok, "dataset_path is required");
  c.dataset_path = "/data";
  expect(validate_config(c).ok, "defaults plus dataset_path are valid");
}

void test_config_parse_and_validate() {
  sieve::ConfigValidationResult r;
  auto c = sieve::parse_config_json(
      R"({"dataset_path":"/d","parallelism":8,"seed":42,"backend":"container","multi_turn":true,"max_turns":3,"bogus":1})",
      &r);
  expect(r.ok, "config parses");
  expect(c.parallelism == 8 && c.seed && *c.seed == 42, "numeric fields read");
  expect(c.backend == sieve::SandboxBackend::container, "backend read");
  expect(c.multi_turn && c.max_turns == 3, "multi-turn read");
  expect(std::any_of(r.warnings.begin(), r.warnings.end(),
                     [](const std::string& w) { return w.find("bogus") != std::string::npos; }),
         "unknown key warned");

  sieve::ConfigValidationResult bad;
  sieve::parse_config_json(R"({"dataset_path":"/d","parallelism":"four"})", &bad);
  expect(!bad.ok, "wrong type rejected");

  sieve::EnvConfig zero;
  zero.dataset_path = "/d";
  zero.parallelism = 0;
  expect(!sieve::validate_config(zero).ok, "parallelism 0 rejected");

  sieve::ConfigValidationResult again;
  auto copy = sieve::parse_config_json(sieve::config_to_json(c), &again);
  expect(again.ok && again.warnings.empty(), "serialized config reads back cleanly");
  expect(copy.parallelism == 8 && copy.max_turns == 3 && copy.seed == c.seed, "serialized config keeps values");

  expect(throws<sieve::ConfigError>([] { sieve::load_config_file("/nonexistent/sieve.json"); }),
         "missing config file is ConfigError");
}

// ============================================================================
// ProblemStore
// ============================================================================

void test_store_load_and_skip() {
  TempDir dir;
  dir.write("b_add.json", problem_json("add", "def add(a,b): return a+b", {"p1", "p2"}));
  dir.write("a_mul.json", problem_json("mul", "def mul(a,b): return a*b", {"q1"}, "multiply"));
  dir.write("c_broken.json", "{not json");
  dir.write("d_noperts.json", problem_json("x", "y", {}));
  dir.write("e_missing.json", R"({"spec":"s","perturbations":["p"]})");
  dir.write("f_dup.json", problem_json("dup", "z", {"p"}, "multiply"));
  dir.write("notes.txt", "ignored");

  auto store = sieve::ProblemStore::load(dir.path.string());
  expect(store.size() == 2, "two valid records");
  expect(store.at(0).id == "multiply", "explicit id, sorted filename order");
  expect(store.at(1).id == "b_add", "id defaults to file stem");
  expect(store.at(1).perturbations.size() == 2, "perturbations kept in order");
  expect(store.at(1).content_digest.size() == 64, "content digest computed");
  expect(store.skipped().size() == 4, "four records skipped");
  expect(store.find("b_add") != nullptr && store.find("nope") == nullptr, "find by id");
  expect(throws<sieve::InvalidInputError>([&] { store.at(5); }), "at() out of range");

  bool saw_dup = false;
  for (const auto& s : store.skipped()) {
    if (s.reason.find("duplicate id") != std::string::npos) saw_dup = true;
  }
  expect(saw_dup, "duplicate id reported");
}

void test_store_skips_blank_code() {
  TempDir dir;
  dir.write("a_ok.json", problem_json("s", "def f():\n    return 0\n", {"def f():\n    return 1\n"}));
  dir.write("b_blank_problem.json", problem_json("s", "", {"def f():\n    return 1\n"}));
  dir.write("c_blank_perturbation.json", problem_json("s", "def f():\n    return 0\n", {"x = 1", " \n\t"}));
  dir.write("d_blank_spec.json", problem_json("  ", "def f():\n    return 0\n", {"x = 1"}));

  auto store = sieve::ProblemStore::load(dir.path.string());
  expect(store.size() == 1 && store.at(0).id == "a_ok", "only the complete record loads");
  expect(store.skipped().size() == 3, "three blank records skipped");
  std::set<std::string> reasons;
  for (const auto& s : store.skipped()) reasons.insert(s.reason);
  expect(reasons.count("field is empty: problem") == 1, "blank problem reported");
  expect(reasons.count("perturbation 1 is empty") == 1, "blank perturbation reported by index");
  expect(reasons.count("field is empty: spec") == 1, "blank spec reported");
  for (const char* name : {"b_blank_problem.json", "c_blank_perturbation.json"}) {
    expect(!sieve::validate_problem_file((dir.path / name).string()).ok,
           std::string("offline validation agrees on ") + name);
  }

  auto mem = sieve::ProblemStore::from_records({make_record("x", "", {"p"}),
                                                make_record("y", "r", {"p", ""}),
                                                make_record("z", "r", {"p"})});
  expect(mem.size() == 1 && mem.at(0).id == "z", "in-memory records follow the same rule");
  expect(mem.skipped().size() == 2, "blank in-memory records skipped");
}

void test_store_expected_perturbations() {
  TempDir dir;
  dir.write("five.json", problem_json("s", "r", {"1", "2", "3", "4", "5"}));
  dir.write("two.json", problem_json("s", "r", {"1", "2"}));
  sieve::ProblemStoreOptions opts;
  opts.expected_perturbations = 5;
  auto store = sieve::ProblemStore::load(dir.path.string(), opts);
  expect(store.size() == 1 && store.at(0).id == "five", "count mismatch skipped");
}

void test_store_fatal_conditions() {
  expect(throws<sieve::DatasetError>([] { sieve::ProblemStore::load("/nonexistent/problems"); }),
         "missing location is DatasetError");
  TempDir empty;
  expect(throws<sieve::DatasetError>([&] { sieve::ProblemStore::load(empty.path.string()); }),
         "no candidate files is DatasetError");
  TempDir bad;
  bad.write("x.json", "[]");
  expect(throws<sieve::DatasetError>([&] { sieve::ProblemStore::load(bad.path.string()); }),
         "zero valid records is DatasetError");

  auto none = sieve::ProblemStore::from_records({});
  std::mt19937_64 rng(1);
  expect(throws<sieve::EmptyDatasetError>([&] { none.sample(rng); }), "sampling empty store");
}

void test_store_seeded_sampling() {
  std::vector<sieve::ProblemRecord> recs;
  for (int i = 0; i < 20; ++i) recs.push_back(make_record("p" + std::to_string(i), "r", {"x"}));
  auto store = sieve::ProblemStore::from_records(recs);
  std::mt19937_64 a(1234), b(1234);
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    const auto& x = store.sample(a);
    const auto& y = store.sample(b);
    expect(x.id == y.id, "same seed, same sequence");
    seen.insert(x.id);
  }
  expect(seen.size() > 1, "sampling is not constant");
}

void test_validate_problem_file() {
  TempDir dir;
  dir.write("ok.json", problem_json("s", "r", {"a", "b"}));
  dir.write("blank.json", problem_json("   ", "r", {"a", "\n"}));
  auto ok = sieve::validate_problem_file((dir.path / "ok.json").string(), 2);
  expect(ok.ok && ok.num_perturbations == 2, "valid file passes");
  auto blank = sieve::validate_problem_file((dir.path / "blank.json").string());
  expect(!blank.ok, "whitespace-only fields fail validation");
  expect(blank.errors.size() == 2, "blank spec and blank perturbation both reported");
  auto wrong = sieve::validate_problem_file((dir.path / "ok.json").string(), 5);
  expect(!wrong.ok, "expected count enforced");
}

// ============================================================================
// RewardComputer
// ============================================================================

void test_reward_gate_open() {
  using S = sieve::OutcomeStatus;
  auto r = sieve::score(outcome(S::passed), {outcome(S::failed), outcome(S::passed), outcome(S::errored),
                                             outcome(S::timed_out), outcome(S::passed)});
  expect(r.passed_on_reference, "gate open");
  expect(r.detections == std::vector<bool>({true, false, true, true, false}), "detections");
  expect(r.num_detected == 3, "three detected");
  expect(r.reward == 0.6 && r.detection_rate == 0.6, "reward is detection rate");
}

void test_reward_gate_closed() {
  using S = sieve::OutcomeStatus;
  for (S ref : {S::failed, S::errored, S::timed_out}) {
    auto r = sieve::score(outcome(ref), {outcome(S::failed), outcome(S::failed)});
    expect(!r.passed_on_reference, "gate closed");
    expect(r.reward == 0.0 && r.detection_rate == 0.0, "closed gate scores zero");
    expect(r.detections == std::vector<bool>({false, false}), "closed gate detects nothing");
  }
}

void test_reward_deterministic() {
  using S = sieve::OutcomeStatus;
  std::vector<sieve::ExecutionOutcome> perts = {outcome(S::failed), outcome(S::passed)};
  auto a = sieve::score(outcome(S::passed), perts);
  auto b = sieve::score(outcome(S::passed), perts);
  expect(a.result_digest == b.result_digest && a.result_digest.size() == 64, "digest stable");
  expect(sieve::episode_result_to_json(a) == sieve::episode_result_to_json(b), "json stable");
  auto c = sieve::score(outcome(S::passed), {outcome(S::passed), outcome(S::failed)});
  expect(c.reward == a.reward && c.result_digest != a.result_digest, "detection order is digested");
  expect(throws<sieve::InvalidInputError>([] { sieve::score(outcome(S::passed), {}); }),
         "zero perturbations rejected");
}

// ============================================================================
// Sandbox primitives
// ============================================================================

void test_append_tail() {
  std::string buf;
  bool truncated = false;
  for (int i = 0; i < 100; ++i) sieve::append_tail(buf, "0123456789", 10, 16, truncated);
  expect(truncated, "overflow marks truncation");
  expect(buf.size() <= 32, "buffer bounded");
  expect(buf.substr(buf.size() - 10) == "0123456789", "tail kept");
}

void test_classify_harness_exit() {
  using S = sieve::OutcomeStatus;
  sieve::ProcessResult r;
  std::string d;
  r.exit_code = 0;
  expect(sieve::classify_harness_exit(r, &d) == S::passed, "exit 0 passes");
  r.exit_code = 1;
  expect(sieve::classify_harness_exit(r, &d) == S::failed && d == "pytest_exit_1", "exit 1 fails");
  r.stdout_text = "E       MemoryError\n1 failed in 0.02s\n";
  expect(sieve::classify_harness_exit(r, &d) == S::errored && d == "memory_limit",
         "memory cap is errored, not failed");
  r.stdout_text.clear();
  for (int code : {2, 3, 4, 5, 127}) {
    r.exit_code = code;
    expect(sieve::classify_harness_exit(r, &d) == S::errored, "harness error codes are errored");
  }
  r.exit_code = 137;
  r.term_signal = 9;
  expect(sieve::classify_harness_exit(r, &d) == S::errored && d == "signal_9", "signal is errored");
  r.timed_out = true;
  expect(sieve::classify_harness_exit(r, &d) == S::timed_out && d == "timeout", "deadline");
  r.timed_out = false;
  r.cancelled = true;
  expect(sieve::classify_harness_exit(r, &d) == S::timed_out && d == "cancelled", "cancellation");
}

sieve::ProcessSpec shell(const std::string& script, std::uint64_t timeout_ms = 5000) {
  sieve::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", script};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.timeout_ms = timeout_ms;
  return spec;
}

void test_run_process_exit_and_output() {
  auto r = sieve::run_process(shell("echo out; echo err 1>&2; exit 3"));
  expect(!r.spawn_failed && !r.timed_out, "ran");
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stdout_text == "out\n" && r.stderr_text == "err\n", "streams captured");
}

void test_run_process_timeout_kills_group() {
  const auto start = std::chrono::steady_clock::now();
  auto r = sieve::run_process(shell("sleep 30 & sleep 30; wait", 300));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.timed_out, "deadline reported");
  expect(elapsed < 5s, "children killed with the group");
}

void test_run_process_output_bounded() {
  auto spec = shell("i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done");
  spec.max_output_bytes = 64;
  auto r = sieve::run_process(spec);
  expect(r.exit_code == 0, "completed");
  expect(r.stdout_truncated && r.stdout_text.size() == 64, "tail bounded");
  expect(r.stdout_text.find("line1999\n") != std::string::npos, "last line retained");
}

void test_run_process_cancel() {
  sieve::CancelToken token;
  auto spec = shell("sleep 30", 60000);
  spec.cancel = &token;
  std::thread canceller([&] {
    std::this_thread::sleep_for(100ms);
    token.cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  auto r = sieve::run_process(spec);
  canceller.join();
  expect(r.cancelled && !r.timed_out, "cancel reported");
  expect(std::chrono::steady_clock::now() - start < 5s, "cancel is prompt");
}

void test_run_process_spawn_failure() {
  sieve::ProcessSpec spec;
  spec.command = "/nonexistent/binary";
  auto r = sieve::run_process(spec);
  expect(r.spawn_failed, "exec failure reported");
  std::string d;
  expect(sieve::classify_harness_exit(r, &d) == sieve::OutcomeStatus::errored, "spawn failure errored");
}

void test_start_failure_is_unavailable() {
  sieve::ProcessSpec spec;
  spec.command = "/nonexistent/binary";
  auto r = sieve::run_process(spec);
  expect(throws<sieve::SandboxUnavailableError>([&] { sieve::outcome_from_process(r); }),
         "unrunnable harness is not scored");

  auto confined = shell("exit 0");
  confined.cwd = "/nonexistent/workspace";
  confined.filesystem_isolation = true;
  expect(sieve::run_process(confined).spawn_failed, "missing workspace fails before exec");

  for (int code : {125, 126, 127}) {
    sieve::ProcessResult runtime;
    runtime.exit_code = code;
    runtime.stderr_text = "Cannot connect to the Docker daemon";
    expect(throws<sieve::SandboxUnavailableError>([&] { sieve::container_outcome_from_process(runtime); }),
           "container runtime exit " + std::to_string(code) + " is not scored");
  }
  sieve::ProcessResult assertion;
  assertion.exit_code = 1;
  expect(sieve::container_outcome_from_process(assertion).status == sieve::OutcomeStatus::failed,
         "pytest failure inside the container still scores");
  sieve::ProcessResult killed;
  killed.exit_code = 124;
  killed.timed_out = true;
  expect(sieve::container_outcome_from_process(killed).status == sieve::OutcomeStatus::timed_out,
         "client deadline is a timeout");
}

void test_container_run_args() {
  sieve::SandboxLimits limits;
  auto args = sieve::container_run_args("sieve-1-0", "testrunner:latest", "/w/x", limits);
  auto value_after = [&](const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    return (it == args.end() || it + 1 == args.end()) ? std::string("<missing>") : *(it + 1);
  };
  expect(value_after("--user") == std::to_string(::getuid()) + ":" + std::to_string(::getgid()),
         "container runs as the workspace owner");
  expect(std::find(args.begin(), args.end(), "--read-only") != args.end(), "read-only root");
  expect(value_after("--tmpfs").rfind("/tmp", 0) == 0, "private /tmp");
  expect(value_after("--cap-drop") == "ALL", "capabilities dropped");
  expect(value_after("--network") == "none", "no network");
  expect(value_after("-v") == "/w/x:/workspace", "workspace bind");
  auto image = std::find(args.begin(), args.end(), "testrunner:latest");
  expect(image != args.end() && std::find(args.begin(), image, "--pids-limit") != image,
         "runtime flags precede the image");
}

bool namespaces_available() {
  const auto caps = sieve::detect_platform_sandbox_capabilities();
  return caps.mount_namespace && caps.pid_namespace;
}

bool process_with_arg_exists(const std::string& arg) {
  std::error_code ec;
  for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
    std::ifstream ifs(it->path() / "cmdline", std::ios::binary);
    const std::string cmdline((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (cmdline.find(arg) != std::string::npos) return true;
  }
  return false;
}

// Namespace teardown is synchronous, the grace period covers slow /proc.
bool gone_within(const std::string& arg, std::chrono::milliseconds grace) {
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (process_with_arg_exists(arg)) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(20ms);
  }
  return true;
}

void test_run_process_filesystem_isolation() {
  TempDir ws;
  const std::string marker = "/tmp/sieve_scratch_" + std::to_string(::getpid());
  const fs::path host_file = fs::current_path() / ("sieve_leak_" + std::to_string(::getpid()));
  auto spec = shell("echo kept > inside.txt && echo m > " + marker + " && test -f " + marker +
                    " && ! (echo x > " + host_file.string() + ") 2>/dev/null");
  spec.cwd = ws.path.string();
  spec.filesystem_isolation = true;
  auto r = sieve::run_process(spec);
  std::error_code ec;
  const bool leaked = fs::exists(host_file);
  fs::remove(host_file, ec);
  expect(r.filesystem_isolated && r.pid_isolated, "namespaces entered");
  expect(r.exit_code == 0, "workspace and scratch writable, host read-only: " + r.stderr_text);
  expect(fs::exists(ws.path / "inside.txt"), "workspace writes reach the host");
  expect(!fs::exists(marker), "scratch writes discarded");
  expect(!leaked, "writes outside the workspace blocked");
}

void test_run_process_kills_detached_descendants() {
  TempDir ws;
  const std::string tag = "2718." + std::to_string(::getpid());
  auto spec = shell("setsid sleep " + tag + " >/dev/null 2>&1 </dev/null & echo started");
  spec.cwd = ws.path.string();
  spec.filesystem_isolation = true;
  auto r = sieve::run_process(spec);
  expect(r.exit_code == 0 && r.stdout_text == "started\n", "launched: " + r.stderr_text);
  expect(gone_within(tag, 2000ms), "descendant in its own session killed with the run");
}

void test_scoped_workspace_cleanup() {
  TempDir root;
  fs::path p;
  {
    sieve::ScopedWorkspace ws(root.path.string());
    p = ws.path();
    expect(fs::is_directory(p), "workspace created");
    expect(ws.write_file("solution.py", "x = 1\n"), "file written");
    fs::create_directories(p / "sub");
    fs::permissions(p / "sub", fs::perms::owner_read | fs::perms::owner_exec);
  }
  expect(!fs::exists(p), "workspace removed, read-only subdirs included");
}

// ============================================================================
// WorkerPool / ExecutionCoordinator
// ============================================================================

void test_worker_pool_drains_on_shutdown() {
  std::atomic<int> done{0};
  sieve::WorkerPool pool(2);
  for (int i = 0; i < 10; ++i) {
    expect(pool.submit([&] {
      std::this_thread::sleep_for(5ms);
      done++;
    }), "submit accepted");
  }
  pool.shutdown();
  expect(done == 10, "queued tasks drained");
  expect(!pool.submit([] {}), "submit after shutdown refused");
  pool.shutdown();
}

void test_coordinator_index_alignment() {
  auto runner = std::make_shared<FakeRunner>();
  runner->status_by_code = {{"p0", sieve::OutcomeStatus::failed}, {"p2", sieve::OutcomeStatus::errored}};
  // Earlier slots finish last.
  runner->delay_ms_by_code = {{"ref", 60}, {"p0", 45}, {"p1", 30}, {"p2", 15}, {"p3", 0}};
  sieve::CoordinatorOptions opts;
  opts.parallelism = 5;
  sieve::ExecutionCoordinator coord(runner, opts);

  auto out = coord.run("suite", make_record("x", "ref", {"p0", "p1", "p2", "p3"}));
  expect(out.reference.detail == "ref", "reference slot");
  expect(out.perturbations.size() == 4, "N slots");
  for (size_t i = 0; i < 4; ++i) {
    expect(out.perturbations[i].detail == "p" + std::to_string(i), "slot i holds perturbation i");
  }
  expect(out.perturbations[0].status == sieve::OutcomeStatus::failed, "status aligned");
  expect(out.perturbations[2].status == sieve::OutcomeStatus::errored, "status aligned");
}

void test_coordinator_bounded_parallelism() {
  auto runner = std::make_shared<FakeRunner>();
  std::vector<std::string> perts;
  for (int i = 0; i < 12; ++i) {
    perts.push_back("p" + std::to_string(i));
    runner->delay_ms_by_code[perts.back()] = 20;
  }
  sieve::CoordinatorOptions opts;
  opts.parallelism = 3;
  sieve::ExecutionCoordinator coord(runner, opts);
  coord.run("suite", make_record("x", "ref", perts));
  expect(runner->calls == 13, "all N+1 executed");
  expect(runner->max_active <= 3, "concurrency bounded by parallelism");
}

void test_coordinator_all_timeouts() {
  auto runner = std::make_shared<FakeRunner>();
  for (const char* c : {"ref", "a", "b"}) runner->status_by_code[c] = sieve::OutcomeStatus::timed_out;
  sieve::ExecutionCoordinator coord(runner, {});
  auto out = coord.run("suite", make_record("x", "ref", {"a", "b"}));
  expect(out.reference.status == sieve::OutcomeStatus::timed_out, "reference timed out");
  expect(out.perturbations.size() == 2, "all slots populated");
  auto r = sieve::score(out.reference, out.perturbations);
  expect(r.reward == 0.0 && !r.passed_on_reference, "scores zero without error");
}

void test_coordinator_step_deadline() {
  auto runner = std::make_shared<FakeRunner>();
  runner->hang_until_cancel = true;
  sieve::CoordinatorOptions opts;
  opts.execution_timeout = 50ms;
  opts.step_slack = 50ms;
  opts.parallelism = 2;
  sieve::ExecutionCoordinator coord(runner, opts);
  expect(coord.step_budget(3) == 150ms, "two waves plus slack");

  const auto start = std::chrono::steady_clock::now();
  expect(throws<sieve::EpisodeTimeoutError>([&] { coord.run("suite", make_record("x", "ref", {"a", "b"})); }),
         "step deadline raises EpisodeTimeoutError");
  expect(std::chrono::steady_clock::now() - start < 3s, "deadline enforced promptly");
  expect(runner->active == 0, "no execution left running");
}

void test_coordinator_propagates_task_errors() {
  auto runner = std::make_shared<FakeRunner>();
  sieve::ExecutionCoordinator coord(runner, {});
  expect(throws<sieve::SandboxUnavailableError>([&] { coord.run("suite", make_record("x", "ref", {"ok", "boom"})); }),
         "task exception rethrown after fan-in");
  expect(runner->calls == 3, "other slots still executed");
  expect(runner->active == 0, "drained before rethrow");
}

void test_coordinator_oversized_suite() {
  auto runner = std::make_shared<FakeRunner>();
  sieve::CoordinatorOptions opts;
  opts.max_suite_bytes = 8;
  sieve::ExecutionCoordinator coord(runner, opts);
  auto out = coord.run(std::string(9, 'x'), make_record("x", "ref", {"a"}));
  expect(runner->calls == 0, "oversized suite not executed");
  expect(out.reference.status == sieve::OutcomeStatus::errored && out.reference.detail == "suite_too_large",
         "oversized suite is errored");
}

// ============================================================================
// EpisodeController
// ============================================================================

std::mutex g_events_mu;
std::vector<sieve::EpisodeEvent> g_events;
void capture_event(const sieve::EpisodeEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

std::shared_ptr<const sieve::ProblemStore> fake_store() {
  return std::make_shared<const sieve::ProblemStore>(sieve::ProblemStore::from_records(
      {make_record("alpha", "ref", {"SECRET_MUTANT_A", "SECRET_MUTANT_B"}),
       make_record("beta", "ref", {"SECRET_MUTANT_C"})}));
}

void test_controller_state_machine() {
  auto runner = std::make_shared<FakeRunner>();
  runner->status_by_code = {{"SECRET_MUTANT_A", sieve::OutcomeStatus::failed},
                            {"SECRET_MUTANT_C", sieve::OutcomeStatus::failed}};
  sieve::EpisodeController env(fake_config(), fake_store(), runner);

  expect(env.state() == sieve::EpisodeState::idle, "starts idle");
  expect(throws<sieve::InvalidStateError>([&] { env.step("suite"); }), "step before reset");

  auto obs = env.reset();
  expect(env.state() == sieve::EpisodeState::awaiting_submission, "reset awaits submission");
  expect(obs.spec == "spec for " + obs.problem_id && obs.reference_code == "ref", "observation content");
  expect(sieve::observation_to_json(obs).find("SECRET_MUTANT") == std::string::npos,
         "observation never exposes perturbations");

  auto res = env.step("suite");
  expect(res.terminated && !res.truncated, "single-shot terminates");
  expect(env.state() == sieve::EpisodeState::idle, "back to idle");
  expect(res.info.passed_on_reference, "reference passed");
  expect(res.info.perturbation_outcomes.size() == obs.num_perturbations, "one outcome per perturbation");
  expect(res.reward == (obs.problem_id == "alpha" ? 0.5 : 1.0), "reward from fake outcomes");
  expect(throws<sieve::InvalidStateError>([&] { env.step("suite"); }), "no second step");

  env.close();
  env.close();
  expect(env.state() == sieve::EpisodeState::closed, "closed");
  expect(runner->closed, "runner closed with the environment");
  expect(throws<sieve::InvalidStateError>([&] { env.reset(); }), "reset after close");
  expect(throws<sieve::InvalidStateError>([&] { env.step("suite"); }), "step after close");
}

void test_controller_reset_discards_episode() {
  auto runner = std::make_shared<FakeRunner>();
  sieve::EpisodeController env(fake_config(), fake_store(), runner);
  env.reset();
  auto obs = env.reset_to("beta");
  expect(obs.problem_id == "beta" && obs.num_perturbations == 1, "reset_to picks named problem");
  expect(throws<sieve::InvalidInputError>([&] { env.reset_to("gamma"); }), "unknown problem id");
  expect(runner->calls == 0, "reset never executes code");
}

void test_controller_seeded_reset() {
  std::vector<sieve::ProblemRecord> recs;
  for (int i = 0; i < 16; ++i) recs.push_back(make_record("p" + std::to_string(i), "ref", {"m"}));
  auto store = std::make_shared<const sieve::ProblemStore>(sieve::ProblemStore::from_records(recs));
  sieve::EpisodeController a(fake_config(), store, std::make_shared<FakeRunner>());
  sieve::EpisodeController b(fake_config(), store, std::make_shared<FakeRunner>());
  for (int i = 0; i < 5; ++i) {
    expect(a.reset(99 + i).problem_id == b.reset(99 + i).problem_id, "seeded reset reproducible");
  }
}

void test_controller_timeout_returns_to_idle() {
  auto runner = std::make_shared<FakeRunner>();
  runner->hang_until_cancel = true;
  auto config = fake_config();
  config.execution_timeout_ms = 40;
  config.step_timeout_slack_ms = 40;
  sieve::EpisodeController env(config, fake_store(), runner);
  env.reset();
  expect(throws<sieve::EpisodeTimeoutError>([&] { env.step("suite"); }), "timeout propagates");
  expect(env.state() == sieve::EpisodeState::idle, "idle after timeout");
  expect(throws<sieve::InvalidStateError>([&] { env.step("suite"); }), "must reset after timeout");
  runner->hang_until_cancel = false;
  env.reset();
  env.step("suite");
  expect(env.state() == sieve::EpisodeState::idle, "recovers after reset");
}

void test_controller_multi_turn() {
  auto runner = std::make_shared<FakeRunner>();
  auto config = fake_config();
  config.multi_turn = true;
  config.max_turns = 2;
  sieve::EpisodeController env(config, fake_store(), runner);
  auto obs = env.reset();
  expect(obs.turn == 0, "turn starts at zero");
  auto first = env.step("suite v1");
  expect(!first.terminated && !first.truncated, "episode continues");
  expect(first.observation.turn == 1 && first.info.turn == 1, "turn advanced");
  expect(env.state() == sieve::EpisodeState::awaiting_submission, "awaiting next suite");
  auto second = env.step("suite v2");
  expect(second.truncated && !second.terminated, "truncated at max_turns");
  expect(env.state() == sieve::EpisodeState::idle, "idle after final turn");
}

void test_controller_emits_events() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  sieve::set_episode_event_hook(capture_event);
  const auto before = sieve::global_env_stats().total_steps.load();

  auto runner = std::make_shared<FakeRunner>();
  runner->status_by_code = {{"ref", sieve::OutcomeStatus::failed}};
  sieve::EpisodeController env(fake_config(), fake_store(), runner);
  env.reset_to("alpha");
  auto res = env.step("def test_x(): pass");
  sieve::set_episode_event_hook(nullptr);

  expect(res.reward == 0.0 && !res.info.passed_on_reference, "gate closed");
  std::lock_guard<std::mutex> lk(g_events_mu);
  expect(g_events.size() == 1, "one event per step");
  const auto& ev = g_events[0];
  expect(ev.ok && ev.problem_id == "alpha" && ev.backend == "fake", "event identity");
  expect(ev.failed == 1 && ev.passed == 2, "outcome counts");
  expect(ev.suite_digest == sieve::suite_digest("def test_x(): pass"), "suite digest");
  expect(ev.result_digest == res.info.result_digest, "result digest");
  expect(sieve::global_env_stats().total_steps.load() == before + 1, "stats recorded");
  const auto recent = sieve::global_env_stats().recent_events_snapshot();
  expect(!recent.empty() && recent.back().problem_id == "alpha", "event kept in recent ring");
  expect(sieve::episode_event_to_json(ev).find("\"problem_id\":\"alpha\"") != std::string::npos,
         "event serializes");
}

// ============================================================================
// C ABI
// ============================================================================

std::string take(char* s) {
  std::string out = s ? s : "";
  sieve_free_string(s);
  return out;
}

void test_c_api_errors() {
  expect(sieve_abi_version() == SIEVE_ABI_VERSION, "abi version");
  expect(SIEVE_ABI_VERSION == sieve::version::ENGINE_ABI_VERSION, "abi constants agree");

  expect(sieve_env_create("{}", SIEVE_ABI_VERSION + 1) == nullptr, "abi mismatch refused");
  expect(take(sieve_env_last_error(nullptr)).find("abi_version_mismatch") != std::string::npos,
         "abi mismatch reported");

  expect(sieve_env_create("{not json", SIEVE_ABI_VERSION) == nullptr, "bad json refused");
  expect(take(sieve_env_last_error(nullptr)).find("\"error_code\":\"config_invalid\"") != std::string::npos,
         "bad config reported");

  expect(sieve_env_create(R"({"dataset_path":"/nonexistent/problems"})", SIEVE_ABI_VERSION) == nullptr,
         "missing dataset refused");
  expect(take(sieve_env_last_error(nullptr)).find("\"error_code\":\"dataset_invalid\"") != std::string::npos,
         "dataset error reported");

  const std::string null_reset = take(sieve_env_reset(nullptr, 0, 0));
  expect(null_reset.find("\"ok\":false") != std::string::npos &&
             null_reset.find("invalid_input") != std::string::npos,
         "null handle is an error envelope");
  sieve_env_destroy(nullptr);
}

// ============================================================================
// Harness integration (requires python3 with pytest)
// ============================================================================

const char* kAddReference = "def add(a, b):\n    return a + b\n";
const std::vector<std::string> kAddMutants = {
    "def add(a, b):\n    return a - b\n",
    "def add(a, b):\n    return a * b\n",
    "def add(a, b):\n    return a + b + 1\n",
    "def add(a, b):\n    return abs(a) + abs(b)\n",
    "def add(a, b)\n    return a + b\n",
};
const char* kAddSuite =
    "from solution import add\n\n"
    "def test_small():\n    assert add(2, 3) == 5\n\n"
    "def test_zero():\n    assert add(0, 0) == 0\n\n"
    "def test_negative():\n    assert add(-1, 1) == 0\n";

std::shared_ptr<sieve::ProcessSandboxRunner> g_python_runner;
std::string g_python_skip_reason;
std::unique_ptr<TempDir> g_work_root;

bool python_available() {
  if (g_python_runner) return true;
  if (!g_python_skip_reason.empty()) return false;
  try {
    g_work_root = std::make_unique<TempDir>();
    sieve::SandboxLimits limits;
    limits.work_root = g_work_root->path.string();
    g_python_runner = std::make_shared<sieve::ProcessSandboxRunner>("python3", limits);
    return true;
  } catch (const sieve::SandboxUnavailableError& e) {
    g_python_skip_reason = e.what();
    return false;
  }
}

void test_harness_perfect_suite() {
  sieve::EnvConfig config = fake_config();
  config.execution_timeout_ms = 20000;
  config.step_timeout_slack_ms = 20000;
  auto store = std::make_shared<const sieve::ProblemStore>(
      sieve::ProblemStore::from_records({make_record("add", kAddReference, kAddMutants)}));
  sieve::EpisodeController env(config, store, g_python_runner);
  env.reset();
  auto res = env.step(kAddSuite);
  expect(res.info.reference_outcome.status == sieve::OutcomeStatus::passed,
         "suite passes on reference: " + res.info.reference_outcome.stdout_tail +
             res.info.reference_outcome.stderr_tail);
  expect(res.reward == 1.0, "every mutant detected");
  expect(res.info.perturbation_outcomes[0].status == sieve::OutcomeStatus::failed, "wrong result is failed");
  expect(res.info.perturbation_outcomes[4].status == sieve::OutcomeStatus::errored,
         "mutant with a syntax error is errored");
}

void test_harness_broken_suite_scores_zero() {
  auto out = g_python_runner->execute("def test_broken(:\n    pass\n", kAddReference, 20000ms);
  expect(out.status == sieve::OutcomeStatus::errored && out.detail == "pytest_exit_2",
         "syntax error in suite is a collection error");

  sieve::ExecutionCoordinator coord(g_python_runner, {});
  auto outcomes = coord.run("def test_broken(:\n    pass\n", make_record("add", kAddReference, {kAddMutants[0]}));
  auto r = sieve::score(outcomes.reference, outcomes.perturbations);
  expect(r.reward == 0.0 && r.detections == std::vector<bool>({false}), "gate closed on broken suite");
}

void test_harness_wrong_suite_gated() {
  const std::string suite = "from solution import add\n\ndef test_wrong():\n    assert add(2, 2) == 5\n";
  auto out = g_python_runner->execute(suite, kAddReference, 20000ms);
  expect(out.status == sieve::OutcomeStatus::failed, "assertion failure on reference");
  expect(out.stdout_tail.find("test_wrong") != std::string::npos, "pytest report captured");
}

void test_harness_infinite_loop_times_out() {
  const std::string suite = "def test_spin():\n    while True:\n        pass\n";
  const auto start = std::chrono::steady_clock::now();
  auto out = g_python_runner->execute(suite, kAddReference, 1500ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(out.status == sieve::OutcomeStatus::timed_out, "spinning suite times out");
  expect(elapsed < 10s, "timeout bounded");
}

void test_harness_workspace_released() {
  g_python_runner->execute("def test_spin():\n    while True:\n        pass\n", kAddReference, 500ms);
  g_python_runner->execute(kAddSuite, kAddReference, 20000ms);
  expect(fs::is_empty(g_work_root->path), "no workspace left behind");
}

void test_harness_runs_are_isolated() {
  const std::string marker = "/tmp/sieve_marker_" + std::to_string(::getpid());
  const std::string check =
      "import os\n\ndef test_clean():\n    assert not os.path.exists('" + marker + "')\n";
  const std::string taint = "def test_taint():\n    open('" + marker + "', 'w').write('x')\n";
  expect(g_python_runner->execute(check, kAddReference, 20000ms).status == sieve::OutcomeStatus::passed,
         "clean scratch on first run");
  expect(g_python_runner->execute(taint, kAddReference, 20000ms).status == sieve::OutcomeStatus::passed,
         "scratch writable inside the run");
  expect(g_python_runner->execute(check, kAddReference, 20000ms).status == sieve::OutcomeStatus::passed,
         "no state carried into the next run");
  expect(!fs::exists(marker), "host /tmp untouched");

  const std::string poison =
      "import os\nimport pytest\n\n"
      "def test_poison():\n"
      "    target = os.path.join(os.path.dirname(pytest.__file__), 'sieve_poison.py')\n"
      "    with pytest.raises(OSError):\n"
      "        open(target, 'w')\n";
  auto out = g_python_runner->execute(poison, kAddReference, 20000ms);
  expect(out.status == sieve::OutcomeStatus::passed, "interpreter tree is read-only: " + out.stdout_tail);
}

void test_harness_no_orphans() {
  const std::string tag = "3141." + std::to_string(::getpid());
  const std::string suite =
      "import subprocess\n\n"
      "def test_detach():\n"
      "    subprocess.Popen(['sleep', '" + tag + "'], start_new_session=True,\n"
      "                     stdout=subprocess.DEVNULL, stderr=subprocess.DEVNULL)\n";
  auto out = g_python_runner->execute(suite, kAddReference, 20000ms);
  expect(out.status == sieve::OutcomeStatus::passed, "suite ran: " + out.stdout_tail + out.stderr_tail);
  expect(gone_within(tag, 2000ms), "no descendant outlives the run");
}

void test_harness_memory_limit_errored() {
  const std::string suite = "def test_hog():\n    data = bytearray(4 * 1024 ** 3)\n    assert data\n";
  auto out = g_python_runner->execute(suite, kAddReference, 20000ms);
  expect(out.status == sieve::OutcomeStatus::errored && out.detail == "memory_limit",
         "allocation past the cap is errored: " + out.detail);
}

void test_harness_empty_implementation_rejected() {
  expect(throws<sieve::InvalidInputError>([] { g_python_runner->execute(kAddSuite, "", 1000ms); }),
         "empty implementation rejected");
  expect(throws<sieve::InvalidInputError>([] { g_python_runner->execute(kAddSuite, kAddReference, 0ms); }),
         "zero timeout rejected");
}

void test_python_syntax_check() {
  const std::string interp = g_python_runner->interpreter_path();
  expect(sieve::check_python_syntax(interp, kAddReference).empty(), "valid source");
  expect(!sieve::check_python_syntax(interp, kAddMutants[4]).empty(), "syntax error found");
}

}  // namespace

int main() {
  std::cout << "=== sieve test suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[JSON]\n";
  run_test("unicode escapes", test_json_unicode_escapes);
  run_test("duplicate key rejected", test_json_duplicate_key_rejected);
  run_test("canonical output and escaping", test_json_canonical_and_escape);
  run_test("strict document boundaries", test_json_rejects_trailing_garbage);

  std::cout << "\n[Configuration]\n";
  run_test("defaults", test_config_defaults);
  run_test("parse and validate", test_config_parse_and_validate);

  std::cout << "\n[ProblemStore]\n";
  run_test("load with skips", test_store_load_and_skip);
  run_test("blank code skipped at load", test_store_skips_blank_code);
  run_test("expected perturbation count", test_store_expected_perturbations);
  run_test("fatal dataset conditions", test_store_fatal_conditions);
  run_test("seeded sampling", test_store_seeded_sampling);
  run_test("offline file validation", test_validate_problem_file);

  std::cout << "\n[Reward]\n";
  run_test("gate open", test_reward_gate_open);
  run_test("gate closed", test_reward_gate_closed);
  run_test("deterministic result", test_reward_deterministic);

  std::cout << "\n[Sandbox primitives]\n";
  run_test("tail buffer", test_append_tail);
  run_test("harness exit classification", test_classify_harness_exit);
  run_test("exit code and streams", test_run_process_exit_and_output);
  run_test("timeout kills process group", test_run_process_timeout_kills_group);
  run_test("output bounded", test_run_process_output_bounded);
  run_test("cancellation", test_run_process_cancel);
  run_test("spawn failure", test_run_process_spawn_failure);
  run_test("start failure is unavailable", test_start_failure_is_unavailable);
  run_test("container run arguments", test_container_run_args);
  if (namespaces_available() && !sieve::find_executable("setsid").empty()) {
    run_test("filesystem isolation", test_run_process_filesystem_isolation);
    run_test("detached descendants killed", test_run_process_kills_detached_descendants);
  } else {
    skip_test("filesystem isolation", "mount/pid namespaces or setsid unavailable");
    skip_test("detached descendants killed", "mount/pid namespaces or setsid unavailable");
  }
  run_test("workspace cleanup", test_scoped_workspace_cleanup);

  std::cout << "\n[Coordinator]\n";
  run_test("worker pool drains on shutdown", test_worker_pool_drains_on_shutdown);
  run_test("index alignment under reordering", test_coordinator_index_alignment);
  run_test("bounded parallelism", test_coordinator_bounded_parallelism);
  run_test("all executions time out", test_coordinator_all_timeouts);
  run_test("step deadline", test_coordinator_step_deadline);
  run_test("task errors propagate", test_coordinator_propagates_task_errors);
  run_test("oversized suite", test_coordinator_oversized_suite);

  std::cout << "\n[EpisodeController]\n";
  run_test("state machine", test_controller_state_machine);
  run_test("reset discards episode", test_controller_reset_discards_episode);
  run_test("seeded reset", test_controller_seeded_reset);
  run_test("timeout returns to idle", test_controller_timeout_returns_to_idle);
  run_test("multi-turn", test_controller_multi_turn);
  run_test("episode events", test_controller_emits_events);

  std::cout << "\n[C ABI]\n";
  run_test("error envelopes", test_c_api_errors);

  std::cout << "\n[Harness integration]\n";
  const std::vector<std::pair<std::string, void (*)()>> integration = {
      {"perfect suite scores 1.0", test_harness_perfect_suite},
      {"broken suite scores 0", test_harness_broken_suite_scores_zero},
      {"wrong suite is gated", test_harness_wrong_suite_gated},
      {"infinite loop times out", test_harness_infinite_loop_times_out},
      {"workspace released", test_harness_workspace_released},
      {"runs are isolated", test_harness_runs_are_isolated},
      {"no orphans survive", test_harness_no_orphans},
      {"memory cap is errored", test_harness_memory_limit_errored},
      {"invalid arguments rejected", test_harness_empty_implementation_rejected},
      {"python syntax check", test_python_syntax_check},
  };
  const bool have_python = python_available();
  for (const auto& [name, fn] : integration) {
    if (have_python) {
      run_test(name, fn);
    } else {
      skip_test(name, g_python_skip_reason);
    }
  }
  g_python_runner.reset();
  g_work_root.reset();

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " skipped";
  std::cout << " ===\n";
  return (g_tests_passed == g_tests_run) ? 0 : 1;
}
