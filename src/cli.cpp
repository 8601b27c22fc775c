#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "sieve/config.hpp"
#include "sieve/environment.hpp"
#include "sieve/errors.hpp"
#include "sieve/hash.hpp"
#include "sieve/jsonlite.hpp"
#include "sieve/observability.hpp"
#include "sieve/problem_store.hpp"
#include "sieve/sandbox.hpp"
#include "sieve/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  std::ostringstream buf;
  buf << ifs.rdbuf();
  *out = buf.str();
  return true;
}

// Flags take the form --name value; anything else is positional.
struct Args {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> flags;

  static Args parse(int argc, char **argv, int first) {
    static const std::vector<std::string> kSwitches = {"--check-syntax"};
    Args a;
    for (int i = first; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.rfind("--", 0) != 0) {
        a.positional.push_back(arg);
        continue;
      }
      bool is_switch = false;
      for (const auto &s : kSwitches)
        if (arg == s)
          is_switch = true;
      if (is_switch || i + 1 >= argc) {
        a.flags.emplace_back(arg, "");
      } else {
        a.flags.emplace_back(arg, argv[++i]);
      }
    }
    return a;
  }

  bool has(const std::string &name) const {
    for (const auto &[k, v] : flags)
      if (k == name)
        return true;
    return false;
  }

  std::string get(const std::string &name, const std::string &def = "") const {
    for (const auto &[k, v] : flags)
      if (k == name)
        return v;
    return def;
  }
};

bool parse_u64(const std::string &s, std::uint64_t *out) {
  if (s.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || s[0] == '-')
    return false;
  *out = v;
  return true;
}

void print_error(const sieve::Error &e) {
  std::cout << "{\"ok\":false,\"error_code\":\"" << sieve::to_string(e.code())
            << "\",\"message\":\"" << sieve::jsonlite::escape(e.what())
            << "\"}\n";
}

void apply_log_level(const Args &args) {
  const std::string level = args.get("--log-level");
  if (level.empty())
    return;
  sieve::LogLevel parsed;
  if (sieve::parse_log_level(level, &parsed)) {
    sieve::set_log_level(parsed);
  } else {
    sieve::log_warn("cli", "ignoring unknown --log-level " + level);
  }
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (sieve::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    return false;
  if (sieve::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f")
    return false;
  return true;
}

void usage() {
  std::cerr
      << "usage: sieve <command> [options]\n"
         "  validate <dir|file> [--expected N] [--check-syntax] "
         "[--interpreter python3]\n"
         "  episode --config <cfg.json> --suite <file> [--seed N] "
         "[--problem <id>]\n"
         "  doctor [--config <cfg.json>]\n"
         "  version\n"
         "common: --log-level debug|info|warn|error\n";
}

int cmd_validate(const Args &args) {
  if (args.positional.empty()) {
    usage();
    return kExitUsage;
  }
  std::uint64_t expected = 0;
  if (args.has("--expected") && !parse_u64(args.get("--expected"), &expected)) {
    std::cerr << "--expected needs a non-negative integer\n";
    return kExitUsage;
  }

  std::string interpreter;
  if (args.has("--check-syntax")) {
    interpreter = sieve::resolve_interpreter(args.get("--interpreter", "python3"));
  }

  const auto files = sieve::list_problem_files(args.positional[0]);
  size_t valid = 0;
  std::string reports;
  for (const auto &path : files) {
    sieve::RecordReport report = sieve::validate_problem_file(path, expected);
    if (report.ok && !interpreter.empty()) {
      std::string text;
      std::string reason;
      std::optional<sieve::ProblemRecord> rec;
      if (read_file(path, &text))
        rec = sieve::parse_problem_record(text, path, {}, &reason);
      if (rec) {
        std::string err = sieve::check_python_syntax(interpreter, rec->reference_code);
        if (!err.empty())
          report.errors.push_back("syntax error in problem: " + err);
        for (size_t i = 0; i < rec->perturbations.size(); ++i) {
          err = sieve::check_python_syntax(interpreter, rec->perturbations[i]);
          if (!err.empty())
            report.errors.push_back("syntax error in perturbation " +
                                    std::to_string(i) + ": " + err);
        }
      }
      report.ok = report.errors.empty();
    }
    if (report.ok)
      ++valid;
    if (!reports.empty())
      reports += ",";
    reports += sieve::record_report_to_json(report);
  }

  const bool ok = !files.empty() && valid == files.size();
  std::cout << "{\"ok\":" << (ok ? "true" : "false")
            << ",\"files\":" << files.size() << ",\"valid\":" << valid
            << ",\"reports\":[" << reports << "]}\n";
  return ok ? kExitOk : kExitFailed;
}

int cmd_episode(const Args &args) {
  const std::string config_path = args.get("--config");
  const std::string suite_path = args.get("--suite");
  if (config_path.empty() || suite_path.empty()) {
    usage();
    return kExitUsage;
  }
  std::optional<std::uint64_t> seed;
  if (args.has("--seed")) {
    std::uint64_t s = 0;
    if (!parse_u64(args.get("--seed"), &s)) {
      std::cerr << "--seed needs a non-negative integer\n";
      return kExitUsage;
    }
    seed = s;
  }
  std::string suite;
  if (!read_file(suite_path, &suite)) {
    std::cerr << "cannot read suite file: " << suite_path << "\n";
    return kExitUsage;
  }

  sieve::EnvConfig config = sieve::load_config_file(config_path);
  auto env = sieve::make_environment(config);
  apply_log_level(args);

  const std::string problem_id = args.get("--problem");
  sieve::Observation obs =
      problem_id.empty() ? env->reset(seed) : env->reset_to(problem_id);
  sieve::StepResult result = env->step(suite);
  env->close();

  std::cout << "{\"ok\":true,\"backend\":\"" << env->backend_name()
            << "\",\"observation\":" << sieve::observation_to_json(obs)
            << ",\"result\":" << sieve::step_result_to_json(result) << "}\n";
  return kExitOk;
}

int cmd_doctor(const Args &args) {
  std::vector<std::string> blockers;
  std::vector<std::string> notes;

  const auto h = sieve::hash_runtime_info();
  if (!verify_hash_vectors())
    blockers.push_back("hash_vectors_failed");

  const auto caps = sieve::detect_platform_sandbox_capabilities();
  if (!caps.network_namespace)
    notes.push_back("network namespaces unavailable: process backend runs "
                    "suites with host networking");
  if (!caps.mount_namespace || !caps.pid_namespace)
    notes.push_back("mount/pid namespaces unavailable: process backend "
                    "requires filesystem_isolation=false");

  std::string backend_json = "null";
  std::string dataset_json = "null";
  std::string config_json = "null";
  const std::string config_path = args.get("--config");
  if (!config_path.empty()) {
    try {
      sieve::EnvConfig config = sieve::load_config_file(config_path);
      config_json = sieve::config_to_json(config);
      try {
        auto runner = sieve::make_sandbox_runner(config);
        backend_json = "{\"name\":\"" + runner->backend_name() + "\",\"ok\":true}";
        runner->close();
      } catch (const sieve::Error &e) {
        blockers.push_back(sieve::to_string(e.code()));
        backend_json = "{\"name\":\"" + sieve::to_string(config.backend) +
                       "\",\"ok\":false,\"message\":\"" +
                       sieve::jsonlite::escape(e.what()) + "\"}";
      }
      try {
        sieve::ProblemStoreOptions opts;
        opts.expected_perturbations = config.expected_perturbations;
        auto store = sieve::ProblemStore::load(config.dataset_path, opts);
        dataset_json = "{\"ok\":true,\"problems\":" + std::to_string(store.size()) +
                       ",\"skipped\":" + std::to_string(store.skipped().size()) + "}";
      } catch (const sieve::Error &e) {
        blockers.push_back(sieve::to_string(e.code()));
        dataset_json = "{\"ok\":false,\"message\":\"" +
                       sieve::jsonlite::escape(e.what()) + "\"}";
      }
    } catch (const sieve::ConfigError &e) {
      blockers.push_back(sieve::to_string(e.code()));
      notes.push_back(e.what());
    }
  }

  auto json_list = [](const std::vector<std::string> &items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0)
        out += ",";
      out += "\"" + sieve::jsonlite::escape(items[i]) + "\"";
    }
    return out + "]";
  };

  std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false")
            << ",\"blockers\":" << json_list(blockers)
            << ",\"notes\":" << json_list(notes)
            << ",\"engine_version\":\"" << PROJECT_VERSION << "\""
            << ",\"hash_primitive\":\"" << h.primitive << "\""
            << ",\"hash_version\":\"" << h.version << "\""
            << ",\"sandbox\":{\"enforced\":" << json_list(caps.enforced())
            << ",\"unsupported\":" << json_list(caps.unsupported()) << "}"
            << ",\"config\":" << config_json
            << ",\"backend\":" << backend_json
            << ",\"dataset\":" << dataset_json << "}\n";
  return blockers.empty() ? kExitOk : kExitUsage;
}

int cmd_version() {
  auto manifest = sieve::version::current_manifest(PROJECT_VERSION);
  auto compat = sieve::version::check_compatibility(sieve::version::ENGINE_ABI_VERSION);
  std::cout << "{\"ok\":" << (compat.ok ? "true" : "false")
            << ",\"manifest\":" << sieve::version::manifest_to_json(manifest)
            << "}\n";
  return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return kExitUsage;
  }
  const std::string cmd = argv[1];
  const Args args = Args::parse(argc, argv, 2);
  apply_log_level(args);

  try {
    if (cmd == "validate")
      return cmd_validate(args);
    if (cmd == "episode")
      return cmd_episode(args);
    if (cmd == "doctor")
      return cmd_doctor(args);
    if (cmd == "version")
      return cmd_version();
  } catch (const sieve::Error &e) {
    print_error(e);
    return kExitFailed;
  } catch (const std::exception &e) {
    std::cout << "{\"ok\":false,\"error_code\":\"internal_error\",\"message\":\""
              << sieve::jsonlite::escape(e.what()) << "\"}\n";
    return kExitFailed;
  }

  usage();
  return kExitUsage;
}
