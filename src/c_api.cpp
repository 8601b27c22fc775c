#include "sieve/c_api.h"

// Wraps EpisodeController behind a pure-C boundary. Every entry point
// converts exceptions into the JSON error envelope and records it as the
// handle's last error.

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "sieve/config.hpp"
#include "sieve/environment.hpp"
#include "sieve/errors.hpp"
#include "sieve/jsonlite.hpp"
#include "sieve/observability.hpp"
#include "sieve/version.hpp"

struct sieve_env {
  std::unique_ptr<sieve::EpisodeController> controller;
  std::mutex mu;
  std::string last_error;
};

namespace {

thread_local std::string g_create_error;

std::string error_envelope(const std::string& code, const std::string& message) {
  return "{\"ok\":false,\"error_code\":\"" + code + "\",\"message\":\"" +
         sieve::jsonlite::escape(message) + "\"}";
}

char* dup_string(const std::string& s) {
  char* out = static_cast<char*>(std::malloc(s.size() + 1));
  if (!out) return nullptr;
  std::memcpy(out, s.c_str(), s.size() + 1);
  return out;
}

// Runs fn under the handle lock and converts failures into envelopes.
template <typename Fn>
char* guarded(sieve_env_t* env, Fn&& fn) {
  if (!env) {
    return dup_string(error_envelope(sieve::to_string(sieve::ErrorCode::invalid_input),
                                     "null environment handle"));
  }
  std::lock_guard<std::mutex> lk(env->mu);
  std::string out;
  try {
    out = fn(*env->controller);
    return dup_string(out);
  } catch (const sieve::Error& e) {
    out = error_envelope(sieve::to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    out = error_envelope(sieve::to_string(sieve::ErrorCode::internal_error), e.what());
  } catch (...) {
    out = error_envelope(sieve::to_string(sieve::ErrorCode::internal_error), "unknown exception");
  }
  env->last_error = out;
  return dup_string(out);
}

}  // namespace

extern "C" {

uint32_t sieve_abi_version(void) { return SIEVE_ABI_VERSION; }

sieve_env_t* sieve_env_create(const char* config_json, uint32_t abi_version) {
  g_create_error.clear();
  auto compat = sieve::version::check_compatibility(abi_version);
  if (!compat.ok) {
    g_create_error = error_envelope(compat.error_code, compat.description);
    return nullptr;
  }
  try {
    sieve::ConfigValidationResult parsed;
    sieve::EnvConfig config =
        sieve::parse_config_json(config_json ? config_json : "{}", &parsed);
    for (const auto& w : parsed.warnings) sieve::log_warn("c_api", w);
    if (!parsed.ok) {
      std::string msg = "invalid config:";
      for (const auto& e : parsed.errors) msg += " " + e + ";";
      throw sieve::ConfigError(msg);
    }
    auto env = std::make_unique<sieve_env>();
    env->controller = sieve::make_environment(config);
    return env.release();
  } catch (const sieve::Error& e) {
    g_create_error = error_envelope(sieve::to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    g_create_error = error_envelope(sieve::to_string(sieve::ErrorCode::internal_error), e.what());
  } catch (...) {
    g_create_error = error_envelope(sieve::to_string(sieve::ErrorCode::internal_error),
                                    "unknown exception");
  }
  sieve::log_error("c_api", g_create_error);
  return nullptr;
}

char* sieve_env_reset(sieve_env_t* env, uint64_t seed, int has_seed) {
  return guarded(env, [&](sieve::EpisodeController& c) {
    std::optional<std::uint64_t> s;
    if (has_seed) s = seed;
    return "{\"ok\":true,\"observation\":" + sieve::observation_to_json(c.reset(s)) + "}";
  });
}

char* sieve_env_step(sieve_env_t* env, const char* test_suite) {
  return guarded(env, [&](sieve::EpisodeController& c) {
    if (!test_suite) throw sieve::InvalidInputError("null test suite");
    return "{\"ok\":true,\"result\":" + sieve::step_result_to_json(c.step(test_suite)) + "}";
  });
}

char* sieve_env_stats(sieve_env_t* env) {
  return guarded(env, [](sieve::EpisodeController&) {
    std::string recent = "[";
    for (const auto& ev : sieve::global_env_stats().recent_events_snapshot()) {
      if (recent.size() > 1) recent += ",";
      recent += sieve::episode_event_to_json(ev);
    }
    recent += "]";
    return "{\"ok\":true,\"stats\":" + sieve::global_env_stats().to_json() +
           ",\"recent_events\":" + recent + "}";
  });
}

char* sieve_env_last_error(sieve_env_t* env) {
  if (!env) return dup_string(g_create_error.empty() ? "{\"ok\":true}" : g_create_error);
  std::lock_guard<std::mutex> lk(env->mu);
  return dup_string(env->last_error.empty() ? "{\"ok\":true}" : env->last_error);
}

void sieve_free_string(char* s) { std::free(s); }

void sieve_env_destroy(sieve_env_t* env) {
  if (!env) return;
  {
    std::lock_guard<std::mutex> lk(env->mu);
    env->controller->close();
  }
  delete env;
}

}  // extern "C"
