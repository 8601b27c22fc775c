/*
 * sieve/c_api.h - C ABI for driving the environment from a training loop.
 *
 * OWNERSHIP CONTRACT:
 *   - Caller owns all input strings; they are copied as needed.
 *   - Every returned char* is heap-allocated and MUST be released with
 *     sieve_free_string(). Never free() or delete[] it.
 *   - sieve_env_t* is opaque.
 *
 * RESULT ENVELOPE:
 *   Success:  {"ok":true, ...payload...}
 *   Failure:  {"ok":false,"error_code":"<snake_case>","message":"..."}
 *   Exceptions never cross this boundary.
 *
 * THREAD SAFETY:
 *   One environment is one episode. Calls on the same handle are serialized
 *   internally; use one handle per concurrent episode. Handles share only the
 *   process-wide statistics.
 *
 * EXAMPLE (C):
 *   sieve_env_t* env = sieve_env_create(config_json, SIEVE_ABI_VERSION);
 *   char* obs = sieve_env_reset(env, 7, 1);
 *   char* res = sieve_env_step(env, suite_source);
 *   sieve_free_string(obs);
 *   sieve_free_string(res);
 *   sieve_env_destroy(env);
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define SIEVE_ABI_VERSION 1

typedef struct sieve_env sieve_env_t;

/*
 * config_json: EnvConfig as a JSON object (see sieve/config.hpp).
 *   "dataset_path" is required; every other key is optional.
 * abi_version: pass SIEVE_ABI_VERSION.
 *
 * Returns NULL on ABI mismatch, invalid config, unloadable dataset or an
 * unavailable sandbox backend. The reason is then available from
 * sieve_env_last_error(NULL) on the same thread.
 */
sieve_env_t* sieve_env_create(const char* config_json, uint32_t abi_version);

/*
 * Starts a new episode. has_seed != 0 reseeds the environment's generator.
 * Returns {"ok":true,"observation":{...}}.
 */
char* sieve_env_reset(sieve_env_t* env, uint64_t seed, int has_seed);

/*
 * Scores test_suite against the current episode's problem.
 * Returns {"ok":true,"result":{observation, reward, terminated, truncated, info}}.
 */
char* sieve_env_step(sieve_env_t* env, const char* test_suite);

/*
 * Process-wide statistics plus the most recent step events (oldest first):
 * {"ok":true,"stats":{...},"recent_events":[...]}.
 */
char* sieve_env_stats(sieve_env_t* env);

/*
 * Envelope of the last failed call on env, or of the last failed
 * sieve_env_create() on this thread when env is NULL. {"ok":true} if none.
 */
char* sieve_env_last_error(sieve_env_t* env);

void sieve_free_string(char* s);

/* Closes the environment and frees it. env is invalid afterwards. */
void sieve_env_destroy(sieve_env_t* env);

uint32_t sieve_abi_version(void);

#ifdef __cplusplus
}  /* extern "C" */
#endif
