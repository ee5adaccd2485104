// SPDX-License-Identifier: MIT

#pragma once
#ifdef __cplusplus
extern "C" {
#endif

// Status codes returned by rqh_hash_string.
#define RQH_OK 0
#define RQH_E_ARGS 2
#define RQH_E_CONFIG 3
#define RQH_E_RESOURCE 9
#define RQH_E_INTERNAL 10

// Hashes message (NUL-terminated bytes) and writes a JSON report to *out_json.
// options_json may be NULL or an object with any of the keys: n_qubits, depth,
// seed, shots, threads, sample_seed, max_qubits, max_threads, memory_budget_bytes,
// norm_tolerance, reuse_evolved_state, top.
// Returns RQH_OK on success; *out_json must be freed with rqh_free().
int rqh_hash_string(const char* message, const char* options_json, char** out_json);

// Frees buffers allocated by the library.
void rqh_free(char* p);

// Returns the compiled library version string.
const char* rqh_version(void);

#ifdef __cplusplus
}
#endif
