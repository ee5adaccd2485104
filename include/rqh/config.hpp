// SPDX-License-Identifier: MIT

#pragma once
#include "hash.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rqh {

// Everything one invocation needs: core parameters plus message and report size.
struct RunConfig {
  HashConfig hash;
  std::string message = "hello";
  std::size_t top_k = 10;
};

// Recognised keys (aliases n and d are also accepted):
//   message, n_qubits, depth, seed, shots, threads, sample_seed, max_qubits, max_threads,
//   memory_budget_bytes, norm_tolerance, reuse_evolved_state, top
const std::vector<std::string>& option_keys();

// Sets one key from its textual value. Returns false with err set on an
// unknown key or malformed value; range checks are left to validate().
bool set_option(RunConfig& rc, const std::string& key, const std::string& value, std::string& err);

// Parse a key=value file on top of base. Lines:
//   # comment
//   n_qubits = 16
//   message = hello world
// One space after '=' is dropped; message keeps the rest of the line as is.
std::optional<RunConfig> load_run_config(const std::string& path, std::string& err, RunConfig base = {});

} // namespace rqh
