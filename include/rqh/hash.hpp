// SPDX-License-Identifier: MIT

#pragma once
#include "angles.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rqh {

struct HashConfig {
  int n_qubits = 16;
  int depth = 12;
  std::uint64_t seed = 12345;
  int shots = 1024;

  int threads = 1;                            // worker pool size
  int max_threads = 256;                      // ceiling on threads
  std::optional<std::uint64_t> sample_seed;   // unset: sampling seeded from std::random_device
  int max_qubits = 26;
  std::uint64_t memory_budget_bytes = 4ULL << 30; // 4 GiB across all amplitude buffers
  double norm_tolerance = kDefaultNormTolerance;
  bool reuse_evolved_state = false;           // evolve once, sample the shared result every trial
};

struct HashEntry {
  std::uint64_t value{};
  std::uint64_t count{};
  bool operator==(const HashEntry&) const = default;
};

struct HashResult {
  std::size_t nqubits{};
  std::uint64_t shots{};
  std::uint64_t input_value{}; // prepared register
  AngleSchedule schedule;
  Histogram histogram;
  HashEntry final_hash;

  // Descending count, ascending value on ties; at most k entries.
  std::vector<HashEntry> top(std::size_t k) const;
  std::string bitstring() const;
  std::string hex() const;
};

// ConfigError for invalid parameters, then ResourceError for the thread or
// qubit ceiling or the memory budget. Nothing is allocated.
void validate(const HashConfig& cfg);

// Number of amplitude buffers a run allocates.
std::size_t buffer_count(const HashConfig& cfg);

// Max count, smallest value on ties.
HashEntry select_final(const Histogram& h);
std::vector<HashEntry> sorted_entries(const Histogram& h);

HashResult run_hash(std::span<const std::uint8_t> message, const HashConfig& cfg);
HashResult run_hash(std::string_view message, const HashConfig& cfg);
HashResult run_hash(std::string_view message, int n_qubits, int depth, std::uint64_t seed, int shots);

} // namespace rqh
