// SPDX-License-Identifier: MIT

#include "rqh/hash.hpp"
#include "rqh/errors.hpp"
#include "rqh/log.hpp"
#include "rqh/message.hpp"
#include "rqh/sampler.hpp"
#include "rqh/simulator.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <system_error>
#include <thread>
#ifdef RQH_OPENMP
#include <omp.h>
#endif

namespace rqh {

std::size_t buffer_count(const HashConfig& cfg) {
  if (cfg.reuse_evolved_state) return 1;
  return static_cast<std::size_t>(std::max(1, std::min(cfg.threads, cfg.shots)));
}

void validate(const HashConfig& cfg) {
  if (cfg.n_qubits <= 0) throw ConfigError("n_qubits must be positive, got " + std::to_string(cfg.n_qubits));
  if (cfg.depth < 0) throw ConfigError("depth must be non-negative, got " + std::to_string(cfg.depth));
  if (cfg.shots <= 0) throw ConfigError("shots must be positive, got " + std::to_string(cfg.shots));
  if (cfg.threads <= 0) throw ConfigError("threads must be positive, got " + std::to_string(cfg.threads));
  if (!(cfg.norm_tolerance > 0.0) || !std::isfinite(cfg.norm_tolerance)) throw ConfigError("norm_tolerance must be a positive finite number");
  if (cfg.max_threads <= 0) throw ConfigError("max_threads must be positive, got " + std::to_string(cfg.max_threads));
  if (cfg.threads > cfg.max_threads)
    throw ResourceError("threads " + std::to_string(cfg.threads) + " exceeds the worker ceiling of " + std::to_string(cfg.max_threads));
  const int ceiling = std::min(cfg.max_qubits, kHardQubitLimit);
  if (cfg.n_qubits > ceiling)
    throw ResourceError("n_qubits " + std::to_string(cfg.n_qubits) + " exceeds the qubit ceiling of " + std::to_string(ceiling));
  // Memory estimate guard
  long double need = std::ldexp((long double)sizeof(c64), cfg.n_qubits) * (long double)buffer_count(cfg);
  if (need > (long double)cfg.memory_budget_bytes)
    throw ResourceError("estimated state memory " + std::to_string((unsigned long long)need) + " bytes exceeds budget of " +
                        std::to_string(cfg.memory_budget_bytes) + " bytes");
}

HashEntry select_final(const Histogram& h) {
  HashEntry best;
  for (const auto& [value, count] : h) {
    if (count > best.count) best = {value, count};
  }
  return best;
}

std::vector<HashEntry> sorted_entries(const Histogram& h) {
  std::vector<HashEntry> v; v.reserve(h.size());
  for (const auto& [value, count] : h) v.push_back({value, count});
  std::sort(v.begin(), v.end(), [](const HashEntry& a, const HashEntry& b){
    return a.count != b.count ? a.count > b.count : a.value < b.value;
  });
  return v;
}

std::vector<HashEntry> HashResult::top(std::size_t k) const {
  auto v = sorted_entries(histogram);
  if (v.size() > k) v.resize(k);
  return v;
}

std::string HashResult::bitstring() const { return to_bitstring(final_hash.value, nqubits); }
std::string HashResult::hex() const { return to_hex(final_hash.value, nqubits); }

static std::uint64_t production_seed() {
  std::random_device rd;
  return (std::uint64_t(rd()) << 32) | std::uint64_t(rd());
}

HashResult run_hash(std::span<const std::uint8_t> message, const HashConfig& cfg) {
  validate(cfg);
  const std::size_t n = static_cast<std::size_t>(cfg.n_qubits);
  const std::uint64_t shots = static_cast<std::uint64_t>(cfg.shots);

  HashResult res;
  res.nqubits = n;
  res.shots = shots;
  res.input_value = register_value(prepare(message, cfg.n_qubits));
  res.schedule = generate_angles(cfg.seed, static_cast<std::size_t>(cfg.depth), n);
  const std::uint64_t base_seed = cfg.sample_seed ? *cfg.sample_seed : production_seed();

  const int workers = std::max(1, std::min(cfg.threads, cfg.shots));
  logger(LogLevel::Debug) << "run: n=" << n << " depth=" << cfg.depth << " seed=" << cfg.seed << " shots=" << shots
                 << " workers=" << workers << " buffers=" << buffer_count(cfg)
                 << (cfg.sample_seed ? " sampling=fixed" : " sampling=random");

  std::optional<StateVector> shared;
  if (cfg.reuse_evolved_state) {
    shared.emplace(n);
    shared->reset_basis(res.input_value);
    evolve(*shared, res.schedule, cfg.norm_tolerance);
  }

  // Per-worker histograms, merged once after join.
  std::vector<Histogram> partial(workers);
  std::vector<std::exception_ptr> errors(workers);
  auto worker = [&](int t){
    try {
#ifdef RQH_OPENMP
      if (workers > 1) omp_set_num_threads(1);
#endif
      const std::uint64_t start = (shots * t) / workers;
      const std::uint64_t end   = (shots * (t+1)) / workers;
      std::optional<StateVector> own;
      if (!shared) own.emplace(n);
      Histogram& local = partial[t];
      for (std::uint64_t s = start; s < end; ++s) {
        if (own) {
          own->reset_basis(res.input_value);
          evolve(*own, res.schedule, cfg.norm_tolerance);
        }
        Pcg32 rng = trial_rng(base_seed, s);
        ++local[sample_index(own ? *own : *shared, rng, cfg.norm_tolerance)];
      }
    } catch (...) {
      errors[t] = std::current_exception();
    }
  };

  if (workers == 1) {
    worker(0);
  } else {
    std::vector<std::thread> pool; pool.reserve(workers);
    try {
      for (int t=0; t<workers; ++t) pool.emplace_back(worker, t);
    } catch (const std::system_error& e) {
      // Started workers must finish before the pool goes out of scope.
      for (auto& th: pool) th.join();
      throw ResourceError("could not start worker " + std::to_string(pool.size()) + " of " + std::to_string(workers) + ": " + e.what());
    }
    for (auto& th: pool) th.join();
  }
  for (auto& e : errors) if (e) std::rethrow_exception(e);

  for (auto& h : partial) for (const auto& [value, count] : h) res.histogram[value] += count;
  res.final_hash = select_final(res.histogram);
  logger(LogLevel::Debug) << "run: " << res.histogram.size() << " distinct outcomes, top " << res.bitstring() << " x" << res.final_hash.count;
  return res;
}

HashResult run_hash(std::string_view message, const HashConfig& cfg) {
  return run_hash(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(message.data()), message.size()), cfg);
}

HashResult run_hash(std::string_view message, int n_qubits, int depth, std::uint64_t seed, int shots) {
  HashConfig cfg;
  cfg.n_qubits = n_qubits;
  cfg.depth = depth;
  cfg.seed = seed;
  cfg.shots = shots;
  return run_hash(message, cfg);
}

} // namespace rqh
