// SPDX-License-Identifier: MIT

#include "rqh/state_vector.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#ifdef RQH_OPENMP
#include <omp.h>
#endif

namespace rqh {

namespace {
// Below this many amplitude pairs a parallel region costs more than it saves.
constexpr std::size_t kParallelMinPairs = std::size_t(1) << 14;

void check_qubit(std::size_t q, std::size_t n) {
  if (q >= n) throw std::out_of_range("qubit " + std::to_string(q) + " out of range for " + std::to_string(n) + " qubits");
}
} // namespace

StateVector::StateVector(std::size_t n) : n_(n), amp_(std::size_t(1) << n, c64{0.0, 0.0}) {
  amp_[0] = {1.0, 0.0};
}

void StateVector::reset_basis(std::uint64_t index) {
  if (index >= amp_.size()) throw std::out_of_range("basis index " + std::to_string(index) + " outside state of dimension " + std::to_string(amp_.size()));
  std::fill(amp_.begin(), amp_.end(), c64{0.0, 0.0});
  amp_[index] = {1.0, 0.0};
}

void StateVector::apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  check_qubit(target, n_);
  const std::size_t half = amp_.size() >> 1;
  const std::size_t mask = std::size_t(1) << target;
  const std::size_t low = mask - 1;
  c64* a = amp_.data();
  // k enumerates the 2^(n-1) indices with bit `target` clear.
#ifdef RQH_OPENMP
#pragma omp parallel for schedule(static) if(half >= kParallelMinPairs)
#endif
  for (std::size_t k = 0; k < half; ++k) {
    const std::size_t i = ((k & ~low) << 1) | (k & low);
    const std::size_t j = i | mask;
    const c64 a0 = a[i];
    const c64 a1 = a[j];
    a[i] = u00 * a0 + u01 * a1;
    a[j] = u10 * a0 + u11 * a1;
  }
}

void StateVector::apply_cx(std::size_t control, std::size_t target) {
  check_qubit(control, n_);
  check_qubit(target, n_);
  if (control == target) throw std::invalid_argument("CNOT control and target must differ");
  const std::size_t N = amp_.size();
  const std::size_t cm = std::size_t(1) << control;
  const std::size_t tm = std::size_t(1) << target;
  c64* a = amp_.data();
#ifdef RQH_OPENMP
#pragma omp parallel for schedule(static) if(N >= 2 * kParallelMinPairs)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & cm) && !(i & tm)) {
      std::swap(a[i], a[i | tm]);
    }
  }
}

double StateVector::norm2() const {
  const std::size_t N = amp_.size();
  const c64* a = amp_.data();
  double total = 0.0;
#ifdef RQH_OPENMP
#pragma omp parallel reduction(+:total) if(N >= 2 * kParallelMinPairs)
#endif
  {
    double s = 0.0, c = 0.0;
#ifdef RQH_OPENMP
#pragma omp for schedule(static)
#endif
    for (std::size_t i = 0; i < N; ++i) {
      double y = std::norm(a[i]) - c;
      double t = s + y;
      c = (t - s) - y;
      s = t;
    }
    total += s;
  }
  return total;
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

} // namespace rqh
