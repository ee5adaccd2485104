// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cstddef>
#include <cstdint>

namespace rqh {

// Owned amplitude buffer of 2^n complex numbers. Index bit i is qubit i.
// Gates mutate in place; one buffer is reused across the trials of a worker.
class StateVector {
  std::size_t n_;
  vec_c64 amp_;

public:
  // Allocates 2^n amplitudes initialised to |0...0>. Callers gate n first.
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }

  // Overwrite with the basis state |index>.
  void reset_basis(std::uint64_t index);

  // Single-qubit 2x2 gate on target qubit (0-indexed, LSB = qubit 0)
  void apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11);

  void apply_cx(std::size_t control, std::size_t target); // CNOT

  // Compensated sum of |a_i|^2.
  double norm2() const;
  double probability_of_basis(std::size_t basis_index) const;

  static std::uint64_t bytes_for(std::size_t n) { return std::uint64_t(sizeof(c64)) << n; }
};

} // namespace rqh
