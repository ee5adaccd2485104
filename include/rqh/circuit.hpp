// SPDX-License-Identifier: MIT

#pragma once
#include "angles.hpp"
#include "state_vector.hpp"
#include "types.hpp"
#include <vector>

namespace rqh {

enum class OpType { X, RZ, RX, CNOT, MEASURE };

struct Op {
  OpType type;
  std::vector<std::size_t> qubits; // CNOT: {control, target}
  double angle = 0.0; // for rotations
};

struct Circuit {
  std::size_t nqubits{};
  std::vector<Op> ops;
};

// The whole hash circuit as an op list: X on every set input bit, then per
// layer RZ/RX on each qubit and the entangling pattern, then MEASURE ALL.
Circuit build_circuit(const BitRegister& input, const AngleSchedule& s);

// Applies every unitary op to sv; MEASURE is left to the sampler.
void apply_circuit(const Circuit& c, StateVector& sv);

const char* op_name(OpType t);

} // namespace rqh
