// SPDX-License-Identifier: MIT

#include "rqh/circuit.hpp"
#include "rqh/errors.hpp"
#include "rqh/gates.hpp"
#include "rqh/simulator.hpp"

namespace rqh {

const char* op_name(OpType t) {
  switch (t) {
    case OpType::X: return "X";
    case OpType::RZ: return "RZ";
    case OpType::RX: return "RX";
    case OpType::CNOT: return "CNOT";
    case OpType::MEASURE: return "MEASURE";
  }
  return "?";
}

Circuit build_circuit(const BitRegister& input, const AngleSchedule& s) {
  check_schedule(s, input.size());
  Circuit c;
  c.nqubits = s.nqubits;
  for (std::size_t q = 0; q < input.size(); ++q) {
    if (input[q]) c.ops.push_back({OpType::X, {q}, 0.0});
  }
  const auto pairs = entangling_pairs(s.nqubits);
  for (std::size_t layer = 0; layer < s.depth; ++layer) {
    for (std::size_t q = 0; q < s.nqubits; ++q) {
      c.ops.push_back({OpType::RZ, {q}, s.rz[layer][q]});
      c.ops.push_back({OpType::RX, {q}, s.rx[layer][q]});
    }
    for (const auto& [ctl, tgt] : pairs) c.ops.push_back({OpType::CNOT, {ctl, tgt}, 0.0});
  }
  c.ops.push_back({OpType::MEASURE, {}, 0.0});
  return c;
}

void apply_circuit(const Circuit& c, StateVector& sv) {
  if (c.nqubits != sv.num_qubits()) throw ConfigError("circuit width does not match the state");
  for (const auto& op : c.ops) {
    using namespace rqh::gates;
    c64 u00,u01,u10,u11;
    switch (op.type) {
      case OpType::X:
        X_coeffs(u00,u01,u10,u11);
        sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
        break;
      case OpType::RZ:
        RZ_coeffs(op.angle, u00,u01,u10,u11);
        sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11);
        break;
      case OpType::RX:
        RX_coeffs(op.angle, u00,u01,u10,u11); sv.apply_gate_1q(op.qubits[0], u00,u01,u10,u11); break;
      case OpType::CNOT:
        sv.apply_cx(op.qubits[0], op.qubits[1]);
        break;
      case OpType::MEASURE:
        // sampled separately
        break;
    }
  }
}

} // namespace rqh
