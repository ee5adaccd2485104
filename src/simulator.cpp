// SPDX-License-Identifier: MIT

#include "rqh/simulator.hpp"
#include "rqh/errors.hpp"
#include "rqh/gates.hpp"
#include <cmath>

namespace rqh {

std::vector<std::pair<std::size_t, std::size_t>> entangling_pairs(std::size_t nqubits) {
  std::vector<std::pair<std::size_t, std::size_t>> pairs;
  for (std::size_t i = 0; i + 1 < nqubits; i += 2) pairs.emplace_back(i, i + 1);
  for (std::size_t i = 1; i + 1 < nqubits; i += 2) pairs.emplace_back(i, i + 1);
  if (nqubits > 2) pairs.emplace_back(nqubits - 1, 0);
  return pairs;
}

void check_schedule(const AngleSchedule& s, std::size_t nqubits) {
  if (s.nqubits != nqubits || s.rz.size() != s.depth || s.rx.size() != s.depth)
    throw ConfigError("angle schedule is " + std::to_string(s.depth) + "x" + std::to_string(s.nqubits) +
                      " but the state has " + std::to_string(nqubits) + " qubits");
  for (std::size_t layer = 0; layer < s.depth; ++layer) {
    if (s.rz[layer].size() != nqubits || s.rx[layer].size() != nqubits)
      throw ConfigError("angle schedule layer " + std::to_string(layer) + " does not have " + std::to_string(nqubits) + " entries");
  }
}

void apply_rotation_layer(StateVector& sv, const AngleSchedule& s, std::size_t layer) {
  using namespace rqh::gates;
  const std::size_t n = sv.num_qubits();
  if (layer >= s.rz.size() || layer >= s.rx.size() || s.rz[layer].size() != n || s.rx[layer].size() != n)
    throw ConfigError("angle schedule has no " + std::to_string(n) + "-qubit layer " + std::to_string(layer));
  c64 u00, u01, u10, u11;
  for (std::size_t q = 0; q < n; ++q) {
    RZ_coeffs(s.rz[layer][q], u00, u01, u10, u11);
    sv.apply_gate_1q(q, u00, u01, u10, u11);
    RX_coeffs(s.rx[layer][q], u00, u01, u10, u11);
    sv.apply_gate_1q(q, u00, u01, u10, u11);
  }
}

void apply_entangling_layer(StateVector& sv) {
  for (const auto& [c, t] : entangling_pairs(sv.num_qubits())) sv.apply_cx(c, t);
}

void evolve(StateVector& sv, const AngleSchedule& s, double norm_tolerance) {
  check_schedule(s, sv.num_qubits());
  for (std::size_t layer = 0; layer < s.depth; ++layer) {
    apply_rotation_layer(sv, s, layer);
    apply_entangling_layer(sv);
    const double n2 = sv.norm2();
    if (!(std::fabs(n2 - 1.0) <= norm_tolerance)) throw NormError("after layer " + std::to_string(layer), n2);
  }
}

} // namespace rqh
