// SPDX-License-Identifier: MIT

#include "rqh/angles.hpp"
#include "rqh/rng.hpp"
#include <numbers>

namespace rqh {

static std::vector<std::vector<double>> angle_matrix(std::uint64_t seed, std::size_t depth, std::size_t nqubits) {
  constexpr double two_pi = 2.0 * std::numbers::pi;
  Pcg32 rng(seed, kAngleStream);
  std::vector<std::vector<double>> m(depth, std::vector<double>(nqubits));
  for (auto& row : m) {
    for (auto& v : row) {
      v = rng.uniform01() * two_pi;
      if (v >= two_pi) v = 0.0; // product may round up
    }
  }
  return m;
}

AngleSchedule generate_angles(std::uint64_t seed, std::size_t depth, std::size_t nqubits) {
  AngleSchedule s;
  s.depth = depth;
  s.nqubits = nqubits;
  s.rz = angle_matrix(seed + kRzSeedOffset, depth, nqubits);
  s.rx = angle_matrix(seed + kRxSeedOffset, depth, nqubits);
  return s;
}

} // namespace rqh
