// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rqh {

// Rotation parameters for every layer and qubit, all in [0, 2π).
struct AngleSchedule {
  std::size_t depth{};
  std::size_t nqubits{};
  std::vector<std::vector<double>> rz; // rz[layer][qubit]
  std::vector<std::vector<double>> rx; // rx[layer][qubit]
};

// Derived seeds: the rz and rx matrices use seed+1 and seed+1000 on kAngleStream.
inline constexpr std::uint64_t kRzSeedOffset = 1;
inline constexpr std::uint64_t kRxSeedOffset = 1000;

// Pure function of its arguments; bit-identical across calls and processes.
// Each matrix is filled layer-major from its own Pcg32.
AngleSchedule generate_angles(std::uint64_t seed, std::size_t depth, std::size_t nqubits);

} // namespace rqh
