// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <map>
#include <cstdint>

namespace rqh {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // One boolean per qubit, qubit 0 first.
  using BitRegister = std::vector<bool>;

  // Outcome value (bit i weighted 2^i) -> occurrence count.
  using Histogram = std::map<std::uint64_t, std::uint64_t>;

  // Hard limit so basis indices always fit an unsigned 64-bit value.
  inline constexpr int kHardQubitLimit = 62;

  // Allowed drift of the squared norm from 1.
  inline constexpr double kDefaultNormTolerance = 1e-9;
}
