// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace rqh {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Invalid run parameters; raised before any simulation.
struct ConfigError : Error {
  using Error::Error;
};

// Qubit ceiling or memory budget exceeded; raised before allocation.
struct ResourceError : Error {
  using Error::Error;
};

// Squared norm drifted beyond tolerance: an arithmetic defect in a gate kernel.
struct NormError : Error {
  NormError(const std::string& where, double norm2)
    : Error("norm invariant violated " + where + ": |psi|^2 = " + std::to_string(norm2)), norm2(norm2) {}
  double norm2;
};

} // namespace rqh
