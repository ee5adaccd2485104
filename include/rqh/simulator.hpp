// SPDX-License-Identifier: MIT

#pragma once
#include "angles.hpp"
#include "state_vector.hpp"
#include "types.hpp"
#include <utility>
#include <vector>

namespace rqh {

// (control, target) pairs of one entangling layer, in application order:
// even pairs (0,1),(2,3).., odd pairs (1,2),(3,4).., then (n-1,0) when n > 2.
std::vector<std::pair<std::size_t, std::size_t>> entangling_pairs(std::size_t nqubits);

// ConfigError unless s is depth x nqubits in both matrices, every row included.
void check_schedule(const AngleSchedule& s, std::size_t nqubits);

// RZ(rz[layer][q]) then RX(rx[layer][q]) on every qubit q.
void apply_rotation_layer(StateVector& sv, const AngleSchedule& s, std::size_t layer);
void apply_entangling_layer(StateVector& sv);

// Runs all schedule layers in place. After each layer the squared norm must be
// within norm_tolerance of 1, otherwise NormError. ConfigError if the schedule
// width does not match the state.
void evolve(StateVector& sv, const AngleSchedule& s, double norm_tolerance = kDefaultNormTolerance);

} // namespace rqh
