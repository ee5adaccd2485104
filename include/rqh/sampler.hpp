// SPDX-License-Identifier: MIT

#pragma once
#include "rng.hpp"
#include "state_vector.hpp"
#include "types.hpp"
#include <cstdint>

namespace rqh {

// Source for one trial's measurement. Depends only on (sample_seed, trial),
// never on which worker runs the trial.
inline std::uint64_t trial_seed(std::uint64_t sample_seed, std::uint64_t trial) {
  return splitmix64(sample_seed ^ (trial * 0x9e3779b97f4a7c15ULL));
}
inline Pcg32 trial_rng(std::uint64_t sample_seed, std::uint64_t trial) { return Pcg32(trial_seed(sample_seed, trial), kSampleStream); }

// Draw one basis index with probability |a_i|^2. If the probabilities sum to
// something further than tolerance from 1 the draw is rescaled by that sum.
std::uint64_t sample_index(const StateVector& sv, Pcg32& rng, double tolerance = kDefaultNormTolerance);

// sample_index decomposed into a register, bit i = (index >> i) & 1.
BitRegister sample(const StateVector& sv, Pcg32& rng, double tolerance = kDefaultNormTolerance);

} // namespace rqh
