// SPDX-License-Identifier: MIT

#include "rqh/sampler.hpp"
#include "rqh/errors.hpp"
#include "rqh/log.hpp"
#include "rqh/message.hpp"
#include <cmath>

namespace rqh {

std::uint64_t sample_index(const StateVector& sv, Pcg32& rng, double tolerance) {
  const double total = sv.norm2();
  if (!(total > 0.0) || !std::isfinite(total)) throw NormError("at sampling", total);
  double scale = 1.0;
  if (std::fabs(total - 1.0) > tolerance) {
    logger(LogLevel::Warn) << "renormalizing sampling distribution, |psi|^2 = " << total;
    scale = total;
  }
  const double r = rng.uniform01() * scale;
  const auto& amp = sv.amplitudes();
  const std::size_t N = amp.size();
  // Cumulative distribution
  double acc = 0.0;
  std::size_t last_nonzero = 0;
  for (std::size_t i = 0; i < N; ++i) {
    const double p = std::norm(amp[i]);
    if (p == 0.0) continue;
    acc += p;
    last_nonzero = i;
    if (r < acc) return i;
  }
  // r landed past the rounded cumulative sum
  return last_nonzero;
}

BitRegister sample(const StateVector& sv, Pcg32& rng, double tolerance) {
  return register_from_value(sample_index(sv, rng, tolerance), sv.num_qubits());
}

} // namespace rqh
