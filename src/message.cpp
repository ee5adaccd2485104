// SPDX-License-Identifier: MIT

#include "rqh/message.hpp"
#include "rqh/errors.hpp"
#include <cstdio>

namespace rqh {

BitRegister prepare(std::span<const std::uint8_t> message, int n_qubits) {
  if (n_qubits <= 0) throw ConfigError("n_qubits must be positive, got " + std::to_string(n_qubits));
  const std::size_t n = static_cast<std::size_t>(n_qubits);
  BitRegister bits(n, false);
  std::size_t idx = 0;
  for (std::uint8_t b : message) {
    for (int i = 0; i < 8 && idx < n; ++i, ++idx) bits[idx] = ((b >> i) & 1) != 0;
    if (idx >= n) break;
  }
  return bits;
}

BitRegister prepare(std::string_view message, int n_qubits) {
  return prepare(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(message.data()), message.size()), n_qubits);
}

std::uint64_t register_value(const BitRegister& bits) {
  if (bits.size() > std::size_t(kHardQubitLimit)) throw ConfigError("register wider than " + std::to_string(kHardQubitLimit) + " bits");
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < bits.size(); ++i) if (bits[i]) v |= std::uint64_t(1) << i;
  return v;
}

BitRegister register_from_value(std::uint64_t value, std::size_t n) {
  BitRegister bits(n, false);
  for (std::size_t q = 0; q < n && q < 64; ++q) bits[q] = ((value >> q) & 1) != 0;
  return bits;
}

StateVector to_basis_state(const BitRegister& bits) {
  if (bits.empty()) throw ConfigError("cannot build a state for an empty register");
  const std::uint64_t index = register_value(bits);
  StateVector sv(bits.size());
  sv.reset_basis(index);
  return sv;
}

std::string to_bitstring(std::uint64_t value, std::size_t n) {
  std::string s; s.reserve(n);
  for (std::size_t i = n; i-- > 0;) s.push_back(((value >> i) & 1) ? '1' : '0');
  return s;
}

std::string to_bitstring(const BitRegister& bits) {
  std::string s; s.reserve(bits.size());
  for (std::size_t i = bits.size(); i-- > 0;) s.push_back(bits[i] ? '1' : '0');
  return s;
}

std::string to_hex(std::uint64_t value, std::size_t n) {
  const std::size_t width = (n + 3) / 4;
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%0*llx", static_cast<int>(width), static_cast<unsigned long long>(value));
  return buf;
}

} // namespace rqh
