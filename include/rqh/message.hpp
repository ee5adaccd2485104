// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "state_vector.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rqh {

// Unpack message bits LSB-first per byte, in byte order, into n_qubits slots.
// Slots past the message's bit length stay false. Throws ConfigError if n_qubits <= 0.
BitRegister prepare(std::span<const std::uint8_t> message, int n_qubits);
BitRegister prepare(std::string_view message, int n_qubits);

// Integer value of a register, bit i weighted 2^i.
std::uint64_t register_value(const BitRegister& bits);

// Inverse of register_value for a register of n bits.
BitRegister register_from_value(std::uint64_t value, std::size_t n);

// Fresh state with amplitude 1 at register_value(bits).
StateVector to_basis_state(const BitRegister& bits);

// Qubit n-1 first, the order external toolkits print counts in.
std::string to_bitstring(std::uint64_t value, std::size_t n);
std::string to_bitstring(const BitRegister& bits);

// Lowercase hex of the LSB-first value, zero padded to ceil(n/4) digits.
std::string to_hex(std::uint64_t value, std::size_t n);

} // namespace rqh
