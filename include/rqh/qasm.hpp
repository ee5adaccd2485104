// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <string>

namespace rqh {
// OpenQASM 2.0 text for a circuit: qreg/creg q,c[n]; x, rz, rx, cx; measure q -> c.
std::string to_qasm(const Circuit& c);
bool export_qasm(const Circuit& c, const std::string& path);
}
