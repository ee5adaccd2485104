// SPDX-License-Identifier: MIT

#include "rqh/qasm.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace rqh {

std::string to_qasm(const Circuit& c){
  std::ostringstream out;
  out << std::setprecision(17);
  out << "OPENQASM 2.0;\ninclude \"qelib1.inc\";\n";
  out << "qreg q[" << c.nqubits << "];\ncreg c[" << c.nqubits << "];\n";
  for (const auto& op : c.ops){
    switch (op.type){
      case OpType::X: out << "x q[" << op.qubits[0] << "];\n"; break;
      case OpType::RZ: out << "rz(" << op.angle << ") q[" << op.qubits[0] << "];\n"; break;
      case OpType::RX: out << "rx(" << op.angle << ") q[" << op.qubits[0] << "];\n"; break;
      case OpType::CNOT: out << "cx q[" << op.qubits[0] << "],q[" << op.qubits[1] << "];\n"; break;
      case OpType::MEASURE: out << "measure q -> c;\n"; break;
    }
  }
  return out.str();
}

bool export_qasm(const Circuit& c, const std::string& path){
  std::ofstream out(path);
  if (!out) return false;
  out << to_qasm(c);
  return bool(out);
}

} // namespace rqh
