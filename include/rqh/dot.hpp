// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <string>
#include <fstream>

namespace rqh {
// Graphviz view: one plaintext node per qubit wire, one box per op.
inline bool export_dot(const Circuit& c, const std::string& path){
  std::ofstream out(path);
  if(!out) return false;
  out << "digraph circuit {\n  rankdir=LR;\n";
  for (std::size_t q=0; q<c.nqubits; ++q){
    out << "  q" << q << " [shape=plaintext,label=\"q" << q << "\"];\n";
  }
  std::size_t idx=0;
  for (auto& op: c.ops){
    out << "  n" << idx << " [shape=box,label=\"" << op_name(op.type) << "\"];\n";
    for (auto q : op.qubits){
      out << "  q" << q << " -> n" << idx << ";\n";
      out << "  n" << idx << " -> q" << q << ";\n";
    }
    ++idx;
  }
  out << "}\n";
  return bool(out);
}
} // namespace rqh
