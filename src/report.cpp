// SPDX-License-Identifier: MIT

#include "rqh/report.hpp"
#include "rqh/message.hpp"
#include <cstdio>

namespace rqh {

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if there is none.
static std::size_t utf8_sequence(const std::string& s, std::size_t i) {
  const auto b = [&](std::size_t k){ return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  std::size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte
  if (c >= 0xC2 && c <= 0xDF) len = 2;
  else if (c >= 0xE0 && c <= 0xEF) { len = 3; if (c == 0xE0) lo = 0xA0; if (c == 0xED) hi = 0x9F; }
  else if (c >= 0xF0 && c <= 0xF4) { len = 4; if (c == 0xF0) lo = 0x90; if (c == 0xF4) hi = 0x8F; }
  else return 0;
  if (i + len > s.size()) return 0;
  if (b(i+1) < lo || b(i+1) > hi) return 0;
  for (std::size_t k = 2; k < len; ++k) if ((b(i+k) & 0xC0) != 0x80) return 0;
  return len;
}

std::string json_escape(const std::string& s) {
  std::string out; out.reserve(s.size() + 2);
  char buf[8];
  for (std::size_t i = 0; i < s.size(); ++i) {
    const unsigned char ch = static_cast<unsigned char>(s[i]);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (ch < 0x20) { std::snprintf(buf, sizeof(buf), "\\u%04x", ch); out += buf; }
        else if (ch < 0x80) out.push_back(static_cast<char>(ch));
        else if (const std::size_t len = utf8_sequence(s, i)) { out.append(s, i, len); i += len - 1; }
        // Stray byte: written as the code point of the same value.
        else { std::snprintf(buf, sizeof(buf), "\\u%04x", ch); out += buf; }
    }
  }
  return out;
}

void write_text_report(std::ostream& os, const RunConfig& rc, const HashResult& r) {
  const auto& h = rc.hash;
  os << "=== RQC-Hash Result ===\n";
  os << "Message   : \"" << rc.message << "\"\n";
  os << "n_qubits  : " << h.n_qubits << ", depth: " << h.depth << ", seed: " << h.seed << ", shots: " << h.shots << "\n";
  os << "Top bitstr: " << r.bitstring() << "  (MSB..LSB) count=" << r.final_hash.count << "\n";
  os << "Hash hex  : " << r.hex() << " (LSB-first integer)\n";
  os << "Top " << rc.top_k << " results:\n";
  for (const auto& e : r.top(rc.top_k)) os << to_bitstring(e.value, r.nqubits) << " : " << e.count << "\n";
}

void write_json_report(std::ostream& os, const RunConfig& rc, const HashResult& r) {
  const auto& h = rc.hash;
  os << "{\n";
  os << "  \"message\": \"" << json_escape(rc.message) << "\",\n";
  os << "  \"n_qubits\": " << h.n_qubits << ",\n";
  os << "  \"depth\": " << h.depth << ",\n";
  os << "  \"seed\": " << h.seed << ",\n";
  os << "  \"shots\": " << h.shots << ",\n";
  os << "  \"top_bitstring\": \"" << r.bitstring() << "\",\n";
  os << "  \"hash_hex\": \"" << r.hex() << "\",\n";
  os << "  \"top_count\": " << r.final_hash.count << ",\n";
  os << "  \"top\": [";
  auto top = r.top(rc.top_k);
  for (std::size_t i=0;i<top.size();++i){
    os << (i ? ", " : "") << "{\"bitstring\": \"" << to_bitstring(top[i].value, r.nqubits) << "\", \"count\": " << top[i].count << "}";
  }
  os << "],\n  \"counts\": {\n";
  std::size_t k=0;
  for (const auto& [value, count] : r.histogram){
    os << "    \"" << to_bitstring(value, r.nqubits) << "\": " << count << (++k<r.histogram.size() ? "," : "") << "\n";
  }
  os << "  }\n}\n";
}

} // namespace rqh
