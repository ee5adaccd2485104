// SPDX-License-Identifier: MIT

#include "rqh/circuit.hpp"
#include "rqh/dot.hpp"
#include "rqh/message.hpp"
#include "rqh/qasm.hpp"
#include "rqh/report.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace rqh;

static int tests_failed = 0;
#define EXPECT_TRUE(c) do{ if (!(c)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_EQ(a,b) do{ if (!((a)==(b))) { std::cerr << "EXPECT_EQ failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

static std::size_t count_of(const std::string& s, const std::string& needle){
  std::size_t n=0;
  for (auto p = s.find(needle); p != std::string::npos; p = s.find(needle, p + needle.size())) ++n;
  return n;
}

int main(){
  auto sched = generate_angles(7, 2, 3);
  auto circ = build_circuit(prepare(std::string("\x05", 1), 3), sched);

  // QASM
  {
    auto q = to_qasm(circ);
    EXPECT_EQ(q.rfind("OPENQASM 2.0;\ninclude \"qelib1.inc\";\nqreg q[3];\ncreg c[3];\nx q[0];\nx q[2];\n", 0), 0u);
    EXPECT_EQ(count_of(q, "\nx q["), 2u);
    EXPECT_EQ(count_of(q, "rz("), 6u);
    EXPECT_EQ(count_of(q, "rx("), 6u);
    EXPECT_EQ(count_of(q, "cx q[0],q[1];"), 2u);
    EXPECT_EQ(count_of(q, "cx q[2],q[0];"), 2u);
    EXPECT_EQ(count_of(q, "cx "), 6u);
    EXPECT_TRUE(q.size() > 16 && q.substr(q.size() - 16) == "measure q -> c;\n");
    // angles survive the text round trip
    auto p = q.find("rz(");
    EXPECT_TRUE(std::stod(q.substr(p + 3)) == sched.rz[0][0]);

    auto path = (std::filesystem::temp_directory_path() / "rqh_test.qasm").string();
    EXPECT_TRUE(export_qasm(circ, path));
    std::ifstream in(path); std::stringstream ss; ss << in.rdbuf();
    EXPECT_EQ(ss.str(), q);
    std::remove(path.c_str());
    EXPECT_TRUE(!export_qasm(circ, "/nonexistent/dir/x.qasm"));
  }

  // DOT
  {
    auto path = (std::filesystem::temp_directory_path() / "rqh_test.dot").string();
    EXPECT_TRUE(export_dot(circ, path));
    std::ifstream in(path); std::stringstream ss; ss << in.rdbuf();
    auto d = ss.str();
    EXPECT_EQ(d.rfind("digraph circuit {", 0), 0u);
    EXPECT_EQ(count_of(d, "label=\"CNOT\""), 6u);
    EXPECT_EQ(count_of(d, "label=\"MEASURE\""), 1u);
    EXPECT_EQ(count_of(d, "[shape=plaintext"), 3u);
    std::remove(path.c_str());
  }

  // Reports
  {
    RunConfig rc;
    rc.message = "say \"hi\"\n";
    rc.hash.n_qubits = 5; rc.hash.depth = 2; rc.hash.shots = 40; rc.hash.sample_seed = 3;
    rc.top_k = 2;
    auto r = run_hash(rc.message, rc.hash);
    std::ostringstream txt, js;
    write_text_report(txt, rc, r);
    write_json_report(js, rc, r);
    EXPECT_EQ(txt.str().rfind("=== RQC-Hash Result ===\n", 0), 0u);
    EXPECT_TRUE(txt.str().find("Hash hex  : " + r.hex()) != std::string::npos);
    EXPECT_TRUE(txt.str().find("Top 2 results:\n") != std::string::npos);
    EXPECT_TRUE(js.str().find("\"message\": \"say \\\"hi\\\"\\n\"") != std::string::npos);
    EXPECT_TRUE(js.str().find("\"top_bitstring\": \"" + r.bitstring() + "\"") != std::string::npos);
    EXPECT_EQ(count_of(js.str(), "{\"bitstring\""), std::min<std::size_t>(2, r.histogram.size()));
    EXPECT_EQ(json_escape(std::string("a\x01" "b", 3)), "a\\u0001b");
    EXPECT_EQ(json_escape("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x99\x82"), "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x99\x82");
    EXPECT_EQ(json_escape("\xff"), "\\u00ff");
    EXPECT_EQ(json_escape("a\xc3"), "a\\u00c3");          // truncated sequence
    EXPECT_EQ(json_escape("\xc0\xaf"), "\\u00c0\\u00af"); // overlong
    EXPECT_EQ(json_escape("\xed\xa0\x80"), "\\u00ed\\u00a0\\u0080"); // surrogate

    // Stray bytes in the message are escaped in the report
    RunConfig raw = rc;
    raw.message = std::string("\x80\xfe", 2);
    std::ostringstream js2;
    write_json_report(js2, raw, r);
    EXPECT_TRUE(js2.str().find("\"message\": \"\\u0080\\u00fe\"") != std::string::npos);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
