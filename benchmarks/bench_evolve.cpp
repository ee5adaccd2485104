// SPDX-License-Identifier: MIT

#include "rqh/angles.hpp"
#include "rqh/simulator.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>

using namespace rqh;

int main(int argc, char** argv){
  std::size_t n = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 20;
  std::size_t depth = argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 4;
  if (n == 0 || n > 30){ std::cerr << "qubits must be in 1..30\n"; return 2; }
  auto sched = generate_angles(12345, depth, n);
  StateVector sv(n);
  auto t0 = std::chrono::steady_clock::now();
  evolve(sv, sched);
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "n=" << n << " depth=" << depth << " elapsed seconds: " << dt.count() << "\n";
  return 0;
}
