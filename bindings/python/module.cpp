// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "rqh/errors.hpp"
#include "rqh/hash.hpp"
#include "rqh/message.hpp"

namespace py = pybind11;
using namespace rqh;

PYBIND11_MODULE(rqh_python, m){
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);
  py::register_exception<ResourceError>(m, "ResourceError", PyExc_MemoryError);

  // message may be bytes or str; str is hashed as its UTF-8 encoding.
  m.def("rqc_hash", [](const std::string& message, int n, int depth, std::uint64_t seed, int shots,
                       std::optional<std::uint64_t> sample_seed, int threads, std::size_t top){
    HashConfig cfg;
    cfg.n_qubits = n; cfg.depth = depth; cfg.seed = seed; cfg.shots = shots;
    cfg.sample_seed = sample_seed; cfg.threads = threads;
    HashResult r;
    {
      py::gil_scoped_release release;
      r = run_hash(message, cfg);
    }
    py::list top_list;
    for (const auto& e : r.top(top)) top_list.append(py::make_tuple(to_bitstring(e.value, r.nqubits), e.count));
    py::dict counts;
    for (const auto& [value, count] : r.histogram) counts[py::str(to_bitstring(value, r.nqubits))] = count;
    return py::make_tuple(r.bitstring(), r.hex(), r.final_hash.count, top_list, counts);
  }, py::arg("message"), py::arg("n") = 16, py::arg("depth") = 12, py::arg("seed") = 12345,
     py::arg("shots") = 1024, py::arg("sample_seed") = py::none(), py::arg("threads") = 1, py::arg("top") = 10,
     "Returns (top_bitstring, hash_hex, top_count, top_list, counts).");
}
