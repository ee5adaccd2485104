// SPDX-License-Identifier: MIT

#include "rqh/c_api.h"
#include "rqh/circuit.hpp"
#include "rqh/config.hpp"
#include "rqh/dot.hpp"
#include "rqh/errors.hpp"
#include "rqh/hash.hpp"
#include "rqh/log.hpp"
#include "rqh/message.hpp"
#include "rqh/qasm.hpp"
#include "rqh/report.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <new>
#include <string>

using namespace rqh;

static void usage() {
  std::cout << "rqc-hash [--version] [--config file] [--message|-m TEXT] [--n N] [--d D] [--seed S] [--shots K]\n"
               "         [--threads T] [--sample-seed X] [--top K] [--max-qubits N] [--reuse-state]\n"
               "         [--out counts.json] [--qasm circuit.qasm] [--dot circuit.dot] [--verbose]\n";
}

int main(int argc, char** argv) {
  RunConfig rc;
  std::string outp, qasm_path, dot_path;

  // Config file first so flags override it regardless of position.
  for (int i=1;i<argc;i++){
    std::string a=argv[i];
    if (a=="--config"){
      if (i+1>=argc){ std::cerr<<"Missing --config\n"; return 2; }
      std::string err;
      auto loaded = load_run_config(argv[i+1], err, rc);
      if (!loaded){ std::cerr<<err<<"\n"; return 3; }
      rc = *loaded;
    }
  }

  for (int i=1;i<argc;i++){
    std::string a=argv[i];
    auto nx=[&](const char* n, std::string& v){ if(i+1>=argc){ std::cerr<<"Missing "<<n<<"\n"; return false; } v=argv[++i]; return true; };
    auto opt=[&](const char* n, const char* key){
      std::string v, err;
      if (!nx(n, v)) return false;
      if (!set_option(rc, key, v, err)){ std::cerr<<err<<"\n"; return false; }
      return true;
    };
    bool ok = true;
    if (a=="--version"){ std::cout << rqh_version() << "\n"; return 0; }
    else if (a=="--help"||a=="-h"){ usage(); return 0; }
    else if (a=="--config"){ ++i; }
    else if (a=="--message"||a=="-m") ok=opt("--message","message");
    else if (a=="--n") ok=opt("--n","n_qubits");
    else if (a=="--d") ok=opt("--d","depth");
    else if (a=="--seed") ok=opt("--seed","seed");
    else if (a=="--shots") ok=opt("--shots","shots");
    else if (a=="--threads") ok=opt("--threads","threads");
    else if (a=="--sample-seed") ok=opt("--sample-seed","sample_seed");
    else if (a=="--top") ok=opt("--top","top");
    else if (a=="--max-qubits") ok=opt("--max-qubits","max_qubits");
    else if (a=="--reuse-state") rc.hash.reuse_evolved_state=true;
    else if (a=="--out") ok=nx("--out", outp);
    else if (a=="--qasm") ok=nx("--qasm", qasm_path);
    else if (a=="--dot") ok=nx("--dot", dot_path);
    else if (a=="--verbose"||a=="-v") set_log_level(log_level()==LogLevel::Info ? LogLevel::Debug : LogLevel::Info);
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; usage(); return 2; }
    if (!ok) return 2;
  }

  HashResult r;
  try {
    auto t0 = std::chrono::steady_clock::now();
    r = run_hash(rc.message, rc.hash);
    std::chrono::duration<double> dt = std::chrono::steady_clock::now() - t0;
    logger(LogLevel::Info) << "hashed in " << dt.count() << " s";
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n"; return 3;
  } catch (const ResourceError& e) {
    std::cerr << "Resource limit: " << e.what() << "\n"; return 9;
  } catch (const std::bad_alloc&) {
    std::cerr << "Resource limit: out of memory allocating the state vector\n"; return 9;
  } catch (const std::exception& e) {
    std::cerr << "Internal error: " << e.what() << "\n"; return 10;
  }

  write_text_report(std::cout, rc, r);

  if (!outp.empty()){
    std::ofstream of(outp);
    if (!of){ std::cerr<<"Cannot open out file "<<outp<<"\n"; return 4; }
    write_json_report(of, rc, r);
    if (!of){ std::cerr<<"Failed writing "<<outp<<"\n"; return 4; }
    std::cout << "Saved counts to " << outp << "\n";
  }
  if (!qasm_path.empty() || !dot_path.empty()){
    auto circ = build_circuit(prepare(rc.message, rc.hash.n_qubits), r.schedule);
    if (!qasm_path.empty()){
      if (!export_qasm(circ, qasm_path)){ std::cerr<<"Failed to export QASM\n"; return 4; }
      std::cout << "Wrote " << qasm_path << "\n";
    }
    if (!dot_path.empty()){
      if (!export_dot(circ, dot_path)){ std::cerr<<"Failed to export DOT\n"; return 4; }
      std::cout << "Wrote " << dot_path << "\n";
    }
  }
  return 0;
}
