// SPDX-License-Identifier: MIT

#include "rqh/config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <fstream>

namespace rqh {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

template <typename T>
static bool parse_number(const std::string& s, T& out) {
  const char* b = s.data();
  const char* e = b + s.size();
  auto [p, ec] = std::from_chars(b, e, out);
  return ec == std::errc() && p == e && b != e;
}

static bool parse_int(const std::string& s, int& out) {
  long long v = 0;
  if (!parse_number(s, v) || v < INT_MIN || v > INT_MAX) return false;
  out = static_cast<int>(v);
  return true;
}

// Negative seeds wrap to their two's complement value.
static bool parse_seed(const std::string& s, std::uint64_t& out) {
  if (!s.empty() && s[0] == '-') {
    long long v = 0;
    if (!parse_number(s, v)) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
  }
  return parse_number(s, out);
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
  if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
  return false;
}

const std::vector<std::string>& option_keys() {
  static const std::vector<std::string> keys = {
    "message", "n_qubits", "depth", "seed", "shots", "threads", "sample_seed",
    "max_qubits", "max_threads", "memory_budget_bytes", "norm_tolerance", "reuse_evolved_state", "top"};
  return keys;
}

bool set_option(RunConfig& rc, const std::string& key, const std::string& raw, std::string& err) {
  const std::string v = key == "message" ? raw : trim(raw);
  auto& h = rc.hash;
  bool ok = true;
  if (key == "message") rc.message = v;
  else if (key == "n_qubits" || key == "n") ok = parse_int(v, h.n_qubits);
  else if (key == "depth" || key == "d") ok = parse_int(v, h.depth);
  else if (key == "seed") ok = parse_seed(v, h.seed);
  else if (key == "shots") ok = parse_int(v, h.shots);
  else if (key == "threads") ok = parse_int(v, h.threads);
  else if (key == "sample_seed") {
    std::uint64_t s = 0;
    if (v.empty() || v == "random") h.sample_seed.reset();
    else if ((ok = parse_seed(v, s))) h.sample_seed = s;
  }
  else if (key == "max_qubits") ok = parse_int(v, h.max_qubits);
  else if (key == "max_threads") ok = parse_int(v, h.max_threads);
  else if (key == "memory_budget_bytes") ok = parse_number(v, h.memory_budget_bytes);
  else if (key == "norm_tolerance") ok = parse_number(v, h.norm_tolerance);
  else if (key == "reuse_evolved_state") ok = parse_bool(v, h.reuse_evolved_state);
  else if (key == "top") ok = parse_number(v, rc.top_k);
  else { err = "Unknown option '" + key + "'"; return false; }
  if (!ok) { err = "Invalid value '" + v + "' for option '" + key + "'"; return false; }
  return true;
}

std::optional<RunConfig> load_run_config(const std::string& path, std::string& err, RunConfig base) {
  std::ifstream in(path);
  if (!in) { err = "Cannot open config file: " + path; return std::nullopt; }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    auto p = line.find('=');
    if (p == std::string::npos) { err = "Expected key=value at line " + std::to_string(lineno); return std::nullopt; }
    std::string key = trim(line.substr(0, p));
    std::string value = line.substr(p + 1);
    if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    std::string e;
    if (!set_option(base, key, value, e)) { err = e + " at line " + std::to_string(lineno); return std::nullopt; }
  }
  return base;
}

} // namespace rqh
