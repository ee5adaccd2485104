// SPDX-License-Identifier: MIT

#include "rqh/c_api.h"
#include "rqh/config.hpp"
#include "rqh/errors.hpp"
#include "rqh/hash.hpp"
#include "rqh/log.hpp"
#include "rqh/report.hpp"
#include <cstdlib>
#include <cstring>
#include <new>
#include <sstream>
#include <string>

// Value of "key": <value> in a flat JSON object; empty if absent.
static std::string get_kv(const std::string& js, const std::string& k){
  auto p = js.find(k);
  if (p==std::string::npos) return "";
  p = js.find(':', p + k.size());
  if (p==std::string::npos) return "";
  auto q = js.find_first_not_of(" \t\r\n", p+1);
  if (q==std::string::npos) return "";
  if (js[q]=='"'){ auto e = js.find('"', q+1); return e==std::string::npos ? "" : js.substr(q+1, e-q-1); }
  auto e = js.find_first_of(",}\n", q);
  auto v = js.substr(q, e==std::string::npos ? std::string::npos : e-q);
  v.erase(v.find_last_not_of(" \t\r") + 1);
  return v;
}

extern "C" {

int rqh_hash_string(const char* message, const char* options_json, char** out_json){
  if (!message || !out_json) return RQH_E_ARGS;
  *out_json = nullptr;
  rqh::RunConfig rc;
  rc.message = message;
  std::string opts = options_json ? options_json : "";
  for (const auto& key : rqh::option_keys()){
    if (key == "message") continue;
    auto v = get_kv(opts, "\"" + key + "\"");
    if (v.empty()) continue;
    std::string err;
    if (!rqh::set_option(rc, key, v, err)) { rqh::logger(rqh::LogLevel::Error) << "rqh_hash_string: " << err; return RQH_E_CONFIG; }
  }
  std::string js;
  try {
    auto r = rqh::run_hash(rc.message, rc.hash);
    std::ostringstream os;
    rqh::write_json_report(os, rc, r);
    js = os.str();
  } catch (const rqh::ConfigError& e) {
    rqh::logger(rqh::LogLevel::Error) << "rqh_hash_string: " << e.what(); return RQH_E_CONFIG;
  } catch (const rqh::ResourceError& e) {
    rqh::logger(rqh::LogLevel::Error) << "rqh_hash_string: " << e.what(); return RQH_E_RESOURCE;
  } catch (const std::bad_alloc&) {
    rqh::logger(rqh::LogLevel::Error) << "rqh_hash_string: out of memory"; return RQH_E_RESOURCE;
  } catch (const std::exception& e) {
    rqh::logger(rqh::LogLevel::Error) << "rqh_hash_string: " << e.what(); return RQH_E_INTERNAL;
  }
  char* buf = (char*)std::malloc(js.size()+1);
  if (!buf) return RQH_E_RESOURCE;
  std::memcpy(buf, js.data(), js.size()); buf[js.size()]='\0';
  *out_json = buf;
  return RQH_OK;
}

void rqh_free(char* p){ if (p) std::free(p); }

const char* rqh_version(void){
#ifdef RQH_VERSION
  return RQH_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"
