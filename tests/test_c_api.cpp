// SPDX-License-Identifier: MIT

#include "rqh/c_api.h"
#include "rqh/log.hpp"
#include <cstring>
#include <iostream>
#include <string>

static int tests_failed = 0;
#define EXPECT_TRUE(c) do{ if (!(c)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_EQ(a,b) do{ if (!((a)==(b))) { std::cerr << "EXPECT_EQ failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

static int hash_json(const char* msg, const char* opts, std::string& out){
  char* js = nullptr;
  int rc = rqh_hash_string(msg, opts, &js);
  out = js ? js : "";
  rqh_free(js);
  return rc;
}

int main(){
  rqh::set_log_level(rqh::LogLevel::Error);
  std::string a, b;

  const char* opts = "{\"n_qubits\": 6, \"depth\": 3, \"seed\": 21, \"shots\": 64, \"sample_seed\": 5, \"top\": 4}";
  EXPECT_EQ(hash_json("hello", opts, a), RQH_OK);
  EXPECT_TRUE(a.find("\"message\": \"hello\"") != std::string::npos);
  EXPECT_TRUE(a.find("\"n_qubits\": 6,") != std::string::npos);
  EXPECT_TRUE(a.find("\"seed\": 21,") != std::string::npos);
  EXPECT_TRUE(a.find("\"shots\": 64,") != std::string::npos);
  EXPECT_TRUE(a.find("\"hash_hex\": \"") != std::string::npos);
  EXPECT_TRUE(a.find("\"counts\": {") != std::string::npos);
  EXPECT_EQ(hash_json("hello", opts, b), RQH_OK);
  EXPECT_EQ(a, b);

  // Unlisted keys fall back to the defaults
  EXPECT_EQ(hash_json("x", "{\"shots\": 3}", a), RQH_OK);
  EXPECT_TRUE(a.find("\"n_qubits\": 16,") != std::string::npos);
  EXPECT_EQ(hash_json("x", "{\"n_qubits\": 3, \"shots\": 3, \"reuse_evolved_state\": true}", a), RQH_OK);

  EXPECT_EQ(hash_json("\xff\xfe", "{\"n_qubits\": 4, \"shots\": 8}", a), RQH_OK);
  EXPECT_TRUE(a.find("\"message\": \"\\u00ff\\u00fe\"") != std::string::npos);

  EXPECT_EQ(hash_json("x", "{\"shots\": \"lots\"}", a), RQH_E_CONFIG);
  EXPECT_TRUE(a.empty());
  EXPECT_EQ(hash_json("x", "{\"n_qubits\": 0}", a), RQH_E_CONFIG);
  EXPECT_EQ(hash_json("x", "{\"n_qubits\": 40}", a), RQH_E_RESOURCE);
  EXPECT_EQ(hash_json(nullptr, nullptr, a), RQH_E_ARGS);
  EXPECT_EQ(rqh_hash_string("x", nullptr, nullptr), RQH_E_ARGS);

  EXPECT_TRUE(rqh_version() != nullptr && std::strlen(rqh_version()) > 0);

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
