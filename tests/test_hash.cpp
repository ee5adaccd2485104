// SPDX-License-Identifier: MIT

#include "rqh/errors.hpp"
#include "rqh/hash.hpp"
#include <iostream>
#include <numeric>

using namespace rqh;

static int tests_failed = 0;
#define EXPECT_TRUE(c) do{ if (!(c)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_EQ(a,b) do{ if (!((a)==(b))) { std::cerr << "EXPECT_EQ failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

template <typename E, typename F>
static bool throws(F f){
  try { f(); } catch (const E&) { return true; }
  return false;
}

static std::uint64_t total(const Histogram& h){
  return std::accumulate(h.begin(), h.end(), std::uint64_t{0}, [](std::uint64_t a, const auto& kv){ return a + kv.second; });
}

static HashConfig small(){
  HashConfig c;
  c.n_qubits = 8; c.depth = 5; c.seed = 777; c.shots = 400; c.sample_seed = 42;
  return c;
}

int main(){
  // "hello" at the default parameters with a fixed sampling seed
  {
    HashConfig cfg;
    cfg.sample_seed = 1;
    cfg.reuse_evolved_state = true;
    auto r = run_hash("hello", cfg);
    EXPECT_EQ(r.input_value, 0x6568u);
    EXPECT_EQ(total(r.histogram), 1024u);
    EXPECT_EQ(r.histogram.size(), 1001u);
    EXPECT_EQ(r.final_hash.value, 1396u);
    EXPECT_EQ(r.final_hash.count, 3u);
    EXPECT_EQ(r.bitstring(), "0000010101110100");
    EXPECT_EQ(r.hex(), "0574");
    const std::vector<HashEntry> expected = {
      {1396,3}, {352,2}, {16509,2}, {16514,2}, {20229,2},
      {26448,2}, {27045,2}, {30238,2}, {38303,2}, {38703,2}};
    EXPECT_TRUE(r.top(10) == expected);
  }

  // Shot conservation and determinism
  {
    auto cfg = small();
    auto a = run_hash("abc", cfg);
    auto b = run_hash("abc", cfg);
    EXPECT_EQ(total(a.histogram), 400u);
    EXPECT_TRUE(a.histogram == b.histogram);
    EXPECT_TRUE(a.final_hash == b.final_hash);

    // Worker count and state reuse do not change outcomes
    for (int t : {2, 3, 7}){
      cfg.threads = t;
      EXPECT_TRUE(run_hash("abc", cfg).histogram == a.histogram);
    }
    cfg.threads = 4; cfg.reuse_evolved_state = true;
    EXPECT_TRUE(run_hash("abc", cfg).histogram == a.histogram);

    cfg = small();
    cfg.sample_seed = 43;
    EXPECT_TRUE(run_hash("abc", cfg).histogram != a.histogram);
  }

  // More workers than shots
  {
    auto cfg = small();
    cfg.shots = 5; cfg.threads = 16;
    EXPECT_EQ(total(run_hash("x", cfg).histogram), 5u);
    EXPECT_EQ(buffer_count(cfg), 5u);
  }

  // Depth 0: every shot measures the prepared register
  {
    auto cfg = small();
    cfg.depth = 0;
    auto r = run_hash("Z", cfg);
    EXPECT_EQ(r.histogram.size(), 1u);
    EXPECT_EQ(r.histogram.at(r.input_value), 400u);
    EXPECT_EQ(r.final_hash.value, std::uint64_t('Z'));
  }

  // Unseeded sampling still conserves shots
  {
    auto r = run_hash("abc", 4, 2, 9, 50);
    EXPECT_EQ(total(r.histogram), 50u);
    EXPECT_EQ(r.schedule.depth, 2u);
    EXPECT_EQ(r.input_value, std::uint64_t('a') & 0xF);
  }

  // Ties resolve to the smallest value; ranking is count desc, value asc
  {
    Histogram h{{5,2},{3,2},{9,1},{1,4},{12,4}};
    EXPECT_TRUE(select_final(h) == (HashEntry{1,4}));
    Histogram tie{{5,2},{3,2},{9,1}};
    EXPECT_TRUE(select_final(tie) == (HashEntry{3,2}));
    EXPECT_TRUE(sorted_entries(h) == (std::vector<HashEntry>{{1,4},{12,4},{3,2},{5,2},{9,1}}));
    HashResult r; r.histogram = h;
    EXPECT_EQ(r.top(2).size(), 2u);
    EXPECT_EQ(r.top(50).size(), 5u);
  }

  // Parameter errors come before resource errors
  {
    auto bad = [](auto mutate){ auto c = small(); mutate(c); return throws<ConfigError>([&]{ run_hash("m", c); }); };
    EXPECT_TRUE(bad([](HashConfig& c){ c.n_qubits = 0; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.n_qubits = -3; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.depth = -1; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.shots = 0; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.threads = 0; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.norm_tolerance = 0.0; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.max_threads = 0; }));
    EXPECT_TRUE(bad([](HashConfig& c){ c.n_qubits = 100; c.shots = 0; }));
  }

  // Resource ceilings reject before allocating
  {
    auto cfg = small();
    cfg.n_qubits = 27;
    EXPECT_TRUE(throws<ResourceError>([&]{ validate(cfg); }));
    cfg.n_qubits = 63; cfg.max_qubits = 200;
    EXPECT_TRUE(throws<ResourceError>([&]{ validate(cfg); }));
    cfg.n_qubits = 40; cfg.max_qubits = 62;
    EXPECT_TRUE(throws<ResourceError>([&]{ validate(cfg); }));

    cfg = small();
    cfg.n_qubits = 20; cfg.threads = 4; cfg.shots = 100;
    cfg.memory_budget_bytes = 32ULL << 20; // one buffer is 16 MiB
    EXPECT_TRUE(throws<ResourceError>([&]{ validate(cfg); }));
    cfg.reuse_evolved_state = true;
    EXPECT_EQ(buffer_count(cfg), 1u);
    EXPECT_TRUE(!throws<ResourceError>([&]{ validate(cfg); }));
  }

  // Worker count is capped before any thread starts
  {
    HashConfig cfg;
    cfg.n_qubits = 1; cfg.depth = 1; cfg.shots = 2000000; cfg.threads = 2000000;
    cfg.sample_seed = 1; cfg.memory_budget_bytes = ~0ULL;
    EXPECT_TRUE(throws<ResourceError>([&]{ run_hash("t", cfg); }));

    cfg = small();
    cfg.max_threads = 4; cfg.threads = 5;
    EXPECT_TRUE(throws<ResourceError>([&]{ validate(cfg); }));
    cfg.threads = 4;
    EXPECT_EQ(total(run_hash("abc", cfg).histogram), 400u);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
