// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>

namespace rqh {
// Minimal PCG32 RNG (portable, reproducible across compilers/OS)
struct Pcg32 {
  uint64_t state;
  uint64_t inc;
  explicit Pcg32(uint64_t seed=0x853c49e6748fea9bULL, uint64_t seq=0xda3e39cb94b95bdbULL){ seed_rng(seed, seq); }
  void seed_rng(uint64_t seed, uint64_t seq){
    state = 0U; inc = (seq << 1u) | 1u;
    next(); state += seed; next();
  }
  uint32_t next(){
    uint64_t oldstate = state;
    state = oldstate * 6364136223846793005ULL + inc;
    uint32_t xorshifted = (uint32_t)(((oldstate >> 18u) ^ oldstate) >> 27u);
    uint32_t rot = (uint32_t)(oldstate >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
  }
  uint32_t operator()(){ return next(); }
  // 53-bit fraction in [0,1) from two draws (27 + 26 bits)
  double uniform01(){
    uint32_t a = next() >> 5, b = next() >> 6;
    return (a * 67108864.0 + b) * (1.0/9007199254740992.0);
  }
};

inline uint64_t splitmix64(uint64_t x){
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Stream shared by both angle matrices; they differ by derived seed.
inline constexpr uint64_t kAngleStream = 0xda3e39cb94b95bdbULL;
// Measurement draws use their own stream, seeded per trial.
inline constexpr uint64_t kSampleStream = 0x9E3779B97F4A7C15ULL;
} // namespace rqh
