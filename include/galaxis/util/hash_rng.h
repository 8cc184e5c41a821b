#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace galaxis::util {

// splitmix64: fast deterministic mixing / RNG step.
//
// Every random decision in the simulation (event draws, greedy neighbor
// choice) goes through this so a run is reproducible from SimConfig::seed.
// Not a cryptographic generator.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Derive an independent stream seed from a base seed and a few salts
// (tick, actor id, purpose tag).
inline std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t a, std::uint64_t b = 0) {
  return splitmix64(splitmix64(seed ^ splitmix64(a)) ^ (b * 0xd1b54a32d192ed03ULL));
}

// Convert a 64-bit word into a double in [0,1) using the top 53 bits.
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0); // 2^53
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() {
    s = splitmix64(s);
    return s;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return next_u01() < p;
  }

  // Unbiased index in [0, n). Rejection sampling avoids modulo bias.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return static_cast<std::size_t>(r % bound);
    }
  }
};

} // namespace galaxis::util
