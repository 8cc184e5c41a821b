#pragma once

#include <cstdint>
#include <string>

#include "galaxis/core/snapshot.h"

namespace galaxis {

// Stable 64-bit digest of a snapshot.
//
// Covers every field of every planet and explorer plus tick, run state,
// connectivity and critical nodes. Deterministic across runs and platforms, so
// two replays with the same seed, schedule and deterministic dispatch produce
// the same value.
std::uint64_t digest_snapshot64(const GalaxySnapshot& s);

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace galaxis
