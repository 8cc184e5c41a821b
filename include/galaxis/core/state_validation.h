#pragma once

#include <string>
#include <vector>

#include "galaxis/core/snapshot.h"

namespace galaxis {

// Check a published snapshot against the structural invariants of the
// simulation:
// - every planet within its type's capability matrix (generation,
//   combination and rocket counters; energy inside [0, capacity])
// - planets and explorers sorted by unique id
// - living explorers standing on a known planet
// - critical nodes referring to known planets
//
// Planets reported Unknown are skipped; their numbers are stale.
//
// Returns a sorted list of human-readable problems. Empty => valid.
std::vector<std::string> validate_snapshot(const GalaxySnapshot& s);

} // namespace galaxis
