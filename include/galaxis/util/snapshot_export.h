#pragma once

#include <string>

#include "galaxis/core/snapshot.h"
#include "galaxis/util/json.h"

namespace galaxis {

// Structured form of a snapshot:
//
//   { "tick", "run_state", "connected", "critical_nodes",
//     "planets":   [{ "id", "type", "status", "alive", "energy", "energy_capacity",
//                     "rockets", "generations", "combinations", "generates", "inventory" }],
//     "explorers": [{ "id", "position", "status", "alive", "life", "strategy",
//                     "target", "fallback", "last_failure", "death_reason",
//                     "inventory", "moves", "rocket_jumps", "harvests",
//                     "combinations", "targets_completed" }] }
//
// Inventories are objects keyed by resource label, zero counts omitted.
json::Value snapshot_to_json(const GalaxySnapshot& s);

// snapshot_to_json() rendered as text. Ends with a trailing newline.
std::string snapshot_to_json_text(const GalaxySnapshot& s, int indent = 2);

} // namespace galaxis
