#pragma once

#include <optional>
#include <string>
#include <vector>

#include "galaxis/core/ids.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/sim_config.h"
#include "galaxis/core/strategy.h"
#include "galaxis/util/json.h"

namespace galaxis {

struct PlanetConfig {
  Id id{kInvalidId};
  PlanetType type{PlanetType::A};
  std::vector<Id> neighbors;

  // Empty => default_generation_catalog(id).
  std::vector<ResourceKind> generates;

  // Charged cells at start; -1 = full.
  int energy{-1};

  // Cell count for many-cell types; 0 = SimConfig::many_cell_capacity.
  int capacity{0};

  Inventory inventory;
};

struct ExplorerConfig {
  // kInvalidId = assign the next free id.
  Id id{kInvalidId};
  Id start{kInvalidId};
  Strategy strategy{Strategy::Greedy};
  ResourceKind target{ResourceKind::Water};
  std::optional<ResourceKind> fallback;

  // <= 0 = SimConfig::explorer_life.
  int life{0};

  Inventory inventory;
};

struct GalaxyConfig {
  std::vector<PlanetConfig> planets;
  std::vector<ExplorerConfig> explorers;
  SimConfig sim;
};

// Deterministic single-kind catalog for planets whose file gives none.
std::vector<ResourceKind> default_generation_catalog(Id id);

// Galaxy definition in JSON:
//
//   {
//     "sim": { "seed": 7, "event_schedule": "S..A", "tie_break": "lowest_id", ... },
//     "planets": [
//       { "id": 0, "type": "C", "neighbors": [1], "generates": ["hydrogen"],
//         "energy": 1, "capacity": 5, "inventory": { "carbon": 2 } }
//     ],
//     "explorers": [
//       { "start": 0, "strategy": "best_path_adaptive", "target": "ai_partner",
//         "fallback": "dolphin", "life": 40 }
//     ]
//   }
//
// Throws std::runtime_error naming the offending field.
GalaxyConfig parse_galaxy_json(const std::string& text);

// Adjacency text format, one planet per line:
//
//   id,type,neighbor,neighbor,...
//
// `type` is A-D or 0-3. Blank lines and lines starting with '#' are skipped.
// Edges are undirected; listing one side is enough.
//
// Throws std::runtime_error naming the offending line.
GalaxyConfig parse_galaxy_adjacency(const std::string& text);

// Picks the format by extension (".json" => JSON, anything else => adjacency).
GalaxyConfig load_galaxy_file(const std::string& path);

// Overrides fields of `cfg` present in a JSON object. Throws on wrong types or
// unknown enum names.
void apply_sim_config_json(const json::Value& v, SimConfig& cfg);

// Throws std::runtime_error on out-of-range settings.
void validate_sim_config(const SimConfig& cfg);

// Throws std::runtime_error on duplicate planet ids, dangling neighbor ids,
// empty or complex generation catalogs, or explorers starting nowhere.
void validate_galaxy(const GalaxyConfig& galaxy);

} // namespace galaxis
