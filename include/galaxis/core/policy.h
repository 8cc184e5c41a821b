#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "galaxis/core/galaxy_map.h"
#include "galaxis/core/ids.h"
#include "galaxis/core/outcome.h"
#include "galaxis/core/recipes.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/snapshot.h"
#include "galaxis/core/strategy.h"
#include "galaxis/util/hash_rng.h"

namespace galaxis {

// What an explorer remembers about the planets it has visited.
//
// Entries are the planet's own QueryState answers stamped with the tick they
// were observed. Entries older than the TTL are treated as unknown, which
// planners read optimistically (a stale planet may have been recharged).
class ExplorerMemory {
 public:
  void observe(std::uint64_t tick, const PlanetView& v);
  void forget(Id id);

  const PlanetView* recall(Id id, std::uint64_t now, int ttl_ticks) const;

  std::size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    std::uint64_t tick{0};
    PlanetView view;
  };
  std::map<Id, Entry> entries_;
};

// True if the planet is dead, or has neither a charged cell nor anything left
// to harvest.
bool known_exhausted(const PlanetView& v);

// True if a further GenerateResource could still succeed.
bool can_still_generate(const PlanetView& v);

// True if a further RequestCombine could still succeed.
bool can_still_combine(const PlanetView& v);

// Everything a policy decision may look at, bundled for one step.
struct PolicyContext {
  const GalaxyMap& map;
  const ExplorerMemory& memory;
  std::uint64_t tick{0};
  int memory_ttl_ticks{20};

  const PlanetView* recall(Id id) const { return memory.recall(id, tick, memory_ttl_ticks); }
};

// Units available as combination inputs. Finished units of the target are set
// aside so they are never consumed by another recipe.
Inventory working_inventory(const Inventory& held, ResourceKind target);

// Base units the explorer wants to harvest at `here`, with counts.
//
// Greedy takes every base unit present. Purposeful strategies only take what
// is still missing for the target.
Inventory harvest_wants(Strategy s, ResourceKind target, const Inventory& working, const PlanetView& here);

// Purposeful strategies only spend requests on planets that accept
// combinations; Greedy tries everywhere.
bool combines_at(Strategy s, const PlanetView& here);

// The next combination to request with the given working inventory.
//
// Greedy takes the first recipe-table entry whose inputs are on hand.
// Purposeful strategies only build toward the target.
std::optional<Recipe> pick_combination(Strategy s, ResourceKind target, const Inventory& working);

struct RoutePlan {
  // Planets to visit in order: providers of missing base kinds, then a planet
  // able to combine (for complex targets). May start with the current planet.
  std::vector<Id> waypoints;
  Failure failure{Failure::None};

  bool ok() const { return failure == Failure::None; }
};

// BestPath planning. Repeatedly walks to the nearest planet (hop distance,
// then lowest id) able to supply any missing base kind, then to the nearest
// usable combiner. Returns Failure::Disconnected if some kind or the combiner
// cannot be reached.
RoutePlan plan_route(const PolicyContext& ctx, Id from, ResourceKind target, const Inventory& working);

// Units of the `wanted` kinds planet `id` is believed able to provide.
Inventory estimated_supply(const PolicyContext& ctx, Id id, const Inventory& wanted);

// Any neighbor of `from`. kInvalidId if there is none.
Id choose_any_neighbor(const GalaxyMap& map, Id from, TieBreak tie_break, util::HashRng& rng);

// Neighbor choice weighted toward planets known to hold or generate kinds the
// target still needs (or toward combiners once nothing is missing).
Id choose_weighted_neighbor(const PolicyContext& ctx, Id from, ResourceKind target, const Inventory& working,
                            TieBreak tie_break, util::HashRng& rng);

// Death by starvation: every planet reachable from `from` is known exhausted
// and no combination is possible with what is on hand.
bool starving(const PolicyContext& ctx, Id from, Strategy s, ResourceKind target, const Inventory& working);

} // namespace galaxis
