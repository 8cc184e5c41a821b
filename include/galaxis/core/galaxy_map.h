#pragma once

#include <map>
#include <memory>
#include <set>
#include <vector>

#include "galaxis/core/ids.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/topology.h"

namespace galaxis {

// Static, publicly known facts about a planet: what it is and what it can
// generate. Mutable economic state (energy, inventory) lives only inside the
// planet actor.
struct PlanetProfile {
  Id id{kInvalidId};
  PlanetType type{PlanetType::A};
  std::vector<ResourceKind> generates;

  bool generates_kind(ResourceKind k) const;
};

// Immutable galaxy map handed to explorers every tick.
//
// The orchestrator builds a fresh map whenever the edge set changes and shares
// it through shared_ptr<const GalaxyMap>; nothing ever mutates a published map,
// so explorer threads read it without locks.
struct GalaxyMap {
  Topology topology;
  std::map<Id, PlanetProfile> planets;

  const PlanetProfile* find(Id id) const;

  // Planets still in the topology that generate `k`, sorted by id.
  std::vector<Id> providers_of(ResourceKind k) const;

  // Planets still in the topology whose type allows combinations at all.
  std::vector<Id> combiners() const;
};

using GalaxyMapPtr = std::shared_ptr<const GalaxyMap>;

} // namespace galaxis
