#include "galaxis/core/snapshot.h"

#include <algorithm>

namespace galaxis {

const PlanetView* GalaxySnapshot::find_planet(Id id) const& {
  const auto it = std::lower_bound(planets.begin(), planets.end(), id,
                                   [](const PlanetView& p, Id v) { return p.id < v; });
  if (it == planets.end() || it->id != id) return nullptr;
  return &*it;
}

const ExplorerView* GalaxySnapshot::find_explorer(Id id) const& {
  const auto it = std::lower_bound(explorers.begin(), explorers.end(), id,
                                   [](const ExplorerView& e, Id v) { return e.id < v; });
  if (it == explorers.end() || it->id != id) return nullptr;
  return &*it;
}

} // namespace galaxis
