#include "galaxis/core/galaxy_map.h"

#include <algorithm>

namespace galaxis {

bool PlanetProfile::generates_kind(ResourceKind k) const {
  return std::find(generates.begin(), generates.end(), k) != generates.end();
}

const PlanetProfile* GalaxyMap::find(Id id) const {
  const auto it = planets.find(id);
  return it == planets.end() ? nullptr : &it->second;
}

std::vector<Id> GalaxyMap::providers_of(ResourceKind k) const {
  std::vector<Id> out;
  for (const auto& [id, p] : planets) {
    if (!topology.contains(id)) continue;
    if (!rules_for(p.type).can_generate()) continue;
    if (p.generates_kind(k)) out.push_back(id);
  }
  return out;
}

std::vector<Id> GalaxyMap::combiners() const {
  std::vector<Id> out;
  for (const auto& [id, p] : planets) {
    if (!topology.contains(id)) continue;
    if (rules_for(p.type).can_combine()) out.push_back(id);
  }
  return out;
}

} // namespace galaxis
