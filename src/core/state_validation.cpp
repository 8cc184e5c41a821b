#include "galaxis/core/state_validation.h"

#include <algorithm>
#include <sstream>
#include <utility>

#include "galaxis/core/planet_rules.h"

namespace galaxis {
namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

std::string planet_ref(const PlanetView& p) {
  std::ostringstream ss;
  ss << "Planet " << p.id << " (type " << planet_type_label(p.type) << ")";
  return ss.str();
}

void check_limit(std::vector<std::string>& errors, const PlanetView& p, const char* what, int value, int limit) {
  if (limit == kUnlimited || value <= limit) return;
  std::ostringstream ss;
  ss << planet_ref(p) << ": " << what << " " << value << " exceeds limit " << limit;
  push(errors, ss.str());
}

} // namespace

std::vector<std::string> validate_snapshot(const GalaxySnapshot& s) {
  std::vector<std::string> errors;

  for (std::size_t i = 1; i < s.planets.size(); ++i) {
    if (s.planets[i - 1].id >= s.planets[i].id) {
      push(errors, "Planets not sorted by unique id at " + std::to_string(s.planets[i].id));
    }
  }
  for (std::size_t i = 1; i < s.explorers.size(); ++i) {
    if (s.explorers[i - 1].id >= s.explorers[i].id) {
      push(errors, "Explorers not sorted by unique id at " + std::to_string(s.explorers[i].id));
    }
  }

  for (const PlanetView& p : s.planets) {
    if (p.status == PlanetStatus::Unknown) continue;
    const PlanetRules& rules = rules_for(p.type);

    check_limit(errors, p, "generations", p.generations, rules.max_generations);
    check_limit(errors, p, "combinations", p.combinations, rules.max_combinations);
    check_limit(errors, p, "rockets", p.rockets, rules.max_rockets);
    if (p.rockets < 0) push(errors, planet_ref(p) + ": negative rocket count");

    if (!rules.many_cells && p.energy_capacity != 1) {
      push(errors, planet_ref(p) + ": single-cell type with capacity " + std::to_string(p.energy_capacity));
    }
    if (p.energy < 0 || p.energy > p.energy_capacity) {
      push(errors, planet_ref(p) + ": energy " + std::to_string(p.energy) + " outside [0," +
                       std::to_string(p.energy_capacity) + "]");
    }
    for (ResourceKind k : all_resource_kinds()) {
      if (p.inventory.count(k) < 0) push(errors, planet_ref(p) + ": negative " + resource_label(k));
    }
  }

  for (const ExplorerView& e : s.explorers) {
    if (e.life < 0) push(errors, "Explorer " + std::to_string(e.id) + ": negative life");
    if (e.status == ExplorerStatus::Alive && !s.find_planet(e.position)) {
      push(errors, "Explorer " + std::to_string(e.id) + ": standing on unknown planet " + std::to_string(e.position));
    }
  }

  for (Id c : s.critical_nodes) {
    if (!s.find_planet(c)) push(errors, "Critical node " + std::to_string(c) + " is not a known planet");
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace galaxis
