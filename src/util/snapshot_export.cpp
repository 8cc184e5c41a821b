#include "galaxis/util/snapshot_export.h"

#include <string>

#include "galaxis/core/outcome.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/strategy.h"

namespace galaxis {
namespace {

json::Value num(double v) { return json::Value(v); }

json::Object inventory_to_object(const Inventory& inv) {
  json::Object o;
  for (ResourceKind k : inv.kinds()) o[resource_label(k)] = num(inv.count(k));
  return o;
}

json::Object planet_to_object(const PlanetView& p) {
  json::Object o;
  o["id"] = num(p.id);
  o["type"] = std::string(planet_type_label(p.type));
  o["status"] = std::string(planet_status_label(p.status));
  o["alive"] = p.alive();
  o["energy"] = num(p.energy);
  o["energy_capacity"] = num(p.energy_capacity);
  o["rockets"] = num(p.rockets);
  o["generations"] = num(p.generations);
  o["combinations"] = num(p.combinations);

  json::Array gen;
  for (ResourceKind k : p.generates) gen.push_back(std::string(resource_label(k)));
  o["generates"] = std::move(gen);
  o["inventory"] = inventory_to_object(p.inventory);
  return o;
}

json::Object explorer_to_object(const ExplorerView& e) {
  json::Object o;
  o["id"] = num(e.id);
  o["position"] = num(e.position);
  o["status"] = std::string(explorer_status_label(e.status));
  o["alive"] = e.alive();
  o["life"] = num(e.life);
  o["strategy"] = std::string(strategy_label(e.strategy));
  o["target"] = std::string(resource_label(e.target));
  if (e.fallback) {
    o["fallback"] = std::string(resource_label(*e.fallback));
  } else {
    o["fallback"] = nullptr;
  }
  o["last_failure"] = std::string(failure_label(e.last_failure));
  o["death_reason"] = e.death_reason;
  o["inventory"] = inventory_to_object(e.inventory);
  o["moves"] = num(e.moves);
  o["rocket_jumps"] = num(e.rocket_jumps);
  o["harvests"] = num(e.harvests);
  o["combinations"] = num(e.combinations);
  o["targets_completed"] = num(e.targets_completed);
  return o;
}

} // namespace

json::Value snapshot_to_json(const GalaxySnapshot& s) {
  json::Object root;
  root["tick"] = num(static_cast<double>(s.tick));
  root["run_state"] = std::string(run_state_label(s.run_state));
  root["connected"] = s.connected;

  json::Array critical;
  for (Id c : s.critical_nodes) critical.push_back(num(c));
  root["critical_nodes"] = std::move(critical);

  json::Array planets;
  planets.reserve(s.planets.size());
  for (const PlanetView& p : s.planets) planets.push_back(planet_to_object(p));
  root["planets"] = std::move(planets);

  json::Array explorers;
  explorers.reserve(s.explorers.size());
  for (const ExplorerView& e : s.explorers) explorers.push_back(explorer_to_object(e));
  root["explorers"] = std::move(explorers);

  return json::object(std::move(root));
}

std::string snapshot_to_json_text(const GalaxySnapshot& s, int indent) {
  std::string out = json::stringify(snapshot_to_json(s), indent);
  out.push_back('\n');
  return out;
}

} // namespace galaxis
