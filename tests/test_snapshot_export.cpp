#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "galaxis/core/state_validation.h"
#include "galaxis/util/digest.h"
#include "galaxis/util/json.h"
#include "galaxis/util/snapshot_export.h"

#define GALAXIS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace galaxis;
using K = ResourceKind;

GalaxySnapshot sample_snapshot() {
  GalaxySnapshot s;
  s.tick = 12;
  s.run_state = RunState::Running;
  s.connected = true;
  s.critical_nodes = {1};

  PlanetView a;
  a.id = 0;
  a.type = PlanetType::C;
  a.status = PlanetStatus::Active;
  a.energy = 1;
  a.energy_capacity = 1;
  a.combinations = 7;
  a.generates = {K::Hydrogen};
  a.inventory.add(K::Water, 2);

  PlanetView b;
  b.id = 1;
  b.type = PlanetType::D;
  b.status = PlanetStatus::Active;
  b.energy = 3;
  b.energy_capacity = 5;
  b.generations = 9;
  b.generates = {K::Oxygen, K::Silicon};

  PlanetView c;
  c.id = 2;
  c.type = PlanetType::B;
  c.status = PlanetStatus::Dead;
  c.energy = 0;
  c.energy_capacity = 1;
  c.generates = {K::Carbon};
  s.planets = {a, b, c};

  ExplorerView e;
  e.id = 4;
  e.position = 1;
  e.status = ExplorerStatus::Alive;
  e.life = 30;
  e.strategy = Strategy::BestPathAdaptive;
  e.target = K::AIPartner;
  e.fallback = K::Dolphin;
  e.last_failure = Failure::Disconnected;
  e.inventory.add(K::Silicon);
  e.moves = 5;

  ExplorerView dead;
  dead.id = 6;
  dead.position = 2;
  dead.status = ExplorerStatus::Dead;
  dead.death_reason = "planet 2 destroyed";
  s.explorers = {e, dead};
  return s;
}

} // namespace

int test_snapshot_export() {
  const GalaxySnapshot s = sample_snapshot();
  GALAXIS_ASSERT(validate_snapshot(s).empty());

  // Export: every planet and explorer, with readable labels.
  {
    const std::string text = snapshot_to_json_text(s);
    GALAXIS_ASSERT(!text.empty());
    GALAXIS_ASSERT(text.back() == '\n');

    const json::Value root = json::parse(text);
    GALAXIS_ASSERT(root.at("tick").int_value() == 12);
    GALAXIS_ASSERT(root.at("run_state").string_value() == "running");
    GALAXIS_ASSERT(root.at("connected").bool_value());
    GALAXIS_ASSERT(root.at("critical_nodes").array().size() == 1);

    const json::Array& planets = root.at("planets").array();
    GALAXIS_ASSERT(planets.size() == 3);
    GALAXIS_ASSERT(planets[0].at("type").string_value() == "C");
    GALAXIS_ASSERT(planets[0].at("inventory").at("Water").int_value() == 2);
    GALAXIS_ASSERT(planets[0].at("inventory").find("Hydrogen") == nullptr);
    GALAXIS_ASSERT(planets[1].at("generates").array().size() == 2);
    GALAXIS_ASSERT(planets[2].at("status").string_value() == "dead");
    GALAXIS_ASSERT(!planets[2].at("alive").bool_value(true));

    const json::Array& explorers = root.at("explorers").array();
    GALAXIS_ASSERT(explorers.size() == 2);
    GALAXIS_ASSERT(explorers[0].at("strategy").string_value() == "best_path_adaptive");
    GALAXIS_ASSERT(explorers[0].at("target").string_value() == "AIPartner");
    GALAXIS_ASSERT(explorers[0].at("fallback").string_value() == "Dolphin");
    GALAXIS_ASSERT(explorers[0].at("last_failure").string_value() == "disconnected");
    GALAXIS_ASSERT(explorers[0].at("moves").int_value() == 5);
    GALAXIS_ASSERT(explorers[1].at("fallback").is_null());
    GALAXIS_ASSERT(explorers[1].at("death_reason").string_value() == "planet 2 destroyed");

    // Stable text for identical snapshots.
    GALAXIS_ASSERT(snapshot_to_json_text(sample_snapshot()) == text);
  }

  // Digest: stable, and sensitive to any single field.
  {
    const std::uint64_t d = digest_snapshot64(s);
    GALAXIS_ASSERT(d == digest_snapshot64(sample_snapshot()));

    GalaxySnapshot moved = sample_snapshot();
    moved.explorers[0].position = 0;
    GALAXIS_ASSERT(digest_snapshot64(moved) != d);

    GalaxySnapshot richer = sample_snapshot();
    richer.planets[1].inventory.add(K::Oxygen);
    GALAXIS_ASSERT(digest_snapshot64(richer) != d);

    GalaxySnapshot later = sample_snapshot();
    later.tick = 13;
    GALAXIS_ASSERT(digest_snapshot64(later) != d);

    const std::string hex = digest64_to_hex(d);
    GALAXIS_ASSERT(hex.size() == 16);
    GALAXIS_ASSERT(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
    GALAXIS_ASSERT(digest64_to_hex(0x1fULL) == "000000000000001f");
  }

  // Validation catches broken capability counters and dangling references.
  {
    GalaxySnapshot bad = sample_snapshot();
    bad.planets[2].status = PlanetStatus::Active;
    bad.planets[2].energy = 1;
    bad.planets[2].combinations = 2;
    bad.planets[0].generations = 2;
    bad.critical_nodes.push_back(42);
    bad.explorers[0].position = 77;

    const std::vector<std::string> errors = validate_snapshot(bad);
    GALAXIS_ASSERT(errors.size() == 4);
    bool found_b = false;
    for (const std::string& e : errors) {
      if (e.find("Planet 2 (type B): combinations 2 exceeds limit 1") != std::string::npos) found_b = true;
    }
    GALAXIS_ASSERT(found_b);

    // Unknown planets carry stale numbers and are not judged.
    GalaxySnapshot stale = sample_snapshot();
    stale.planets[1].status = PlanetStatus::Unknown;
    stale.planets[1].energy = 99;
    GALAXIS_ASSERT(validate_snapshot(stale).empty());

    GalaxySnapshot unsorted = sample_snapshot();
    std::swap(unsorted.planets[0], unsorted.planets[1]);
    GALAXIS_ASSERT(!validate_snapshot(unsorted).empty());
  }

  return 0;
}
