#include <iostream>
#include <stdexcept>
#include <string>

#include "galaxis/core/planet.h"
#include "galaxis/core/planet_rules.h"
#include "test.h"

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

bool setup_rejected(PlanetSetup s) {
  try {
    PlanetState p(std::move(s));
    (void)p;
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_planet() {
  using test::planet_setup;

  // Capability matrix as data.
  GALAXIS_ASSERT(rules_for(PlanetType::A).many_cells);
  GALAXIS_ASSERT(!rules_for(PlanetType::B).many_cells);
  GALAXIS_ASSERT(!rules_for(PlanetType::C).many_cells);
  GALAXIS_ASSERT(rules_for(PlanetType::D).many_cells);
  GALAXIS_ASSERT(!rules_for(PlanetType::A).can_combine());
  GALAXIS_ASSERT(!rules_for(PlanetType::D).can_combine());
  GALAXIS_ASSERT(!rules_for(PlanetType::B).can_build_rockets());
  GALAXIS_ASSERT(!rules_for(PlanetType::D).can_build_rockets());
  GALAXIS_ASSERT(rules_for(PlanetType::C).max_combinations == kUnlimited);
  GALAXIS_ASSERT(parse_planet_type("c") == PlanetType::C);
  GALAXIS_ASSERT(parse_planet_type("3") == PlanetType::D);
  GALAXIS_ASSERT(!parse_planet_type("E"));

  // Type B generates Hydrogen indefinitely and combines exactly once.
  {
    PlanetSetup s = planet_setup(1, PlanetType::B, {K::Hydrogen});
    s.initial_inventory.add(K::Oxygen, 2);
    PlanetState b(std::move(s));
    GALAXIS_ASSERT(b.energy_capacity() == 1);

    for (int i = 0; i < 200; ++i) {
      const PlanetReply r = b.handle(GenerateResource{K::Hydrogen});
      GALAXIS_ASSERT(r.ok);
      GALAXIS_ASSERT(r.resource == K::Hydrogen);
      b.check_invariants();
    }
    GALAXIS_ASSERT(b.inventory().count(K::Hydrogen) == 200);
    GALAXIS_ASSERT(b.energy() == 1);

    // Unsupported kind.
    GALAXIS_ASSERT(b.handle(GenerateResource{K::Carbon}).failure == Failure::CapabilityExceeded);

    const PlanetReply first = b.handle(RequestCombine{K::Hydrogen, K::Oxygen, CombineSource::Planet});
    GALAXIS_ASSERT(first.ok);
    GALAXIS_ASSERT(first.resource == K::Water);
    GALAXIS_ASSERT(b.inventory().count(K::Water) == 1);

    const PlanetReply second = b.handle(RequestCombine{K::Oxygen, K::Hydrogen, CombineSource::Planet});
    GALAXIS_ASSERT(!second.ok);
    GALAXIS_ASSERT(second.failure == Failure::CapabilityExceeded);
    GALAXIS_ASSERT(b.combinations() == 1);
    GALAXIS_ASSERT(b.inventory().count(K::Oxygen) == 1);

    GALAXIS_ASSERT(b.handle(RequestRocket{RocketAction::Create}).failure == Failure::CapabilityExceeded);
    b.check_invariants();
  }

  // Type A: one generation, one rocket at a time, never combines.
  {
    PlanetSetup s = planet_setup(2, PlanetType::A, {K::Carbon, K::Silicon});
    s.many_cell_capacity = 3;
    PlanetState a(std::move(s));
    GALAXIS_ASSERT(a.energy_capacity() == 3);
    GALAXIS_ASSERT(a.energy() == 3);

    const PlanetReply g = a.handle(GenerateResource{});
    GALAXIS_ASSERT(g.ok);
    GALAXIS_ASSERT(g.resource == K::Carbon);
    GALAXIS_ASSERT(a.energy() == 2);
    GALAXIS_ASSERT(a.handle(GenerateResource{K::Silicon}).failure == Failure::CapabilityExceeded);

    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Create}).ok);
    GALAXIS_ASSERT(a.energy() == 1);
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Create}).failure == Failure::CapabilityExceeded);
    GALAXIS_ASSERT(a.rockets() == 1);
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Use}).ok);
    GALAXIS_ASSERT(a.rockets() == 0);
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Use}).failure == Failure::InsufficientInventory);

    // A rocket can be rebuilt once used, while energy lasts.
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Create}).ok);
    GALAXIS_ASSERT(a.energy() == 0);
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Use}).ok);
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Create}).failure == Failure::EnergyDepleted);

    const PlanetReply c = a.handle(RequestCombine{K::Hydrogen, K::Oxygen, CombineSource::Explorer});
    GALAXIS_ASSERT(c.failure == Failure::CapabilityExceeded);
    GALAXIS_ASSERT(c.returned.count(K::Hydrogen) == 1);
    GALAXIS_ASSERT(c.returned.count(K::Oxygen) == 1);
    a.check_invariants();
  }

  // Type D: unbounded generation limited only by energy.
  {
    PlanetSetup s = planet_setup(3, PlanetType::D, {K::Oxygen});
    s.many_cell_capacity = 4;
    PlanetState d(std::move(s));
    for (int i = 0; i < 4; ++i) GALAXIS_ASSERT(d.handle(GenerateResource{K::Oxygen}).ok);
    GALAXIS_ASSERT(d.energy() == 0);
    GALAXIS_ASSERT(d.handle(GenerateResource{K::Oxygen}).failure == Failure::EnergyDepleted);
    GALAXIS_ASSERT(d.generations() == 4);

    GALAXIS_ASSERT(d.handle(SunrayArrival{}).ok);
    GALAXIS_ASSERT(d.energy() == 1);
    GALAXIS_ASSERT(d.handle(GenerateResource{K::Oxygen}).ok);
    GALAXIS_ASSERT(d.handle(RequestRocket{RocketAction::Create}).failure == Failure::CapabilityExceeded);
    GALAXIS_ASSERT(d.handle(RequestCombine{K::Hydrogen, K::Oxygen, CombineSource::Planet}).failure ==
                   Failure::CapabilityExceeded);

    // Harvest hands units out one at a time.
    GALAXIS_ASSERT(d.handle(ExplorerHarvest{K::Oxygen}).resource == K::Oxygen);
    GALAXIS_ASSERT(d.inventory().count(K::Oxygen) == 4);
    GALAXIS_ASSERT(d.handle(ExplorerHarvest{K::Carbon}).failure == Failure::InsufficientInventory);
  }

  // Type C: one generation, unlimited combinations, all-or-nothing.
  {
    PlanetState c(planet_setup(4, PlanetType::C, {K::Hydrogen}));
    GALAXIS_ASSERT(c.handle(GenerateResource{}).ok);
    GALAXIS_ASSERT(c.energy() == 0);
    GALAXIS_ASSERT(c.handle(GenerateResource{}).failure == Failure::CapabilityExceeded);

    for (int i = 0; i < 25; ++i) {
      const PlanetReply r = c.handle(RequestCombine{K::Carbon, K::Carbon, CombineSource::Explorer});
      GALAXIS_ASSERT(r.ok);
      GALAXIS_ASSERT(r.resource == K::Diamond);
    }
    GALAXIS_ASSERT(c.combinations() == 25);

    const PlanetReply bad = c.handle(RequestCombine{K::Hydrogen, K::Hydrogen, CombineSource::Explorer});
    GALAXIS_ASSERT(bad.failure == Failure::NoRecipe);
    GALAXIS_ASSERT(bad.returned.count(K::Hydrogen) == 2);

    // Planet-sourced inputs must be on hand; a failed attempt changes nothing.
    const PlanetReply missing = c.handle(RequestCombine{K::Hydrogen, K::Oxygen, CombineSource::Planet});
    GALAXIS_ASSERT(missing.failure == Failure::InsufficientInventory);
    GALAXIS_ASSERT(c.inventory().count(K::Hydrogen) == 1);
    GALAXIS_ASSERT(c.combinations() == 25);

    // Rocket needs a charged cell.
    GALAXIS_ASSERT(c.handle(RequestRocket{RocketAction::Create}).failure == Failure::EnergyDepleted);
    GALAXIS_ASSERT(c.handle(SunrayArrival{}).ok);
    GALAXIS_ASSERT(c.handle(SunrayArrival{}).ok);
    GALAXIS_ASSERT(c.energy() == 1);
    GALAXIS_ASSERT(c.handle(RequestRocket{RocketAction::Create}).ok);
    c.check_invariants();
  }

  // Asteroids: deflected by a rocket, otherwise drain cells until the planet dies.
  {
    PlanetSetup s = planet_setup(5, PlanetType::A, {K::Carbon});
    s.many_cell_capacity = 3;
    PlanetState a(std::move(s));
    GALAXIS_ASSERT(a.handle(RequestRocket{RocketAction::Create}).ok);
    const PlanetReply hit1 = a.handle(AsteroidArrival{});
    GALAXIS_ASSERT(hit1.deflected);
    GALAXIS_ASSERT(!hit1.destroyed);
    GALAXIS_ASSERT(a.energy() == 2);
    GALAXIS_ASSERT(a.rockets() == 0);

    GALAXIS_ASSERT(!a.handle(AsteroidArrival{}).destroyed);
    GALAXIS_ASSERT(a.energy() == 1);
    const PlanetReply hit3 = a.handle(AsteroidArrival{});
    GALAXIS_ASSERT(hit3.destroyed);
    GALAXIS_ASSERT(!a.alive());

    // Dead planets refuse everything but answer queries.
    GALAXIS_ASSERT(a.handle(GenerateResource{}).failure == Failure::PlanetUnavailable);
    GALAXIS_ASSERT(a.handle(SunrayArrival{}).failure == Failure::PlanetUnavailable);
    const PlanetReply q = a.handle(QueryState{});
    GALAXIS_ASSERT(q.ok);
    GALAXIS_ASSERT(q.state.has_value());
    GALAXIS_ASSERT(q.state->status == PlanetStatus::Dead);
    const PlanetReply combine_dead = a.handle(RequestCombine{K::Water, K::Carbon, CombineSource::Explorer});
    GALAXIS_ASSERT(combine_dead.failure == Failure::PlanetUnavailable);
    GALAXIS_ASSERT(combine_dead.returned.total() == 2);
  }

  // Sunray never overcharges; kill is terminal.
  {
    PlanetSetup s = planet_setup(6, PlanetType::D, {K::Silicon});
    s.many_cell_capacity = 2;
    s.initial_energy = 0;
    s.sunray_charge = 5;
    PlanetState d(std::move(s));
    GALAXIS_ASSERT(d.energy() == 0);
    d.handle(SunrayArrival{});
    GALAXIS_ASSERT(d.energy() == 2);

    const PlanetReply caps = d.handle(QueryCapabilities{});
    GALAXIS_ASSERT(caps.capabilities.has_value());
    GALAXIS_ASSERT(caps.capabilities->energy_capacity == 2);
    GALAXIS_ASSERT(caps.capabilities->rules.type == PlanetType::D);

    GALAXIS_ASSERT(d.handle(KillPlanet{}).destroyed);
    GALAXIS_ASSERT(!d.alive());
    GALAXIS_ASSERT(d.handle(ExplorerHarvest{K::Silicon}).failure == Failure::PlanetUnavailable);
  }

  // Invalid setups are configuration errors.
  GALAXIS_ASSERT(setup_rejected(planet_setup(7, PlanetType::C, {})));
  GALAXIS_ASSERT(setup_rejected(planet_setup(7, PlanetType::C, {K::Water})));
  {
    PlanetSetup s = planet_setup(7, PlanetType::B, {K::Carbon});
    s.initial_energy = 2;
    GALAXIS_ASSERT(setup_rejected(std::move(s)));
  }

  return 0;
}
