#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local GALAXIS_ASSERT macro. This file only
// holds fixtures shared by more than one test file.

#include <cstdint>
#include <map>
#include <string>

#include "galaxis/core/explorer.h"
#include "galaxis/core/planet.h"

namespace galaxis::test {

// Synchronous PlanetPort over PlanetState objects owned by the test.
//
// Lets explorer logic run without threads, so every request and its order is
// fully deterministic.
class LocalPlanetPort : public PlanetPort {
 public:
  void add(PlanetState* p) { planets_[p->id()] = p; }

  PlanetReply request(Id planet, PlanetRequest req) override {
    if (!std::holds_alternative<QueryState>(req)) ++requests_[planet];
    const auto it = planets_.find(planet);
    if (it == planets_.end()) {
      PlanetReply r;
      r.planet_id = planet;
      r.failure = Failure::PlanetUnavailable;
      return r;
    }
    PlanetReply r = it->second->handle(req);
    it->second->check_invariants();
    r.planet_id = planet;
    return r;
  }

  // Requests other than QueryState sent to `planet`.
  int requests_to(Id planet) const {
    const auto it = requests_.find(planet);
    return it == requests_.end() ? 0 : it->second;
  }

 private:
  std::map<Id, PlanetState*> planets_;
  std::map<Id, int> requests_;
};

inline PlanetSetup planet_setup(Id id, PlanetType type, std::vector<ResourceKind> generates) {
  PlanetSetup s;
  s.id = id;
  s.type = type;
  s.generates = std::move(generates);
  return s;
}

} // namespace galaxis::test
