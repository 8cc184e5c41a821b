#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "galaxis/core/ids.h"
#include "galaxis/core/outcome.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/strategy.h"

namespace galaxis {

enum class PlanetStatus : std::uint8_t { Active = 0, Dead, Unknown };
enum class ExplorerStatus : std::uint8_t { Alive = 0, Dead, Unknown };

// Orchestrator run state. Ticks only advance while Running.
enum class RunState : std::uint8_t { WaitingStart = 0, Running, Paused, Stopped };

const char* planet_status_label(PlanetStatus s);
const char* explorer_status_label(ExplorerStatus s);
const char* run_state_label(RunState s);

// Point-in-time copy of one planet's state, as answered to QueryState.
struct PlanetView {
  Id id{kInvalidId};
  PlanetType type{PlanetType::A};
  PlanetStatus status{PlanetStatus::Unknown};

  Inventory inventory;
  int energy{0};          // charged cells
  int energy_capacity{0}; // total cells
  int rockets{0};

  // Lifetime counters checked against the capability matrix.
  int generations{0};
  int combinations{0};

  std::vector<ResourceKind> generates;

  bool alive() const { return status == PlanetStatus::Active; }
};

// Point-in-time copy of one explorer.
struct ExplorerView {
  Id id{kInvalidId};
  Id position{kInvalidId};
  ExplorerStatus status{ExplorerStatus::Unknown};

  Inventory inventory;
  int life{0};

  Strategy strategy{Strategy::Greedy};
  ResourceKind target{ResourceKind::Water};
  std::optional<ResourceKind> fallback;

  Failure last_failure{Failure::None};
  std::string death_reason;

  int moves{0};
  int rocket_jumps{0};
  int harvests{0};
  int combinations{0};
  int targets_completed{0};

  bool alive() const { return status == ExplorerStatus::Alive; }
};

// Immutable point-in-time copy of the whole simulation, safe to hand to any
// consumer. Planets and explorers are sorted by id.
struct GalaxySnapshot {
  std::uint64_t tick{0};
  RunState run_state{RunState::WaitingStart};

  std::vector<PlanetView> planets;
  std::vector<ExplorerView> explorers;

  bool connected{true};
  std::vector<Id> critical_nodes;

  // Pointers into this snapshot; never look up on a temporary.
  const PlanetView* find_planet(Id id) const&;
  const ExplorerView* find_explorer(Id id) const&;
  const PlanetView* find_planet(Id id) const&& = delete;
  const ExplorerView* find_explorer(Id id) const&& = delete;
};

} // namespace galaxis
