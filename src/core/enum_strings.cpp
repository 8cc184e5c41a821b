#include "galaxis/core/outcome.h"
#include "galaxis/core/snapshot.h"
#include "galaxis/core/strategy.h"

#include "galaxis/util/strings.h"

// String conversions for the small enums shared by logging, the snapshot
// export and the galaxy file loader. Keeping them together avoids drift
// between file-format names and log labels.

namespace galaxis {

const char* failure_label(Failure f) {
  switch (f) {
    case Failure::None: return "none";
    case Failure::NoRecipe: return "no_recipe";
    case Failure::CapabilityExceeded: return "capability_exceeded";
    case Failure::InsufficientInventory: return "insufficient_inventory";
    case Failure::PlanetUnavailable: return "planet_unavailable";
    case Failure::ExplorerDead: return "explorer_dead";
    case Failure::Disconnected: return "disconnected";
    case Failure::EnergyDepleted: return "energy_depleted";
    case Failure::Timeout: return "timeout";
  }
  return "unknown";
}

const char* strategy_label(Strategy s) {
  switch (s) {
    case Strategy::Greedy: return "greedy";
    case Strategy::GreedyWithPurpose: return "greedy_with_purpose";
    case Strategy::BestPath: return "best_path";
    case Strategy::BestPathAdaptive: return "best_path_adaptive";
  }
  return "greedy";
}

std::optional<Strategy> parse_strategy(const std::string& s) {
  const std::string n = to_lower(trim_copy(s));
  if (n == "greedy") return Strategy::Greedy;
  if (n == "greedy_with_purpose" || n == "greedywithpurpose" || n == "purpose") return Strategy::GreedyWithPurpose;
  if (n == "best_path" || n == "bestpath") return Strategy::BestPath;
  if (n == "best_path_adaptive" || n == "bestpathadaptive" || n == "adaptive") return Strategy::BestPathAdaptive;
  return std::nullopt;
}

const char* tie_break_label(TieBreak t) {
  switch (t) {
    case TieBreak::Random: return "random";
    case TieBreak::LowestId: return "lowest_id";
  }
  return "random";
}

std::optional<TieBreak> parse_tie_break(const std::string& s) {
  const std::string n = to_lower(trim_copy(s));
  if (n == "random") return TieBreak::Random;
  if (n == "lowest_id" || n == "lowest") return TieBreak::LowestId;
  return std::nullopt;
}

const char* planet_status_label(PlanetStatus s) {
  switch (s) {
    case PlanetStatus::Active: return "active";
    case PlanetStatus::Dead: return "dead";
    case PlanetStatus::Unknown: return "unknown";
  }
  return "unknown";
}

const char* explorer_status_label(ExplorerStatus s) {
  switch (s) {
    case ExplorerStatus::Alive: return "alive";
    case ExplorerStatus::Dead: return "dead";
    case ExplorerStatus::Unknown: return "unknown";
  }
  return "unknown";
}

const char* run_state_label(RunState s) {
  switch (s) {
    case RunState::WaitingStart: return "waiting_start";
    case RunState::Running: return "running";
    case RunState::Paused: return "paused";
    case RunState::Stopped: return "stopped";
  }
  return "stopped";
}

} // namespace galaxis
