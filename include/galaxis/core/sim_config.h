#pragma once

#include <cstdint>
#include <string>

#include "galaxis/core/strategy.h"
#include "galaxis/util/log.h"

namespace galaxis {

struct SimConfig {
  // Base seed for every random draw (environment events, random tie-breaks).
  std::uint64_t seed{1};

  // Per-planet, per-tick probability of a sunray / asteroid when no event
  // schedule is active. Both are clamped to [0,1] when used.
  double sunray_rate{0.10};
  double asteroid_rate{0.02};

  // Optional fixed event schedule, consumed one character per tick:
  //   'S' = sunray to every planet
  //   'A' = asteroid to every planet
  //   '$' = pause after this tick
  //   '.' = no event
  // Once exhausted the random rates above take over.
  std::string event_schedule;

  // Cells charged by one sunray (capped at capacity).
  int sunray_charge{1};

  // Cells discharged by one undeflected asteroid. A planet left with zero
  // charged cells is destroyed.
  int asteroid_damage{1};

  // Cell count of many-cell planet types (A and D). Single-cell types always
  // hold exactly one.
  int many_cell_capacity{5};

  // Bounded capacity of every actor inbox and reply channel.
  int channel_capacity{64};

  // How long a requester waits for one planet reply before treating the
  // planet as unresponsive.
  int reply_timeout_ms{1000};

  // How long the orchestrator waits for one explorer to finish its step.
  int step_timeout_ms{10000};

  // Step explorers one at a time in id order instead of concurrently.
  //
  // Required for bit-identical replays when explorers share planets.
  bool deterministic_dispatch{false};

  // Starting life of explorers that do not set their own.
  int explorer_life{50};

  // How Greedy-style neighbor choices settle.
  TieBreak tie_break{TieBreak::Random};

  // Route planners request a rocket when the next waypoint is at least this
  // many hops away (and the current planet type builds rockets).
  int rocket_min_hops{3};

  // BestPathAdaptive switches to its fallback target after this many
  // consecutive CapabilityExceeded rejections.
  int capability_failure_limit{3};

  // Explorer memory of a planet older than this many ticks is treated as
  // unknown.
  int memory_ttl_ticks{20};

  // Upper bound on planet requests an explorer issues during one step.
  int max_actions_per_tick{8};

  log::Level log_level{log::Level::Info};
};

} // namespace galaxis
