#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "galaxis/core/channel.h"
#include "galaxis/core/explorer.h"
#include "galaxis/core/galaxy_config.h"
#include "galaxis/core/galaxy_map.h"
#include "galaxis/core/messages.h"
#include "galaxis/core/planet.h"
#include "galaxis/core/sim_config.h"
#include "galaxis/core/snapshot.h"
#include "galaxis/core/topology.h"

namespace galaxis {

// Owns the galaxy: topology, one actor per planet and explorer, and the
// global tick.
//
// Each tick runs the same pipeline:
//   1. environment events (schedule or seeded random draws), awaited
//   2. one Step per living explorer (concurrent, or in id order when
//      SimConfig::deterministic_dispatch is set), awaited
//   3. QueryState to every planet; destroyed planets leave the topology and
//      the critical-node cache is recomputed
//   4. the new snapshot is validated and published
//
// Control methods are meant for one controlling thread. snapshot() and
// survivors() may be called from any thread and never wait for a tick.
class Orchestrator {
 public:
  // Validates the galaxy, builds the topology, spawns every actor and
  // publishes the tick-0 snapshot. Throws std::runtime_error on an invalid
  // galaxy.
  explicit Orchestrator(GalaxyConfig galaxy);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // WaitingStart -> Running.
  void start();
  // Running -> Paused.
  void pause();
  // Paused -> Running.
  void resume();
  RunState run_state() const;

  // Advances one tick. Returns false (and does nothing) unless Running.
  //
  // Throws std::runtime_error if a planet breaks its capability matrix or the
  // resulting snapshot fails validation.
  bool tick();

  // Up to n ticks; stops early on pause. Returns the number advanced.
  int run(int n);

  GalaxySnapshot snapshot() const;

  // Current immutable map (what explorers plan on).
  GalaxyMapPtr map() const;

  // Destroys a planet and removes it from the topology. False if unknown or
  // already destroyed.
  bool destroy_planet(Id id);

  // Removes the link a-b. False if it did not exist.
  bool destroy_link(Id a, Id b);

  // Spawns an explorer. Returns its id. Throws std::runtime_error after
  // shutdown, for a duplicate id, or for a start planet that is not part of
  // the topology.
  Id add_explorer(const ExplorerConfig& cfg);

  // False if the explorer is unknown, dead or unresponsive.
  bool configure_explorer(Id id, Strategy strategy, ResourceKind target, std::optional<ResourceKind> fallback);

  // Terminates an explorer. False if unknown, already dead or unresponsive.
  bool kill_explorer(Id id, const std::string& reason = "killed by command");

  // Throws std::runtime_error for rates outside [0,1].
  void set_event_rates(double sunray_rate, double asteroid_rate);

  // Replaces the remaining event schedule. Throws std::runtime_error on
  // unknown event characters.
  void set_event_schedule(const std::string& schedule);

  struct Survivors {
    int planets{0};
    int explorers{0};
  };
  Survivors survivors() const;

  // Stops every actor (explorers first) and joins their threads. Idempotent.
  void shutdown();
  bool is_shut_down() const;

  const SimConfig& config() const { return cfg_; }

 private:
  struct ExplorerSlot {
    std::unique_ptr<ExplorerActor> actor;
    ChannelPtr<ExplorerReply> replies;
  };

  Id spawn_explorer(const ExplorerConfig& cfg);

  std::map<Id, PlanetReply> broadcast(const std::vector<Id>& ids, const PlanetRequest& req);
  std::optional<PlanetReply> ask_planet(Id id, const PlanetRequest& req);

  bool send_explorer(ExplorerSlot& slot, std::uint64_t seq, ExplorerCommand cmd);
  std::optional<ExplorerReply> await_explorer(ExplorerSlot& slot, std::uint64_t seq,
                                              std::chrono::steady_clock::time_point deadline);

  void apply_environment(bool& pause_after);
  void step_explorers();
  void refresh_planets();
  void check_faults() const;

  std::vector<Id> live_planets() const;

  void rebuild_map();
  void publish();
  void publish_run_state();

  SimConfig cfg_;

  mutable std::mutex control_mu_;
  bool shut_down_{false};
  RunState state_{RunState::WaitingStart};
  std::uint64_t tick_{0};
  std::uint64_t next_seq_{1};
  std::string schedule_;
  std::size_t schedule_pos_{0};

  Topology topology_;
  std::map<Id, PlanetProfile> profiles_;
  std::vector<Id> critical_;
  bool connected_{true};

  std::map<Id, std::unique_ptr<PlanetActor>> planets_;
  std::shared_ptr<const PlanetDirectory> directory_;
  ChannelPtr<PlanetReply> planet_replies_;
  std::map<Id, PlanetView> planet_views_;

  // Declared after planets_ so explorers are torn down first.
  std::map<Id, ExplorerSlot> explorers_;
  std::map<Id, ExplorerView> explorer_views_;
  Id next_explorer_id_{0};

  mutable std::mutex snapshot_mu_;
  GalaxySnapshot published_;
  GalaxyMapPtr map_;
};

} // namespace galaxis
