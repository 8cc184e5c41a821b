#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "galaxis/core/channel.h"
#include "galaxis/core/galaxy_map.h"
#include "galaxis/core/ids.h"
#include "galaxis/core/messages.h"
#include "galaxis/core/policy.h"
#include "galaxis/core/sim_config.h"
#include "galaxis/core/snapshot.h"
#include "galaxis/util/hash_rng.h"

namespace galaxis {

// How an explorer reaches planets. Requests are synchronous from the
// explorer's point of view.
class PlanetPort {
 public:
  virtual ~PlanetPort() = default;

  // Never throws for a missing or silent planet: those come back as
  // PlanetUnavailable / Timeout replies.
  virtual PlanetReply request(Id planet, PlanetRequest req) = 0;
};

// Inboxes of every planet, fixed at galaxy creation.
using PlanetDirectory = std::map<Id, ChannelPtr<PlanetEnvelope>>;

// PlanetPort over actor channels: send into the planet's bounded inbox, then
// block on a private reply channel until the matching sequence number arrives
// or the timeout passes. Replies to earlier, timed-out requests are dropped.
class ChannelPlanetPort : public PlanetPort {
 public:
  ChannelPlanetPort(Id sender, std::shared_ptr<const PlanetDirectory> directory, std::size_t reply_capacity,
                    std::chrono::milliseconds timeout);

  PlanetReply request(Id planet, PlanetRequest req) override;

 private:
  Id sender_{kInvalidId};
  std::shared_ptr<const PlanetDirectory> directory_;
  ChannelPtr<PlanetReply> replies_;
  std::chrono::milliseconds timeout_;
  std::uint64_t next_seq_{1};
};

struct ExplorerSetup {
  Id id{kInvalidId};
  Id start{kInvalidId};
  Strategy strategy{Strategy::Greedy};
  ResourceKind target{ResourceKind::Water};
  std::optional<ResourceKind> fallback;

  // <= 0 means SimConfig::explorer_life.
  int life{0};

  Inventory initial_inventory;
};

// Decision-making state of one explorer. Single-threaded; ExplorerActor runs
// it on its own thread, tests drive it directly through any PlanetPort.
class Explorer {
 public:
  Explorer(ExplorerSetup setup, const SimConfig& cfg);

  // One decision cycle: observe the current planet, harvest, combine, check
  // feasibility, move. Issues at most SimConfig::max_actions_per_tick
  // economic requests. No-op for a dead explorer.
  void step(std::uint64_t tick, const GalaxyMap& map, PlanetPort& port);

  // Returns false for a dead explorer.
  bool configure(Strategy strategy, ResourceKind target, std::optional<ResourceKind> fallback);

  void kill(const std::string& reason);

  ExplorerView view() const;

  Id id() const { return id_; }
  Id position() const { return position_; }
  bool alive() const { return alive_; }
  int life() const { return life_; }
  Strategy strategy() const { return strategy_; }
  ResourceKind target() const { return target_; }
  std::optional<ResourceKind> fallback() const { return fallback_; }
  const Inventory& inventory() const { return inventory_; }
  Failure last_failure() const { return last_failure_; }
  const std::string& death_reason() const { return death_reason_; }
  const ExplorerMemory& memory() const { return memory_; }

 private:
  PolicyContext context(const GalaxyMap& map) const;

  bool has_budget() const { return actions_ < cfg_.max_actions_per_tick; }

  // Economic request at the current planet; counts against the budget and
  // tracks failures.
  PlanetReply send(PlanetPort& port, PlanetRequest req);

  std::optional<PlanetView> observe(PlanetPort& port);
  void receive(ResourceKind k);

  // Each returns true if anything succeeded.
  bool gather(PlanetView& here, PlanetPort& port);
  bool combine_here(PlanetView& here, PlanetPort& port);

  // BestPath planning with the adaptive fallback switch applied.
  RoutePlan plan(const GalaxyMap& map);
  bool switch_to_fallback(const char* why);

  void move(const GalaxyMap& map, const PlanetView& here, PlanetPort& port, bool progressed);
  void travel_to(Id dest, bool by_rocket);
  bool try_rocket_jump(const PlanetView& here, PlanetPort& port);

  void die(const std::string& reason);

  const SimConfig cfg_;
  util::HashRng rng_;

  Id id_{kInvalidId};
  Id position_{kInvalidId};
  bool alive_{true};
  int life_{0};
  Inventory inventory_;

  Strategy strategy_{Strategy::Greedy};
  ResourceKind target_{ResourceKind::Water};
  std::optional<ResourceKind> fallback_;

  ExplorerMemory memory_;
  std::uint64_t tick_{0};
  int actions_{0};
  int capability_streak_{0};

  Failure last_failure_{Failure::None};
  std::string death_reason_;

  int moves_{0};
  int rocket_jumps_{0};
  int harvests_{0};
  int combinations_{0};
  int targets_completed_{0};
};

// One explorer on its own thread, serving orchestrator commands from a bounded
// inbox. Every command is answered with the explorer's view.
class ExplorerActor {
 public:
  ExplorerActor(ExplorerSetup setup, const SimConfig& cfg, std::shared_ptr<const PlanetDirectory> planets);
  ~ExplorerActor();

  ExplorerActor(const ExplorerActor&) = delete;
  ExplorerActor& operator=(const ExplorerActor&) = delete;

  void start();

  // Sends StopActor and joins. Safe to call more than once.
  void stop();

  Id id() const { return id_; }
  const ChannelPtr<ExplorerEnvelope>& inbox() const { return inbox_; }

 private:
  void run();

  Id id_{kInvalidId};
  Explorer brain_;
  ChannelPlanetPort port_;
  ChannelPtr<ExplorerEnvelope> inbox_;
  std::thread thread_;
};

} // namespace galaxis
