#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "galaxis/core/channel.h"
#include "galaxis/core/ids.h"
#include "galaxis/core/messages.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/snapshot.h"

namespace galaxis {

struct PlanetSetup {
  Id id{kInvalidId};
  PlanetType type{PlanetType::A};

  // Base kinds this planet can generate. Must be non-empty.
  std::vector<ResourceKind> generates;

  // Cell count for many-cell types; ignored for single-cell types.
  int many_cell_capacity{5};

  // Charged cells at creation. -1 = fully charged.
  int initial_energy{-1};

  Inventory initial_inventory;

  int sunray_charge{1};
  int asteroid_damage{1};
};

// Economic state of one planet and the rules that govern it.
//
// Pure and single-threaded: every request is handled to completion by
// handle(), which is all-or-nothing. PlanetActor owns one of these and feeds
// it from its inbox, which is what serializes concurrent explorers.
class PlanetState {
 public:
  // Throws std::runtime_error on an invalid setup (empty or non-base
  // generation catalog, energy outside the cell range).
  explicit PlanetState(PlanetSetup setup);

  PlanetReply handle(const PlanetRequest& req);

  // Throws std::logic_error if any capability-matrix invariant is broken.
  void check_invariants() const;

  PlanetView view() const;
  PlanetCapabilities capabilities() const;

  Id id() const { return id_; }
  PlanetType type() const { return rules_.type; }
  const PlanetRules& rules() const { return rules_; }
  bool alive() const { return status_ == PlanetStatus::Active; }

  int energy() const { return charged_; }
  int energy_capacity() const { return capacity_; }
  int rockets() const { return rockets_; }
  int generations() const { return generations_; }
  int combinations() const { return combinations_; }
  const Inventory& inventory() const { return inventory_; }

 private:
  PlanetReply generate(const GenerateResource& req);
  PlanetReply combine_units(const RequestCombine& req);
  PlanetReply rocket(const RequestRocket& req);
  PlanetReply harvest(const ExplorerHarvest& req);
  PlanetReply sunray();
  PlanetReply asteroid();
  PlanetReply kill();

  PlanetReply accepted() const;
  PlanetReply rejected(Failure f) const;

  Id id_{kInvalidId};
  PlanetRules rules_;
  std::vector<ResourceKind> generates_;
  int sunray_charge_{1};
  int asteroid_damage_{1};

  PlanetStatus status_{PlanetStatus::Active};
  int capacity_{1};
  int charged_{1};
  int rockets_{0};
  int generations_{0};
  int combinations_{0};
  Inventory inventory_;
};

// One planet on its own thread, serving a bounded inbox first come first
// served.
//
// An invariant fault is logged, latched in faulted(), and closes the inbox so
// every later sender fails fast; the orchestrator turns it into a fatal error.
class PlanetActor {
 public:
  PlanetActor(PlanetSetup setup, std::size_t inbox_capacity);
  ~PlanetActor();

  PlanetActor(const PlanetActor&) = delete;
  PlanetActor& operator=(const PlanetActor&) = delete;

  void start();

  // Sends StopActor and joins. Safe to call more than once.
  void stop();

  Id id() const { return id_; }
  const ChannelPtr<PlanetEnvelope>& inbox() const { return inbox_; }

  bool faulted() const { return faulted_.load(); }
  std::string fault_message() const;

 private:
  void run();
  void reply(const PlanetEnvelope& env, PlanetReply r);

  Id id_{kInvalidId};
  PlanetState state_;
  ChannelPtr<PlanetEnvelope> inbox_;
  std::thread thread_;

  std::atomic<bool> faulted_{false};
  mutable std::mutex fault_mu_;
  std::string fault_;
};

} // namespace galaxis
