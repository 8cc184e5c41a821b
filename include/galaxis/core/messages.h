#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "galaxis/core/channel.h"
#include "galaxis/core/galaxy_map.h"
#include "galaxis/core/ids.h"
#include "galaxis/core/outcome.h"
#include "galaxis/core/planet_rules.h"
#include "galaxis/core/resources.h"
#include "galaxis/core/snapshot.h"
#include "galaxis/core/strategy.h"

namespace galaxis {

// --- Planet requests -------------------------------------------------------

// Produce one unit of a base kind. Without a kind the planet picks the first
// entry of its generation catalog.
struct GenerateResource {
  std::optional<ResourceKind> kind;
};

enum class CombineSource : std::uint8_t {
  Planet = 0, // inputs taken from the planet inventory, product stays there
  Explorer,   // inputs travel with the request, product travels back
};

struct RequestCombine {
  ResourceKind a{ResourceKind::Hydrogen};
  ResourceKind b{ResourceKind::Oxygen};
  CombineSource source{CombineSource::Planet};
};

enum class RocketAction : std::uint8_t { Create = 0, Use };

struct RequestRocket {
  RocketAction action{RocketAction::Create};
};

struct ExplorerHarvest {
  ResourceKind kind{ResourceKind::Hydrogen};
};

struct SunrayArrival {};
struct AsteroidArrival {};
struct QueryState {};
struct QueryCapabilities {};
struct KillPlanet {};

// Finish the current message and leave the actor loop. Shared by planets and
// explorers.
struct StopActor {};

using PlanetRequest = std::variant<GenerateResource, RequestCombine, RequestRocket, ExplorerHarvest, SunrayArrival,
                                   AsteroidArrival, QueryState, QueryCapabilities, KillPlanet, StopActor>;

const char* planet_request_label(const PlanetRequest& req);

// Static answer to QueryCapabilities.
struct PlanetCapabilities {
  PlanetRules rules;
  int energy_capacity{0};
  std::vector<ResourceKind> generates;
};

struct PlanetReply {
  Id planet_id{kInvalidId};
  std::uint64_t seq{0};

  bool ok{false};
  Failure failure{Failure::None};

  // Generated, harvested or combined unit.
  std::optional<ResourceKind> resource;

  // Explorer-sourced combination inputs handed back on rejection.
  Inventory returned;

  std::optional<PlanetView> state;
  std::optional<PlanetCapabilities> capabilities;

  // Asteroid outcome.
  bool deflected{false};
  bool destroyed{false};
};

struct PlanetEnvelope {
  Id sender{kInvalidId};
  std::uint64_t seq{0};
  PlanetRequest body;
  // May be null for fire-and-forget messages.
  ChannelPtr<PlanetReply> reply_to;
};

// --- Explorer commands -----------------------------------------------------

// Run one decision cycle against the given (immutable) galaxy map.
struct StepCommand {
  std::uint64_t tick{0};
  GalaxyMapPtr map;
};

struct ConfigureCommand {
  Strategy strategy{Strategy::Greedy};
  ResourceKind target{ResourceKind::Water};
  std::optional<ResourceKind> fallback;
};

struct QueryExplorer {};

struct KillExplorer {
  std::string reason;
};

using ExplorerCommand = std::variant<StepCommand, ConfigureCommand, QueryExplorer, KillExplorer, StopActor>;

// Every command is answered with the explorer's state after handling it.
struct ExplorerReply {
  Id explorer_id{kInvalidId};
  std::uint64_t seq{0};
  bool ok{true};
  Failure failure{Failure::None};
  ExplorerView view;
};

struct ExplorerEnvelope {
  std::uint64_t seq{0};
  ExplorerCommand body;
  ChannelPtr<ExplorerReply> reply_to;
};

} // namespace galaxis
