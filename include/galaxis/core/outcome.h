#pragma once

#include <cstdint>

namespace galaxis {

// Why a request was rejected. Every value except None is recoverable: it is
// handed back to the requester as data, never thrown.
enum class Failure : std::uint8_t {
  None = 0,
  NoRecipe,              // the pair has no product
  CapabilityExceeded,    // generation/combination/rocket limit of the planet type
  InsufficientInventory, // missing input units (or nothing to harvest / no rocket to use)
  PlanetUnavailable,     // target planet is dead or unknown
  ExplorerDead,          // action requested from a terminated explorer
  Disconnected,          // no path to a required resource
  EnergyDepleted,        // no charged energy cell left
  Timeout,               // the actor did not answer in time
};

const char* failure_label(Failure f);

} // namespace galaxis
