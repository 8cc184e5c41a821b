#pragma once

#include <cstdint>

namespace galaxis {

using Id = std::uint32_t;

constexpr Id kInvalidId = 0xFFFFFFFFu;

// Ids at or above this value are reserved for sentinels.
constexpr Id kReservedIdBase = 0xFFFFFF00u;

// Sender id used by the orchestrator itself.
constexpr Id kOrchestratorId = kReservedIdBase;

} // namespace galaxis
