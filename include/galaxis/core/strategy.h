#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace galaxis {

// Explorer decision policies. A closed set selected by configuration; the
// per-variant behavior lives in policy.h.
enum class Strategy : std::uint8_t {
  Greedy = 0,
  GreedyWithPurpose,
  BestPath,
  BestPathAdaptive,
};

// How Greedy-style choices settle between equally good neighbors.
enum class TieBreak : std::uint8_t {
  Random = 0, // seeded, reproducible
  LowestId,
};

const char* strategy_label(Strategy s);
std::optional<Strategy> parse_strategy(const std::string& s);

const char* tie_break_label(TieBreak t);
std::optional<TieBreak> parse_tie_break(const std::string& s);

inline bool is_purposeful(Strategy s) { return s != Strategy::Greedy; }
inline bool uses_route_planning(Strategy s) {
  return s == Strategy::BestPath || s == Strategy::BestPathAdaptive;
}

} // namespace galaxis
