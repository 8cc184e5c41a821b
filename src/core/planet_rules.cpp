#include "galaxis/core/planet_rules.h"

#include <array>

#include "galaxis/util/strings.h"

namespace galaxis {

const PlanetRules& rules_for(PlanetType type) {
  static const std::array<PlanetRules, 4> kRules = {{
      {PlanetType::A, /*many_cells=*/true, /*max_generations=*/1, /*max_rockets=*/1, /*max_combinations=*/0, true},
      {PlanetType::B, false, kUnlimited, 0, 1, false},
      {PlanetType::C, false, 1, 1, kUnlimited, true},
      {PlanetType::D, true, kUnlimited, 0, 0, true},
  }};
  return kRules[static_cast<std::size_t>(type)];
}

const char* planet_type_label(PlanetType t) {
  switch (t) {
    case PlanetType::A: return "A";
    case PlanetType::B: return "B";
    case PlanetType::C: return "C";
    case PlanetType::D: return "D";
  }
  return "?";
}

std::optional<PlanetType> parse_planet_type(const std::string& s) {
  const std::string n = to_lower(trim_copy(s));
  if (n == "a" || n == "0") return PlanetType::A;
  if (n == "b" || n == "1") return PlanetType::B;
  if (n == "c" || n == "2") return PlanetType::C;
  if (n == "d" || n == "3") return PlanetType::D;
  return std::nullopt;
}

} // namespace galaxis
