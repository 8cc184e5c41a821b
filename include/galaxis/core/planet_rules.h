#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace galaxis {

enum class PlanetType : std::uint8_t { A = 0, B = 1, C = 2, D = 3 };

// Sentinel for "no limit" in the capability matrix.
constexpr int kUnlimited = -1;

// The per-type capability matrix.
//
//   Type | Energy cells | Generation | Rockets | Combination
//   A    | many         | <=1        | <=1     | none
//   B    | one          | unbounded  | none    | <=1
//   C    | one          | <=1        | <=1     | unbounded
//   D    | many         | unbounded  | none    | none
//
// Generation and combination limits are lifetime counts of successful
// operations; the rocket limit caps rockets held at once.
struct PlanetRules {
  PlanetType type{PlanetType::A};
  bool many_cells{false};
  int max_generations{0};
  int max_rockets{0};
  int max_combinations{0};

  // Whether a generation discharges a cell. B's single cell powers
  // generation continuously; every other type spends a cell per unit.
  bool generation_discharges_cell{true};

  bool can_generate() const { return max_generations != 0; }
  bool can_combine() const { return max_combinations != 0; }
  bool can_build_rockets() const { return max_rockets != 0; }

  bool generation_allowed(int done) const { return max_generations == kUnlimited || done < max_generations; }
  bool combination_allowed(int done) const { return max_combinations == kUnlimited || done < max_combinations; }
  bool rocket_allowed(int held) const { return max_rockets == kUnlimited || held < max_rockets; }
};

const PlanetRules& rules_for(PlanetType type);

const char* planet_type_label(PlanetType t);

// Accepts "A".."D" (case-insensitive) and the digits 0..3.
std::optional<PlanetType> parse_planet_type(const std::string& s);

} // namespace galaxis
