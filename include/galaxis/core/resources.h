#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace galaxis {

// Every resource an explorer can carry or a planet can hold.
//
// The first four are base resources (generated by planets); the rest are
// complex resources (only produced by combining two units).
enum class ResourceKind : std::uint8_t {
  Hydrogen = 0,
  Oxygen,
  Carbon,
  Silicon,
  Water,
  Diamond,
  Life,
  Robot,
  Dolphin,
  AIPartner,
};

constexpr int kResourceKindCount = 10;
constexpr int kBaseKindCount = 4;

inline int resource_index(ResourceKind k) { return static_cast<int>(k); }

inline bool is_base(ResourceKind k) { return resource_index(k) < kBaseKindCount; }
inline bool is_complex(ResourceKind k) { return !is_base(k); }

const std::array<ResourceKind, kResourceKindCount>& all_resource_kinds();
const std::array<ResourceKind, kBaseKindCount>& base_resource_kinds();

const char* resource_label(ResourceKind k);

// Accepts labels as written by resource_label() plus a few aliases
// ("ai_partner", "ai-partner"). Case-insensitive.
std::optional<ResourceKind> parse_resource_kind(const std::string& name);

// Counted multiset of resources. Counts never go negative.
class Inventory {
 public:
  int count(ResourceKind k) const { return counts_[resource_index(k)]; }
  bool has(ResourceKind k, int n = 1) const { return count(k) >= n; }

  void add(ResourceKind k, int n = 1);

  // Removes n units. Returns false (and leaves the inventory untouched) if fewer
  // than n are present.
  bool take(ResourceKind k, int n = 1);

  int total() const;
  bool empty() const { return total() == 0; }

  // Kinds with a non-zero count, in enum order.
  std::vector<ResourceKind> kinds() const;

  bool operator==(const Inventory& o) const { return counts_ == o.counts_; }
  bool operator!=(const Inventory& o) const { return !(*this == o); }

 private:
  std::array<int, kResourceKindCount> counts_{};
};

std::string inventory_to_string(const Inventory& inv);

} // namespace galaxis
