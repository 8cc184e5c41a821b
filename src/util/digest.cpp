#include "galaxis/util/digest.h"

#include <cstdint>
#include <string>
#include <type_traits>

namespace galaxis {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  // Little-endian byte order regardless of host.
  void add_u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_bool(bool b) { add_u8(b ? 1 : 0); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    add_u64(static_cast<std::uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  void add_string(const std::string& s) {
    add_u64(s.size());
    for (unsigned char c : s) add_u8(c);
  }

  void add_inventory(const Inventory& inv) {
    for (ResourceKind k : all_resource_kinds()) add_i64(inv.count(k));
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

} // namespace

std::uint64_t digest_snapshot64(const GalaxySnapshot& s) {
  Digest64 d;
  d.add_u64(s.tick);
  d.add_enum(s.run_state);
  d.add_bool(s.connected);

  d.add_u64(s.critical_nodes.size());
  for (Id c : s.critical_nodes) d.add_u64(c);

  d.add_u64(s.planets.size());
  for (const PlanetView& p : s.planets) {
    d.add_u64(p.id);
    d.add_enum(p.type);
    d.add_enum(p.status);
    d.add_i64(p.energy);
    d.add_i64(p.energy_capacity);
    d.add_i64(p.rockets);
    d.add_i64(p.generations);
    d.add_i64(p.combinations);
    d.add_u64(p.generates.size());
    for (ResourceKind k : p.generates) d.add_enum(k);
    d.add_inventory(p.inventory);
  }

  d.add_u64(s.explorers.size());
  for (const ExplorerView& e : s.explorers) {
    d.add_u64(e.id);
    d.add_u64(e.position);
    d.add_enum(e.status);
    d.add_i64(e.life);
    d.add_enum(e.strategy);
    d.add_enum(e.target);
    d.add_bool(e.fallback.has_value());
    if (e.fallback) d.add_enum(*e.fallback);
    d.add_enum(e.last_failure);
    d.add_string(e.death_reason);
    d.add_inventory(e.inventory);
    d.add_i64(e.moves);
    d.add_i64(e.rocket_jumps);
    d.add_i64(e.harvests);
    d.add_i64(e.combinations);
    d.add_i64(e.targets_completed);
  }

  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace galaxis
