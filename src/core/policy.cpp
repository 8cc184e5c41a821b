#include "galaxis/core/policy.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_map>

#include "galaxis/core/planet_rules.h"

namespace galaxis {

void ExplorerMemory::observe(std::uint64_t tick, const PlanetView& v) {
  Entry& e = entries_[v.id];
  e.tick = tick;
  e.view = v;
}

void ExplorerMemory::forget(Id id) { entries_.erase(id); }

const PlanetView* ExplorerMemory::recall(Id id, std::uint64_t now, int ttl_ticks) const {
  const auto it = entries_.find(id);
  if (it == entries_.end()) return nullptr;
  if (ttl_ticks >= 0 && now > it->second.tick + static_cast<std::uint64_t>(ttl_ticks)) return nullptr;
  return &it->second.view;
}

bool known_exhausted(const PlanetView& v) {
  if (!v.alive()) return true;
  return v.energy <= 0 && v.inventory.empty();
}

bool can_still_generate(const PlanetView& v) {
  if (!v.alive() || v.energy <= 0) return false;
  return rules_for(v.type).generation_allowed(v.generations);
}

bool can_still_combine(const PlanetView& v) {
  if (!v.alive()) return false;
  return rules_for(v.type).combination_allowed(v.combinations);
}

Inventory working_inventory(const Inventory& held, ResourceKind target) {
  Inventory out = held;
  out.take(target, out.count(target));
  return out;
}

Inventory harvest_wants(Strategy s, ResourceKind target, const Inventory& working, const PlanetView& here) {
  if (!is_purposeful(s)) {
    Inventory all;
    for (ResourceKind k : base_resource_kinds()) {
      const int n = here.inventory.count(k);
      if (n > 0) all.add(k, n);
    }
    return all;
  }
  return missing_base_resources(target, working);
}

bool combines_at(Strategy s, const PlanetView& here) {
  if (!here.alive()) return false;
  if (!is_purposeful(s)) return true;
  return can_still_combine(here);
}

std::optional<Recipe> pick_combination(Strategy s, ResourceKind target, const Inventory& working) {
  if (is_purposeful(s)) return next_combination_toward(target, working);

  for (const Recipe& r : recipe_table()) {
    const int need_a = (r.a == r.b) ? 2 : 1;
    if (working.has(r.a, need_a) && working.has(r.b)) return r;
  }
  return std::nullopt;
}

Inventory estimated_supply(const PolicyContext& ctx, Id id, const Inventory& wanted) {
  Inventory supply;
  const PlanetProfile* p = ctx.map.find(id);
  if (!p || !ctx.map.topology.contains(id)) return supply;

  const PlanetView* v = ctx.recall(id);
  if (v && !v->alive()) return supply;

  const PlanetRules& rules = rules_for(p->type);
  for (ResourceKind k : base_resource_kinds()) {
    const int want = wanted.count(k);
    if (want <= 0) continue;

    int units = 0;
    if (p->generates_kind(k) && rules.can_generate() && (!v || can_still_generate(*v))) {
      if (rules.max_generations == kUnlimited) {
        units = want;
      } else {
        units = std::max(0, rules.max_generations - (v ? v->generations : 0));
      }
    }
    if (v) units += v->inventory.count(k);
    if (units > 0) supply.add(k, units);
  }
  return supply;
}

namespace {

bool usable_combiner(const PolicyContext& ctx, Id id) {
  const PlanetProfile* p = ctx.map.find(id);
  if (!p || !rules_for(p->type).can_combine()) return false;
  const PlanetView* v = ctx.recall(id);
  return !v || can_still_combine(*v);
}

// Nearest node (hop count, then lowest id) accepted by `pred`.
template <typename Pred>
Id nearest(const std::unordered_map<Id, int>& dist, Pred pred) {
  Id best = kInvalidId;
  int best_d = 0;
  for (const auto& [id, d] : dist) {
    if (!pred(id)) continue;
    if (best == kInvalidId || d < best_d || (d == best_d && id < best)) {
      best = id;
      best_d = d;
    }
  }
  return best;
}

} // namespace

RoutePlan plan_route(const PolicyContext& ctx, Id from, ResourceKind target, const Inventory& working) {
  RoutePlan plan;
  if (!ctx.map.topology.contains(from)) {
    plan.failure = Failure::Disconnected;
    return plan;
  }

  Inventory missing = missing_base_resources(target, working);
  std::set<Id> used;
  Id cur = from;

  while (missing.total() > 0) {
    const auto dist = ctx.map.topology.hop_distances(cur);
    const Id next = nearest(dist, [&](Id id) {
      return used.count(id) == 0 && estimated_supply(ctx, id, missing).total() > 0;
    });
    if (next == kInvalidId) {
      plan.waypoints.clear();
      plan.failure = Failure::Disconnected;
      return plan;
    }

    const Inventory supply = estimated_supply(ctx, next, missing);
    for (ResourceKind k : base_resource_kinds()) {
      missing.take(k, std::min(supply.count(k), missing.count(k)));
    }
    used.insert(next);
    plan.waypoints.push_back(next);
    cur = next;
  }

  if (is_complex(target)) {
    const Id combiner = nearest(ctx.map.topology.hop_distances(cur), [&](Id id) { return usable_combiner(ctx, id); });
    if (combiner == kInvalidId) {
      plan.waypoints.clear();
      plan.failure = Failure::Disconnected;
      return plan;
    }
    plan.waypoints.push_back(combiner);
  }
  return plan;
}

Id choose_any_neighbor(const GalaxyMap& map, Id from, TieBreak tie_break, util::HashRng& rng) {
  const std::set<Id>& nb = map.topology.neighbors(from);
  if (nb.empty()) return kInvalidId;
  if (tie_break == TieBreak::LowestId) return *nb.begin();
  auto it = nb.begin();
  std::advance(it, static_cast<std::ptrdiff_t>(rng.index(nb.size())));
  return *it;
}

Id choose_weighted_neighbor(const PolicyContext& ctx, Id from, ResourceKind target, const Inventory& working,
                            TieBreak tie_break, util::HashRng& rng) {
  const std::set<Id>& nb = ctx.map.topology.neighbors(from);
  if (nb.empty()) return kInvalidId;

  const Inventory missing = missing_base_resources(target, working);

  std::vector<Id> ids;
  std::vector<int> weights;
  ids.reserve(nb.size());
  weights.reserve(nb.size());
  for (Id id : nb) {
    int relevant = 0;
    const PlanetView* v = ctx.recall(id);
    const PlanetProfile* p = ctx.map.find(id);
    if (v && p && v->alive()) {
      if (missing.total() > 0) {
        for (ResourceKind k : base_resource_kinds()) {
          if (missing.count(k) <= 0) continue;
          if (v->inventory.has(k) || (p->generates_kind(k) && can_still_generate(*v))) ++relevant;
        }
      } else if (can_still_combine(*v)) {
        relevant = 1;
      }
    }
    ids.push_back(id);
    weights.push_back(1 + 3 * relevant);
  }

  if (tie_break == TieBreak::LowestId) {
    // Heaviest wins; ids are ascending so the first maximum is the lowest id.
    const auto it = std::max_element(weights.begin(), weights.end());
    return ids[static_cast<std::size_t>(std::distance(weights.begin(), it))];
  }

  int total = 0;
  for (int w : weights) total += w;
  int r = static_cast<int>(rng.index(static_cast<std::size_t>(total)));
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (r < weights[i]) return ids[i];
    r -= weights[i];
  }
  return ids.back();
}

bool starving(const PolicyContext& ctx, Id from, Strategy s, ResourceKind target, const Inventory& working) {
  if (pick_combination(s, target, working)) return false;
  for (Id id : ctx.map.topology.reachable_from(from)) {
    const PlanetView* v = ctx.recall(id);
    if (!v || !known_exhausted(*v)) return false;
  }
  return true;
}

} // namespace galaxis
