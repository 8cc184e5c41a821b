#include "galaxis/core/recipes.h"

#include <algorithm>

namespace galaxis {
namespace {

// Consumes units of `kind` (or of its inputs, recursively) from `inv`.
// Anything that cannot be covered is added to `missing`.
void resolve_missing(ResourceKind kind, Inventory& inv, Inventory& missing) {
  if (inv.take(kind)) return;
  const auto r = recipe_for(kind);
  if (!r) {
    missing.add(kind);
    return;
  }
  resolve_missing(r->a, inv, missing);
  resolve_missing(r->b, inv, missing);
}

// Post-order walk. Returns true if `kind` was taken from `inv` as an already
// existing unit. `found` receives the first recipe whose inputs were both taken.
bool resolve_next(ResourceKind kind, Inventory& inv, std::optional<Recipe>& found) {
  if (inv.take(kind)) return true;
  const auto r = recipe_for(kind);
  if (!r) return false;
  const bool have_a = resolve_next(r->a, inv, found);
  const bool have_b = resolve_next(r->b, inv, found);
  if (have_a && have_b && !found) found = *r;
  return false;
}

} // namespace

const std::vector<Recipe>& recipe_table() {
  static const std::vector<Recipe> kTable = {
      {ResourceKind::Hydrogen, ResourceKind::Oxygen, ResourceKind::Water},
      {ResourceKind::Carbon, ResourceKind::Carbon, ResourceKind::Diamond},
      {ResourceKind::Water, ResourceKind::Carbon, ResourceKind::Life},
      {ResourceKind::Silicon, ResourceKind::Life, ResourceKind::Robot},
      {ResourceKind::Water, ResourceKind::Life, ResourceKind::Dolphin},
      {ResourceKind::Robot, ResourceKind::Diamond, ResourceKind::AIPartner},
  };
  return kTable;
}

std::optional<ResourceKind> combine(ResourceKind a, ResourceKind b) {
  for (const Recipe& r : recipe_table()) {
    if ((r.a == a && r.b == b) || (r.a == b && r.b == a)) return r.product;
  }
  return std::nullopt;
}

std::optional<Recipe> recipe_for(ResourceKind product) {
  for (const Recipe& r : recipe_table()) {
    if (r.product == product) return r;
  }
  return std::nullopt;
}

Inventory base_requirements(ResourceKind target) {
  return missing_base_resources(target, Inventory{});
}

Inventory missing_base_resources(ResourceKind target, const Inventory& on_hand) {
  Inventory scratch = on_hand;
  Inventory missing;
  resolve_missing(target, scratch, missing);
  return missing;
}

std::vector<ResourceKind> recipe_tree_kinds(ResourceKind target) {
  std::vector<ResourceKind> out;
  std::vector<ResourceKind> stack{target};
  while (!stack.empty()) {
    const ResourceKind k = stack.back();
    stack.pop_back();
    if (std::find(out.begin(), out.end(), k) == out.end()) out.push_back(k);
    if (const auto r = recipe_for(k)) {
      stack.push_back(r->a);
      stack.push_back(r->b);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<Recipe> next_combination_toward(ResourceKind target, const Inventory& on_hand) {
  Inventory scratch = on_hand;
  std::optional<Recipe> found;
  if (resolve_next(target, scratch, found)) return std::nullopt;
  return found;
}

} // namespace galaxis
