#pragma once

#include <optional>
#include <vector>

#include "galaxis/core/resources.h"

namespace galaxis {

// One entry of the fixed combination table: (a, b) -> product.
//
// The pair is unordered; `a` and `b` are stored in the canonical order used by
// the table below.
struct Recipe {
  ResourceKind a{ResourceKind::Hydrogen};
  ResourceKind b{ResourceKind::Oxygen};
  ResourceKind product{ResourceKind::Water};
};

// The full table:
//   Hydrogen + Oxygen  -> Water
//   Carbon   + Carbon  -> Diamond
//   Water    + Carbon  -> Life
//   Silicon  + Life    -> Robot
//   Water    + Life    -> Dolphin
//   Robot    + Diamond -> AIPartner
const std::vector<Recipe>& recipe_table();

// Resolve a combination. Order-independent; pairs outside the table yield
// std::nullopt. Pure: never touches any inventory.
std::optional<ResourceKind> combine(ResourceKind a, ResourceKind b);

// The recipe producing `product`, or std::nullopt for base resources.
std::optional<Recipe> recipe_for(ResourceKind product);

// Base resources consumed (with multiplicity) to build one unit of `target`
// from scratch. A base target yields itself.
Inventory base_requirements(ResourceKind target);

// Base resources still missing to build one unit of `target`, counting units
// already on hand, including already-built intermediates.
Inventory missing_base_resources(ResourceKind target, const Inventory& on_hand);

// Every kind (base and intermediate) that appears in the recipe tree of
// `target`, target included.
std::vector<ResourceKind> recipe_tree_kinds(ResourceKind target);

// The deepest combination in the recipe tree of `target` whose two inputs are
// on hand right now, or std::nullopt if no combination makes progress.
//
// Returns nothing once `target` itself is on hand.
std::optional<Recipe> next_combination_toward(ResourceKind target, const Inventory& on_hand);

} // namespace galaxis
