#include <iostream>

#include "galaxis/core/recipes.h"
#include "galaxis/core/resources.h"

#define GALAXIS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_recipes() {
  using namespace galaxis;
  using K = ResourceKind;

  // Every table entry, both orders.
  GALAXIS_ASSERT(combine(K::Hydrogen, K::Oxygen) == K::Water);
  GALAXIS_ASSERT(combine(K::Oxygen, K::Hydrogen) == K::Water);
  GALAXIS_ASSERT(combine(K::Carbon, K::Carbon) == K::Diamond);
  GALAXIS_ASSERT(combine(K::Water, K::Carbon) == K::Life);
  GALAXIS_ASSERT(combine(K::Carbon, K::Water) == K::Life);
  GALAXIS_ASSERT(combine(K::Silicon, K::Life) == K::Robot);
  GALAXIS_ASSERT(combine(K::Life, K::Silicon) == K::Robot);
  GALAXIS_ASSERT(combine(K::Water, K::Life) == K::Dolphin);
  GALAXIS_ASSERT(combine(K::Life, K::Water) == K::Dolphin);
  GALAXIS_ASSERT(combine(K::Robot, K::Diamond) == K::AIPartner);
  GALAXIS_ASSERT(combine(K::Diamond, K::Robot) == K::AIPartner);

  // Symmetric over the full domain, and only table pairs produce anything.
  int producing_pairs = 0;
  for (K a : all_resource_kinds()) {
    for (K b : all_resource_kinds()) {
      GALAXIS_ASSERT(combine(a, b) == combine(b, a));
      if (combine(a, b)) ++producing_pairs;
    }
  }
  // Five unordered pairs count twice, Carbon+Carbon once.
  GALAXIS_ASSERT(producing_pairs == 11);
  GALAXIS_ASSERT(!combine(K::Hydrogen, K::Hydrogen));
  GALAXIS_ASSERT(!combine(K::Water, K::Water));
  GALAXIS_ASSERT(!combine(K::AIPartner, K::Dolphin));

  // Reverse lookup.
  GALAXIS_ASSERT(!recipe_for(K::Silicon));
  GALAXIS_ASSERT(recipe_for(K::Dolphin)->a == K::Water);
  GALAXIS_ASSERT(recipe_for(K::Dolphin)->b == K::Life);

  // Bills of materials.
  {
    const Inventory bom = base_requirements(K::AIPartner);
    GALAXIS_ASSERT(bom.count(K::Hydrogen) == 1);
    GALAXIS_ASSERT(bom.count(K::Oxygen) == 1);
    GALAXIS_ASSERT(bom.count(K::Carbon) == 3);
    GALAXIS_ASSERT(bom.count(K::Silicon) == 1);
    GALAXIS_ASSERT(bom.total() == 6);
  }
  {
    const Inventory bom = base_requirements(K::Dolphin);
    GALAXIS_ASSERT(bom.count(K::Hydrogen) == 2);
    GALAXIS_ASSERT(bom.count(K::Oxygen) == 2);
    GALAXIS_ASSERT(bom.count(K::Carbon) == 1);
  }
  GALAXIS_ASSERT(base_requirements(K::Carbon).count(K::Carbon) == 1);

  // Intermediates on hand reduce what is missing.
  {
    Inventory held;
    held.add(K::Life);
    held.add(K::Carbon, 2);
    const Inventory missing = missing_base_resources(K::AIPartner, held);
    GALAXIS_ASSERT(missing.count(K::Silicon) == 1);
    GALAXIS_ASSERT(missing.total() == 1);
  }

  // Next combination: deepest doable step first.
  {
    Inventory held;
    held.add(K::Hydrogen);
    held.add(K::Oxygen);
    held.add(K::Carbon);
    const auto step1 = next_combination_toward(K::Life, held);
    GALAXIS_ASSERT(step1 && step1->product == K::Water);

    held.take(K::Hydrogen);
    held.take(K::Oxygen);
    held.add(K::Water);
    const auto step2 = next_combination_toward(K::Life, held);
    GALAXIS_ASSERT(step2 && step2->product == K::Life);

    held.take(K::Water);
    held.take(K::Carbon);
    held.add(K::Life);
    GALAXIS_ASSERT(!next_combination_toward(K::Life, held));
  }
  {
    // Nothing doable yet.
    Inventory held;
    held.add(K::Carbon);
    GALAXIS_ASSERT(!next_combination_toward(K::Diamond, held));
    held.add(K::Carbon);
    GALAXIS_ASSERT(next_combination_toward(K::Diamond, held)->product == K::Diamond);
  }

  // Tree kinds.
  {
    const auto kinds = recipe_tree_kinds(K::Life);
    GALAXIS_ASSERT(kinds.size() == 5);
    GALAXIS_ASSERT(kinds.front() == K::Hydrogen);
  }

  // Labels round-trip, aliases accepted.
  for (K k : all_resource_kinds()) GALAXIS_ASSERT(parse_resource_kind(resource_label(k)) == k);
  GALAXIS_ASSERT(parse_resource_kind(" ai_partner ") == K::AIPartner);
  GALAXIS_ASSERT(parse_resource_kind("WATER") == K::Water);
  GALAXIS_ASSERT(!parse_resource_kind("unobtainium"));

  // Inventory never goes negative.
  {
    Inventory inv;
    inv.add(K::Oxygen, 2);
    GALAXIS_ASSERT(!inv.take(K::Oxygen, 3));
    GALAXIS_ASSERT(inv.count(K::Oxygen) == 2);
    GALAXIS_ASSERT(inv.take(K::Oxygen, 2));
    GALAXIS_ASSERT(inv.empty());
  }

  return 0;
}
