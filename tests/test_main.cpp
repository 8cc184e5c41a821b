#include <iostream>

#include "galaxis/util/log.h"

int test_recipes();
int test_topology();
int test_channel();
int test_planet();
int test_planet_concurrency();
int test_explorer();
int test_orchestrator();
int test_galaxy_config();
int test_snapshot_export();
int test_json_errors();

int main() {
  // Scenario tests destroy planets and kill explorers on purpose.
  galaxis::log::set_level(galaxis::log::Level::Error);

  int fails = 0;
  fails += test_recipes();
  fails += test_topology();
  fails += test_channel();
  fails += test_planet();
  fails += test_planet_concurrency();
  fails += test_explorer();
  fails += test_orchestrator();
  fails += test_galaxy_config();
  fails += test_snapshot_export();
  fails += test_json_errors();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " test(s) failed\n";
  return 1;
}
