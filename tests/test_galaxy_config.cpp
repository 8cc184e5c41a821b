#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "galaxis/core/galaxy_config.h"
#include "galaxis/util/file_io.h"
#include "galaxis/util/log.h"

#define GALAXIS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace galaxis;
using K = ResourceKind;

// Error text of a rejected document, or "" if it parsed.
template <typename F>
std::string error_of(F&& f) {
  try {
    f();
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

bool contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

const char* kGalaxyJson = R"({
  "sim": {
    "seed": 7,
    "event_schedule": "S.A$",
    "tie_break": "lowest_id",
    "deterministic_dispatch": true,
    "many_cell_capacity": 3,
    "log_level": "warn",
    "colour": "blue"
  },
  "planets": [
    { "id": 0, "type": "C", "neighbors": [1, 2], "generates": ["hydrogen"], "inventory": { "carbon": 2 } },
    { "id": 1, "type": 3, "generates": ["oxygen", "carbon"], "energy": 2, "capacity": 4 },
    { "id": 2, "type": "b" }
  ],
  "explorers": [
    { "start": 0, "strategy": "best_path_adaptive", "target": "ai_partner", "fallback": "dolphin", "life": 40 },
    { "id": 9, "start": 2, "fallback": null, "inventory": { "water": 1 } }
  ]
})";

} // namespace

int test_galaxy_config() {
  // JSON galaxy.
  {
    const GalaxyConfig g = parse_galaxy_json(kGalaxyJson);
    GALAXIS_ASSERT(g.sim.seed == 7);
    GALAXIS_ASSERT(g.sim.event_schedule == "S.A$");
    GALAXIS_ASSERT(g.sim.tie_break == TieBreak::LowestId);
    GALAXIS_ASSERT(g.sim.deterministic_dispatch);
    GALAXIS_ASSERT(g.sim.many_cell_capacity == 3);
    GALAXIS_ASSERT(g.sim.log_level == log::Level::Warn);
    GALAXIS_ASSERT(g.sim.reply_timeout_ms == SimConfig{}.reply_timeout_ms);

    GALAXIS_ASSERT(g.planets.size() == 3);
    GALAXIS_ASSERT(g.planets[0].type == PlanetType::C);
    GALAXIS_ASSERT((g.planets[0].neighbors == std::vector<Id>{1, 2}));
    GALAXIS_ASSERT(g.planets[0].inventory.count(K::Carbon) == 2);
    GALAXIS_ASSERT(g.planets[1].type == PlanetType::D);
    GALAXIS_ASSERT(g.planets[1].generates.size() == 2);
    GALAXIS_ASSERT(g.planets[1].energy == 2);
    GALAXIS_ASSERT(g.planets[1].capacity == 4);
    GALAXIS_ASSERT(g.planets[2].type == PlanetType::B);
    GALAXIS_ASSERT(g.planets[2].generates.empty());
    GALAXIS_ASSERT(g.planets[2].energy == -1);

    GALAXIS_ASSERT(g.explorers.size() == 2);
    GALAXIS_ASSERT(g.explorers[0].id == kInvalidId);
    GALAXIS_ASSERT(g.explorers[0].strategy == Strategy::BestPathAdaptive);
    GALAXIS_ASSERT(g.explorers[0].target == K::AIPartner);
    GALAXIS_ASSERT(g.explorers[0].fallback == K::Dolphin);
    GALAXIS_ASSERT(g.explorers[0].life == 40);
    GALAXIS_ASSERT(g.explorers[1].id == 9);
    GALAXIS_ASSERT(g.explorers[1].strategy == Strategy::Greedy);
    GALAXIS_ASSERT(!g.explorers[1].fallback.has_value());
    GALAXIS_ASSERT(g.explorers[1].inventory.count(K::Water) == 1);
  }

  // Adjacency text.
  {
    const GalaxyConfig g = parse_galaxy_adjacency(
        "# tiny galaxy\n"
        "0,A,1,2\n"
        "\n"
        "1, d, 2\n"
        "2,2\n");
    GALAXIS_ASSERT(g.planets.size() == 3);
    GALAXIS_ASSERT(g.planets[0].type == PlanetType::A);
    GALAXIS_ASSERT((g.planets[0].neighbors == std::vector<Id>{1, 2}));
    GALAXIS_ASSERT(g.planets[1].type == PlanetType::D);
    GALAXIS_ASSERT(g.planets[2].type == PlanetType::C);
    GALAXIS_ASSERT(g.planets[2].neighbors.empty());
    GALAXIS_ASSERT(g.explorers.empty());

    GALAXIS_ASSERT(default_generation_catalog(0) == std::vector<ResourceKind>{K::Hydrogen});
    GALAXIS_ASSERT(default_generation_catalog(7) == std::vector<ResourceKind>{K::Silicon});
  }

  // Malformed input names where it went wrong.
  {
    std::string err = error_of([] { parse_galaxy_adjacency("0,A,1\n1,E\n"); });
    GALAXIS_ASSERT(contains(err, "line 2"));
    GALAXIS_ASSERT(contains(err, "unknown planet type 'E'"));

    err = error_of([] { parse_galaxy_adjacency("0,A,5\n"); });
    GALAXIS_ASSERT(contains(err, "neighbor 5 does not exist"));

    err = error_of([] { parse_galaxy_adjacency("zero,A\n"); });
    GALAXIS_ASSERT(contains(err, "line 1"));
    GALAXIS_ASSERT(contains(err, "is not a valid id"));

    err = error_of([] { parse_galaxy_adjacency("0\n"); });
    GALAXIS_ASSERT(contains(err, "expected 'id,type"));

    err = error_of([] { parse_galaxy_adjacency("# nothing\n\n"); });
    GALAXIS_ASSERT(contains(err, "no planets defined"));

    err = error_of([] { parse_galaxy_adjacency("0,A\n0,B\n"); });
    GALAXIS_ASSERT(contains(err, "duplicate id"));

    err = error_of([] { parse_galaxy_json(R"({"explorers": []})"); });
    GALAXIS_ASSERT(contains(err, "missing 'planets'"));

    err = error_of([] { parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C", "generates": ["plutonium"]}]})"); });
    GALAXIS_ASSERT(contains(err, "planets[0].generates[0]"));
    GALAXIS_ASSERT(contains(err, "unknown resource 'plutonium'"));

    err = error_of([] { parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C", "generates": ["water"]}]})"); });
    GALAXIS_ASSERT(contains(err, "cannot generate complex resource"));

    err = error_of(
        [] { parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C"}], "explorers": [{"start": 0, "strategy": "lazy"}]})"); });
    GALAXIS_ASSERT(contains(err, "unknown strategy 'lazy'"));

    err = error_of([] { parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C"}], "explorers": [{"start": 3}]})"); });
    GALAXIS_ASSERT(contains(err, "start planet 3 does not exist"));

    err = error_of([] { parse_galaxy_json(R"({"planets": [{"id": -1, "type": "C"}]})"); });
    GALAXIS_ASSERT(contains(err, "not a valid planet/explorer id"));

    err = error_of([] { parse_galaxy_json(R"({"sim": {"event_schedule": "S?"}, "planets": [{"id": 0, "type": "C"}]})"); });
    GALAXIS_ASSERT(contains(err, "sim.event_schedule"));

    err = error_of([] { parse_galaxy_json(R"({"sim": {"sunray_rate": 2}, "planets": [{"id": 0, "type": "C"}]})"); });
    GALAXIS_ASSERT(contains(err, "sim.sunray_rate"));

    err = error_of([] { parse_galaxy_json(R"({"sim": {"seed": 1e30}, "planets": [{"id": 0, "type": "C"}]})"); });
    GALAXIS_ASSERT(contains(err, "sim.seed: out of range"));

    err = error_of([] {
      parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C"}], "explorers": [{"start": 0, "life": 1e20}]})");
    });
    GALAXIS_ASSERT(contains(err, "explorers[0].life: out of range"));

    err = error_of([] { parse_galaxy_json(R"({"sim": {"many_cell_capacity": -3e9}, "planets": [{"id": 0, "type": "C"}]})"); });
    GALAXIS_ASSERT(contains(err, "sim.many_cell_capacity: out of range"));

    GALAXIS_ASSERT(parse_galaxy_json(R"({"sim": {"seed": 4294967296}, "planets": [{"id": 0, "type": "C"}]})").sim.seed ==
                   4294967296ULL);

    err = error_of([] { parse_galaxy_json(R"({"planets": [{"id": 0, "type": "C",}]})"); });
    GALAXIS_ASSERT(contains(err, "JSON parse error"));
  }

  // Unknown settings warn, unless the file's own log_level silences warnings.
  {
    std::vector<std::string> warnings;
    const log::Level saved = log::level();
    log::set_level(log::Level::Info);
    log::set_sink([&](log::Level lvl, const std::string& msg) {
      if (lvl == log::Level::Warn) warnings.push_back(msg);
    });
    parse_galaxy_json(R"({"sim": {"colour": "blue", "log_level": "error"}, "planets": [{"id": 0, "type": "C"}]})");
    const std::size_t quiet = warnings.size();
    parse_galaxy_json(R"({"sim": {"colour": "blue", "log_level": "info"}, "planets": [{"id": 0, "type": "C"}]})");
    log::set_sink({});
    log::set_level(saved);

    GALAXIS_ASSERT(quiet == 0);
    GALAXIS_ASSERT(warnings.size() == 1);
    GALAXIS_ASSERT(warnings[0] == "Galaxy config: ignoring unknown setting 'sim.colour'");
  }

  // Files: format picked by extension, errors prefixed with the path.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "galaxis_test_galaxy_config";
    dir /= std::to_string(static_cast<long long>(nonce));
    fs::create_directories(dir, ec);
    GALAXIS_ASSERT(!ec);

    const std::string json_path = (dir / "galaxy.JSON").string();
    write_text_file(json_path, kGalaxyJson);
    GALAXIS_ASSERT(load_galaxy_file(json_path).planets.size() == 3);

    const std::string csv_path = (dir / "galaxy.txt").string();
    write_text_file(csv_path, "0,A,1\n1,B\n");
    GALAXIS_ASSERT(load_galaxy_file(csv_path).planets.size() == 2);

    const std::string bad_path = (dir / "bad.txt").string();
    write_text_file(bad_path, "0,Z\n");
    const std::string err = error_of([&] { load_galaxy_file(bad_path); });
    GALAXIS_ASSERT(err.rfind(bad_path, 0) == 0);

    GALAXIS_ASSERT(!error_of([&] { load_galaxy_file((dir / "missing.json").string()); }).empty());

    fs::remove_all(dir, ec);
  }

  return 0;
}
