#include "galaxis/core/galaxy_config.h"

#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "galaxis/util/file_io.h"
#include "galaxis/util/log.h"
#include "galaxis/util/strings.h"

namespace galaxis {
namespace {

[[noreturn]] void fail(const std::string& where, const std::string& msg) {
  throw std::runtime_error("Galaxy config: " + where + ": " + msg);
}

Id parse_id_value(const json::Value& v, const std::string& where) {
  const double* d = v.as_number();
  if (!d) fail(where, "expected a number");
  if (*d < 0 || *d >= static_cast<double>(kReservedIdBase) || *d != static_cast<double>(static_cast<Id>(*d))) {
    fail(where, "not a valid planet/explorer id");
  }
  return static_cast<Id>(*d);
}

int parse_int_value(const json::Value& v, const std::string& where) {
  const double* d = v.as_number();
  if (!d) fail(where, "expected a number");
  if (!(*d >= std::numeric_limits<int>::min() && *d <= std::numeric_limits<int>::max())) {
    fail(where, "out of range");
  }
  if (*d != static_cast<double>(static_cast<int>(*d))) fail(where, "expected an integer");
  return static_cast<int>(*d);
}

double parse_number_value(const json::Value& v, const std::string& where) {
  const double* d = v.as_number();
  if (!d) fail(where, "expected a number");
  return *d;
}

const std::string& parse_string_value(const json::Value& v, const std::string& where) {
  const std::string* s = v.as_string();
  if (!s) fail(where, "expected a string");
  return *s;
}

ResourceKind parse_kind_value(const json::Value& v, const std::string& where) {
  const std::string& s = parse_string_value(v, where);
  const auto k = parse_resource_kind(s);
  if (!k) fail(where, "unknown resource '" + s + "'");
  return *k;
}

Inventory parse_inventory(const json::Value& v, const std::string& where) {
  const json::Object* o = v.as_object();
  if (!o) fail(where, "expected an object of resource counts");
  Inventory inv;
  for (const auto& [name, count] : *o) {
    const auto k = parse_resource_kind(name);
    if (!k) fail(where, "unknown resource '" + name + "'");
    const int n = parse_int_value(count, where + "." + name);
    if (n < 0) fail(where + "." + name, "negative count");
    inv.add(*k, n);
  }
  return inv;
}

PlanetConfig parse_planet(const json::Value& v, const std::string& where) {
  if (!v.is_object()) fail(where, "expected an object");
  PlanetConfig p;

  const json::Value* id = v.find("id");
  if (!id) fail(where, "missing 'id'");
  p.id = parse_id_value(*id, where + ".id");

  const json::Value* type = v.find("type");
  if (!type) fail(where, "missing 'type'");
  std::string type_name;
  if (type->is_number()) {
    type_name = std::to_string(parse_int_value(*type, where + ".type"));
  } else {
    type_name = parse_string_value(*type, where + ".type");
  }
  const auto t = parse_planet_type(type_name);
  if (!t) fail(where + ".type", "unknown planet type '" + type_name + "'");
  p.type = *t;

  if (const json::Value* nb = v.find("neighbors")) {
    const json::Array* arr = nb->as_array();
    if (!arr) fail(where + ".neighbors", "expected an array");
    for (std::size_t i = 0; i < arr->size(); ++i) {
      p.neighbors.push_back(parse_id_value((*arr)[i], where + ".neighbors[" + std::to_string(i) + "]"));
    }
  }

  if (const json::Value* gen = v.find("generates")) {
    const json::Array* arr = gen->as_array();
    if (!arr) fail(where + ".generates", "expected an array");
    for (std::size_t i = 0; i < arr->size(); ++i) {
      p.generates.push_back(parse_kind_value((*arr)[i], where + ".generates[" + std::to_string(i) + "]"));
    }
    if (p.generates.empty()) fail(where + ".generates", "must not be empty");
  }

  if (const json::Value* e = v.find("energy")) p.energy = parse_int_value(*e, where + ".energy");
  if (const json::Value* c = v.find("capacity")) p.capacity = parse_int_value(*c, where + ".capacity");
  if (const json::Value* inv = v.find("inventory")) p.inventory = parse_inventory(*inv, where + ".inventory");
  return p;
}

ExplorerConfig parse_explorer(const json::Value& v, const std::string& where) {
  if (!v.is_object()) fail(where, "expected an object");
  ExplorerConfig e;

  if (const json::Value* id = v.find("id")) e.id = parse_id_value(*id, where + ".id");

  const json::Value* start = v.find("start");
  if (!start) fail(where, "missing 'start'");
  e.start = parse_id_value(*start, where + ".start");

  if (const json::Value* s = v.find("strategy")) {
    const std::string& name = parse_string_value(*s, where + ".strategy");
    const auto st = parse_strategy(name);
    if (!st) fail(where + ".strategy", "unknown strategy '" + name + "'");
    e.strategy = *st;
  }
  if (const json::Value* t = v.find("target")) e.target = parse_kind_value(*t, where + ".target");
  if (const json::Value* f = v.find("fallback")) {
    if (!f->is_null()) e.fallback = parse_kind_value(*f, where + ".fallback");
  }
  if (const json::Value* l = v.find("life")) e.life = parse_int_value(*l, where + ".life");
  if (const json::Value* inv = v.find("inventory")) e.inventory = parse_inventory(*inv, where + ".inventory");
  return e;
}

} // namespace

std::vector<ResourceKind> default_generation_catalog(Id id) {
  return {base_resource_kinds()[id % kBaseKindCount]};
}

void apply_sim_config_json(const json::Value& v, SimConfig& cfg) {
  const json::Object* o = v.as_object();
  if (!o) fail("sim", "expected an object");

  // Reported after the loop so the file's own log_level applies to them.
  std::vector<std::string> unknown;
  for (const auto& [key, val] : *o) {
    const std::string where = "sim." + key;
    if (key == "seed") {
      const double d = parse_number_value(val, where);
      if (d < 0) fail(where, "must be non-negative");
      // 2^64 is exact as a double; everything below it fits.
      if (!(d < 18446744073709551616.0)) fail(where, "out of range");
      cfg.seed = static_cast<std::uint64_t>(d);
    } else if (key == "sunray_rate") {
      cfg.sunray_rate = parse_number_value(val, where);
    } else if (key == "asteroid_rate") {
      cfg.asteroid_rate = parse_number_value(val, where);
    } else if (key == "event_schedule") {
      cfg.event_schedule = parse_string_value(val, where);
    } else if (key == "sunray_charge") {
      cfg.sunray_charge = parse_int_value(val, where);
    } else if (key == "asteroid_damage") {
      cfg.asteroid_damage = parse_int_value(val, where);
    } else if (key == "many_cell_capacity") {
      cfg.many_cell_capacity = parse_int_value(val, where);
    } else if (key == "channel_capacity") {
      cfg.channel_capacity = parse_int_value(val, where);
    } else if (key == "reply_timeout_ms") {
      cfg.reply_timeout_ms = parse_int_value(val, where);
    } else if (key == "step_timeout_ms") {
      cfg.step_timeout_ms = parse_int_value(val, where);
    } else if (key == "deterministic_dispatch") {
      const bool* b = val.as_bool();
      if (!b) fail(where, "expected true/false");
      cfg.deterministic_dispatch = *b;
    } else if (key == "explorer_life") {
      cfg.explorer_life = parse_int_value(val, where);
    } else if (key == "tie_break") {
      const std::string& name = parse_string_value(val, where);
      const auto tb = parse_tie_break(name);
      if (!tb) fail(where, "unknown tie break '" + name + "'");
      cfg.tie_break = *tb;
    } else if (key == "rocket_min_hops") {
      cfg.rocket_min_hops = parse_int_value(val, where);
    } else if (key == "capability_failure_limit") {
      cfg.capability_failure_limit = parse_int_value(val, where);
    } else if (key == "memory_ttl_ticks") {
      cfg.memory_ttl_ticks = parse_int_value(val, where);
    } else if (key == "max_actions_per_tick") {
      cfg.max_actions_per_tick = parse_int_value(val, where);
    } else if (key == "log_level") {
      const std::string& name = parse_string_value(val, where);
      cfg.log_level = log::parse_level(name, cfg.log_level);
    } else {
      unknown.push_back(where);
    }
  }
  if (cfg.log_level > log::Level::Warn) return;
  for (const std::string& where : unknown) log::warn("Galaxy config: ignoring unknown setting '" + where + "'");
}

void validate_sim_config(const SimConfig& cfg) {
  auto check = [](bool ok, const std::string& field, const std::string& msg) {
    if (!ok) fail("sim." + field, msg);
  };
  check(cfg.sunray_rate >= 0.0 && cfg.sunray_rate <= 1.0, "sunray_rate", "must be within [0,1]");
  check(cfg.asteroid_rate >= 0.0 && cfg.asteroid_rate <= 1.0, "asteroid_rate", "must be within [0,1]");
  check(cfg.sunray_charge >= 0, "sunray_charge", "must be non-negative");
  check(cfg.asteroid_damage >= 0, "asteroid_damage", "must be non-negative");
  check(cfg.many_cell_capacity >= 1, "many_cell_capacity", "must be at least 1");
  check(cfg.channel_capacity >= 1, "channel_capacity", "must be at least 1");
  check(cfg.reply_timeout_ms >= 1, "reply_timeout_ms", "must be at least 1");
  check(cfg.step_timeout_ms >= 1, "step_timeout_ms", "must be at least 1");
  check(cfg.explorer_life >= 1, "explorer_life", "must be at least 1");
  check(cfg.rocket_min_hops >= 1, "rocket_min_hops", "must be at least 1");
  check(cfg.capability_failure_limit >= 1, "capability_failure_limit", "must be at least 1");
  check(cfg.max_actions_per_tick >= 1, "max_actions_per_tick", "must be at least 1");
  for (char c : cfg.event_schedule) {
    check(c == 'S' || c == 'A' || c == '$' || c == '.', "event_schedule",
          std::string("unknown event '") + c + "' (expected S, A, $ or .)");
  }
}

void validate_galaxy(const GalaxyConfig& galaxy) {
  validate_sim_config(galaxy.sim);

  std::set<Id> ids;
  for (const PlanetConfig& p : galaxy.planets) {
    const std::string where = "planet " + std::to_string(p.id);
    if (p.id == kInvalidId || p.id >= kReservedIdBase) fail(where, "reserved id");
    if (!ids.insert(p.id).second) fail(where, "duplicate id");
    for (ResourceKind k : p.generates) {
      if (!is_base(k)) fail(where, std::string("cannot generate complex resource ") + resource_label(k));
    }
    if (p.capacity < 0) fail(where, "negative capacity");
    if (p.energy < -1) fail(where, "negative energy");
  }
  for (const PlanetConfig& p : galaxy.planets) {
    for (Id n : p.neighbors) {
      if (ids.count(n) == 0) {
        fail("planet " + std::to_string(p.id), "neighbor " + std::to_string(n) + " does not exist");
      }
    }
  }

  std::set<Id> explorer_ids;
  for (std::size_t i = 0; i < galaxy.explorers.size(); ++i) {
    const ExplorerConfig& e = galaxy.explorers[i];
    const std::string where = "explorers[" + std::to_string(i) + "]";
    if (ids.count(e.start) == 0) fail(where, "start planet " + std::to_string(e.start) + " does not exist");
    if (e.id != kInvalidId && !explorer_ids.insert(e.id).second) fail(where, "duplicate id");
  }
}

GalaxyConfig parse_galaxy_json(const std::string& text) {
  const json::Value root = json::parse(text);
  if (!root.is_object()) fail("root", "expected an object");

  GalaxyConfig g;
  if (const json::Value* sim = root.find("sim")) apply_sim_config_json(*sim, g.sim);

  const json::Value* planets = root.find("planets");
  if (!planets) fail("root", "missing 'planets'");
  const json::Array* parr = planets->as_array();
  if (!parr) fail("planets", "expected an array");
  for (std::size_t i = 0; i < parr->size(); ++i) {
    g.planets.push_back(parse_planet((*parr)[i], "planets[" + std::to_string(i) + "]"));
  }

  if (const json::Value* explorers = root.find("explorers")) {
    const json::Array* earr = explorers->as_array();
    if (!earr) fail("explorers", "expected an array");
    for (std::size_t i = 0; i < earr->size(); ++i) {
      g.explorers.push_back(parse_explorer((*earr)[i], "explorers[" + std::to_string(i) + "]"));
    }
  }

  validate_galaxy(g);
  return g;
}

GalaxyConfig parse_galaxy_adjacency(const std::string& text) {
  GalaxyConfig g;
  const std::vector<std::string> lines = split(text, '\n');

  for (std::size_t ln = 0; ln < lines.size(); ++ln) {
    const std::string line = trim_copy(lines[ln]);
    if (line.empty() || line[0] == '#') continue;
    const std::string where = "line " + std::to_string(ln + 1);

    const std::vector<std::string> fields = split(line, ',');
    if (fields.size() < 2) fail(where, "expected 'id,type[,neighbor...]'");

    PlanetConfig p;
    unsigned long long v = 0;
    const std::string id_text = trim_copy(fields[0]);
    if (!parse_u64(id_text, &v) || v >= kReservedIdBase) fail(where, "id '" + id_text + "' is not a valid id");
    p.id = static_cast<Id>(v);

    const std::string type_text = trim_copy(fields[1]);
    const auto t = parse_planet_type(type_text);
    if (!t) fail(where, "unknown planet type '" + type_text + "'");
    p.type = *t;

    for (std::size_t i = 2; i < fields.size(); ++i) {
      const std::string nb = trim_copy(fields[i]);
      if (nb.empty()) continue;
      if (!parse_u64(nb, &v) || v >= kReservedIdBase) fail(where, "neighbor '" + nb + "' is not a valid id");
      p.neighbors.push_back(static_cast<Id>(v));
    }
    g.planets.push_back(std::move(p));
  }

  if (g.planets.empty()) fail("file", "no planets defined");
  validate_galaxy(g);
  return g;
}

GalaxyConfig load_galaxy_file(const std::string& path) {
  const std::string text = read_text_file(path);
  const std::string lower = to_lower(path);
  const bool is_json = lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0;
  try {
    return is_json ? parse_galaxy_json(text) : parse_galaxy_adjacency(text);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

} // namespace galaxis
