#include "galaxis/core/orchestrator.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "galaxis/core/state_validation.h"
#include "galaxis/util/hash_rng.h"
#include "galaxis/util/log.h"

namespace galaxis {
namespace {

std::chrono::milliseconds ms(int v) { return std::chrono::milliseconds(std::max(1, v)); }

std::chrono::milliseconds time_left(std::chrono::steady_clock::time_point deadline) {
  const auto now = std::chrono::steady_clock::now();
  if (now >= deadline) return std::chrono::milliseconds(0);
  return std::max(std::chrono::milliseconds(1),
                  std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
}

} // namespace

Orchestrator::Orchestrator(GalaxyConfig galaxy) : cfg_(galaxy.sim), schedule_(galaxy.sim.event_schedule) {
  validate_galaxy(galaxy);

  for (const PlanetConfig& p : galaxy.planets) {
    topology_.add_node(p.id);
    PlanetProfile prof;
    prof.id = p.id;
    prof.type = p.type;
    prof.generates = p.generates.empty() ? default_generation_catalog(p.id) : p.generates;
    profiles_[p.id] = std::move(prof);
  }
  for (const PlanetConfig& p : galaxy.planets) {
    for (Id n : p.neighbors) topology_.connect(p.id, n);
  }

  const auto cap = static_cast<std::size_t>(cfg_.channel_capacity);
  planet_replies_ = make_channel<PlanetReply>(2 * galaxy.planets.size() + cap);

  auto directory = std::make_shared<PlanetDirectory>();
  for (const PlanetConfig& p : galaxy.planets) {
    PlanetSetup setup;
    setup.id = p.id;
    setup.type = p.type;
    setup.generates = profiles_[p.id].generates;
    setup.many_cell_capacity = p.capacity > 0 ? p.capacity : cfg_.many_cell_capacity;
    setup.initial_energy = p.energy;
    setup.initial_inventory = p.inventory;
    setup.sunray_charge = cfg_.sunray_charge;
    setup.asteroid_damage = cfg_.asteroid_damage;

    auto actor = std::make_unique<PlanetActor>(std::move(setup), cap);
    (*directory)[p.id] = actor->inbox();
    planets_[p.id] = std::move(actor);
  }
  directory_ = std::move(directory);
  for (auto& [id, actor] : planets_) actor->start();

  rebuild_map();
  for (const ExplorerConfig& e : galaxy.explorers) spawn_explorer(e);

  refresh_planets();
  publish();

  log::info("Galaxy ready: " + std::to_string(planets_.size()) + " planets, " + std::to_string(explorers_.size()) +
            " explorers, " + std::to_string(topology_.edge_count()) + " links");
}

Orchestrator::~Orchestrator() { shutdown(); }

// --- run state ---------------------------------------------------------------

void Orchestrator::start() {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || state_ != RunState::WaitingStart) return;
  state_ = RunState::Running;
  log::info("Simulation started");
  publish_run_state();
}

void Orchestrator::pause() {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || state_ != RunState::Running) return;
  state_ = RunState::Paused;
  log::info("Simulation paused at tick " + std::to_string(tick_));
  publish_run_state();
}

void Orchestrator::resume() {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || state_ != RunState::Paused) return;
  state_ = RunState::Running;
  log::info("Simulation resumed at tick " + std::to_string(tick_));
  publish_run_state();
}

RunState Orchestrator::run_state() const {
  std::lock_guard<std::mutex> lock(control_mu_);
  return state_;
}

// --- tick --------------------------------------------------------------------

bool Orchestrator::tick() {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || state_ != RunState::Running) return false;

  ++tick_;
  bool pause_after = false;
  apply_environment(pause_after);
  step_explorers();
  refresh_planets();

  if (pause_after) {
    state_ = RunState::Paused;
    log::info("Simulation paused by schedule at tick " + std::to_string(tick_));
  }
  publish();
  return true;
}

int Orchestrator::run(int n) {
  int done = 0;
  for (int i = 0; i < n; ++i) {
    if (!tick()) break;
    ++done;
  }
  return done;
}

std::vector<Id> Orchestrator::live_planets() const {
  std::vector<Id> out;
  for (const auto& [id, view] : planet_views_) {
    if (view.status != PlanetStatus::Dead && topology_.contains(id)) out.push_back(id);
  }
  return out;
}

void Orchestrator::apply_environment(bool& pause_after) {
  const std::vector<Id> alive = live_planets();

  if (schedule_pos_ < schedule_.size()) {
    const char ev = schedule_[schedule_pos_++];
    switch (ev) {
      case 'S':
        log::debug("Tick " + std::to_string(tick_) + ": sunray to every planet");
        broadcast(alive, SunrayArrival{});
        break;
      case 'A':
        log::debug("Tick " + std::to_string(tick_) + ": asteroid to every planet");
        broadcast(alive, AsteroidArrival{});
        break;
      case '$':
        pause_after = true;
        break;
      default:
        break;
    }
    return;
  }

  std::vector<Id> sunrays;
  std::vector<Id> asteroids;
  for (Id id : alive) {
    util::HashRng rng(util::mix_seed(cfg_.seed, tick_, id));
    if (rng.chance(cfg_.sunray_rate)) sunrays.push_back(id);
    if (rng.chance(cfg_.asteroid_rate)) asteroids.push_back(id);
  }
  if (!sunrays.empty()) broadcast(sunrays, SunrayArrival{});
  if (!asteroids.empty()) {
    for (const auto& [id, r] : broadcast(asteroids, AsteroidArrival{})) {
      if (r.deflected) log::info("Planet " + std::to_string(id) + " deflected an asteroid with its rocket");
    }
  }
}

void Orchestrator::step_explorers() {
  const GalaxyMapPtr map = map_;
  const auto timeout = ms(cfg_.step_timeout_ms);

  std::vector<std::pair<Id, std::uint64_t>> pending;
  for (auto& [id, slot] : explorers_) {
    const auto vit = explorer_views_.find(id);
    if (vit != explorer_views_.end() && vit->second.status == ExplorerStatus::Dead) continue;

    const std::uint64_t seq = next_seq_++;
    if (!send_explorer(slot, seq, StepCommand{tick_, map})) {
      explorer_views_[id].status = ExplorerStatus::Unknown;
      continue;
    }

    if (cfg_.deterministic_dispatch) {
      const auto r = await_explorer(slot, seq, std::chrono::steady_clock::now() + timeout);
      if (r) {
        explorer_views_[id] = r->view;
      } else {
        explorer_views_[id].status = ExplorerStatus::Unknown;
      }
    } else {
      pending.emplace_back(id, seq);
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (const auto& [id, seq] : pending) {
    const auto r = await_explorer(explorers_.at(id), seq, deadline);
    if (r) {
      explorer_views_[id] = r->view;
    } else {
      explorer_views_[id].status = ExplorerStatus::Unknown;
    }
  }
}

void Orchestrator::check_faults() const {
  for (const auto& [id, actor] : planets_) {
    if (!actor->faulted()) continue;
    const std::string msg = "Planet " + std::to_string(id) + " broke its capability matrix: " + actor->fault_message();
    log::error(msg);
    throw std::runtime_error(msg);
  }
}

void Orchestrator::refresh_planets() {
  check_faults();

  std::vector<Id> ids;
  for (const auto& [id, actor] : planets_) {
    const auto vit = planet_views_.find(id);
    if (vit != planet_views_.end() && vit->second.status == PlanetStatus::Dead) continue;
    ids.push_back(id);
  }

  const std::map<Id, PlanetReply> replies = broadcast(ids, QueryState{});
  check_faults();

  bool changed = false;
  for (Id id : ids) {
    const auto rit = replies.find(id);
    PlanetView& view = planet_views_[id];
    if (rit == replies.end() || !rit->second.state) {
      if (view.id == kInvalidId) {
        view.id = id;
        view.type = profiles_.at(id).type;
        view.generates = profiles_.at(id).generates;
      }
      view.status = PlanetStatus::Unknown;
      continue;
    }
    view = *rit->second.state;
    if (!view.alive() && topology_.contains(id)) {
      topology_.remove_node(id);
      changed = true;
      log::info("Planet " + std::to_string(id) + " removed from the topology");
    }
  }
  if (changed) rebuild_map();
}

// --- messaging ---------------------------------------------------------------

std::map<Id, PlanetReply> Orchestrator::broadcast(const std::vector<Id>& ids, const PlanetRequest& req) {
  std::map<Id, PlanetReply> out;
  std::map<std::uint64_t, Id> pending;

  for (Id id : ids) {
    const auto it = planets_.find(id);
    if (it == planets_.end()) continue;
    const std::uint64_t seq = next_seq_++;
    if (it->second->inbox()->send(PlanetEnvelope{kOrchestratorId, seq, req, planet_replies_})) {
      pending[seq] = id;
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + ms(cfg_.reply_timeout_ms);
  while (!pending.empty()) {
    const auto left = time_left(deadline);
    if (left.count() == 0) break;
    std::optional<PlanetReply> r = planet_replies_->recv_for(left);
    if (!r) continue;
    const auto p = pending.find(r->seq);
    if (p == pending.end()) {
      log::debug("Dropping stale reply " + std::to_string(r->seq) + " from planet " + std::to_string(r->planet_id));
      continue;
    }
    out[p->second] = std::move(*r);
    pending.erase(p);
  }

  for (const auto& [seq, id] : pending) {
    log::warn("Planet " + std::to_string(id) + " did not answer " + planet_request_label(req) + " in time");
  }
  return out;
}

std::optional<PlanetReply> Orchestrator::ask_planet(Id id, const PlanetRequest& req) {
  std::map<Id, PlanetReply> r = broadcast({id}, req);
  const auto it = r.find(id);
  if (it == r.end()) return std::nullopt;
  return std::move(it->second);
}

bool Orchestrator::send_explorer(ExplorerSlot& slot, std::uint64_t seq, ExplorerCommand cmd) {
  return slot.actor->inbox()->send(ExplorerEnvelope{seq, std::move(cmd), slot.replies});
}

std::optional<ExplorerReply> Orchestrator::await_explorer(ExplorerSlot& slot, std::uint64_t seq,
                                                          std::chrono::steady_clock::time_point deadline) {
  for (;;) {
    const auto left = time_left(deadline);
    if (left.count() == 0) break;
    std::optional<ExplorerReply> r = slot.replies->recv_for(left);
    if (!r) continue;
    if (r->seq == seq) return r;
    log::debug("Dropping stale reply " + std::to_string(r->seq) + " from explorer " + std::to_string(r->explorer_id));
  }
  log::warn("Explorer " + std::to_string(slot.actor->id()) + " did not answer in time");
  return std::nullopt;
}

// --- destructive events / population ------------------------------------------

bool Orchestrator::destroy_planet(Id id) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || planets_.find(id) == planets_.end() || !topology_.contains(id)) return false;

  ask_planet(id, KillPlanet{});
  topology_.remove_node(id);
  log::info("Planet " + std::to_string(id) + " destroyed by command");

  PlanetView& view = planet_views_[id];
  if (const auto r = ask_planet(id, QueryState{}); r && r->state) {
    view = *r->state;
  } else {
    view.status = PlanetStatus::Dead;
  }

  rebuild_map();
  publish();
  return true;
}

bool Orchestrator::destroy_link(Id a, Id b) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_ || !topology_.disconnect(a, b)) return false;
  log::info("Link " + std::to_string(a) + "-" + std::to_string(b) + " destroyed");
  rebuild_map();
  publish();
  return true;
}

Id Orchestrator::add_explorer(const ExplorerConfig& cfg) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_) throw std::runtime_error("Cannot add an explorer after shutdown");
  const Id id = spawn_explorer(cfg);
  publish();
  return id;
}

Id Orchestrator::spawn_explorer(const ExplorerConfig& cfg) {
  if (!topology_.contains(cfg.start)) {
    throw std::runtime_error("Explorer start planet " + std::to_string(cfg.start) + " is not part of the galaxy");
  }
  const Id id = (cfg.id == kInvalidId) ? next_explorer_id_ : cfg.id;
  if (id >= kReservedIdBase) throw std::runtime_error("Explorer id " + std::to_string(id) + " is reserved");
  if (explorers_.count(id) != 0) throw std::runtime_error("Duplicate explorer id " + std::to_string(id));
  next_explorer_id_ = std::max(next_explorer_id_, id + 1);

  ExplorerSetup setup;
  setup.id = id;
  setup.start = cfg.start;
  setup.strategy = cfg.strategy;
  setup.target = cfg.target;
  setup.fallback = cfg.fallback;
  setup.life = cfg.life;
  setup.initial_inventory = cfg.inventory;

  ExplorerSlot slot;
  slot.actor = std::make_unique<ExplorerActor>(std::move(setup), cfg_, directory_);
  slot.replies = make_channel<ExplorerReply>(static_cast<std::size_t>(cfg_.channel_capacity));
  slot.actor->start();
  ExplorerSlot& placed = explorers_[id] = std::move(slot);

  const std::uint64_t seq = next_seq_++;
  std::optional<ExplorerReply> r;
  if (send_explorer(placed, seq, QueryExplorer{})) {
    r = await_explorer(placed, seq, std::chrono::steady_clock::now() + ms(cfg_.reply_timeout_ms));
  }
  if (r) {
    explorer_views_[id] = r->view;
  } else {
    ExplorerView& v = explorer_views_[id];
    v.id = id;
    v.position = cfg.start;
    v.status = ExplorerStatus::Unknown;
  }

  log::info("Explorer " + std::to_string(id) + " spawned at planet " + std::to_string(cfg.start) + " (" +
            strategy_label(cfg.strategy) + " -> " + resource_label(cfg.target) + ")");
  return id;
}

bool Orchestrator::configure_explorer(Id id, Strategy strategy, ResourceKind target,
                                      std::optional<ResourceKind> fallback) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_) return false;
  const auto it = explorers_.find(id);
  if (it == explorers_.end()) return false;

  const std::uint64_t seq = next_seq_++;
  if (!send_explorer(it->second, seq, ConfigureCommand{strategy, target, fallback})) return false;
  const auto r = await_explorer(it->second, seq, std::chrono::steady_clock::now() + ms(cfg_.reply_timeout_ms));
  if (!r) return false;

  explorer_views_[id] = r->view;
  publish();
  return r->ok;
}

bool Orchestrator::kill_explorer(Id id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_) return false;
  const auto it = explorers_.find(id);
  if (it == explorers_.end()) return false;
  const auto vit = explorer_views_.find(id);
  if (vit != explorer_views_.end() && vit->second.status == ExplorerStatus::Dead) return false;

  const std::uint64_t seq = next_seq_++;
  if (!send_explorer(it->second, seq, KillExplorer{reason})) return false;
  const auto r = await_explorer(it->second, seq, std::chrono::steady_clock::now() + ms(cfg_.reply_timeout_ms));
  if (!r) return false;

  explorer_views_[id] = r->view;
  publish();
  return true;
}

void Orchestrator::set_event_rates(double sunray_rate, double asteroid_rate) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (sunray_rate < 0.0 || sunray_rate > 1.0 || asteroid_rate < 0.0 || asteroid_rate > 1.0) {
    throw std::runtime_error("Event rates must be within [0,1]");
  }
  cfg_.sunray_rate = sunray_rate;
  cfg_.asteroid_rate = asteroid_rate;
}

void Orchestrator::set_event_schedule(const std::string& schedule) {
  std::lock_guard<std::mutex> lock(control_mu_);
  SimConfig probe = cfg_;
  probe.event_schedule = schedule;
  validate_sim_config(probe);
  cfg_.event_schedule = schedule;
  schedule_ = schedule;
  schedule_pos_ = 0;
}

// --- publication -------------------------------------------------------------

void Orchestrator::rebuild_map() {
  auto m = std::make_shared<GalaxyMap>();
  m->topology = topology_;
  m->planets = profiles_;

  const std::set<Id> critical = topology_.critical_nodes();
  critical_.assign(critical.begin(), critical.end());
  connected_ = topology_.is_connected();

  std::lock_guard<std::mutex> lock(snapshot_mu_);
  map_ = std::move(m);
}

void Orchestrator::publish() {
  GalaxySnapshot s;
  s.tick = tick_;
  s.run_state = state_;
  s.connected = connected_;
  s.critical_nodes = critical_;
  s.planets.reserve(planet_views_.size());
  for (const auto& [id, v] : planet_views_) s.planets.push_back(v);
  s.explorers.reserve(explorer_views_.size());
  for (const auto& [id, v] : explorer_views_) s.explorers.push_back(v);

  const std::vector<std::string> errors = validate_snapshot(s);
  if (!errors.empty()) {
    for (const std::string& e : errors) log::error("Snapshot validation: " + e);
    throw std::runtime_error("Snapshot at tick " + std::to_string(tick_) + " failed validation: " + errors.front());
  }

  std::lock_guard<std::mutex> lock(snapshot_mu_);
  published_ = std::move(s);
}

void Orchestrator::publish_run_state() {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  published_.run_state = state_;
}

GalaxySnapshot Orchestrator::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  return published_;
}

GalaxyMapPtr Orchestrator::map() const {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  return map_;
}

Orchestrator::Survivors Orchestrator::survivors() const {
  const GalaxySnapshot s = snapshot();
  Survivors out;
  for (const PlanetView& p : s.planets) {
    if (p.alive()) ++out.planets;
  }
  for (const ExplorerView& e : s.explorers) {
    if (e.alive()) ++out.explorers;
  }
  return out;
}

// --- shutdown ----------------------------------------------------------------

void Orchestrator::shutdown() {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (shut_down_) return;
  shut_down_ = true;

  for (auto& [id, slot] : explorers_) slot.actor->stop();
  for (auto& [id, actor] : planets_) actor->stop();

  state_ = RunState::Stopped;
  publish_run_state();
  log::info("Orchestrator shut down at tick " + std::to_string(tick_));
}

bool Orchestrator::is_shut_down() const {
  std::lock_guard<std::mutex> lock(control_mu_);
  return shut_down_;
}

} // namespace galaxis
