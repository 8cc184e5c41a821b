#include "galaxis/core/explorer.h"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "galaxis/core/planet_rules.h"
#include "galaxis/util/log.h"

namespace galaxis {
namespace {

std::string explorer_tag(Id id) { return "Explorer " + std::to_string(id) + ": "; }

// Units that travel with an explorer-sourced combination request.
Inventory carried_inputs(const PlanetRequest& req) {
  Inventory inv;
  if (const auto* c = std::get_if<RequestCombine>(&req); c && c->source == CombineSource::Explorer) {
    inv.add(c->a);
    inv.add(c->b);
  }
  return inv;
}

} // namespace

// --- ChannelPlanetPort -------------------------------------------------------

ChannelPlanetPort::ChannelPlanetPort(Id sender, std::shared_ptr<const PlanetDirectory> directory,
                                     std::size_t reply_capacity, std::chrono::milliseconds timeout)
    : sender_(sender),
      directory_(std::move(directory)),
      replies_(make_channel<PlanetReply>(reply_capacity)),
      timeout_(timeout) {}

PlanetReply ChannelPlanetPort::request(Id planet, PlanetRequest req) {
  PlanetReply out;
  out.planet_id = planet;

  const auto it = directory_ ? directory_->find(planet) : PlanetDirectory::const_iterator{};
  if (!directory_ || it == directory_->end() || !it->second) {
    out.failure = Failure::PlanetUnavailable;
    out.returned = carried_inputs(req);
    return out;
  }

  const Inventory in_flight = carried_inputs(req);
  const std::uint64_t seq = next_seq_++;
  if (!it->second->send(PlanetEnvelope{sender_, seq, std::move(req), replies_})) {
    out.failure = Failure::PlanetUnavailable;
    out.returned = in_flight;
    return out;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  for (;;) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    const auto left = std::max(std::chrono::milliseconds(1),
                               std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    std::optional<PlanetReply> r = replies_->recv_for(left);
    if (!r) continue;
    if (r->seq == seq) return std::move(*r);
    log::debug("Dropping stale reply " + std::to_string(r->seq) + " from planet " + std::to_string(r->planet_id));
  }

  log::warn("Planet " + std::to_string(planet) + " did not answer request " + std::to_string(seq) + " from " +
            std::to_string(sender_) + " in time");
  out.failure = Failure::Timeout;
  return out;
}

// --- Explorer ----------------------------------------------------------------

Explorer::Explorer(ExplorerSetup setup, const SimConfig& cfg)
    : cfg_(cfg),
      rng_(util::mix_seed(cfg.seed, setup.id, 0x45)),
      id_(setup.id),
      position_(setup.start),
      life_(setup.life > 0 ? setup.life : cfg.explorer_life),
      inventory_(setup.initial_inventory),
      strategy_(setup.strategy),
      target_(setup.target),
      fallback_(setup.fallback) {}

PolicyContext Explorer::context(const GalaxyMap& map) const {
  return PolicyContext{map, memory_, tick_, cfg_.memory_ttl_ticks};
}

void Explorer::step(std::uint64_t tick, const GalaxyMap& map, PlanetPort& port) {
  if (!alive_) {
    last_failure_ = Failure::ExplorerDead;
    return;
  }
  tick_ = tick;
  actions_ = 0;

  if (!map.topology.contains(position_)) {
    die("planet " + std::to_string(position_) + " destroyed");
    return;
  }

  std::optional<PlanetView> here = observe(port);
  if (!here) {
    if (last_failure_ == Failure::PlanetUnavailable) die("planet " + std::to_string(position_) + " unavailable");
    return;
  }
  if (!here->alive()) {
    die("planet " + std::to_string(position_) + " destroyed");
    return;
  }

  bool progressed = gather(*here, port);
  progressed = combine_here(*here, port) || progressed;
  if (progressed) {
    if (std::optional<PlanetView> fresh = observe(port)) here = std::move(fresh);
  }

  if (strategy_ == Strategy::BestPathAdaptive && capability_streak_ >= cfg_.capability_failure_limit) {
    switch_to_fallback("repeated capability rejections");
  }

  move(map, *here, port, progressed);
  if (!alive_) return;

  if (uses_route_planning(strategy_)) plan(map);

  const Inventory working = working_inventory(inventory_, target_);
  if (starving(context(map), position_, strategy_, target_, working)) {
    die("starved: every reachable planet is exhausted");
  }
}

bool Explorer::configure(Strategy strategy, ResourceKind target, std::optional<ResourceKind> fallback) {
  if (!alive_) {
    last_failure_ = Failure::ExplorerDead;
    return false;
  }
  strategy_ = strategy;
  target_ = target;
  fallback_ = fallback;
  capability_streak_ = 0;
  log::debug(explorer_tag(id_) + "configured " + strategy_label(strategy) + " -> " + resource_label(target));
  return true;
}

void Explorer::kill(const std::string& reason) { die(reason.empty() ? "killed" : reason); }

void Explorer::die(const std::string& reason) {
  if (!alive_) return;
  alive_ = false;
  death_reason_ = reason;
  log::info(explorer_tag(id_) + "died at planet " + std::to_string(position_) + " (" + reason + "), carrying " +
            inventory_to_string(inventory_));
}

ExplorerView Explorer::view() const {
  ExplorerView v;
  v.id = id_;
  v.position = position_;
  v.status = alive_ ? ExplorerStatus::Alive : ExplorerStatus::Dead;
  v.inventory = inventory_;
  v.life = life_;
  v.strategy = strategy_;
  v.target = target_;
  v.fallback = fallback_;
  v.last_failure = last_failure_;
  v.death_reason = death_reason_;
  v.moves = moves_;
  v.rocket_jumps = rocket_jumps_;
  v.harvests = harvests_;
  v.combinations = combinations_;
  v.targets_completed = targets_completed_;
  return v;
}

PlanetReply Explorer::send(PlanetPort& port, PlanetRequest req) {
  ++actions_;
  const char* what = planet_request_label(req);
  PlanetReply r = port.request(position_, std::move(req));
  if (r.ok) {
    capability_streak_ = 0;
    return r;
  }
  last_failure_ = r.failure;
  if (r.failure == Failure::CapabilityExceeded) ++capability_streak_;
  log::debug(explorer_tag(id_) + what + " at planet " + std::to_string(position_) + " rejected: " +
             failure_label(r.failure));
  return r;
}

std::optional<PlanetView> Explorer::observe(PlanetPort& port) {
  PlanetReply r = port.request(position_, QueryState{});
  if (!r.ok || !r.state) {
    last_failure_ = r.ok ? Failure::PlanetUnavailable : r.failure;
    return std::nullopt;
  }
  memory_.observe(tick_, *r.state);
  return r.state;
}

void Explorer::receive(ResourceKind k) {
  inventory_.add(k);
  ++harvests_;
  if (k == target_) ++targets_completed_;
}

bool Explorer::gather(PlanetView& here, PlanetPort& port) {
  bool any = false;
  Inventory wants = harvest_wants(strategy_, target_, working_inventory(inventory_, target_), here);

  for (ResourceKind k : base_resource_kinds()) {
    while (wants.has(k) && has_budget()) {
      if (here.inventory.has(k)) {
        if (!send(port, ExplorerHarvest{k}).ok) break;
        here.inventory.take(k);
        wants.take(k);
        receive(k);
        any = true;
        continue;
      }
      const bool generates = std::find(here.generates.begin(), here.generates.end(), k) != here.generates.end();
      if (!is_purposeful(strategy_) || !generates || !can_still_generate(here)) break;
      if (!send(port, GenerateResource{k}).ok) break;
      here.inventory.add(k);
      ++here.generations;
      if (rules_for(here.type).generation_discharges_cell) --here.energy;
    }
  }

  // Greedy: nothing lying around, so make something.
  if (!is_purposeful(strategy_) && !any && has_budget()) {
    const PlanetReply g = send(port, GenerateResource{});
    if (g.ok && g.resource && has_budget()) {
      if (send(port, ExplorerHarvest{*g.resource}).ok) {
        receive(*g.resource);
        any = true;
      }
    }
  }
  return any;
}

bool Explorer::combine_here(PlanetView& here, PlanetPort& port) {
  if (!combines_at(strategy_, here)) return false;

  bool any = false;
  while (has_budget()) {
    const auto recipe = pick_combination(strategy_, target_, working_inventory(inventory_, target_));
    if (!recipe) break;

    inventory_.take(recipe->a);
    inventory_.take(recipe->b);
    const PlanetReply r = send(port, RequestCombine{recipe->a, recipe->b, CombineSource::Explorer});
    if (r.ok && r.resource) {
      inventory_.add(*r.resource);
      ++combinations_;
      ++here.combinations;
      if (*r.resource == target_) ++targets_completed_;
      any = true;
      if (is_purposeful(strategy_) && !can_still_combine(here)) break;
      continue;
    }

    for (ResourceKind k : r.returned.kinds()) inventory_.add(k, r.returned.count(k));
    if (r.failure == Failure::Timeout) {
      log::warn(explorer_tag(id_) + "combination inputs lost to an unanswered request at planet " +
                std::to_string(position_));
    }
    break;
  }
  return any;
}

bool Explorer::switch_to_fallback(const char* why) {
  if (strategy_ != Strategy::BestPathAdaptive || !fallback_ || *fallback_ == target_) return false;
  log::info(explorer_tag(id_) + "switching target " + resource_label(target_) + " -> " + resource_label(*fallback_) +
            " (" + why + ")");
  target_ = *fallback_;
  capability_streak_ = 0;
  return true;
}

RoutePlan Explorer::plan(const GalaxyMap& map) {
  const PolicyContext ctx = context(map);
  RoutePlan p = plan_route(ctx, position_, target_, working_inventory(inventory_, target_));
  if (p.ok()) return p;

  last_failure_ = p.failure;
  if (switch_to_fallback("target unreachable")) {
    p = plan_route(ctx, position_, target_, working_inventory(inventory_, target_));
    if (!p.ok()) last_failure_ = p.failure;
  }
  return p;
}

void Explorer::move(const GalaxyMap& map, const PlanetView& here, PlanetPort& port, bool progressed) {
  Id dest = kInvalidId;

  if (uses_route_planning(strategy_)) {
    const RoutePlan p = plan(map);
    if (p.ok()) {
      // Still work to do here next tick.
      if (progressed && !p.waypoints.empty() && p.waypoints.front() == position_) return;

      for (Id w : p.waypoints) {
        if (w != position_) {
          dest = w;
          break;
        }
      }
      if (dest == kInvalidId) return;

      const auto path = map.topology.shortest_path(position_, dest);
      if (!path || path->size() < 2) return;

      const int hops = static_cast<int>(path->size()) - 1;
      if (hops >= cfg_.rocket_min_hops && try_rocket_jump(here, port)) {
        travel_to(dest, true);
        return;
      }
      travel_to((*path)[1], false);
      return;
    }
    // No route: wander rather than wait.
    dest = choose_any_neighbor(map, position_, cfg_.tie_break, rng_);
  } else if (strategy_ == Strategy::GreedyWithPurpose) {
    dest = choose_weighted_neighbor(context(map), position_, target_, working_inventory(inventory_, target_),
                                    cfg_.tie_break, rng_);
  } else {
    dest = choose_any_neighbor(map, position_, cfg_.tie_break, rng_);
  }

  if (dest != kInvalidId) travel_to(dest, false);
}

bool Explorer::try_rocket_jump(const PlanetView& here, PlanetPort& port) {
  if (!rules_for(here.type).can_build_rockets()) return false;
  if (here.rockets <= 0) {
    if (!has_budget() || !send(port, RequestRocket{RocketAction::Create}).ok) return false;
  }
  if (!has_budget()) return false;
  return send(port, RequestRocket{RocketAction::Use}).ok;
}

void Explorer::travel_to(Id dest, bool by_rocket) {
  log::debug(explorer_tag(id_) + (by_rocket ? "rocket jump " : "move ") + std::to_string(position_) + " -> " +
             std::to_string(dest));
  position_ = dest;
  --life_;
  if (by_rocket) {
    ++rocket_jumps_;
  } else {
    ++moves_;
  }
  if (life_ <= 0) {
    life_ = 0;
    die("life exhausted");
  }
}

// --- ExplorerActor -----------------------------------------------------------

ExplorerActor::ExplorerActor(ExplorerSetup setup, const SimConfig& cfg, std::shared_ptr<const PlanetDirectory> planets)
    : id_(setup.id),
      brain_(std::move(setup), cfg),
      port_(id_, std::move(planets), static_cast<std::size_t>(std::max(1, cfg.channel_capacity)),
            std::chrono::milliseconds(cfg.reply_timeout_ms)),
      inbox_(make_channel<ExplorerEnvelope>(static_cast<std::size_t>(std::max(1, cfg.channel_capacity)))) {}

ExplorerActor::~ExplorerActor() { stop(); }

void ExplorerActor::start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { run(); });
}

void ExplorerActor::stop() {
  if (!thread_.joinable()) {
    inbox_->close();
    return;
  }
  if (!inbox_->send(ExplorerEnvelope{0, StopActor{}, nullptr})) inbox_->close();
  thread_.join();
}

void ExplorerActor::run() {
  log::debug(explorer_tag(id_) + "actor started");

  for (;;) {
    std::optional<ExplorerEnvelope> env = inbox_->recv();
    if (!env) break;

    ExplorerReply reply;
    reply.explorer_id = id_;
    reply.seq = env->seq;
    bool stopping = false;

    std::visit(
        [&](const auto& cmd) {
          using T = std::decay_t<decltype(cmd)>;
          if constexpr (std::is_same_v<T, StepCommand>) {
            if (!brain_.alive()) {
              reply.ok = false;
              reply.failure = Failure::ExplorerDead;
            } else if (cmd.map) {
              brain_.step(cmd.tick, *cmd.map, port_);
            }
          } else if constexpr (std::is_same_v<T, ConfigureCommand>) {
            if (!brain_.configure(cmd.strategy, cmd.target, cmd.fallback)) {
              reply.ok = false;
              reply.failure = Failure::ExplorerDead;
            }
          } else if constexpr (std::is_same_v<T, KillExplorer>) {
            brain_.kill(cmd.reason);
          } else if constexpr (std::is_same_v<T, StopActor>) {
            stopping = true;
          }
        },
        env->body);

    reply.view = brain_.view();
    if (env->reply_to && !env->reply_to->try_send(std::move(reply))) {
      log::debug(explorer_tag(id_) + "dropped reply " + std::to_string(env->seq));
    }
    if (stopping) break;
  }

  inbox_->close();
  log::debug(explorer_tag(id_) + "actor stopped");
}

} // namespace galaxis
