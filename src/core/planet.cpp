#include "galaxis/core/planet.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "galaxis/core/recipes.h"
#include "galaxis/util/log.h"

namespace galaxis {

const char* planet_request_label(const PlanetRequest& req) {
  return std::visit(
      [](const auto& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, GenerateResource>) return "generate";
        else if constexpr (std::is_same_v<T, RequestCombine>) return "combine";
        else if constexpr (std::is_same_v<T, RequestRocket>) return "rocket";
        else if constexpr (std::is_same_v<T, ExplorerHarvest>) return "harvest";
        else if constexpr (std::is_same_v<T, SunrayArrival>) return "sunray";
        else if constexpr (std::is_same_v<T, AsteroidArrival>) return "asteroid";
        else if constexpr (std::is_same_v<T, QueryState>) return "query_state";
        else if constexpr (std::is_same_v<T, QueryCapabilities>) return "query_capabilities";
        else if constexpr (std::is_same_v<T, KillPlanet>) return "kill";
        else return "stop";
      },
      req);
}

namespace {

std::string planet_tag(Id id) { return "Planet " + std::to_string(id) + ": "; }

PlanetReply unavailable_reply(const PlanetRequest& req) {
  PlanetReply r;
  r.failure = Failure::PlanetUnavailable;
  if (const auto* c = std::get_if<RequestCombine>(&req); c && c->source == CombineSource::Explorer) {
    r.returned.add(c->a);
    r.returned.add(c->b);
  }
  return r;
}

} // namespace

PlanetState::PlanetState(PlanetSetup setup)
    : id_(setup.id),
      rules_(rules_for(setup.type)),
      generates_(std::move(setup.generates)),
      sunray_charge_(std::max(0, setup.sunray_charge)),
      asteroid_damage_(std::max(0, setup.asteroid_damage)),
      inventory_(setup.initial_inventory) {
  if (generates_.empty()) {
    throw std::runtime_error(planet_tag(id_) + "generation catalog is empty");
  }
  for (ResourceKind k : generates_) {
    if (!is_base(k)) {
      throw std::runtime_error(planet_tag(id_) + "cannot generate complex resource " + resource_label(k));
    }
  }
  std::sort(generates_.begin(), generates_.end());
  generates_.erase(std::unique(generates_.begin(), generates_.end()), generates_.end());

  if (rules_.many_cells) {
    if (setup.many_cell_capacity < 1) {
      throw std::runtime_error(planet_tag(id_) + "many_cell_capacity must be at least 1");
    }
    capacity_ = setup.many_cell_capacity;
  } else {
    capacity_ = 1;
  }

  if (setup.initial_energy < 0) {
    charged_ = capacity_;
  } else if (setup.initial_energy > capacity_) {
    throw std::runtime_error(planet_tag(id_) + "initial energy " + std::to_string(setup.initial_energy) +
                             " exceeds capacity " + std::to_string(capacity_));
  } else {
    charged_ = setup.initial_energy;
  }
}

PlanetReply PlanetState::accepted() const {
  PlanetReply r;
  r.planet_id = id_;
  r.ok = true;
  return r;
}

PlanetReply PlanetState::rejected(Failure f) const {
  PlanetReply r;
  r.planet_id = id_;
  r.ok = false;
  r.failure = f;
  return r;
}

PlanetReply PlanetState::handle(const PlanetRequest& req) {
  // Queries are answered even after destruction; everything else is refused.
  if (std::holds_alternative<QueryState>(req)) {
    PlanetReply r = accepted();
    r.state = view();
    return r;
  }
  if (std::holds_alternative<QueryCapabilities>(req)) {
    PlanetReply r = accepted();
    r.capabilities = capabilities();
    return r;
  }
  if (std::holds_alternative<StopActor>(req)) return accepted();

  if (!alive()) {
    PlanetReply r = unavailable_reply(req);
    r.planet_id = id_;
    return r;
  }

  return std::visit(
      [&](const auto& r) -> PlanetReply {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, GenerateResource>) return generate(r);
        else if constexpr (std::is_same_v<T, RequestCombine>) return combine_units(r);
        else if constexpr (std::is_same_v<T, RequestRocket>) return rocket(r);
        else if constexpr (std::is_same_v<T, ExplorerHarvest>) return harvest(r);
        else if constexpr (std::is_same_v<T, SunrayArrival>) return sunray();
        else if constexpr (std::is_same_v<T, AsteroidArrival>) return asteroid();
        else if constexpr (std::is_same_v<T, KillPlanet>) return kill();
        else return accepted();
      },
      req);
}

PlanetReply PlanetState::generate(const GenerateResource& req) {
  if (!rules_.generation_allowed(generations_)) return rejected(Failure::CapabilityExceeded);

  const ResourceKind kind = req.kind ? *req.kind : generates_.front();
  if (std::find(generates_.begin(), generates_.end(), kind) == generates_.end()) {
    return rejected(Failure::CapabilityExceeded);
  }
  if (charged_ <= 0) return rejected(Failure::EnergyDepleted);

  if (rules_.generation_discharges_cell) --charged_;
  ++generations_;
  inventory_.add(kind);

  PlanetReply r = accepted();
  r.resource = kind;
  return r;
}

PlanetReply PlanetState::combine_units(const RequestCombine& req) {
  const bool from_explorer = req.source == CombineSource::Explorer;
  auto refuse = [&](Failure f) {
    PlanetReply r = rejected(f);
    if (from_explorer) {
      r.returned.add(req.a);
      r.returned.add(req.b);
    }
    return r;
  };

  if (!rules_.combination_allowed(combinations_)) return refuse(Failure::CapabilityExceeded);

  const auto product = combine(req.a, req.b);
  if (!product) return refuse(Failure::NoRecipe);

  if (!from_explorer) {
    const int need_a = (req.a == req.b) ? 2 : 1;
    if (!inventory_.has(req.a, need_a) || !inventory_.has(req.b)) return refuse(Failure::InsufficientInventory);
    inventory_.take(req.a);
    inventory_.take(req.b);
    inventory_.add(*product);
  }
  ++combinations_;

  PlanetReply r = accepted();
  r.resource = *product;
  return r;
}

PlanetReply PlanetState::rocket(const RequestRocket& req) {
  if (!rules_.can_build_rockets()) return rejected(Failure::CapabilityExceeded);

  if (req.action == RocketAction::Create) {
    if (!rules_.rocket_allowed(rockets_)) return rejected(Failure::CapabilityExceeded);
    if (charged_ <= 0) return rejected(Failure::EnergyDepleted);
    --charged_;
    ++rockets_;
    return accepted();
  }

  if (rockets_ <= 0) return rejected(Failure::InsufficientInventory);
  --rockets_;
  return accepted();
}

PlanetReply PlanetState::harvest(const ExplorerHarvest& req) {
  if (!inventory_.take(req.kind)) return rejected(Failure::InsufficientInventory);
  PlanetReply r = accepted();
  r.resource = req.kind;
  return r;
}

PlanetReply PlanetState::sunray() {
  charged_ = std::min(capacity_, charged_ + sunray_charge_);
  return accepted();
}

PlanetReply PlanetState::asteroid() {
  PlanetReply r = accepted();
  if (rockets_ > 0) {
    --rockets_;
    r.deflected = true;
    return r;
  }
  charged_ -= std::min(charged_, asteroid_damage_);
  if (charged_ == 0) {
    status_ = PlanetStatus::Dead;
    r.destroyed = true;
  }
  return r;
}

PlanetReply PlanetState::kill() {
  status_ = PlanetStatus::Dead;
  charged_ = 0;
  PlanetReply r = accepted();
  r.destroyed = true;
  return r;
}

void PlanetState::check_invariants() const {
  auto fail = [&](const std::string& what) { throw std::logic_error(planet_tag(id_) + what); };

  if (capacity_ < 1) fail("energy capacity below one cell");
  if (!rules_.many_cells && capacity_ != 1) fail("single-cell type holds " + std::to_string(capacity_) + " cells");
  if (charged_ < 0 || charged_ > capacity_) {
    fail("charged cells " + std::to_string(charged_) + " outside [0," + std::to_string(capacity_) + "]");
  }
  if (rules_.max_generations != kUnlimited && generations_ > rules_.max_generations) {
    fail("generations " + std::to_string(generations_) + " exceed limit " + std::to_string(rules_.max_generations));
  }
  if (rules_.max_combinations != kUnlimited && combinations_ > rules_.max_combinations) {
    fail("combinations " + std::to_string(combinations_) + " exceed limit " +
         std::to_string(rules_.max_combinations));
  }
  if (rockets_ < 0 || (rules_.max_rockets != kUnlimited && rockets_ > rules_.max_rockets)) {
    fail("rockets " + std::to_string(rockets_) + " outside type limit");
  }
}

PlanetView PlanetState::view() const {
  PlanetView v;
  v.id = id_;
  v.type = rules_.type;
  v.status = status_;
  v.inventory = inventory_;
  v.energy = charged_;
  v.energy_capacity = capacity_;
  v.rockets = rockets_;
  v.generations = generations_;
  v.combinations = combinations_;
  v.generates = generates_;
  return v;
}

PlanetCapabilities PlanetState::capabilities() const {
  PlanetCapabilities c;
  c.rules = rules_;
  c.energy_capacity = capacity_;
  c.generates = generates_;
  return c;
}

// --- PlanetActor -------------------------------------------------------------

PlanetActor::PlanetActor(PlanetSetup setup, std::size_t inbox_capacity)
    : id_(setup.id), state_(std::move(setup)), inbox_(make_channel<PlanetEnvelope>(inbox_capacity)) {}

PlanetActor::~PlanetActor() { stop(); }

void PlanetActor::start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { run(); });
}

void PlanetActor::stop() {
  if (!thread_.joinable()) {
    inbox_->close();
    return;
  }
  PlanetEnvelope env;
  env.sender = kOrchestratorId;
  env.body = StopActor{};
  if (!inbox_->send(std::move(env))) inbox_->close();
  thread_.join();
}

std::string PlanetActor::fault_message() const {
  std::lock_guard<std::mutex> lock(fault_mu_);
  return fault_;
}

void PlanetActor::reply(const PlanetEnvelope& env, PlanetReply r) {
  if (!env.reply_to) return;
  r.planet_id = id_;
  r.seq = env.seq;
  // Never block on a requester: a full or closed reply channel means the
  // requester already gave up on this message.
  if (!env.reply_to->try_send(std::move(r))) {
    log::debug(planet_tag(id_) + "dropped reply " + std::to_string(env.seq) + " to " + std::to_string(env.sender));
  }
}

void PlanetActor::run() {
  log::debug(planet_tag(id_) + "actor started (" + planet_type_label(state_.type()) + ")");

  for (;;) {
    std::optional<PlanetEnvelope> env = inbox_->recv();
    if (!env) break;

    if (std::holds_alternative<StopActor>(env->body)) {
      reply(*env, state_.handle(env->body));
      break;
    }

    const bool was_alive = state_.alive();
    PlanetReply r = state_.handle(env->body);
    try {
      state_.check_invariants();
    } catch (const std::logic_error& e) {
      log::error(std::string("Invariant violation: ") + e.what());
      {
        std::lock_guard<std::mutex> lock(fault_mu_);
        fault_ = e.what();
      }
      faulted_.store(true);
      inbox_->close();
      reply(*env, unavailable_reply(env->body));
      break;
    }

    if (!r.ok) {
      log::debug(planet_tag(id_) + planet_request_label(env->body) + " from " + std::to_string(env->sender) +
                 " rejected: " + failure_label(r.failure));
    }
    if (was_alive && !state_.alive()) log::info(planet_tag(id_) + "destroyed");

    reply(*env, std::move(r));
  }

  // Anything still queued after a stop is answered as unavailable.
  inbox_->close();
  while (std::optional<PlanetEnvelope> rest = inbox_->try_recv()) {
    reply(*rest, unavailable_reply(rest->body));
  }

  log::debug(planet_tag(id_) + "actor stopped");
}

} // namespace galaxis
