#include "galaxis/core/topology.h"

#include <algorithm>
#include <deque>

namespace galaxis {
namespace {
const std::set<Id> kNoNeighbors;
} // namespace

void Topology::add_node(Id id) { adj_.try_emplace(id); }

void Topology::connect(Id a, Id b) {
  add_node(a);
  add_node(b);
  if (a == b) return;
  adj_[a].insert(b);
  adj_[b].insert(a);
}

bool Topology::disconnect(Id a, Id b) {
  auto ia = adj_.find(a);
  auto ib = adj_.find(b);
  if (ia == adj_.end() || ib == adj_.end()) return false;
  const bool removed = ia->second.erase(b) > 0;
  ib->second.erase(a);
  return removed;
}

bool Topology::remove_node(Id id) {
  auto it = adj_.find(id);
  if (it == adj_.end()) return false;
  for (Id n : it->second) {
    auto in = adj_.find(n);
    if (in != adj_.end()) in->second.erase(id);
  }
  adj_.erase(it);
  return true;
}

bool Topology::adjacent(Id a, Id b) const {
  const auto it = adj_.find(a);
  return it != adj_.end() && it->second.count(b) > 0;
}

const std::set<Id>& Topology::neighbors(Id id) const {
  const auto it = adj_.find(id);
  return it == adj_.end() ? kNoNeighbors : it->second;
}

std::vector<Id> Topology::nodes() const {
  std::vector<Id> out;
  out.reserve(adj_.size());
  for (const auto& [id, _] : adj_) out.push_back(id);
  return out;
}

std::size_t Topology::edge_count() const {
  std::size_t twice = 0;
  for (const auto& [_, n] : adj_) twice += n.size();
  return twice / 2;
}

bool Topology::is_connected() const {
  if (adj_.size() <= 1) return true;
  return reachable_from(adj_.begin()->first).size() == adj_.size();
}

std::set<Id> Topology::critical_nodes() const {
  std::set<Id> out;
  std::unordered_map<Id, int> disc;
  std::unordered_map<Id, int> low;
  disc.reserve(adj_.size() * 2);
  low.reserve(adj_.size() * 2);
  int timer = 0;

  struct Frame {
    Id node;
    Id parent;
    std::set<Id>::const_iterator next;
  };
  std::vector<Frame> stack;

  for (const auto& [root, root_nbrs] : adj_) {
    if (disc.count(root)) continue;

    int root_children = 0;
    disc[root] = low[root] = timer++;
    stack.push_back(Frame{root, kInvalidId, root_nbrs.begin()});

    while (!stack.empty()) {
      Frame& f = stack.back();
      const std::set<Id>& nbrs = adj_.at(f.node);

      if (f.next != nbrs.end()) {
        const Id v = *f.next;
        ++f.next;
        if (v == f.parent) continue; // the tree edge back to the parent
        const auto dv = disc.find(v);
        if (dv != disc.end()) {
          // Back edge.
          low[f.node] = std::min(low[f.node], dv->second);
          continue;
        }
        if (f.node == root) ++root_children;
        const Id u = f.node;
        disc[v] = low[v] = timer++;
        stack.push_back(Frame{v, u, adj_.at(v).begin()}); // invalidates f
        continue;
      }

      const Id u = f.node;
      const Id p = f.parent;
      stack.pop_back();
      if (p == kInvalidId) continue;
      low[p] = std::min(low[p], low[u]);
      // No back edge from u's subtree climbs strictly above p.
      if (p != root && low[u] >= disc[p]) out.insert(p);
    }

    if (root_children > 1) out.insert(root);
  }
  return out;
}

std::vector<std::vector<Id>> Topology::components() const {
  std::vector<std::vector<Id>> out;
  std::set<Id> seen;
  for (const auto& [id, _] : adj_) {
    if (seen.count(id)) continue;
    const std::set<Id> comp = reachable_from(id);
    seen.insert(comp.begin(), comp.end());
    out.emplace_back(comp.begin(), comp.end());
  }
  return out;
}

std::set<Id> Topology::reachable_from(Id from) const {
  std::set<Id> seen;
  if (!contains(from)) return seen;
  std::vector<Id> stack{from};
  seen.insert(from);
  while (!stack.empty()) {
    const Id u = stack.back();
    stack.pop_back();
    for (Id v : neighbors(u)) {
      if (seen.insert(v).second) stack.push_back(v);
    }
  }
  return seen;
}

std::unordered_map<Id, int> Topology::hop_distances(Id from) const {
  std::unordered_map<Id, int> dist;
  if (!contains(from)) return dist;
  std::deque<Id> q{from};
  dist[from] = 0;
  while (!q.empty()) {
    const Id u = q.front();
    q.pop_front();
    for (Id v : neighbors(u)) {
      if (dist.count(v)) continue;
      dist[v] = dist[u] + 1;
      q.push_back(v);
    }
  }
  return dist;
}

std::optional<std::vector<Id>> Topology::shortest_path(Id from, Id to) const {
  if (!contains(from) || !contains(to)) return std::nullopt;
  if (from == to) return std::vector<Id>{from};

  std::unordered_map<Id, Id> prev;
  std::deque<Id> q{from};
  prev[from] = kInvalidId;
  while (!q.empty()) {
    const Id u = q.front();
    q.pop_front();
    if (u == to) break;
    // Ordered neighbor sets: the first discovery of a node comes through the
    // lowest-id parent on the previous BFS layer.
    for (Id v : neighbors(u)) {
      if (prev.count(v)) continue;
      prev[v] = u;
      q.push_back(v);
    }
  }
  if (!prev.count(to)) return std::nullopt;

  std::vector<Id> path;
  for (Id cur = to; cur != kInvalidId; cur = prev[cur]) path.push_back(cur);
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace galaxis
