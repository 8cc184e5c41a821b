#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

#include "galaxis/core/ids.h"

namespace galaxis {

// Undirected galaxy graph addressed by planet id.
//
// Nodes own no planet state, only ids, so cycles in the graph never turn into
// ownership cycles. Neighbor sets are ordered, which makes every traversal
// (and therefore every route an explorer picks) deterministic.
class Topology {
 public:
  void add_node(Id id);

  // Adds the undirected edge a-b, creating either node if needed.
  // Self-loops are ignored.
  void connect(Id a, Id b);

  // Removes the edge a-b. Returns false if it did not exist.
  bool disconnect(Id a, Id b);

  // Removes a node together with all its edges. Returns false if unknown.
  bool remove_node(Id id);

  bool contains(Id id) const { return adj_.find(id) != adj_.end(); }
  bool adjacent(Id a, Id b) const;

  // Empty set for unknown ids.
  const std::set<Id>& neighbors(Id id) const;

  std::vector<Id> nodes() const;
  std::size_t node_count() const { return adj_.size(); }
  std::size_t edge_count() const;

  // True for a graph with at most one node, or when every node reaches every
  // other node.
  bool is_connected() const;

  // Articulation points: nodes whose removal increases the number of connected
  // components. Computed per component in O(V + E) with an iterative DFS
  // tracking discovery order and low-link values.
  std::set<Id> critical_nodes() const;

  // Connected components, each sorted, ordered by their smallest id.
  std::vector<std::vector<Id>> components() const;

  // Every node reachable from `from` (including itself). Empty if unknown.
  std::set<Id> reachable_from(Id from) const;

  // Hop counts from `from` to every reachable node.
  std::unordered_map<Id, int> hop_distances(Id from) const;

  // Fewest-hop path [from, ..., to]. Among equal-length paths the one through
  // lower ids wins. std::nullopt if either end is unknown or no path exists.
  std::optional<std::vector<Id>> shortest_path(Id from, Id to) const;

  bool operator==(const Topology& o) const { return adj_ == o.adj_; }

 private:
  std::map<Id, std::set<Id>> adj_;
};

} // namespace galaxis
