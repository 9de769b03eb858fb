#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace moltrace {

struct BondRef {
  std::size_t neighbor = 0;
  int order = 1;
};

// One timestep's bond graph: adjacency[i] lists (neighbor, order) for atom i.
//
// Atoms without recorded bonds simply have an empty list. The graph is
// expected to be symmetric: (a -> b, o) implies (b -> a, o). Readers either
// build it with add_bond() (symmetric by construction) or fill per-atom lists
// from the input and verify with find_asymmetry().
struct BondGraph {
  std::size_t natoms = 0;
  std::vector<std::vector<BondRef>> adjacency; // size natoms

  BondGraph() = default;
  explicit BondGraph(std::size_t n) { reset(n); }

  void reset(std::size_t n) {
    natoms = n;
    adjacency.assign(n, {});
  }

  std::size_t degree(std::size_t i) const { return (i < adjacency.size()) ? adjacency[i].size() : 0; }

  void add_bond(std::size_t a, std::size_t b, int order) {
    if (a >= natoms || b >= natoms) throw std::runtime_error("BondGraph: bond endpoint out of range");
    adjacency[a].push_back(BondRef{b, order});
    adjacency[b].push_back(BondRef{a, order});
  }

  // Undirected bond count.
  std::size_t bond_count() const {
    std::size_t sum = 0;
    for (const auto& nbrs : adjacency) sum += nbrs.size();
    return sum / 2;
  }

  // Returns the first (a, b) whose reverse entry is missing or has a different order.
  std::optional<std::pair<std::size_t, std::size_t>> find_asymmetry() const {
    for (std::size_t a = 0; a < adjacency.size(); ++a) {
      for (const auto& e : adjacency[a]) {
        if (e.neighbor >= adjacency.size()) return std::make_pair(a, e.neighbor);
        // Multiplicity must match as well, so compare counts.
        std::size_t fwd = 0;
        std::size_t rev = 0;
        for (const auto& f : adjacency[a]) {
          if (f.neighbor == e.neighbor && f.order == e.order) ++fwd;
        }
        for (const auto& r : adjacency[e.neighbor]) {
          if (r.neighbor == a && r.order == e.order) ++rev;
        }
        if (fwd != rev) return std::make_pair(a, e.neighbor);
      }
    }
    return std::nullopt;
  }
};

} // namespace moltrace
