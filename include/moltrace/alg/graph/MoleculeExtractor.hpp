#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "moltrace/core/Errors.hpp"
#include "moltrace/topology/BondGraph.hpp"

namespace moltrace::alg::graph {

using Edge = std::pair<std::size_t, std::size_t>;

// A connected component of one timestep's bond graph.
// bonds[k] has bond order orders[k].
struct Molecule {
  std::vector<std::size_t> atoms; // discovery order
  std::vector<Edge> bonds;        // discovery orientation
  std::vector<int> orders;
};

// Connected components by iterative depth-first search.
//
// Components are seeded in ascending atom index, so the molecule order and the
// atom/bond order inside each molecule are a pure function of the graph.
// Each undirected bond is reported once: when its first endpoint is expanded
// and the other endpoint has not been expanded yet. Atoms with no bonds become
// singleton molecules with empty bond lists.
inline std::vector<Molecule> extract_molecules(const BondGraph& g) {
  const std::size_t n = g.natoms;
  std::vector<Molecule> out;

  std::vector<unsigned char> queued(n, 0);
  std::vector<unsigned char> expanded(n, 0);
  std::vector<std::size_t> stack;

  for (std::size_t seed = 0; seed < n; ++seed) {
    if (queued[seed]) continue;
    Molecule m;
    queued[seed] = 1;
    stack.clear();
    stack.push_back(seed);

    while (!stack.empty()) {
      const std::size_t u = stack.back();
      stack.pop_back();
      expanded[u] = 1;
      m.atoms.push_back(u);
      if (u >= g.adjacency.size()) continue;

      for (const BondRef& e : g.adjacency[u]) {
        const std::size_t v = e.neighbor;
        if (v >= n) {
          throw InvariantViolation("extract_molecules: neighbor " + std::to_string(v) + " of atom " +
                                   std::to_string(u) + " out of range");
        }
        if (expanded[v]) continue;
        m.bonds.emplace_back(u, v);
        m.orders.push_back(e.order);
        if (!queued[v]) {
          queued[v] = 1;
          stack.push_back(v);
        }
      }
    }
    out.push_back(std::move(m));
  }
  return out;
}

// Every atom 0..natoms-1 must occur in exactly one molecule.
inline void check_partition(const std::vector<Molecule>& mols, std::size_t natoms) {
  std::vector<unsigned char> hit(natoms, 0);
  std::size_t total = 0;
  for (const auto& m : mols) {
    if (m.bonds.size() != m.orders.size()) {
      throw InvariantViolation("molecule bond/order lists differ in length");
    }
    for (std::size_t a : m.atoms) {
      if (a >= natoms) throw InvariantViolation("molecule atom " + std::to_string(a) + " out of range");
      if (hit[a]) throw InvariantViolation("atom " + std::to_string(a) + " assigned to more than one molecule");
      hit[a] = 1;
      ++total;
    }
  }
  if (total != natoms) {
    for (std::size_t a = 0; a < natoms; ++a) {
      if (!hit[a]) throw InvariantViolation("atom " + std::to_string(a) + " not assigned to any molecule");
    }
  }
}

} // namespace moltrace::alg::graph
