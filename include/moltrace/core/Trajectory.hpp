#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "moltrace/topology/BondGraph.hpp"

namespace moltrace {

// Trajectory-invariant state produced by the one-time header scan.
//
// Immutable once the scan returns; workers receive it by const reference.
struct TrajectoryHeader {
  std::size_t natoms = 0;
  std::vector<int> atom_type;  // size natoms, 0-based type ids
  std::size_t step_lines = 0;  // raw lines per timestep block

  int max_type() const {
    int m = -1;
    for (int t : atom_type) m = (t > m) ? t : m;
    return m;
  }
};

// A contiguous run of raw lines holding one timestep.
struct LineBlock {
  std::size_t step = 0;        // sequence number among sampled blocks
  std::size_t block_index = 0; // raw block position in the input
  std::size_t first_line = 0;  // 1-based line number of lines[0]
  std::vector<std::string> lines;

  std::size_t line_no(std::size_t i) const { return first_line + i; }
};

// Parsed timestep, ready for molecule extraction.
struct StepFrame {
  std::size_t step = 0;
  std::size_t block_index = 0;
  std::int64_t timestep = 0;
  std::vector<int> atom_type; // per-step types; empty when the header's apply
  BondGraph bonds;

  const std::vector<int>& types_or(const TrajectoryHeader& h) const {
    return atom_type.empty() ? h.atom_type : atom_type;
  }
};

} // namespace moltrace
