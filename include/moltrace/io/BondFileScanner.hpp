#pragma once

#include "moltrace/core/Trajectory.hpp"
#include "moltrace/io/LineSource.hpp"

namespace moltrace {

// LAMMPS fix reaxff/bonds output.
//
// Each timestep block looks like:
//   # Timestep 100
//   # Number of particles 3
//   # id type nb id_1...id_nb mol bo_1...bo_nb abo nlp q
//    1 1 2 2 3 0 0.98 1.02 2.0 0.0 -0.1
//   ...
// Bond orders are stored as reals and rounded to the nearest integer
// (half to even), floored at 1.
class BondFileScanner {
public:
  // Reads up to the second "# Number of particles" line: atom count, atom
  // types (from the first block) and the block length in lines.
  TrajectoryHeader scan_header(LineSource& src) const;

  // Thread-safe; parses one block into a bond graph.
  StepFrame scan_block(const LineBlock& block, const TrajectoryHeader& header) const;
};

} // namespace moltrace
