#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "moltrace/bond/PeriodicBondAdapter.hpp"
#include "moltrace/core/Box.hpp"
#include "moltrace/core/Trajectory.hpp"
#include "moltrace/io/LineSource.hpp"

namespace moltrace {

// Coordinates of one dump timestep, indexed by atom id - 1.
struct DumpFrame {
  std::int64_t timestep = 0;
  Box box;
  std::vector<int> type; // 0-based
  std::vector<Vec3> pos;
};

// LAMMPS text dump (dump atom / dump custom) with id, type, x, y, z columns.
//
// Column positions come from the "ITEM: ATOMS ..." header of the first block
// and must stay the same for every later block. Bonds are not stored in the
// file; scan_block() hands the coordinates to a PeriodicBondAdapter.
class DumpFileScanner {
public:
  explicit DumpFileScanner(const PeriodicBondAdapter& adapter);

  // Not thread-safe: records the column layout used by scan_block().
  TrajectoryHeader scan_header(LineSource& src);

  // Thread-safe after scan_header().
  DumpFrame read_frame(const LineBlock& block, const TrajectoryHeader& header) const;
  StepFrame scan_block(const LineBlock& block, const TrajectoryHeader& header) const;

private:
  struct ColSpec {
    int id = -1;
    int type = -1;
    int x = -1;
    int y = -1;
    int z = -1;
    std::size_t ncols = 0;
  };

  const PeriodicBondAdapter& adapter_;
  ColSpec col_;
  std::vector<std::string> fields_;

  ColSpec parse_atoms_header_(const std::string& line, std::size_t line_no,
                              std::vector<std::string>& fields) const;
};

} // namespace moltrace
