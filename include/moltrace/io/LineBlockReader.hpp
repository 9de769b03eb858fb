#pragma once

#include <cstddef>

#include "moltrace/core/Trajectory.hpp"
#include "moltrace/io/LineSource.hpp"

namespace moltrace {

// Cuts a line stream into fixed-length timestep blocks.
//
// Block b is returned iff b % interval == 0; other blocks are consumed
// without being stored. Returned blocks are numbered 0, 1, 2, ... in `step`.
// A trailing short block is returned as-is (the scanner rejects it if it is
// incomplete); a trailing block made only of blank lines ends the stream.
class LineBlockReader {
public:
  LineBlockReader(LineSource& src, std::size_t lines_per_block, std::size_t interval = 1);

  bool next(LineBlock& block);

  std::size_t blocks_seen() const { return block_index_; }
  std::size_t blocks_returned() const { return step_; }

private:
  LineSource& src_;
  std::size_t lines_per_block_ = 0;
  std::size_t interval_ = 1;
  std::size_t block_index_ = 0;
  std::size_t step_ = 0;
  bool eof_ = false;

  bool skip_block_();
};

} // namespace moltrace
