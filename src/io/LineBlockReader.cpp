#include "moltrace/io/LineBlockReader.hpp"

#include <stdexcept>
#include <string>

#include "moltrace/core/Errors.hpp"
#include "moltrace/util/Parse.hpp"

namespace moltrace {

LineBlockReader::LineBlockReader(LineSource& src, std::size_t lines_per_block, std::size_t interval)
: src_(src), lines_per_block_(lines_per_block), interval_(interval) {
  if (lines_per_block_ == 0) throw std::runtime_error("LineBlockReader: lines_per_block must be > 0");
  if (interval_ == 0) throw std::runtime_error("LineBlockReader: interval must be > 0");
}

bool LineBlockReader::skip_block_() {
  for (std::size_t i = 0; i < lines_per_block_; ++i) {
    if (!src_.skip()) {
      eof_ = true;
      return i > 0;
    }
  }
  return true;
}

bool LineBlockReader::next(LineBlock& block) {
  while (!eof_ && (block_index_ % interval_) != 0) {
    if (!skip_block_()) return false;
    ++block_index_;
  }
  if (eof_) return false;

  block.lines.clear();
  block.lines.reserve(lines_per_block_);
  block.first_line = src_.line_no() + 1;

  std::string line;
  bool any_content = false;
  for (std::size_t i = 0; i < lines_per_block_; ++i) {
    if (!src_.next(line)) {
      eof_ = true;
      break;
    }
    if (!is_blank(line)) any_content = true;
    block.lines.push_back(line);
  }
  if (!any_content) {
    if (eof_) return false;
    throw ParseError("timestep block " + std::to_string(block_index_) + " contains only blank lines", block.first_line);
  }

  block.block_index = block_index_++;
  block.step = step_++;
  return true;
}

} // namespace moltrace
