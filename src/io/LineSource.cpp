#include "moltrace/io/LineSource.hpp"

#include <stdexcept>
#include <utility>

namespace moltrace {

LineSource::LineSource(std::vector<std::filesystem::path> files)
: files_(std::move(files)) {
  if (files_.empty()) {
    throw std::runtime_error("LineSource: no input files");
  }
  for (const auto& f : files_) {
    if (!std::filesystem::exists(f)) {
      throw std::runtime_error("LineSource: input file not found: " + f.string());
    }
  }
  if (!open_next_()) {
    throw std::runtime_error("LineSource: failed to open file: " + files_.front().string());
  }
}

bool LineSource::open_next_() {
  if (file_idx_ >= files_.size()) return false;
  ifs_.close();
  ifs_.clear();
  ifs_.open(files_[file_idx_]);
  if (!ifs_) {
    throw std::runtime_error("LineSource: failed to open file: " + files_[file_idx_].string());
  }
  ifs_.exceptions(std::ios::badbit);
  return true;
}

bool LineSource::next(std::string& line) {
  while (true) {
    if (std::getline(ifs_, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      ++line_no_;
      return true;
    }
    ++file_idx_;
    if (!open_next_()) return false;
  }
}

bool LineSource::skip() {
  return next(scratch_);
}

} // namespace moltrace
