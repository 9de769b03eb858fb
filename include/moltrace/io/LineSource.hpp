#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace moltrace {

// Sequential line reader over one or more files, read back to back as a
// single stream. Line numbers are 1-based and global across files.
class LineSource {
public:
  explicit LineSource(std::vector<std::filesystem::path> files);

  // Reads the next line into `line`. Returns false at the end of the last file.
  bool next(std::string& line);

  // Skips one line. Returns false at the end of the last file.
  bool skip();

  // Line number of the most recently returned line (0 before the first).
  std::size_t line_no() const { return line_no_; }

private:
  std::vector<std::filesystem::path> files_;
  std::size_t file_idx_ = 0;
  std::ifstream ifs_;
  std::size_t line_no_ = 0;
  std::string scratch_;

  bool open_next_();
};

} // namespace moltrace
