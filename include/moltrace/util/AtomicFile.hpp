#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace moltrace::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename a finished temporary file over the target.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some platforms/filesystems don't overwrite existing paths on rename.
  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp);
    if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
    fn(ofs);
    ofs.flush();
    if (!ofs) throw std::runtime_error("failed while writing temp file: " + tmp.string());
  }
  atomic_rename_over(tmp, out_path);
}

// Binary file that only appears at its final path after commit().
// If destroyed without commit(), the temporary file is removed.
class AtomicBinaryFile {
public:
  explicit AtomicBinaryFile(fs::path out_path)
      : out_(std::move(out_path)), tmp_(make_tmp_path(out_)), ofs_(tmp_, std::ios::binary | std::ios::trunc) {
    if (!ofs_) throw std::runtime_error("failed to open temp file for atomic write: " + tmp_.string());
  }

  ~AtomicBinaryFile() {
    if (committed_) return;
    ofs_.close();
    std::error_code ec;
    fs::remove(tmp_, ec);
  }

  AtomicBinaryFile(const AtomicBinaryFile&) = delete;
  AtomicBinaryFile& operator=(const AtomicBinaryFile&) = delete;

  std::ostream& stream() { return ofs_; }

  void commit() {
    if (committed_) return;
    ofs_.flush();
    if (!ofs_) throw std::runtime_error("failed while writing temp file: " + tmp_.string());
    ofs_.close();
    atomic_rename_over(tmp_, out_);
    committed_ = true;
  }

private:
  fs::path out_;
  fs::path tmp_;
  std::ofstream ofs_;
  bool committed_ = false;
};

// Output files that appear at their final paths together.
// Each file is written to the path returned by stage(); commit() renames every
// staged file over its target. Files still staged on destruction are removed.
class StagedFileSet {
public:
  StagedFileSet() = default;

  ~StagedFileSet() {
    std::error_code ec;
    for (const auto& e : entries_) {
      if (!e.committed) fs::remove(e.staged, ec);
    }
  }

  StagedFileSet(const StagedFileSet&) = delete;
  StagedFileSet& operator=(const StagedFileSet&) = delete;

  fs::path stage(const fs::path& out_path) {
    fs::path staged = out_path;
    staged += ".part";
    entries_.push_back(Entry{out_path, staged, false});
    return staged;
  }

  void commit() {
    for (const auto& e : entries_) {
      if (!fs::exists(e.staged)) throw std::runtime_error("staged output was never written: " + e.staged.string());
    }
    for (auto& e : entries_) {
      if (e.committed) continue;
      atomic_rename_over(e.staged, e.out);
      e.committed = true;
    }
  }

private:
  struct Entry {
    fs::path out;
    fs::path staged;
    bool committed = false;
  };
  std::vector<Entry> entries_;
};

} // namespace moltrace::util
