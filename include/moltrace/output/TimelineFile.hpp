#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "moltrace/output/TimelineSink.hpp"
#include "moltrace/pipeline/Timeline.hpp"

namespace moltrace::output {
namespace fs = std::filesystem;

inline constexpr const char* kTimelineMagic = "MOLTRACETL";
inline constexpr const char* kTimelineEndMagic = "MOLTRACEEND";
inline constexpr std::uint32_t kTimelineFormatVersion = 1;

// Binary timeline file. Layout (little-endian host order, as BinaryWriter):
//   magic, u32 version, string moltrace version,
//   u64 natoms, vec<i32> atom types, vec<i64> step timesteps, u64 molecules,
//   per molecule: blob key, u64 n, n x (u64 step, blob payload),
//   end magic.
// Data goes to "<path>.tmp" and is renamed over <path> in end(); a writer
// destroyed before end() leaves no file behind.
class TimelineFileWriter final : public TimelineSink {
public:
  explicit TimelineFileWriter(fs::path path);
  ~TimelineFileWriter() override;

  void begin(const TimelineSummary& summary) override;
  void write_molecule(const std::string& key, const std::vector<Occurrence>& occurrences) override;
  void end() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

struct TimelineFileContents {
  std::string moltrace_version;
  std::size_t natoms = 0;
  std::vector<int> atom_type;
  Timeline timeline;
};

// Loads a file written by TimelineFileWriter and rebuilds an equal Timeline.
TimelineFileContents read_timeline_file(const fs::path& path);

} // namespace moltrace::output
