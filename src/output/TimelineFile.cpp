#include "moltrace/output/TimelineFile.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

#include "moltrace/util/AtomicFile.hpp"
#include "moltrace/util/BinaryIO.hpp"

namespace moltrace::output {

struct TimelineFileWriter::Impl {
  fs::path path;
  std::optional<util::AtomicBinaryFile> file;
  std::optional<util::BinaryWriter> w;
  std::size_t expected = 0;
  std::size_t written = 0;
  bool ended = false;
};

TimelineFileWriter::TimelineFileWriter(fs::path path) : impl_(std::make_unique<Impl>()) {
  impl_->path = std::move(path);
}

TimelineFileWriter::~TimelineFileWriter() = default;

void TimelineFileWriter::begin(const TimelineSummary& summary) {
  if (impl_->file) throw std::runtime_error("TimelineFileWriter: begin() called twice");
  if (summary.atom_type.size() != summary.natoms) {
    throw std::runtime_error("TimelineFileWriter: atom_type size does not match natoms");
  }

  impl_->file.emplace(impl_->path);
  std::ostream& os = impl_->file->stream();
  util::write_magic(os, kTimelineMagic);
  impl_->w.emplace(os);
  auto& w = *impl_->w;
  w.write_u32(kTimelineFormatVersion);
  w.write_string(MOLTRACE_VERSION_STR);

  w.write_u64(static_cast<std::uint64_t>(summary.natoms));
  std::vector<std::int32_t> types(summary.atom_type.begin(), summary.atom_type.end());
  w.write_vec_pod(types);
  w.write_vec_pod(summary.timesteps);
  w.write_u64(static_cast<std::uint64_t>(summary.n_molecules));
  impl_->expected = summary.n_molecules;
}

void TimelineFileWriter::write_molecule(const std::string& key, const std::vector<Occurrence>& occurrences) {
  if (!impl_->w || impl_->ended) throw std::runtime_error("TimelineFileWriter: write_molecule() outside begin()/end()");
  if (impl_->written >= impl_->expected) {
    throw std::runtime_error("TimelineFileWriter: more molecules than announced in begin()");
  }
  auto& w = *impl_->w;
  w.write_blob(key);
  w.write_u64(static_cast<std::uint64_t>(occurrences.size()));
  for (const auto& occ : occurrences) {
    w.write_u64(static_cast<std::uint64_t>(occ.step));
    w.write_blob(occ.payload);
  }
  ++impl_->written;
}

void TimelineFileWriter::end() {
  if (!impl_->file || impl_->ended) throw std::runtime_error("TimelineFileWriter: end() without begin()");
  if (impl_->written != impl_->expected) {
    throw std::runtime_error("TimelineFileWriter: wrote " + std::to_string(impl_->written) + " molecules, expected " +
                             std::to_string(impl_->expected));
  }
  util::write_magic(impl_->file->stream(), kTimelineEndMagic);
  impl_->file->commit();
  impl_->ended = true;
}

TimelineFileContents read_timeline_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("failed to open timeline file: " + path.string());

  util::require_magic(ifs, kTimelineMagic);
  util::BinaryReader r(ifs);
  const std::uint32_t ver = r.read_u32();
  if (ver != kTimelineFormatVersion) throw std::runtime_error("timeline file version not supported");

  TimelineFileContents out;
  out.moltrace_version = r.read_string();
  out.natoms = static_cast<std::size_t>(r.read_u64());
  std::vector<std::int32_t> types;
  r.read_vec_pod(types);
  if (types.size() != out.natoms) throw std::runtime_error("timeline file: atom type table size mismatch");
  out.atom_type.assign(types.begin(), types.end());

  std::vector<std::int64_t> timesteps;
  r.read_vec_pod(timesteps);
  const std::size_t nsteps = timesteps.size();

  // Regroup per step; molecules within a step keep key first-appearance
  // order, which reproduces the same key order on re-insertion.
  std::vector<std::vector<EncodedMolecule>> per_step(nsteps);
  const std::uint64_t nmol = r.read_u64();
  for (std::uint64_t m = 0; m < nmol; ++m) {
    std::string key = r.read_blob();
    const std::uint64_t nocc = r.read_u64();
    std::size_t last_step = 0;
    for (std::uint64_t k = 0; k < nocc; ++k) {
      const std::uint64_t step = r.read_u64();
      if (step >= nsteps) throw std::runtime_error("timeline file: occurrence step out of range");
      if (k > 0 && step < last_step) throw std::runtime_error("timeline file: occurrences out of step order");
      last_step = static_cast<std::size_t>(step);
      per_step[last_step].push_back(EncodedMolecule{key, r.read_blob()});
    }
  }
  util::require_magic(ifs, kTimelineEndMagic);

  for (std::size_t s = 0; s < nsteps; ++s) {
    out.timeline.add_step(s, timesteps[s], std::move(per_step[s]));
  }
  return out;
}

} // namespace moltrace::output
