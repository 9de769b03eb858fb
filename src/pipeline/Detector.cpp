#include "moltrace/pipeline/Detector.hpp"

#include <stdexcept>
#include <utility>

#include "moltrace/alg/graph/MoleculeExtractor.hpp"
#include "moltrace/bond/PeriodicBondAdapter.hpp"
#include "moltrace/core/Errors.hpp"
#include "moltrace/encode/CanonicalEncoder.hpp"
#include "moltrace/io/BondFileScanner.hpp"
#include "moltrace/io/DumpFileScanner.hpp"
#include "moltrace/io/LineBlockReader.hpp"
#include "moltrace/io/LineSource.hpp"
#include "moltrace/pipeline/OrderedParallel.hpp"
#include "moltrace/util/Timer.hpp"

namespace moltrace {

namespace {

struct StepMolecules {
  std::size_t step = 0;
  std::int64_t timestep = 0;
  std::vector<EncodedMolecule> molecules;
};

void validate_options(const DetectOptions& opt) {
  if (opt.inputs.empty()) throw std::runtime_error("detect: no input files");
  if (opt.step_interval == 0) throw std::runtime_error("detect: step_interval must be >= 1");
  if (opt.threads < 0) throw std::runtime_error("detect: threads must be >= 0");
  if (opt.format == InputFormat::LammpsDump) {
    if (!opt.oracle) {
      throw std::runtime_error("detect: dump input needs a bonding oracle, but none is available in this build");
    }
    if (opt.atom_names.empty()) throw std::runtime_error("detect: dump input requires atom_names");
  }
  if (opt.format == InputFormat::LammpsBond && opt.pbc) {
    throw std::runtime_error("detect: pbc applies to dump input only (bond files carry explicit bonds)");
  }
}

void check_atom_names(const TrajectoryHeader& h, const DetectOptions& opt) {
  if (opt.atom_names.empty()) return;
  const int mt = h.max_type();
  if (mt >= 0 && static_cast<std::size_t>(mt) >= opt.atom_names.size()) {
    throw ParseError("atom type " + std::to_string(mt + 1) + " has no entry in atom_names (" +
                     std::to_string(opt.atom_names.size()) + " names given)");
  }
}

template <class Scanner>
StepMolecules process_block(const Scanner& scanner, const LineBlock& block, const TrajectoryHeader& header) {
  StepFrame frame = scanner.scan_block(block, header);
  const auto mols = alg::graph::extract_molecules(frame.bonds);
  alg::graph::check_partition(mols, header.natoms);

  StepMolecules out;
  out.step = frame.step;
  out.timestep = frame.timestep;
  out.molecules.reserve(mols.size());
  const std::vector<int>& types = frame.types_or(header);
  for (const auto& m : mols) out.molecules.push_back(encode_molecule(m, types));
  return out;
}

// Shared driver; Scanner provides scan_header(LineSource&) and
// scan_block(const LineBlock&, const TrajectoryHeader&) const.
template <class Scanner>
void run_detect(Scanner& scanner, const DetectOptions& opt, DetectResult& res) {
  res.threads = pipeline::resolve_threads(opt.threads);
  const std::size_t batch = opt.batch_size > 0 ? opt.batch_size : 4 * static_cast<std::size_t>(res.threads);

  {
    StageTimer t(res.profile.header_seconds);
    LineSource src(opt.inputs);
    res.header = scanner.scan_header(src);
    check_atom_names(res.header, opt);
  }

  const TrajectoryHeader& header = res.header;
  const Scanner& worker_view = scanner;
  StageTimer t(res.profile.detect_seconds);

  LineSource src(opt.inputs);
  LineBlockReader reader(src, header.step_lines, opt.step_interval);

  std::vector<LineBlock> blocks;
  while (true) {
    blocks.clear();
    LineBlock b;
    while (blocks.size() < batch && reader.next(b)) blocks.push_back(std::move(b));
    if (blocks.empty()) break;

    auto results = pipeline::parallel_map_ordered(
        blocks,
        [&](const LineBlock& blk) { return process_block(worker_view, blk, header); },
        res.threads);
    ++res.profile.batches;

    for (auto& r : results) {
      res.timeline.add_step(r.step, r.timestep, std::move(r.molecules));
    }
  }
  res.profile.blocks_seen = reader.blocks_seen();
}

} // namespace

TrajectoryHeader scan_trajectory_header(const DetectOptions& opt) {
  validate_options(opt);
  LineSource src(opt.inputs);
  TrajectoryHeader h;
  if (opt.format == InputFormat::LammpsBond) {
    h = BondFileScanner{}.scan_header(src);
  } else {
    PeriodicBondAdapter adapter(opt.oracle, opt.atom_names, opt.pbc);
    DumpFileScanner scanner(adapter);
    h = scanner.scan_header(src);
  }
  check_atom_names(h, opt);
  return h;
}

DetectResult detect_molecules(const DetectOptions& opt) {
  validate_options(opt);
  DetectResult res;
  switch (opt.format) {
    case InputFormat::LammpsBond: {
      BondFileScanner scanner;
      run_detect(scanner, opt, res);
      return res;
    }
    case InputFormat::LammpsDump: {
      PeriodicBondAdapter adapter(opt.oracle, opt.atom_names, opt.pbc);
      DumpFileScanner scanner(adapter);
      run_detect(scanner, opt, res);
      return res;
    }
  }
  throw std::runtime_error("detect: unsupported input format");
}

} // namespace moltrace
