#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "moltrace/bond/BondOracle.hpp"
#include "moltrace/core/Trajectory.hpp"
#include "moltrace/io/InputFormat.hpp"
#include "moltrace/pipeline/Timeline.hpp"

namespace moltrace {

struct DetectOptions {
  InputFormat format = InputFormat::LammpsBond;
  std::vector<std::filesystem::path> inputs; // read back to back
  std::vector<std::string> atom_names;       // atom_names[type] = element symbol
  std::size_t step_interval = 1;             // keep every Kth timestep block
  bool pbc = false;                          // periodic images (dump input)
  int threads = 0;                           // 0 = hardware concurrency
  std::size_t batch_size = 0;                // blocks per parallel batch; 0 = 4 * threads
  const BondOracle* oracle = nullptr;        // required for dump input
};

struct DetectProfile {
  double header_seconds = 0.0;
  double detect_seconds = 0.0;
  std::size_t batches = 0;
  std::size_t blocks_seen = 0;
};

struct DetectResult {
  TrajectoryHeader header;
  Timeline timeline;
  int threads = 1;
  DetectProfile profile;
};

// Validates options and runs the one-time header scan only.
TrajectoryHeader scan_trajectory_header(const DetectOptions& opt);

// Full run: header scan, parallel per-step molecule detection and the
// in-order merge into a Timeline. Any error aborts the run.
DetectResult detect_molecules(const DetectOptions& opt);

} // namespace moltrace
