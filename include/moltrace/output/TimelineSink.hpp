#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "moltrace/core/Trajectory.hpp"
#include "moltrace/pipeline/Timeline.hpp"

namespace moltrace::output {

struct TimelineSummary {
  std::size_t natoms = 0;
  std::vector<int> atom_type;           // 0-based, size natoms
  std::vector<std::int64_t> timesteps;  // step -> simulation timestep
  std::size_t n_molecules = 0;
};

// Destination for a finished Timeline.
//
// Called as begin(), then write_molecule() once per key in first-appearance
// order, then end(). A sink must not publish anything durable before end().
class TimelineSink {
public:
  virtual ~TimelineSink() = default;

  virtual void begin(const TimelineSummary& summary) = 0;
  virtual void write_molecule(const std::string& key, const std::vector<Occurrence>& occurrences) = 0;
  virtual void end() = 0;
};

inline void write_timeline(const Timeline& tl, const TrajectoryHeader& header, TimelineSink& sink) {
  TimelineSummary s;
  s.natoms = header.natoms;
  s.atom_type = header.atom_type;
  s.timesteps = tl.timesteps();
  s.n_molecules = tl.molecule_count();

  sink.begin(s);
  for (std::size_t slot = 0; slot < tl.molecule_count(); ++slot) {
    sink.write_molecule(tl.keys()[slot], tl.occurrences(slot));
  }
  sink.end();
}

} // namespace moltrace::output
