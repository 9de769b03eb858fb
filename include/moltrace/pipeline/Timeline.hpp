#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "moltrace/encode/CanonicalEncoder.hpp"

namespace moltrace {

// One sighting of a molecule: the step it was seen at and its payload.
struct Occurrence {
  std::size_t step = 0;
  std::string payload;

  bool operator==(const Occurrence& o) const { return step == o.step && payload == o.payload; }
};

// Molecule key -> ordered occurrences, plus step -> simulation timestep.
//
// add_step() is the only mutator and must be called by a single owner with
// steps 0, 1, 2, ... in order; keys are kept in first-appearance order.
class Timeline {
public:
  void add_step(std::size_t step, std::int64_t timestep, std::vector<EncodedMolecule>&& molecules);

  std::size_t molecule_count() const { return keys_.size(); }
  std::size_t step_count() const { return timesteps_.size(); }
  std::size_t occurrence_count() const { return n_occurrences_; }

  const std::vector<std::string>& keys() const { return keys_; }
  const std::vector<Occurrence>& occurrences(std::size_t slot) const { return occurrences_.at(slot); }
  const std::vector<std::int64_t>& timesteps() const { return timesteps_; }

  std::optional<std::size_t> find(std::string_view key) const;

  bool operator==(const Timeline& o) const {
    return keys_ == o.keys_ && occurrences_ == o.occurrences_ && timesteps_ == o.timesteps_;
  }

private:
  std::unordered_map<std::string, std::size_t> slot_of_;
  std::vector<std::string> keys_;
  std::vector<std::vector<Occurrence>> occurrences_;
  std::vector<std::int64_t> timesteps_;
  std::size_t n_occurrences_ = 0;
};

} // namespace moltrace
