#include "moltrace/pipeline/Timeline.hpp"

#include <utility>

#include "moltrace/core/Errors.hpp"

namespace moltrace {

void Timeline::add_step(std::size_t step, std::int64_t timestep, std::vector<EncodedMolecule>&& molecules) {
  if (step != timesteps_.size()) {
    throw InvariantViolation("Timeline: step " + std::to_string(step) + " merged out of order (expected " +
                             std::to_string(timesteps_.size()) + ")");
  }
  timesteps_.push_back(timestep);

  for (auto& m : molecules) {
    auto it = slot_of_.find(m.key);
    std::size_t slot = 0;
    if (it == slot_of_.end()) {
      slot = keys_.size();
      slot_of_.emplace(m.key, slot);
      keys_.push_back(std::move(m.key));
      occurrences_.emplace_back();
    } else {
      slot = it->second;
    }
    occurrences_[slot].push_back(Occurrence{step, std::move(m.payload)});
    ++n_occurrences_;
  }
}

std::optional<std::size_t> Timeline::find(std::string_view key) const {
  auto it = slot_of_.find(std::string(key));
  if (it == slot_of_.end()) return std::nullopt;
  return it->second;
}

} // namespace moltrace
