#pragma once

#include <filesystem>

#include "moltrace/bond/BondOracle.hpp"
#include "moltrace/config/IniConfig.hpp"

namespace moltrace {

// main() only handles CLI + config, then calls Runner(cfg).run().
// Runner owns the pipeline: header scan -> parallel detection -> timeline,
// report and results.json.
class Runner {
public:
  // `oracle` may be null; dump input then fails during validation.
  // threads_override > 0 replaces [run] threads.
  Runner(const IniConfig& cfg, const BondOracle* oracle, int threads_override = 0);

  // Execute the run. Returns 0 on success.
  int run();

  // Validate config, inputs and the trajectory header, then stop without
  // processing timesteps or writing outputs (CLI: --validate-config).
  int validate_config();

private:
  const IniConfig& cfg_;
  const BondOracle* oracle_ = nullptr;
  int threads_override_ = 0;

  int run_impl_(bool validate_only);
};

} // namespace moltrace
