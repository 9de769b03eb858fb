#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "moltrace/bond/BondOracle.hpp"

namespace moltrace {

// Bond perception with Open Babel: ConnectTheDots + PerceiveBondOrders,
// labelled the way the mol2 writer does ("ar", "am", integer order).
//
// Open Babel's perception code touches process-wide state, so calls are
// serialized internally.
class OpenBabelOracle final : public BondOracle {
public:
  std::string name() const override;

  std::vector<OracleBond> infer(const std::vector<std::string>& symbols,
                                const std::vector<Vec3>& positions) const override;

private:
  mutable std::mutex mu_;
};

} // namespace moltrace
