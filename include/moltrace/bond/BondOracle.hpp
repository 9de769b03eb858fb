#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace moltrace {

using Vec3 = std::array<double, 3>;

// Bond reported by an oracle, indices into the atom arrays it was given.
// `label` follows the Tripos mol2 bond type vocabulary: "1", "2", "3",
// "ar" (aromatic), "am" (amide).
struct OracleBond {
  std::size_t a = 0;
  std::size_t b = 0;
  std::string label;
};

// External bond perception from element symbols and Cartesian positions.
//
// infer() is called concurrently from worker threads; implementations must be
// safe for concurrent const calls.
class BondOracle {
public:
  virtual ~BondOracle() = default;

  virtual std::string name() const = 0;

  virtual std::vector<OracleBond> infer(const std::vector<std::string>& symbols,
                                        const std::vector<Vec3>& positions) const = 0;
};

// Maps an oracle bond label to the integer order stored in the bond graph:
// aromatic -> 12, amide -> 1, otherwise the decimal order itself.
// Throws std::runtime_error for anything else.
int bond_order_from_label(std::string_view label);

} // namespace moltrace
