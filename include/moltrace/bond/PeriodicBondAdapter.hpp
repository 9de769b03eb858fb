#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "moltrace/bond/BondOracle.hpp"
#include "moltrace/core/Box.hpp"
#include "moltrace/topology/BondGraph.hpp"

namespace moltrace {

// Ghost atoms added around the real cell for periodic bond perception.
struct PeriodicImages {
  std::vector<Vec3> positions;         // image coordinates
  std::vector<std::size_t> real_index; // parallel: the real atom each image copies
};

// One layer of periodic images: the 7 translations (i,j,k) in {0,1}^3 other
// than (0,0,0), scaled by the cell lengths, in x-major order. An image is
// kept only if some real atom lies strictly closer than `cutoff`.
PeriodicImages build_periodic_images(const std::vector<Vec3>& positions,
                                     const std::array<double, 3>& cell,
                                     double cutoff);

// Turns one coordinate frame into a BondGraph through a BondOracle.
//
// Without periodic boundaries the oracle sees the real atoms only. With
// periodic boundaries it also sees the images from build_periodic_images();
// a bond to an image is remapped to the image's real atom and a bond between
// two images is dropped, so each periodic-seam bond is recorded once.
class PeriodicBondAdapter {
public:
  static constexpr double kImageCutoff = 5.0;

  PeriodicBondAdapter(const BondOracle* oracle, std::vector<std::string> atom_names, bool pbc);

  bool pbc() const { return pbc_; }
  const BondOracle* oracle() const { return oracle_; }
  const std::vector<std::string>& atom_names() const { return atom_names_; }

  // `types` are 0-based atom types indexing atom_names.
  // Throws BondInferenceError (tagged with `step`) if the oracle fails.
  BondGraph infer(std::size_t step,
                  const std::vector<int>& types,
                  const std::vector<Vec3>& positions,
                  const Box& box) const;

private:
  const BondOracle* oracle_ = nullptr;
  std::vector<std::string> atom_names_;
  bool pbc_ = false;
};

} // namespace moltrace
