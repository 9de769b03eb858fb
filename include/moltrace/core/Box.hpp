#pragma once

#include <array>
#include <stdexcept>

namespace moltrace {

// Simulation cell as written in a dump's "ITEM: BOX BOUNDS" section.
// Only orthorhombic cells can be used for periodic bond inference.
struct Box {
  double xlo = 0.0, xhi = 0.0;
  double ylo = 0.0, yhi = 0.0;
  double zlo = 0.0, zhi = 0.0;
  bool triclinic = false;
  bool present = false;

  double lx() const { return xhi - xlo; }
  double ly() const { return yhi - ylo; }
  double lz() const { return zhi - zlo; }

  std::array<double, 3> lengths() const { return {lx(), ly(), lz()}; }

  void validate() const {
    if (!(lx() > 0.0) || !(ly() > 0.0) || !(lz() > 0.0)) {
      throw std::runtime_error("Box: invalid box lengths (must be > 0)");
    }
  }
};

} // namespace moltrace
