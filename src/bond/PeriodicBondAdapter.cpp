#include "moltrace/bond/PeriodicBondAdapter.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "moltrace/alg/neighbor/CellList.hpp"
#include "moltrace/core/Errors.hpp"

namespace moltrace {

int bond_order_from_label(std::string_view label) {
  if (label == "ar") return 12;
  if (label == "am") return 1;
  int order = 0;
  const char* b = label.data();
  const char* e = label.data() + label.size();
  auto res = std::from_chars(b, e, order);
  if (res.ec != std::errc{} || res.ptr != e || order < 1) {
    throw std::runtime_error("unsupported bond type label '" + std::string(label) + "'");
  }
  return order;
}

PeriodicImages build_periodic_images(const std::vector<Vec3>& positions,
                                     const std::array<double, 3>& cell,
                                     double cutoff) {
  PeriodicImages out;
  const std::size_t n = positions.size();
  if (n == 0) return out;

  const alg::neighbor::CellList grid(positions, cutoff);

  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2; ++j) {
      for (int k = 0; k < 2; ++k) {
        if (i == 0 && j == 0 && k == 0) continue;
        const Vec3 shift{i * cell[0], j * cell[1], k * cell[2]};
        for (std::size_t a = 0; a < n; ++a) {
          const Vec3 p{positions[a][0] + shift[0], positions[a][1] + shift[1], positions[a][2] + shift[2]};
          if (!grid.any_within(p, cutoff)) continue;
          out.positions.push_back(p);
          out.real_index.push_back(a);
        }
      }
    }
  }
  return out;
}

PeriodicBondAdapter::PeriodicBondAdapter(const BondOracle* oracle, std::vector<std::string> atom_names, bool pbc)
: oracle_(oracle), atom_names_(std::move(atom_names)), pbc_(pbc) {
  if (!oracle_) {
    throw std::runtime_error("PeriodicBondAdapter: no bonding oracle available for coordinate input");
  }
}

BondGraph PeriodicBondAdapter::infer(std::size_t step,
                                     const std::vector<int>& types,
                                     const std::vector<Vec3>& positions,
                                     const Box& box) const {
  const std::size_t n = positions.size();
  if (types.size() != n) {
    throw InvariantViolation("PeriodicBondAdapter: types/positions length mismatch");
  }

  std::vector<std::string> symbols;
  std::vector<Vec3> all = positions;
  symbols.reserve(n);
  for (int t : types) {
    if (t < 0 || static_cast<std::size_t>(t) >= atom_names_.size()) {
      throw ParseError("atom type " + std::to_string(t + 1) + " has no entry in atom_names");
    }
    symbols.push_back(atom_names_[static_cast<std::size_t>(t)]);
  }

  PeriodicImages images;
  if (pbc_) {
    if (!box.present) {
      throw ParseError("periodic boundaries requested but the frame has no BOX BOUNDS");
    }
    if (box.triclinic) {
      throw ParseError("periodic boundaries are only supported for orthorhombic boxes");
    }
    box.validate();
    images = build_periodic_images(positions, box.lengths(), kImageCutoff);
    all.insert(all.end(), images.positions.begin(), images.positions.end());
    for (std::size_t real : images.real_index) symbols.push_back(symbols[real]);
  }

  std::vector<OracleBond> raw;
  try {
    raw = oracle_->infer(symbols, all);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw BondInferenceError(oracle_->name() + ": " + e.what(), step);
  }

  BondGraph g(n);
  for (const auto& rb : raw) {
    if (rb.a >= all.size() || rb.b >= all.size()) {
      throw BondInferenceError(oracle_->name() + ": bond endpoint out of range", step);
    }
    std::size_t a = rb.a;
    std::size_t b = rb.b;
    if (a >= n && b >= n) continue; // image-image duplicate across the seam
    if (a >= n) a = images.real_index[a - n];
    if (b >= n) b = images.real_index[b - n];
    if (a == b) continue; // atom bonded to its own image

    int order = 0;
    try {
      order = bond_order_from_label(rb.label);
    } catch (const std::exception& e) {
      throw BondInferenceError(oracle_->name() + ": " + e.what(), step);
    }
    g.add_bond(a, b, order);
  }
  return g;
}

} // namespace moltrace
