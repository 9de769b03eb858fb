#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace moltrace::alg::neighbor {

using Vec3 = std::array<double, 3>;

inline double distance_sq(const Vec3& a, const Vec3& b) {
  const double dx = a[0] - b[0];
  const double dy = a[1] - b[1];
  const double dz = a[2] - b[2];
  return dx * dx + dy * dy + dz * dz;
}

// Uniform grid over a fixed point set, for radius queries.
//
// Cells are stored as (offset, count) ranges into a cell-sorted entry array.
// Queries outside the grid's bounding box clamp to the border cells, which is
// correct because every cell beyond the border would be empty.
class CellList {
public:
  CellList(const std::vector<Vec3>& points, double cell_size) {
    if (!(cell_size > 0.0)) throw std::runtime_error("CellList: cell_size must be > 0");
    build_(points, cell_size);
  }

  // Calls fn(index, distance_sq) for every point with distance < radius.
  template <class F>
  void for_each_within(const Vec3& p, double radius, F&& fn) const {
    if (entries_.empty()) return;
    const double r2 = radius * radius;
    std::array<int, 3> lo{};
    std::array<int, 3> hi{};
    for (int d = 0; d < 3; ++d) {
      lo[d] = cell_coord_(p[d] - radius, d);
      hi[d] = cell_coord_(p[d] + radius, d);
    }
    for (int z = lo[2]; z <= hi[2]; ++z) {
      for (int y = lo[1]; y <= hi[1]; ++y) {
        for (int x = lo[0]; x <= hi[0]; ++x) {
          const Cell& c = cells_[cell_index_(x, y, z)];
          for (std::size_t e = c.offset; e < c.offset + c.count; ++e) {
            const double d2 = distance_sq(p, entries_[e].pos);
            if (d2 < r2) fn(entries_[e].index, d2);
          }
        }
      }
    }
  }

  bool any_within(const Vec3& p, double radius) const {
    bool found = false;
    for_each_within(p, radius, [&](std::size_t, double) { found = true; });
    return found;
  }

private:
  struct Cell {
    std::size_t offset = 0;
    std::size_t count = 0;
  };
  struct Entry {
    Vec3 pos{};
    std::size_t index = 0;
  };

  Vec3 min_{};
  double cell_ext_ = 1.0;
  std::array<int, 3> ncell_{1, 1, 1};
  std::vector<Cell> cells_;
  std::vector<Entry> entries_;

  int cell_coord_(double v, int d) const {
    const double c = std::floor((v - min_[d]) / cell_ext_);
    if (c < 0.0) return 0;
    if (c >= static_cast<double>(ncell_[d] - 1)) return ncell_[d] - 1;
    return static_cast<int>(c);
  }

  std::size_t cell_index_(int x, int y, int z) const {
    return (static_cast<std::size_t>(z) * static_cast<std::size_t>(ncell_[1]) + static_cast<std::size_t>(y)) *
               static_cast<std::size_t>(ncell_[0]) +
           static_cast<std::size_t>(x);
  }

  void build_(const std::vector<Vec3>& points, double cell_size) {
    cell_ext_ = cell_size;
    if (points.empty()) {
      cells_.assign(1, Cell{});
      return;
    }

    Vec3 max = points.front();
    min_ = points.front();
    for (const auto& p : points) {
      for (int d = 0; d < 3; ++d) {
        if (!std::isfinite(p[d])) throw std::runtime_error("CellList: non-finite coordinate");
        min_[d] = std::min(min_[d], p[d]);
        max[d] = std::max(max[d], p[d]);
      }
    }
    // Cap the grid so a sparse system with a huge extent cannot explode memory.
    constexpr double kMaxCellsPerAxis = 1024.0;
    for (int d = 0; d < 3; ++d) {
      const double n = std::floor((max[d] - min_[d]) / cell_ext_) + 1.0;
      ncell_[d] = static_cast<int>(std::clamp(n, 1.0, kMaxCellsPerAxis));
    }
    // Widen cells if an axis was capped.
    for (int d = 0; d < 3; ++d) {
      const double need = (max[d] - min_[d]) / static_cast<double>(ncell_[d]);
      if (need > cell_ext_) cell_ext_ = need * (1.0 + 1e-12);
    }

    cells_.assign(static_cast<std::size_t>(ncell_[0]) * static_cast<std::size_t>(ncell_[1]) *
                      static_cast<std::size_t>(ncell_[2]),
                  Cell{});

    std::vector<std::size_t> cell_of(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
      const auto& p = points[i];
      const std::size_t ci = cell_index_(cell_coord_(p[0], 0), cell_coord_(p[1], 1), cell_coord_(p[2], 2));
      cell_of[i] = ci;
      ++cells_[ci].count;
    }
    for (std::size_t c = 1; c < cells_.size(); ++c) {
      cells_[c].offset = cells_[c - 1].offset + cells_[c - 1].count;
    }

    entries_.resize(points.size());
    std::vector<std::size_t> fill(cells_.size(), 0);
    for (std::size_t i = 0; i < points.size(); ++i) {
      const std::size_t ci = cell_of[i];
      entries_[cells_[ci].offset + fill[ci]++] = Entry{points[i], i};
    }
  }
};

} // namespace moltrace::alg::neighbor
