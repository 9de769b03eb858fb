#include "moltrace/io/BondFileScanner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "moltrace/core/Errors.hpp"
#include "moltrace/util/Parse.hpp"

namespace moltrace {

namespace {

constexpr std::string_view kParticlesTag = "# Number of particles";
constexpr std::string_view kTimestepTag = "# Timestep";

// First purely numeric token of the delimiter line.
std::optional<std::size_t> particle_count(std::string_view line) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  for (auto t : toks) {
    std::size_t n = 0;
    if (parse_int(t, n)) return n;
  }
  return std::nullopt;
}

std::size_t parse_atom_id(std::string_view tok, std::size_t natoms, std::size_t line_no, const char* what) {
  std::int64_t id = 0;
  if (!parse_int(tok, id)) {
    throw ParseError("BondFileScanner: invalid " + std::string(what) + " '" + std::string(tok) + "'", line_no);
  }
  if (id < 1 || static_cast<std::uint64_t>(id) > natoms) {
    throw ParseError("BondFileScanner: " + std::string(what) + " " + std::to_string(id) +
                     " out of range 1.." + std::to_string(natoms), line_no);
  }
  return static_cast<std::size_t>(id - 1);
}

} // namespace

TrajectoryHeader BondFileScanner::scan_header(LineSource& src) const {
  TrajectoryHeader h;
  bool have_n = false;
  std::size_t first_delim = 0;
  std::vector<std::string_view> toks;
  std::string line;

  while (src.next(line)) {
    if (is_blank(line)) continue;
    if (line[0] == '#') {
      if (!starts_with(line, kParticlesTag)) continue;
      if (have_n) {
        h.step_lines = src.line_no() - first_delim;
        return h;
      }
      const auto n = particle_count(line);
      if (!n || *n == 0) {
        throw ParseError("BondFileScanner: missing atom count in '" + line + "'", src.line_no());
      }
      have_n = true;
      first_delim = src.line_no();
      h.natoms = *n;
      h.atom_type.assign(h.natoms, 0);
      continue;
    }

    if (!have_n) {
      throw ParseError("BondFileScanner: atom record before the atom count ('# Number of particles N')", src.line_no());
    }
    split_ws(line, toks);
    if (toks.size() < 3) {
      throw ParseError("BondFileScanner: atom record has fewer than 3 fields", src.line_no());
    }
    const std::size_t idx = parse_atom_id(toks[0], h.natoms, src.line_no(), "atom id");
    int type = 0;
    if (!parse_int(toks[1], type) || type < 1) {
      throw ParseError("BondFileScanner: invalid atom type '" + std::string(toks[1]) + "'", src.line_no());
    }
    h.atom_type[idx] = type - 1;
  }

  if (!have_n) {
    throw ParseError("BondFileScanner: missing atom count ('# Number of particles N' not found)");
  }
  // Single block: it spans the whole input.
  h.step_lines = src.line_no();
  return h;
}

StepFrame BondFileScanner::scan_block(const LineBlock& block, const TrajectoryHeader& header) const {
  const std::size_t N = header.natoms;
  StepFrame f;
  f.step = block.step;
  f.block_index = block.block_index;
  f.bonds.reset(N);

  bool have_timestep = false;
  std::vector<unsigned char> seen(N, 0);
  std::size_t atoms_read = 0;
  std::vector<std::string_view> toks;

  for (std::size_t li = 0; li < block.lines.size(); ++li) {
    const std::string& line = block.lines[li];
    const std::size_t line_no = block.line_no(li);
    if (is_blank(line)) continue;

    if (line[0] == '#') {
      if (starts_with(line, kTimestepTag)) {
        split_ws(line, toks);
        if (!parse_int(toks.back(), f.timestep)) {
          throw ParseError("BondFileScanner: invalid timestep line '" + line + "'", line_no);
        }
        have_timestep = true;
      } else if (starts_with(line, kParticlesTag)) {
        const auto n = particle_count(line);
        if (!n) throw ParseError("BondFileScanner: missing atom count in '" + line + "'", line_no);
        if (*n != N) {
          throw ParseError("BondFileScanner: atom count " + std::to_string(*n) +
                           " does not match header atom count " + std::to_string(N), line_no);
        }
      }
      continue;
    }

    split_ws(line, toks);
    if (toks.size() < 3) {
      throw ParseError("BondFileScanner: atom record has fewer than 3 fields", line_no);
    }
    const std::size_t a = parse_atom_id(toks[0], N, line_no, "atom id");
    if (seen[a]) {
      throw ParseError("BondFileScanner: duplicate atom id " + std::to_string(a + 1), line_no);
    }
    seen[a] = 1;
    ++atoms_read;

    std::size_t nb = 0;
    if (!parse_int(toks[2], nb)) {
      throw ParseError("BondFileScanner: invalid bond count '" + std::string(toks[2]) + "'", line_no);
    }
    // id type nb nbr[nb] mol bo[nb] ...
    if (toks.size() < 4 + 2 * nb) {
      throw ParseError("BondFileScanner: atom " + std::to_string(a + 1) + " declares " + std::to_string(nb) +
                       " bonds but the record is too short", line_no);
    }

    auto& nbrs = f.bonds.adjacency[a];
    nbrs.reserve(nb);
    for (std::size_t k = 0; k < nb; ++k) {
      const std::size_t b = parse_atom_id(toks[3 + k], N, line_no, "neighbor id");
      double bo = 0.0;
      if (!parse_double(toks[4 + nb + k], bo)) {
        throw ParseError("BondFileScanner: invalid bond order '" + std::string(toks[4 + nb + k]) + "'", line_no);
      }
      if (b == a) continue;
      const int order = std::max(1, static_cast<int>(std::nearbyint(bo)));
      nbrs.push_back(BondRef{b, order});
    }
  }

  if (!have_timestep) {
    throw ParseError("BondFileScanner: block " + std::to_string(block.block_index) + " has no '# Timestep' line",
                     block.first_line);
  }

  if (atoms_read != N) {
    throw ParseError("BondFileScanner: block lists " + std::to_string(atoms_read) + " atoms but declares " +
                     std::to_string(N), block.first_line);
  }

  if (auto bad = f.bonds.find_asymmetry()) {
    throw ParseError("BondFileScanner: asymmetric bond record between atoms " + std::to_string(bad->first + 1) +
                     " and " + std::to_string(bad->second + 1) + " at timestep " + std::to_string(f.timestep),
                     block.first_line);
  }
  return f;
}

} // namespace moltrace
