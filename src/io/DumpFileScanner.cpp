#include "moltrace/io/DumpFileScanner.hpp"

#include <string_view>
#include <utility>

#include "moltrace/core/Errors.hpp"
#include "moltrace/util/Parse.hpp"

namespace moltrace {

namespace {

enum class Section { Timestep, Number, Box, Atoms, Other };

Section section_of(std::string_view line) {
  if (starts_with(line, "ITEM: TIMESTEP")) return Section::Timestep;
  if (starts_with(line, "ITEM: NUMBER OF ATOMS")) return Section::Number;
  if (starts_with(line, "ITEM: BOX")) return Section::Box;
  if (starts_with(line, "ITEM: ATOMS")) return Section::Atoms;
  return Section::Other;
}

inline ParseError die(const std::string& msg, std::size_t line_no) {
  return ParseError("DumpFileScanner: " + msg, line_no);
}

std::size_t parse_count(std::string_view line, std::size_t line_no) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  std::size_t n = 0;
  if (toks.empty() || !parse_int(toks[0], n)) {
    throw die("missing atom count after 'ITEM: NUMBER OF ATOMS'", line_no);
  }
  return n;
}

} // namespace

DumpFileScanner::DumpFileScanner(const PeriodicBondAdapter& adapter)
: adapter_(adapter) {}

DumpFileScanner::ColSpec DumpFileScanner::parse_atoms_header_(const std::string& line, std::size_t line_no,
                                                              std::vector<std::string>& fields) const {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  fields.clear();
  for (std::size_t i = 2; i < toks.size(); ++i) fields.emplace_back(toks[i]);

  ColSpec c;
  c.ncols = fields.size();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const int idx = static_cast<int>(i);
    const std::string& name = fields[i];
    if (name == "id") c.id = idx;
    else if (name == "type") c.type = idx;
    else if (name == "x") c.x = idx;
    else if (name == "y") c.y = idx;
    else if (name == "z") c.z = idx;
  }
  const std::pair<int, const char*> required[] = {
      {c.id, "id"}, {c.type, "type"}, {c.x, "x"}, {c.y, "y"}, {c.z, "z"}};
  for (const auto& [col, name] : required) {
    if (col < 0) throw die(std::string("ATOMS header missing required field '") + name + "'", line_no);
  }
  return c;
}

TrajectoryHeader DumpFileScanner::scan_header(LineSource& src) {
  TrajectoryHeader h;
  Section sec = Section::Other;
  bool have_n = false;
  bool have_cols = false;
  std::size_t first_count_line = 0;
  std::size_t atoms_read = 0;
  std::vector<std::string_view> toks;
  std::string line;

  while (src.next(line)) {
    if (starts_with(line, "ITEM:")) {
      sec = section_of(line);
      if (sec == Section::Atoms && !have_cols) {
        if (!have_n) throw die("ITEM: ATOMS before ITEM: NUMBER OF ATOMS", src.line_no());
        col_ = parse_atoms_header_(line, src.line_no(), fields_);
        have_cols = true;
      }
      continue;
    }
    if (sec == Section::Number) {
      if (have_n) {
        h.step_lines = src.line_no() - first_count_line;
        break;
      }
      h.natoms = parse_count(line, src.line_no());
      if (h.natoms == 0) throw die("atom count must be > 0", src.line_no());
      h.atom_type.assign(h.natoms, 0);
      first_count_line = src.line_no();
      have_n = true;
    } else if (sec == Section::Atoms && have_cols) {
      if (is_blank(line)) continue;
      split_ws(line, toks);
      if (toks.size() < col_.ncols) throw die("atom record has fewer fields than the ATOMS header", src.line_no());
      std::int64_t id = 0;
      int type = 0;
      if (!parse_int(toks[static_cast<std::size_t>(col_.id)], id) || id < 1 ||
          static_cast<std::uint64_t>(id) > h.natoms) {
        throw die("invalid atom id '" + std::string(toks[static_cast<std::size_t>(col_.id)]) + "'", src.line_no());
      }
      if (!parse_int(toks[static_cast<std::size_t>(col_.type)], type) || type < 1) {
        throw die("invalid atom type '" + std::string(toks[static_cast<std::size_t>(col_.type)]) + "'", src.line_no());
      }
      h.atom_type[static_cast<std::size_t>(id - 1)] = type - 1;
      ++atoms_read;
    }
  }

  if (!have_n) throw die("missing atom count ('ITEM: NUMBER OF ATOMS' not found)", 0);
  if (!have_cols) throw die("missing 'ITEM: ATOMS' header", 0);
  if (atoms_read != h.natoms) {
    throw die("first block lists " + std::to_string(atoms_read) + " atoms but declares " + std::to_string(h.natoms), 0);
  }
  // Single block: it spans the whole input.
  if (h.step_lines == 0) h.step_lines = src.line_no();
  return h;
}

DumpFrame DumpFileScanner::read_frame(const LineBlock& block, const TrajectoryHeader& header) const {
  const std::size_t N = header.natoms;
  DumpFrame f;
  f.type.assign(N, 0);
  f.pos.assign(N, Vec3{0.0, 0.0, 0.0});

  Section sec = Section::Other;
  bool have_timestep = false;
  bool have_n = false;
  std::size_t box_row = 0;
  std::size_t atoms_read = 0;
  std::vector<unsigned char> seen(N, 0);
  std::vector<std::string_view> toks;
  std::vector<std::string> fields;

  for (std::size_t li = 0; li < block.lines.size(); ++li) {
    const std::string& line = block.lines[li];
    const std::size_t line_no = block.line_no(li);

    if (starts_with(line, "ITEM:")) {
      sec = section_of(line);
      if (sec == Section::Box) {
        split_ws(line, toks);
        f.box.present = true;
        f.box.triclinic = false;
        for (auto t : toks) {
          if (t == "xy" || t == "xz" || t == "yz") f.box.triclinic = true;
        }
        box_row = 0;
      } else if (sec == Section::Atoms) {
        parse_atoms_header_(line, line_no, fields);
        if (fields != fields_) throw die("ATOMS header changed between blocks (field name/order mismatch)", line_no);
      }
      continue;
    }
    if (is_blank(line)) continue;

    switch (sec) {
      case Section::Timestep: {
        split_ws(line, toks);
        if (toks.empty() || !parse_int(toks[0], f.timestep)) throw die("invalid timestep '" + line + "'", line_no);
        have_timestep = true;
        break;
      }
      case Section::Number: {
        const std::size_t n = parse_count(line, line_no);
        if (n != N) {
          throw die("atom count " + std::to_string(n) + " does not match header atom count " + std::to_string(N), line_no);
        }
        have_n = true;
        break;
      }
      case Section::Box: {
        split_ws(line, toks);
        double lo = 0.0;
        double hi = 0.0;
        if (toks.size() < 2 || !parse_double(toks[0], lo) || !parse_double(toks[1], hi)) {
          throw die("invalid BOX BOUNDS line '" + line + "'", line_no);
        }
        if (box_row == 0) { f.box.xlo = lo; f.box.xhi = hi; }
        else if (box_row == 1) { f.box.ylo = lo; f.box.yhi = hi; }
        else if (box_row == 2) { f.box.zlo = lo; f.box.zhi = hi; }
        else throw die("too many BOX BOUNDS lines", line_no);
        ++box_row;
        break;
      }
      case Section::Atoms: {
        split_ws(line, toks);
        if (toks.size() < col_.ncols) throw die("atom record has fewer fields than the ATOMS header", line_no);
        std::int64_t id = 0;
        int type = 0;
        Vec3 p{};
        if (!parse_int(toks[static_cast<std::size_t>(col_.id)], id) || id < 1 ||
            static_cast<std::uint64_t>(id) > N) {
          throw die("invalid atom id '" + std::string(toks[static_cast<std::size_t>(col_.id)]) + "'", line_no);
        }
        if (!parse_int(toks[static_cast<std::size_t>(col_.type)], type) || type < 1) {
          throw die("invalid atom type '" + std::string(toks[static_cast<std::size_t>(col_.type)]) + "'", line_no);
        }
        if (!parse_double(toks[static_cast<std::size_t>(col_.x)], p[0]) ||
            !parse_double(toks[static_cast<std::size_t>(col_.y)], p[1]) ||
            !parse_double(toks[static_cast<std::size_t>(col_.z)], p[2])) {
          throw die("invalid coordinates for atom " + std::to_string(id), line_no);
        }
        const std::size_t a = static_cast<std::size_t>(id - 1);
        if (seen[a]) throw die("duplicate atom id " + std::to_string(id), line_no);
        seen[a] = 1;
        f.type[a] = type - 1;
        f.pos[a] = p;
        ++atoms_read;
        break;
      }
      case Section::Other:
        break;
    }
  }

  if (!have_timestep) {
    throw die("block " + std::to_string(block.block_index) + " has no ITEM: TIMESTEP", block.first_line);
  }
  if (!have_n) {
    throw die("block " + std::to_string(block.block_index) + " has no ITEM: NUMBER OF ATOMS", block.first_line);
  }
  if (atoms_read != N) {
    throw die("block lists " + std::to_string(atoms_read) + " atoms but declares " + std::to_string(N), block.first_line);
  }
  if (f.box.present && box_row != 3) {
    throw die("BOX BOUNDS must have 3 lines", block.first_line);
  }
  return f;
}

StepFrame DumpFileScanner::scan_block(const LineBlock& block, const TrajectoryHeader& header) const {
  DumpFrame df = read_frame(block, header);
  StepFrame f;
  f.step = block.step;
  f.block_index = block.block_index;
  f.timestep = df.timestep;
  f.bonds = adapter_.infer(block.step, df.type, df.pos, df.box);
  f.atom_type = std::move(df.type);
  return f;
}

} // namespace moltrace
