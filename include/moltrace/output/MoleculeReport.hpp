#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "moltrace/encode/CanonicalEncoder.hpp"
#include "moltrace/pipeline/Timeline.hpp"
#include "moltrace/util/AtomicFile.hpp"

namespace moltrace::output {
namespace fs = std::filesystem;

// Human-readable catalog, one row per distinct molecule in key order:
//   formula  atoms  bonds  occurrences  first_step  last_step
inline void write_molecule_report(std::ostream& os, const Timeline& tl, const std::vector<std::string>& atom_names) {
  os << "# formula\tatoms\tbonds\toccurrences\tfirst_step\tlast_step\n";
  for (std::size_t slot = 0; slot < tl.molecule_count(); ++slot) {
    const DecodedKey k = decode_key(tl.keys()[slot]);
    const auto& occ = tl.occurrences(slot);
    os << molecule_formula(k, atom_names) << '\t' << k.types.size() << '\t' << k.orders.size() << '\t' << occ.size()
       << '\t' << occ.front().step << '\t' << occ.back().step << '\n';
  }
}

inline void write_molecule_report(const fs::path& out_path, const Timeline& tl, const std::vector<std::string>& atom_names) {
  util::atomic_write_text(out_path, [&](std::ostream& ofs) { write_molecule_report(ofs, tl, atom_names); });
}

} // namespace moltrace::output
