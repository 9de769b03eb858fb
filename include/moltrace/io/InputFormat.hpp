#pragma once

#include <cctype>
#include <stdexcept>
#include <string>

namespace moltrace {

// Supported trajectory encodings. Selected explicitly by configuration.
//   LammpsBond: fix reaxff/bonds output ("# Number of particles" blocks)
//   LammpsDump: dump atom/custom output ("ITEM: NUMBER OF ATOMS" blocks)
enum class InputFormat {
  LammpsBond,
  LammpsDump,
};

inline InputFormat parse_input_format(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s == "bond" || s == "lammpsbond" || s == "lammps_bond") return InputFormat::LammpsBond;
  if (s == "dump" || s == "lammpsdump" || s == "lammps_dump") return InputFormat::LammpsDump;
  throw std::runtime_error("unknown input format: '" + s + "' (expected 'bond' or 'dump')");
}

inline std::string input_format_name(InputFormat f) {
  switch (f) {
    case InputFormat::LammpsBond: return "bond";
    case InputFormat::LammpsDump: return "dump";
  }
  return "bond";
}

} // namespace moltrace
