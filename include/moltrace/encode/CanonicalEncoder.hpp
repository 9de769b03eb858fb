#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "moltrace/alg/graph/MoleculeExtractor.hpp"

namespace moltrace {

// Byte encodings of a molecule. All integers are little-endian u32.
//
// key:     natoms, atom types sorted ascending, nbonds, bond orders sorted ascending
// payload: natoms, atom indices sorted ascending, nbonds, (a, b, order) with a < b,
//          triples sorted lexicographically
//
// The key is the identity of a molecule across timesteps. It captures atom
// composition and the bond-order multiset only, not which atoms the bonds
// join: two isomers with equal composition and equal bond orders share a key.
// The payload keeps the concrete atoms and bonds of one occurrence.
struct EncodedMolecule {
  std::string key;
  std::string payload;
};

std::string encode_key(const alg::graph::Molecule& m, const std::vector<int>& atom_type);
std::string encode_payload(const alg::graph::Molecule& m);

inline EncodedMolecule encode_molecule(const alg::graph::Molecule& m, const std::vector<int>& atom_type) {
  return EncodedMolecule{encode_key(m, atom_type), encode_payload(m)};
}

struct DecodedKey {
  std::vector<int> types;
  std::vector<int> orders;
};

struct PayloadBond {
  std::size_t a = 0;
  std::size_t b = 0;
  int order = 0;

  bool operator==(const PayloadBond& o) const { return a == o.a && b == o.b && order == o.order; }
};

struct DecodedPayload {
  std::vector<std::size_t> atoms;
  std::vector<PayloadBond> bonds;
};

// Both throw std::runtime_error on truncated or trailing bytes.
DecodedKey decode_key(std::string_view key);
DecodedPayload decode_payload(std::string_view payload);

// Composition string in atom-type order, e.g. "C2H6O".
// Types without a name are written as "T<type+1>".
std::string molecule_formula(const DecodedKey& key, const std::vector<std::string>& atom_names);

} // namespace moltrace
