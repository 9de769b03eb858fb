#include "moltrace/encode/CanonicalEncoder.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

#include "moltrace/core/Errors.hpp"
#include "moltrace/util/BinaryIO.hpp"

namespace moltrace {

std::string encode_key(const alg::graph::Molecule& m, const std::vector<int>& atom_type) {
  std::vector<std::uint32_t> types;
  types.reserve(m.atoms.size());
  for (std::size_t a : m.atoms) {
    if (a >= atom_type.size()) throw InvariantViolation("encode_key: atom index outside the type table");
    types.push_back(static_cast<std::uint32_t>(atom_type[a]));
  }
  std::sort(types.begin(), types.end());

  std::vector<std::uint32_t> orders;
  orders.reserve(m.orders.size());
  for (int o : m.orders) orders.push_back(static_cast<std::uint32_t>(o));
  std::sort(orders.begin(), orders.end());

  std::string out;
  out.reserve(4 * (2 + types.size() + orders.size()));
  util::ByteWriter w(out);
  w.write_size32(types.size());
  for (auto t : types) w.write_u32(t);
  w.write_size32(orders.size());
  for (auto o : orders) w.write_u32(o);
  return out;
}

std::string encode_payload(const alg::graph::Molecule& m) {
  if (m.bonds.size() != m.orders.size()) {
    throw InvariantViolation("encode_payload: bond/order lists differ in length");
  }
  std::vector<std::size_t> atoms = m.atoms;
  std::sort(atoms.begin(), atoms.end());

  std::vector<std::tuple<std::size_t, std::size_t, int>> bonds;
  bonds.reserve(m.bonds.size());
  for (std::size_t k = 0; k < m.bonds.size(); ++k) {
    const auto [u, v] = m.bonds[k];
    bonds.emplace_back(std::min(u, v), std::max(u, v), m.orders[k]);
  }
  std::sort(bonds.begin(), bonds.end());

  std::string out;
  out.reserve(4 * (2 + atoms.size() + 3 * bonds.size()));
  util::ByteWriter w(out);
  w.write_size32(atoms.size());
  for (auto a : atoms) w.write_size32(a);
  w.write_size32(bonds.size());
  for (const auto& [a, b, o] : bonds) {
    w.write_size32(a);
    w.write_size32(b);
    w.write_u32(static_cast<std::uint32_t>(o));
  }
  return out;
}

DecodedKey decode_key(std::string_view key) {
  util::ByteReader r(key);
  DecodedKey k;
  const std::uint32_t na = r.read_u32();
  if (r.remaining() / 4 < na) throw std::runtime_error("decode_key: truncated key");
  k.types.reserve(na);
  for (std::uint32_t i = 0; i < na; ++i) k.types.push_back(static_cast<int>(r.read_u32()));
  const std::uint32_t nb = r.read_u32();
  if (r.remaining() / 4 < nb) throw std::runtime_error("decode_key: truncated key");
  k.orders.reserve(nb);
  for (std::uint32_t i = 0; i < nb; ++i) k.orders.push_back(static_cast<int>(r.read_u32()));
  if (!r.at_end()) throw std::runtime_error("decode_key: trailing bytes");
  return k;
}

DecodedPayload decode_payload(std::string_view payload) {
  util::ByteReader r(payload);
  DecodedPayload p;
  const std::uint32_t na = r.read_u32();
  if (r.remaining() / 4 < na) throw std::runtime_error("decode_payload: truncated payload");
  p.atoms.reserve(na);
  for (std::uint32_t i = 0; i < na; ++i) p.atoms.push_back(r.read_u32());
  const std::uint32_t nb = r.read_u32();
  if (r.remaining() / 12 < nb) throw std::runtime_error("decode_payload: truncated payload");
  p.bonds.reserve(nb);
  for (std::uint32_t i = 0; i < nb; ++i) {
    PayloadBond b;
    b.a = r.read_u32();
    b.b = r.read_u32();
    b.order = static_cast<int>(r.read_u32());
    p.bonds.push_back(b);
  }
  if (!r.at_end()) throw std::runtime_error("decode_payload: trailing bytes");
  return p;
}

std::string molecule_formula(const DecodedKey& key, const std::vector<std::string>& atom_names) {
  std::string out;
  std::size_t i = 0;
  while (i < key.types.size()) {
    const int t = key.types[i];
    std::size_t j = i;
    while (j < key.types.size() && key.types[j] == t) ++j;
    if (t >= 0 && static_cast<std::size_t>(t) < atom_names.size()) {
      out += atom_names[static_cast<std::size_t>(t)];
    } else {
      out += "T" + std::to_string(t + 1);
    }
    if (j - i > 1) out += std::to_string(j - i);
    i = j;
  }
  return out;
}

} // namespace moltrace
