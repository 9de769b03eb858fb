#include "moltrace/bond/OpenBabelOracle.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <openbabel/babelconfig.h>
#include <openbabel/atom.h>
#include <openbabel/bond.h>
#include <openbabel/elements.h>
#include <openbabel/mol.h>
#include <openbabel/obiter.h>

namespace moltrace {

std::string OpenBabelOracle::name() const {
  return std::string("openbabel-") + BABEL_VERSION;
}

std::vector<OracleBond> OpenBabelOracle::infer(const std::vector<std::string>& symbols,
                                               const std::vector<Vec3>& positions) const {
  if (symbols.size() != positions.size()) {
    throw std::runtime_error("OpenBabelOracle: symbols/positions size mismatch");
  }

  std::lock_guard<std::mutex> lock(mu_);

  OpenBabel::OBMol mol;
  mol.BeginModify();
  mol.ReserveAtoms(static_cast<int>(symbols.size()));
  for (std::size_t i = 0; i < symbols.size(); ++i) {
    const unsigned int z = OpenBabel::OBElements::GetAtomicNum(symbols[i].c_str());
    if (z == 0) throw std::runtime_error("OpenBabelOracle: unknown element symbol '" + symbols[i] + "'");
    OpenBabel::OBAtom* a = mol.NewAtom();
    a->SetAtomicNum(static_cast<int>(z));
    a->SetVector(positions[i][0], positions[i][1], positions[i][2]);
  }
  mol.EndModify();

  mol.ConnectTheDots();
  mol.PerceiveBondOrders();

  std::vector<OracleBond> out;
  out.reserve(mol.NumBonds());
  FOR_BONDS_OF_MOL(b, mol) {
    OracleBond ob;
    // Open Babel atom indices are 1-based.
    ob.a = static_cast<std::size_t>(b->GetBeginAtomIdx() - 1);
    ob.b = static_cast<std::size_t>(b->GetEndAtomIdx() - 1);
    if (b->IsAromatic()) {
      ob.label = "ar";
    } else if (b->IsAmide()) {
      ob.label = "am";
    } else {
      ob.label = std::to_string(b->GetBondOrder());
    }
    out.push_back(std::move(ob));
  }
  return out;
}

} // namespace moltrace
