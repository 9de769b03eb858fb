#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "moltrace/bond/OpenBabelOracle.hpp"

using namespace moltrace;

namespace {

bool is_carbon_pair(const OracleBond& b, const std::vector<std::string>& symbols) {
  return symbols.at(b.a) == "C" && symbols.at(b.b) == "C";
}

} // namespace

TEST(OpenBabelOracleTest, EthaneHasSingleBondsOnly) {
  const std::vector<std::string> symbols = {"C", "C", "H", "H", "H", "H", "H", "H"};
  const std::vector<Vec3> pos = {
      {0.0, 0.0, 0.0},       {1.54, 0.0, 0.0},
      {-0.363, 1.028, 0.0},  {-0.363, -0.513, 0.889}, {-0.363, -0.513, -0.889},
      {1.903, -1.028, 0.0},  {1.903, 0.513, -0.889},  {1.903, 0.513, 0.889},
  };
  const OpenBabelOracle oracle;
  const auto bonds = oracle.infer(symbols, pos);

  ASSERT_EQ(bonds.size(), 7u);
  int cc = 0;
  for (const auto& b : bonds) {
    EXPECT_EQ(b.label, "1");
    if (is_carbon_pair(b, symbols)) ++cc;
  }
  EXPECT_EQ(cc, 1);
}

TEST(OpenBabelOracleTest, BenzeneRingIsAromatic) {
  std::vector<std::string> symbols;
  std::vector<Vec3> pos;
  const double pi = std::acos(-1.0);
  for (int k = 0; k < 6; ++k) {
    const double a = k * pi / 3.0;
    symbols.push_back("C");
    pos.push_back(Vec3{1.39 * std::cos(a), 1.39 * std::sin(a), 0.0});
  }
  for (int k = 0; k < 6; ++k) {
    const double a = k * pi / 3.0;
    symbols.push_back("H");
    pos.push_back(Vec3{2.47 * std::cos(a), 2.47 * std::sin(a), 0.0});
  }
  const OpenBabelOracle oracle;
  const auto bonds = oracle.infer(symbols, pos);

  ASSERT_EQ(bonds.size(), 12u);
  int ring = 0;
  for (const auto& b : bonds) {
    if (!is_carbon_pair(b, symbols)) continue;
    EXPECT_EQ(b.label, "ar");
    ++ring;
  }
  EXPECT_EQ(ring, 6);
}

TEST(OpenBabelOracleTest, RejectsBadInput) {
  const OpenBabelOracle oracle;
  EXPECT_EQ(oracle.name().rfind("openbabel-", 0), 0u);
  EXPECT_THROW(oracle.infer({"C"}, {}), std::runtime_error);
  EXPECT_THROW(oracle.infer({"Qq"}, {{0.0, 0.0, 0.0}}), std::runtime_error);
}
