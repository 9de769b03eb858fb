#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "moltrace/core/Errors.hpp"
#include "moltrace/io/BondFileScanner.hpp"
#include "moltrace/io/LineBlockReader.hpp"
#include "moltrace/io/LineSource.hpp"
#include "TestSupport.hpp"

using namespace moltrace;
using test::BondRecord;
using test::bond_block;

class BondFileScannerTest : public ::testing::Test {
protected:
  test::TempDir dir;
  BondFileScanner scanner;

  std::vector<StepFrame> scan_all(const std::string& text, std::size_t interval = 1) {
    const auto p = dir.write("traj.bonds", text);
    LineSource hsrc({p});
    const TrajectoryHeader h = scanner.scan_header(hsrc);

    LineSource src({p});
    LineBlockReader reader(src, h.step_lines, interval);
    std::vector<StepFrame> out;
    LineBlock blk;
    while (reader.next(blk)) out.push_back(scanner.scan_block(blk, h));
    return out;
  }
};

TEST_F(BondFileScannerTest, HeaderReadsCountTypesAndBlockLength) {
  const std::string text =
      bond_block(0, 3, {{1, 2, {2}, {"1.0"}}, {2, 1, {1, 3}, {"1.0", "0.9"}}, {3, 3, {2}, {"0.9"}}}) +
      bond_block(10, 3, {{1, 2, {}, {}}, {2, 1, {}, {}}, {3, 3, {}, {}}});
  const auto p = dir.write("traj.bonds", text);
  LineSource src({p});
  const TrajectoryHeader h = scanner.scan_header(src);

  EXPECT_EQ(h.natoms, 3u);
  EXPECT_EQ(h.atom_type, (std::vector<int>{1, 0, 2}));
  EXPECT_EQ(h.step_lines, 3u + 8u);
  EXPECT_EQ(h.max_type(), 2);
}

TEST_F(BondFileScannerTest, SingleBlockSpansWholeFile) {
  const std::string text = bond_block(0, 2, {{1, 1, {2}, {"1.4"}}, {2, 2, {1}, {"1.4"}}});
  const auto p = dir.write("traj.bonds", text);
  LineSource src({p});
  EXPECT_EQ(scanner.scan_header(src).step_lines, 10u);
}

TEST_F(BondFileScannerTest, FractionalOrderRoundsToNearestInteger) {
  const auto frames = scan_all(bond_block(0, 2, {{1, 1, {2}, {"1.4"}}, {2, 2, {1}, {"1.4"}}}));
  ASSERT_EQ(frames.size(), 1u);
  const BondGraph& g = frames[0].bonds;
  ASSERT_EQ(g.degree(0), 1u);
  EXPECT_EQ(g.adjacency[0][0].neighbor, 1u);
  EXPECT_EQ(g.adjacency[0][0].order, 1);
  EXPECT_EQ(g.adjacency[1][0].order, 1);
}

TEST_F(BondFileScannerTest, WeakBondsClampToOneAndHalvesRoundToEven) {
  const auto frames = scan_all(bond_block(
      0, 4,
      {{1, 1, {2}, {"0.2"}}, {2, 1, {1, 3}, {"0.2", "2.5"}}, {3, 1, {2, 4}, {"2.5", "1.5"}}, {4, 1, {3}, {"1.5"}}}));
  const BondGraph& g = frames.at(0).bonds;
  EXPECT_EQ(g.adjacency[0][0].order, 1);
  EXPECT_EQ(g.adjacency[1][1].order, 2);
  EXPECT_EQ(g.adjacency[2][1].order, 2);
}

TEST_F(BondFileScannerTest, SelfBondIsDropped) {
  const auto frames = scan_all(bond_block(0, 2, {{1, 1, {1, 2}, {"1.0", "1.0"}}, {2, 2, {1}, {"1.0"}}}));
  const BondGraph& g = frames.at(0).bonds;
  ASSERT_EQ(g.degree(0), 1u);
  EXPECT_EQ(g.adjacency[0][0].neighbor, 1u);
  EXPECT_EQ(g.bond_count(), 1u);
}

TEST_F(BondFileScannerTest, TimestepsAndStepsFollowTheFile) {
  std::string text;
  for (long ts : {0L, 100L, 200L}) text += bond_block(ts, 2, {{1, 1, {}, {}}, {2, 1, {}, {}}});
  const auto frames = scan_all(text);
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[2].timestep, 200);
  EXPECT_EQ(frames[2].step, 2u);
  EXPECT_EQ(frames[1].bonds.bond_count(), 0u);
}

TEST_F(BondFileScannerTest, MissingAtomCountFailsHeaderScan) {
  std::string text = bond_block(0, 2, {{1, 1, {}, {}}, {2, 1, {}, {}}});
  const auto pos = text.find("# Number of particles 2");
  text.replace(pos, std::string("# Number of particles 2").size(), "# Number of particles");
  const auto p = dir.write("bad.bonds", text);
  LineSource src({p});
  try {
    scanner.scan_header(src);
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.line(), 3u);
  }
}

TEST_F(BondFileScannerTest, AtomCountMismatchIsReported) {
  const std::string text = bond_block(0, 2, {{1, 1, {}, {}}, {2, 1, {}, {}}}) +
                           bond_block(5, 3, {{1, 1, {}, {}}, {2, 1, {}, {}}});
  EXPECT_THROW(scan_all(text), ParseError);
}

TEST_F(BondFileScannerTest, MissingAtomRecordIsReported) {
  // Second block declares 2 atoms but lists only one; padding keeps the block length.
  const std::string second = bond_block(5, 2, {{1, 1, {}, {}}}) + "#\n";
  const std::string text = bond_block(0, 2, {{1, 1, {}, {}}, {2, 1, {}, {}}}) + second;
  EXPECT_THROW(scan_all(text), ParseError);
}

TEST_F(BondFileScannerTest, NeighborOutOfRangeIsReported) {
  EXPECT_THROW(scan_all(bond_block(0, 2, {{1, 1, {7}, {"1.0"}}, {2, 1, {}, {}}})), ParseError);
}

TEST_F(BondFileScannerTest, TruncatedRecordIsReported) {
  std::string text = bond_block(0, 2, {{1, 1, {2}, {"1.0"}}, {2, 1, {1}, {"1.0"}}});
  const auto pos = text.find(" 2 1 1 1 0 1.0");
  ASSERT_NE(pos, std::string::npos);
  text.replace(pos, std::string(" 2 1 1 1 0 1.0 3.999 0.000 0.000").size(), " 2 1 1 1");
  EXPECT_THROW(scan_all(text), ParseError);
}

TEST_F(BondFileScannerTest, AsymmetricRecordIsReported) {
  EXPECT_THROW(scan_all(bond_block(0, 2, {{1, 1, {2}, {"1.0"}}, {2, 1, {}, {}}})), ParseError);
}

TEST_F(BondFileScannerTest, NonFiniteOrderIsReported) {
  for (const char* bad : {"nan", "inf", "-inf"}) {
    EXPECT_THROW(scan_all(bond_block(0, 2, {{1, 1, {2}, {bad}}, {2, 1, {1}, {bad}}})), ParseError) << bad;
  }
}

TEST_F(BondFileScannerTest, NonNumericOrderIsReported) {
  EXPECT_THROW(scan_all(bond_block(0, 2, {{1, 1, {2}, {"abc"}}, {2, 1, {1}, {"abc"}}})), ParseError);
}
