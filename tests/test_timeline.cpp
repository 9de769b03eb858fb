#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "moltrace/alg/graph/MoleculeExtractor.hpp"
#include "moltrace/core/Errors.hpp"
#include "moltrace/encode/CanonicalEncoder.hpp"
#include "moltrace/output/MoleculeReport.hpp"
#include "moltrace/output/ResultsIndex.hpp"
#include "moltrace/output/TimelineFile.hpp"
#include "moltrace/output/TimelineSink.hpp"
#include "moltrace/pipeline/Timeline.hpp"
#include "TestSupport.hpp"

using namespace moltrace;
namespace fs = std::filesystem;

namespace {

std::string read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

alg::graph::Molecule make_molecule(std::vector<std::size_t> atoms, std::vector<alg::graph::Edge> bonds,
                                   std::vector<int> orders) {
  alg::graph::Molecule m;
  m.atoms = std::move(atoms);
  m.bonds = std::move(bonds);
  m.orders = std::move(orders);
  return m;
}

// Records every call, for checking the sink protocol.
class RecordingSink final : public output::TimelineSink {
public:
  void begin(const output::TimelineSummary& s) override {
    summary = s;
    calls.push_back("begin");
  }
  void write_molecule(const std::string& key, const std::vector<Occurrence>& occ) override {
    keys.push_back(key);
    counts.push_back(occ.size());
    calls.push_back("molecule");
  }
  void end() override { calls.push_back("end"); }

  output::TimelineSummary summary;
  std::vector<std::string> calls;
  std::vector<std::string> keys;
  std::vector<std::size_t> counts;
};

} // namespace

class TimelineTest : public ::testing::Test {
protected:
  // 0=C, 1=H, 2=O
  std::vector<int> types{0, 1, 1, 2};
  std::vector<std::string> names{"C", "H", "O"};
  test::TempDir dir;

  EncodedMolecule enc(const alg::graph::Molecule& m) const { return encode_molecule(m, types); }

  // Step 0: CH2 + O. Step 1: CH + H + O. Step 2: CH2 + O.
  Timeline sample() const {
    Timeline tl;
    tl.add_step(0, 100, {enc(make_molecule({0, 1, 2}, {{0, 1}, {0, 2}}, {1, 1})), enc(make_molecule({3}, {}, {}))});
    tl.add_step(1, 200,
                {enc(make_molecule({0, 1}, {{0, 1}}, {1})), enc(make_molecule({2}, {}, {})),
                 enc(make_molecule({3}, {}, {}))});
    tl.add_step(2, 300, {enc(make_molecule({0, 2, 1}, {{0, 2}, {0, 1}}, {1, 1})), enc(make_molecule({3}, {}, {}))});
    return tl;
  }
};

TEST_F(TimelineTest, KeysKeepFirstAppearanceOrder) {
  const Timeline tl = sample();
  ASSERT_EQ(tl.molecule_count(), 4u);
  EXPECT_EQ(molecule_formula(decode_key(tl.keys()[0]), names), "CH2");
  EXPECT_EQ(molecule_formula(decode_key(tl.keys()[1]), names), "O");
  EXPECT_EQ(molecule_formula(decode_key(tl.keys()[2]), names), "CH");
  EXPECT_EQ(molecule_formula(decode_key(tl.keys()[3]), names), "H");

  const auto& ch2 = tl.occurrences(0);
  ASSERT_EQ(ch2.size(), 2u);
  EXPECT_EQ(ch2[0].step, 0u);
  EXPECT_EQ(ch2[1].step, 2u);
  EXPECT_EQ(ch2[0].payload, ch2[1].payload);
  EXPECT_EQ(tl.occurrence_count(), 7u);
  EXPECT_EQ(tl.timesteps(), (std::vector<std::int64_t>{100, 200, 300}));
}

TEST_F(TimelineTest, FindLocatesKeys) {
  const Timeline tl = sample();
  EXPECT_EQ(tl.find(tl.keys()[2]), std::optional<std::size_t>(2));
  EXPECT_FALSE(tl.find("not a key").has_value());
}

TEST_F(TimelineTest, StepsMustArriveInOrder) {
  Timeline tl;
  tl.add_step(0, 0, {});
  EXPECT_THROW(tl.add_step(2, 20, {}), InvariantViolation);
  EXPECT_THROW(tl.add_step(0, 0, {}), InvariantViolation);
  EXPECT_NO_THROW(tl.add_step(1, 10, {}));
}

TEST_F(TimelineTest, SinkSeesEveryKeyBetweenBeginAndEnd) {
  const Timeline tl = sample();
  TrajectoryHeader h;
  h.natoms = 4;
  h.atom_type = types;
  RecordingSink sink;
  output::write_timeline(tl, h, sink);

  EXPECT_EQ(sink.calls, (std::vector<std::string>{"begin", "molecule", "molecule", "molecule", "molecule", "end"}));
  EXPECT_EQ(sink.keys, tl.keys());
  EXPECT_EQ(sink.counts, (std::vector<std::size_t>{2, 3, 1, 1}));
  EXPECT_EQ(sink.summary.n_molecules, 4u);
  EXPECT_EQ(sink.summary.timesteps.size(), 3u);
}

TEST_F(TimelineTest, FileRoundTripRebuildsTheSameTimeline) {
  const Timeline tl = sample();
  TrajectoryHeader h;
  h.natoms = 4;
  h.atom_type = types;
  const fs::path p = dir.path() / "molecules.bin";
  {
    output::TimelineFileWriter w(p);
    output::write_timeline(tl, h, w);
  }
  ASSERT_TRUE(fs::exists(p));
  EXPECT_FALSE(fs::exists(dir.path() / "molecules.bin.tmp"));

  const output::TimelineFileContents back = output::read_timeline_file(p);
  EXPECT_EQ(back.natoms, 4u);
  EXPECT_EQ(back.atom_type, types);
  EXPECT_TRUE(back.timeline == tl);
}

TEST_F(TimelineTest, UnfinishedFileLeavesNothingBehind) {
  const fs::path p = dir.path() / "molecules.bin";
  {
    output::TimelineFileWriter w(p);
    output::TimelineSummary s;
    s.natoms = 4;
    s.atom_type = types;
    s.n_molecules = 2;
    w.begin(s);
    w.write_molecule("k", {});
    // destroyed without end(), as when a later step fails
  }
  EXPECT_FALSE(fs::exists(p));
  EXPECT_FALSE(fs::exists(dir.path() / "molecules.bin.tmp"));
}

TEST_F(TimelineTest, EndRejectsMissingMolecules) {
  output::TimelineFileWriter w(dir.path() / "molecules.bin");
  output::TimelineSummary s;
  s.n_molecules = 1;
  w.begin(s);
  EXPECT_THROW(w.end(), std::runtime_error);
}

TEST_F(TimelineTest, ReaderRejectsForeignFiles) {
  const auto junk = dir.write("junk.bin", "not a timeline at all");
  EXPECT_THROW(output::read_timeline_file(junk), std::runtime_error);
}

TEST_F(TimelineTest, ReportListsOneRowPerMolecule) {
  const Timeline tl = sample();
  std::ostringstream os;
  output::write_molecule_report(os, tl, names);
  const std::string expected =
      "# formula\tatoms\tbonds\toccurrences\tfirst_step\tlast_step\n"
      "CH2\t3\t2\t2\t0\t2\n"
      "O\t1\t0\t3\t0\t2\n"
      "CH\t2\t1\t1\t1\t1\n"
      "H\t1\t0\t1\t1\t1\n";
  EXPECT_EQ(os.str(), expected);
}

TEST_F(TimelineTest, ResultsJsonIsWrittenAtomically) {
  output::ResultsIndex idx;
  idx.moltrace_version = "test";
  idx.format = "bond";
  idx.atom_names = {"C", "H\"x"};
  idx.molecules = 4;
  const fs::path p = dir.path() / "results.json";
  output::write_results_json(p, idx);

  const std::string text = read_all(p);
  EXPECT_NE(text.find("\"schema_version\": \"1.0\""), std::string::npos);
  EXPECT_NE(text.find("\"atom_names\": [\"C\", \"H\\\"x\"]"), std::string::npos);
  EXPECT_NE(text.find("\"molecules\": 4"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir.path() / "results.json.tmp"));
}
