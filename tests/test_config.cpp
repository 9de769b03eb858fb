#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "moltrace/app/Runner.hpp"
#include "moltrace/config/IniConfig.hpp"
#include "moltrace/io/InputFormat.hpp"
#include "moltrace/output/TimelineFile.hpp"
#include "TestSupport.hpp"

using namespace moltrace;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  test::TempDir dir;

  std::string trajectory() const {
    return test::bond_block(0, 2, {{1, 1, {2}, {"1.02"}}, {2, 2, {1}, {"1.02"}}}) +
           test::bond_block(10, 2, {{1, 1, {}, {}}, {2, 2, {}, {}}});
  }
};

TEST_F(ConfigTest, ParsesSectionsCommentsAndLists) {
  const auto p = dir.write("run.ini",
                           "# comment\n"
                           "[input]\n"
                           "files = a.bonds, sub/b.bonds   ; two files\n"
                           "atom_names = \"C, H, O\"\n"
                           "step_interval = 3\n"
                           "pbc = yes\n"
                           "[run]\n"
                           "threads = -1\n");
  const IniConfig cfg(p);
  EXPECT_EQ(cfg.get_list("input", "files"), (std::vector<std::string>{"a.bonds", "sub/b.bonds"}));
  EXPECT_EQ(cfg.get_list("input", "atom_names"), (std::vector<std::string>{"C", "H", "O"}));
  EXPECT_EQ(cfg.get_size("input", "step_interval"), 3u);
  EXPECT_TRUE(cfg.get_bool("input", "pbc"));
  EXPECT_EQ(cfg.get_string("output", "dir", std::optional<std::string>("./out")), "./out");
  EXPECT_THROW(cfg.get_size("run", "threads"), std::runtime_error);
  EXPECT_THROW(cfg.get_string("input", "format"), std::runtime_error);
  EXPECT_EQ(cfg.resolve_path("sub/b.bonds"), (dir.path() / "sub/b.bonds").lexically_normal());
}

TEST_F(ConfigTest, RejectsMalformedLines) {
  EXPECT_THROW(IniConfig(dir.write("a.ini", "key = outside\n")), std::runtime_error);
  EXPECT_THROW(IniConfig(dir.write("b.ini", "[input]\njust words\n")), std::runtime_error);
  EXPECT_THROW(IniConfig(dir.path() / "missing.ini"), std::runtime_error);
}

TEST_F(ConfigTest, InputFormatNames) {
  EXPECT_EQ(parse_input_format("bond"), InputFormat::LammpsBond);
  EXPECT_EQ(parse_input_format("dump"), InputFormat::LammpsDump);
  EXPECT_THROW(parse_input_format("xyz"), std::runtime_error);
}

TEST_F(ConfigTest, RunWritesTimelineReportAndResults) {
  dir.write("traj.bonds", trajectory());
  const auto p = dir.write("run.ini",
                           "[input]\nfiles = traj.bonds\nformat = bond\natom_names = C, H\n"
                           "[run]\nthreads = 2\n"
                           "[output]\ndir = out\nprofile = false\n");
  const IniConfig cfg(p);
  Runner runner(cfg, nullptr);
  EXPECT_EQ(runner.run(), 0);

  const fs::path out = dir.path() / "out";
  EXPECT_TRUE(fs::exists(out / "molecules.tsv"));
  EXPECT_TRUE(fs::exists(out / "results.json"));
  const auto back = output::read_timeline_file(out / "molecules.bin");
  EXPECT_EQ(back.natoms, 2u);
  EXPECT_EQ(back.timeline.step_count(), 2u);
  EXPECT_EQ(back.timeline.molecule_count(), 3u);
}

TEST_F(ConfigTest, ValidateOnlyWritesNothing) {
  dir.write("traj.bonds", trajectory());
  const auto p = dir.write("run.ini", "[input]\nfiles = traj.bonds\n[output]\ndir = out\n");
  const IniConfig cfg(p);
  Runner runner(cfg, nullptr);
  EXPECT_EQ(runner.validate_config(), 0);
  EXPECT_FALSE(fs::exists(dir.path() / "out"));
}

TEST_F(ConfigTest, FailedRunLeavesNoOutputs) {
  dir.write("traj.bonds", trajectory() + test::bond_block(20, 2, {{1, 1, {2}, {"1.0"}}, {2, 2, {}, {}}}));
  const auto p = dir.write("run.ini", "[input]\nfiles = traj.bonds\n[output]\ndir = out\n");
  const IniConfig cfg(p);
  Runner runner(cfg, nullptr);
  EXPECT_THROW(runner.run(), std::runtime_error);
  EXPECT_FALSE(fs::exists(dir.path() / "out" / "molecules.bin"));
  EXPECT_FALSE(fs::exists(dir.path() / "out" / "results.json"));
}

TEST_F(ConfigTest, FailedResultsWriteLeavesNoOutputs) {
  dir.write("traj.bonds", trajectory());
  // The results directory does not exist, so the last write fails.
  const auto p = dir.write("run.ini",
                           "[input]\nfiles = traj.bonds\natom_names = C, H\n"
                           "[output]\ndir = out\nresults_json = missing/results.json\nprofile = false\n");
  const IniConfig cfg(p);
  Runner runner(cfg, nullptr);
  EXPECT_THROW(runner.run(), std::runtime_error);

  const fs::path out = dir.path() / "out";
  ASSERT_TRUE(fs::exists(out));
  EXPECT_FALSE(fs::exists(out / "molecules.bin"));
  EXPECT_FALSE(fs::exists(out / "molecules.tsv"));
  EXPECT_TRUE(fs::is_empty(out));
}

TEST_F(ConfigTest, DumpInputNeedsAnOracle) {
  dir.write("t.dump", test::dump_block(0, {{1, 1, 0, 0, 0}}));
  const auto p = dir.write("run.ini", "[input]\nfiles = t.dump\nformat = dump\natom_names = C\n");
  const IniConfig cfg(p);
  Runner runner(cfg, nullptr);
  EXPECT_THROW(runner.validate_config(), std::runtime_error);
}
