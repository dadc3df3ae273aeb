#include "pipeline/positioning_driver.h"
#include "common/path_utils.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const std::string kSourceDir = RFPOS_SOURCE_DIR;

// Runs the CLI entrypoint with the shipped configuration plus `extra`.
int run_cli(const std::vector<std::string>& extra,
            const std::string& system_xml = kSourceDir + "/config/system.xml",
            const std::string& xsd_dir = kSourceDir + "/schemas") {
  std::vector<std::string> args = {"rfpos_run", "--config", system_xml, "--xsd-dir", xsd_dir};
  args.insert(args.end(), extra.begin(), extra.end());

  std::vector<char*> argv;
  for (std::string& a : args) argv.push_back(&a[0]);
  argv.push_back(nullptr);
  return pipeline::RunPositioningCli(static_cast<int>(args.size()), argv.data());
}

TEST(PositioningDriver, HelpExitsCleanly) {
  EXPECT_EQ(run_cli({"--help"}), 0);
}

TEST(PositioningDriver, NonPositiveWindowOverridesAreConfigErrors) {
  EXPECT_EQ(run_cli({"--warmup", "-3"}), 2);
  EXPECT_EQ(run_cli({"--window", "0"}), 2);
  EXPECT_EQ(run_cli({"--warmup", "-3", "--window", "0"}), 2);
}

TEST(PositioningDriver, MalformedNumericOverridesAreConfigErrors) {
  EXPECT_EQ(run_cli({"--feature-count", "abc"}), 2);
  EXPECT_EQ(run_cli({"--feature-count", "-1"}), 2);
  EXPECT_EQ(run_cli({"--window", "7x"}), 2);
  EXPECT_EQ(run_cli({"--warmup", "99999999999999999999"}), 2);
  EXPECT_EQ(run_cli({"--seed"}), 2);
}

TEST(PositioningDriver, UnknownRegressorOverrideIsAConfigError) {
  EXPECT_EQ(run_cli({"--regressor", "svm"}), 2);
}

TEST(PositioningDriver, EmptyStoreExitsWithConfigError) {
  const std::string dir = rfpos_test::MakeTempDir("driver_empty_store");
  const std::string conf = dir + "/conf";
  ASSERT_TRUE(rfpos::pathu::EnsureDirectory(conf));
  rfpos_test::WriteFile(dir + "/system.xml",
                        "<?xml version=\"1.0\"?>\n"
                        "<SystemConfig version=\"1\">\n"
                        "  <Active><StoreProfile id=\"mem\"/></Active>\n"
                        "  <Refs baseDir=\"conf\">\n"
                        "    <Store href=\"store.xml\"/>\n"
                        "    <Positioning href=\"positioning.xml\"/>\n"
                        "  </Refs>\n"
                        "</SystemConfig>\n");
  rfpos_test::WriteFile(conf + "/store.xml",
                        "<?xml version=\"1.0\"?>\n"
                        "<Store><Profile id=\"mem\"><Backend>memory</Backend></Profile></Store>\n");
  rfpos_test::WriteFile(conf + "/positioning.xml",
                        "<?xml version=\"1.0\"?>\n"
                        "<Positioning>\n"
                        "  <Window><WarmupSize>2</WarmupSize><WindowSize>2</WindowSize></Window>\n"
                        "  <Model><FeatureCount>0</FeatureCount><GapPolicy>fail</GapPolicy>"
                        "<Regressor type=\"knn\"><K>1</K></Regressor></Model>\n"
                        "</Positioning>\n");

  EXPECT_EQ(run_cli({"--output-dir", dir + "/out"}, dir + "/system.xml", ""), 2);
}

} // namespace
