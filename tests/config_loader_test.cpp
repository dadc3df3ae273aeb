#include "config/config_loader.h"
#include "common/path_utils.h"
#include "pipeline/positioning_pipeline.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

const std::string kSourceDir = RFPOS_SOURCE_DIR;

const char* kSystemXml =
    "<?xml version=\"1.0\"?>\n"
    "<SystemConfig version=\"1\">\n"
    "  <Active><StoreProfile id=\"mem\"/></Active>\n"
    "  <Refs baseDir=\"conf\">\n"
    "    <Store href=\"store.xml\"/>\n"
    "    <Positioning href=\"positioning.xml\"/>\n"
    "  </Refs>\n"
    "</SystemConfig>\n";

const char* kStoreXml =
    "<?xml version=\"1.0\"?>\n"
    "<Store>\n"
    "  <Profile id=\"mem\"><Backend>memory</Backend></Profile>\n"
    "  <Profile id=\"db\"><Backend>sqlite</Backend><Sqlite><DbUri>db/rfid.db</DbUri></Sqlite></Profile>\n"
    "</Store>\n";

std::string positioning_xml(const std::string& warmup, const std::string& regressor) {
  return "<?xml version=\"1.0\"?>\n"
         "<Positioning>\n"
         "  <Window><WarmupSize>" + warmup + "</WarmupSize><WindowSize>5</WindowSize></Window>\n"
         "  <Model><FeatureCount>0</FeatureCount><GapPolicy>skip_row</GapPolicy>" + regressor +
         "</Model>\n"
         "</Positioning>\n";
}

// Writes a config set under <tmp>/<name> and returns the system.xml path.
std::string write_config(const std::string& name,
                         const std::string& system = kSystemXml,
                         const std::string& store = kStoreXml,
                         const std::string& positioning =
                             positioning_xml("3", "<Regressor type=\"knn\"><K>2</K></Regressor>")) {
  const std::string dir = rfpos_test::MakeTempDir(name);
  const std::string conf = dir + "/conf";
  rfpos::pathu::EnsureDirectory(conf);
  rfpos_test::WriteFile(dir + "/system.xml", system);
  rfpos_test::WriteFile(conf + "/store.xml", store);
  rfpos_test::WriteFile(conf + "/positioning.xml", positioning);
  return dir + "/system.xml";
}

TEST(ConfigLoader, LoadsShippedConfigurationWithSchemas) {
  const cfg::ConfigBundle b =
      cfg::ConfigLoader::Load(kSourceDir + "/config/system.xml", kSourceDir + "/schemas");

  EXPECT_EQ(b.system.active.store_profile_id, "sqlite_file");
  EXPECT_EQ(b.store_profile.backend, "sqlite");
  const std::string& uri = b.store_profile.sqlite.db_uri;
  ASSERT_GE(uri.size(), 12u);
  EXPECT_EQ(uri.substr(uri.size() - 12), "data/rfid.db");
  EXPECT_EQ(uri.find(".."), std::string::npos);
  EXPECT_EQ(b.store_profile.sqlite.journal_mode, "WAL");

  EXPECT_EQ(b.positioning.window.warmup_size, 10);
  EXPECT_EQ(b.positioning.window.window_size, 10);
  EXPECT_EQ(b.positioning.model.feature_count, 40);
  EXPECT_EQ(b.positioning.model.gap_policy, "fail");
  EXPECT_EQ(b.positioning.model.regressor.type, "random_forest");
  EXPECT_EQ(b.positioning.model.regressor.n_estimators, 1000);
  EXPECT_TRUE(b.positioning.output.write_back);

  ASSERT_TRUE(b.has_performance);
  ASSERT_EQ(b.performance.env_defaults.size(), 1u);
  EXPECT_EQ(b.performance.env_defaults[0].name, "OMP_PROC_BIND");
}

TEST(ConfigLoader, ResolvesHrefsThroughBaseDir) {
  const std::string system = write_config("cfg_basedir");
  const cfg::ConfigBundle b = cfg::ConfigLoader::Load(system);

  EXPECT_NE(b.paths.store_xml.find("conf"), std::string::npos);
  EXPECT_EQ(b.store_profile.backend, "memory");
  EXPECT_FALSE(b.has_performance);
  EXPECT_EQ(b.positioning.window.warmup_size, 3);
  EXPECT_EQ(b.positioning.model.regressor.type, "knn");
  EXPECT_EQ(b.positioning.model.regressor.k, 2);
  EXPECT_EQ(b.positioning.model.regressor.n_estimators, 100);  // default kept

  const pipeline::PositioningParams p = pipeline::ParamsFromConfig(b.positioning);
  EXPECT_EQ(p.window.warmup_size, 3);
  EXPECT_EQ(p.feature_count, 0u);
  EXPECT_EQ(p.gap_policy, positioning::GapPolicy::SKIP_ROW);
}

TEST(ConfigLoader, RelativeDatabasePathFollowsStoreXml) {
  std::string system = kSystemXml;
  system.replace(system.find("id=\"mem\""), 8, "id=\"db\"");
  const cfg::ConfigBundle b = cfg::ConfigLoader::Load(write_config("cfg_dbpath", system));
  EXPECT_EQ(b.store_profile.sqlite.db_uri, b.paths.store_xml.substr(0, b.paths.store_xml.size() - 9) +
                                               "db/rfid.db");
}

TEST(ConfigLoader, UnknownActiveProfileThrows) {
  std::string system = kSystemXml;
  system.replace(system.find("id=\"mem\""), 8, "id=\"zzz\"");
  EXPECT_THROW(cfg::ConfigLoader::Load(write_config("cfg_profile", system)), std::runtime_error);
}

TEST(ConfigLoader, MissingReferencedFileThrows) {
  std::string system = kSystemXml;
  system.replace(system.find("positioning.xml"), 15, "missing.xml");
  EXPECT_THROW(cfg::ConfigLoader::Load(write_config("cfg_missing", system)), std::runtime_error);
}

TEST(ConfigLoader, MalformedNumberThrows) {
  const std::string system = write_config(
      "cfg_number", kSystemXml, kStoreXml,
      positioning_xml("ten", "<Regressor type=\"knn\"/>"));
  EXPECT_THROW(cfg::ConfigLoader::Load(system), std::runtime_error);
}

TEST(ConfigLoader, WrongRootElementThrows) {
  const std::string system = write_config("cfg_root", kSystemXml, "<?xml version=\"1.0\"?><Positioning/>");
  EXPECT_THROW(cfg::ConfigLoader::Load(system), std::runtime_error);
}

TEST(ConfigLoader, SchemaRejectsNonPositiveWindow) {
  const std::string system = write_config(
      "cfg_xsd", kSystemXml, kStoreXml,
      positioning_xml("0", "<Regressor type=\"knn\"/>"));
  EXPECT_NO_THROW(cfg::ConfigLoader::Load(system));
  EXPECT_THROW(cfg::ConfigLoader::Load(system, kSourceDir + "/schemas"), std::runtime_error);
}

TEST(ConfigLoader, SchemaRejectsUnknownRegressor) {
  const std::string system = write_config(
      "cfg_xsd_reg", kSystemXml, kStoreXml,
      positioning_xml("3", "<Regressor type=\"svm\"/>"));
  EXPECT_THROW(cfg::ConfigLoader::Load(system, kSourceDir + "/schemas"), std::runtime_error);
}

} // namespace
