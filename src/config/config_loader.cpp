#include "config/config_loader.h"

#include "config/xml_utils.h"
#include "common/path_utils.h"

#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace cfg {

static std::string schema_for_root(const std::string& root_name) {
  // Map root element names to schema filenames in xsd_dir.
  static const std::unordered_map<std::string, std::string> m = {
    {"SystemConfig", "system.xsd"},
    {"Store", "store.xsd"},
    {"Positioning", "positioning.xsd"},
    {"Performance", "performance.xsd"},
  };
  auto it = m.find(root_name);
  return (it == m.end()) ? std::string("") : it->second;
}

static void validate_if_enabled(void* doc,
                                const std::string& xsd_dir,
                                const std::string& xml_path) {
  if (xsd_dir.empty()) return;

  const std::string root = xmlu::RootName(doc);
  const std::string schema = schema_for_root(root);
  if (schema.empty()) {
    throw std::runtime_error("No schema mapping for root element '" + root + "' (file: " + xml_path + ")");
  }

  fs::path xsd_path = fs::path(xsd_dir) / schema;
  if (!fs::exists(xsd_path)) {
    throw std::runtime_error("Schema file not found: " + xsd_path.string());
  }

  xmlu::ValidateOrThrow(doc, xsd_path.string(), xml_path);
}

static void expect_root(void* doc, const std::string& expected, const std::string& xml_path) {
  const std::string root = xmlu::RootName(doc);
  if (root != expected) {
    throw std::runtime_error("Expected root element <" + expected + "> but found <" + root +
                             "> in " + xml_path);
  }
}

static SystemConfig parse_system(void* doc) {
  SystemConfig c;
  c.active.store_profile_id = xmlu::GetAttr(doc, "SystemConfig/Active/StoreProfile", "id");

  c.refs.base_dir         = xmlu::GetAttr(doc, "SystemConfig/Refs", "baseDir");
  c.refs.store_href       = xmlu::GetAttr(doc, "SystemConfig/Refs/Store", "href");
  c.refs.positioning_href = xmlu::GetAttr(doc, "SystemConfig/Refs/Positioning", "href");
  c.refs.performance_href = xmlu::GetAttr(doc, "SystemConfig/Refs/Performance", "href");

  if (c.active.store_profile_id.empty()) {
    throw std::runtime_error("system.xml missing Active/StoreProfile id.");
  }
  if (c.refs.store_href.empty() || c.refs.positioning_href.empty()) {
    throw std::runtime_error("system.xml missing required Refs hrefs (Store, Positioning).");
  }
  return c;
}

static StoreCfg parse_store(void* doc) {
  StoreCfg out;
  auto nodes = xmlu::FindNodes(doc, "Store/Profile");
  for (void* n : nodes) {
    StoreProfile p;
    p.id = xmlu::NodeGetAttr(n, "id");
    if (p.id.empty()) throw std::runtime_error("Store/Profile missing id attribute.");

    p.backend = xmlu::NodeGetTextChild(n, "Backend");
    if (p.backend.empty()) throw std::runtime_error("Store/Profile '" + p.id + "' missing Backend.");

    p.sqlite.db_uri       = xmlu::NodeGetTextPath(n, "Sqlite/DbUri");
    p.sqlite.journal_mode = xmlu::NodeGetTextPath(n, "Sqlite/JournalMode");
    p.sqlite.synchronous  = xmlu::NodeGetTextPath(n, "Sqlite/Synchronous");
    if (p.backend == "sqlite" && p.sqlite.db_uri.empty()) {
      throw std::runtime_error("Store/Profile '" + p.id + "' uses sqlite but has no Sqlite/DbUri.");
    }
    if (out.by_id.count(p.id) != 0) {
      throw std::runtime_error("Duplicate Store/Profile id: " + p.id);
    }
    out.by_id[p.id] = p;
  }
  if (out.by_id.empty()) throw std::runtime_error("No Store/Profile entries found.");
  return out;
}

static PositioningCfg parse_positioning(void* doc) {
  PositioningCfg p;
  p.window.warmup_size = xmlu::GetInt(doc, "Positioning/Window/WarmupSize", p.window.warmup_size);
  p.window.window_size = xmlu::GetInt(doc, "Positioning/Window/WindowSize", p.window.window_size);

  p.model.feature_count = xmlu::GetInt(doc, "Positioning/Model/FeatureCount", 0);
  const std::string gap = xmlu::GetText(doc, "Positioning/Model/GapPolicy");
  if (!gap.empty()) p.model.gap_policy = gap;

  RegressorCfg& r = p.model.regressor;
  const std::string type = xmlu::GetAttr(doc, "Positioning/Model/Regressor", "type");
  if (!type.empty()) r.type = type;
  r.alpha             = xmlu::GetDouble(doc, "Positioning/Model/Regressor/Alpha", r.alpha);
  r.k                 = xmlu::GetInt(doc, "Positioning/Model/Regressor/K", r.k);
  r.n_estimators      = xmlu::GetInt(doc, "Positioning/Model/Regressor/NEstimators", r.n_estimators);
  r.max_depth         = xmlu::GetInt(doc, "Positioning/Model/Regressor/MaxDepth", r.max_depth);
  r.min_samples_split = xmlu::GetInt(doc, "Positioning/Model/Regressor/MinSamplesSplit", r.min_samples_split);
  r.max_features      = xmlu::GetInt(doc, "Positioning/Model/Regressor/MaxFeatures", r.max_features);
  r.seed              = xmlu::GetUInt64(doc, "Positioning/Model/Regressor/Seed", r.seed);

  p.output.write_back = xmlu::GetBoolText(doc, "Positioning/Output/WriteBack", p.output.write_back);
  const std::string dir = xmlu::GetText(doc, "Positioning/Output/Directory");
  if (!dir.empty()) p.output.directory = dir;

  if (p.model.feature_count < 0) {
    throw std::runtime_error("Positioning/Model/FeatureCount must be >= 0.");
  }
  return p;
}

static PerformanceCfg parse_performance(void* doc) {
  PerformanceCfg p;
  p.threads.default_omp_threads = xmlu::GetInt(doc, "Performance/Threads/DefaultOmpThreads", 0);
  p.threads.allow_env_override = xmlu::GetBoolText(doc, "Performance/Threads/AllowEnvOverride", true);
  p.threads.set_env_defaults_if_unset = xmlu::GetBoolText(doc, "Performance/Threads/SetEnvDefaultsIfUnset", true);

  // EnvDefaults: Var elements
  auto vars = xmlu::FindNodes(doc, "Performance/EnvDefaults/Var");
  for (void* n : vars) {
    EnvVar v;
    v.name = xmlu::NodeGetAttr(n, "name");
    v.value = xmlu::NodeGetAttr(n, "value");
    if (!v.name.empty()) p.env_defaults.push_back(v);
  }

  p.diagnostics.print_startup_summary = xmlu::GetBoolText(doc, "Performance/Diagnostics/PrintStartupSummary", true);
  p.diagnostics.print_timing_stats    = xmlu::GetBoolText(doc, "Performance/Diagnostics/PrintTimingStats", false);
  return p;
}

ConfigBundle ConfigLoader::Load(const std::string& system_xml_path, const std::string& xsd_dir) {
  ConfigBundle bundle;
  bundle.paths.system_xml = rfpos::pathu::Normalize(system_xml_path);
  bundle.paths.xsd_dir = xsd_dir;

  // 1) system.xml
  {
    xmlu::ScopedXmlDoc doc(bundle.paths.system_xml);
    validate_if_enabled(doc.get(), xsd_dir, doc.path());
    expect_root(doc.get(), "SystemConfig", doc.path());
    bundle.system = parse_system(doc.get());
  }

  // Resolve referenced XML paths relative to system.xml and baseDir
  const std::string base = bundle.system.refs.base_dir;
  bundle.paths.store_xml       = rfpos::pathu::ResolveHref(bundle.paths.system_xml, base, bundle.system.refs.store_href);
  bundle.paths.positioning_xml = rfpos::pathu::ResolveHref(bundle.paths.system_xml, base, bundle.system.refs.positioning_href);
  if (!bundle.system.refs.performance_href.empty())
    bundle.paths.performance_xml = rfpos::pathu::ResolveHref(bundle.paths.system_xml, base, bundle.system.refs.performance_href);

  // 2) store.xml
  StoreCfg st;
  {
    xmlu::ScopedXmlDoc doc(bundle.paths.store_xml);
    validate_if_enabled(doc.get(), xsd_dir, doc.path());
    expect_root(doc.get(), "Store", doc.path());
    st = parse_store(doc.get());
  }
  auto it_sp = st.by_id.find(bundle.system.active.store_profile_id);
  if (it_sp == st.by_id.end()) {
    throw std::runtime_error("Active StoreProfile id not found: " + bundle.system.active.store_profile_id);
  }
  bundle.store_profile = it_sp->second;

  // Relative sqlite paths are taken relative to store.xml.
  SqliteCfg& sq = bundle.store_profile.sqlite;
  if (!sq.db_uri.empty() && sq.db_uri != ":memory:" && sq.db_uri.rfind("file:", 0) != 0) {
    sq.db_uri = rfpos::pathu::ResolveHref(bundle.paths.store_xml, "", sq.db_uri);
  }

  // 3) positioning.xml
  {
    xmlu::ScopedXmlDoc doc(bundle.paths.positioning_xml);
    validate_if_enabled(doc.get(), xsd_dir, doc.path());
    expect_root(doc.get(), "Positioning", doc.path());
    bundle.positioning = parse_positioning(doc.get());
  }

  // 4) performance.xml (optional)
  if (!bundle.paths.performance_xml.empty()) {
    xmlu::ScopedXmlDoc doc(bundle.paths.performance_xml);
    validate_if_enabled(doc.get(), xsd_dir, doc.path());
    expect_root(doc.get(), "Performance", doc.path());
    bundle.performance = parse_performance(doc.get());
    bundle.has_performance = true;
  }

  return bundle;
}

} // namespace cfg
