/**
 * @file config_check.cpp
 * @brief Minimal executable that loads + (optionally) validates + prints the positioning config bundle.
 */
#include "config/config_loader.h"
#include "pipeline/positioning_pipeline.h"

#include <iostream>
#include <string>

static void print_bundle(const cfg::ConfigBundle& b) {
  std::cout << "=== ConfigBundle Summary ===\n";
  std::cout << "system.xml: " << b.paths.system_xml << "\n";
  std::cout << "xsd_dir:    " << (b.paths.xsd_dir.empty() ? "(none)" : b.paths.xsd_dir) << "\n\n";

  std::cout << "[Active]\n";
  std::cout << "  StoreProfile: " << b.system.active.store_profile_id << "\n\n";

  std::cout << "[Resolved Paths]\n";
  std::cout << "  store:        " << b.paths.store_xml << "\n";
  std::cout << "  positioning:  " << b.paths.positioning_xml << "\n";
  if (!b.paths.performance_xml.empty()) std::cout << "  performance:  " << b.paths.performance_xml << "\n";
  std::cout << "\n";

  std::cout << "[StoreProfile]\n";
  std::cout << "  id=" << b.store_profile.id << " backend=" << b.store_profile.backend << "\n";
  if (!b.store_profile.sqlite.db_uri.empty()) {
    std::cout << "  sqlite.db_uri=" << b.store_profile.sqlite.db_uri
              << " journal_mode=" << (b.store_profile.sqlite.journal_mode.empty() ? "(default)" : b.store_profile.sqlite.journal_mode)
              << " synchronous=" << (b.store_profile.sqlite.synchronous.empty() ? "(default)" : b.store_profile.sqlite.synchronous)
              << "\n";
  }
  std::cout << "\n";

  const cfg::PositioningCfg& p = b.positioning;
  std::cout << "[Positioning]\n";
  std::cout << "  window: warmup=" << p.window.warmup_size << " size=" << p.window.window_size << "\n";
  std::cout << "  model:  feature_count=" << p.model.feature_count
            << (p.model.feature_count == 0 ? " (full)" : "")
            << " gap_policy=" << p.model.gap_policy << "\n";
  std::cout << "  regressor: type=" << p.model.regressor.type
            << " alpha=" << p.model.regressor.alpha
            << " k=" << p.model.regressor.k
            << " n_estimators=" << p.model.regressor.n_estimators
            << " max_depth=" << p.model.regressor.max_depth
            << " min_samples_split=" << p.model.regressor.min_samples_split
            << " max_features=" << p.model.regressor.max_features
            << " seed=" << p.model.regressor.seed << "\n";
  std::cout << "  output: write_back=" << (p.output.write_back ? "true" : "false")
            << " directory=" << p.output.directory << "\n";

  if (b.has_performance) {
    std::cout << "\n[Performance]\n";
    std::cout << "  threads.default_omp=" << b.performance.threads.default_omp_threads
              << " allow_env_override=" << (b.performance.threads.allow_env_override ? "true" : "false") << "\n";
    for (const auto& v : b.performance.env_defaults) {
      std::cout << "  env " << v.name << "=" << v.value << "\n";
    }
  }
}

int main(int argc, char** argv) {
  std::string system_xml = "config/system.xml";
  std::string xsd_dir = ""; // e.g., "schemas"

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      system_xml = argv[++i];
    } else if (a == "--xsd-dir" && i + 1 < argc) {
      xsd_dir = argv[++i];
    } else if (a == "--help" || a == "-h") {
      std::cout << "Usage: config_check [--config <system.xml>] [--xsd-dir <dir>]\n";
      return 0;
    }
  }

  try {
    cfg::ConfigBundle bundle = cfg::ConfigLoader::Load(system_xml, xsd_dir);
    // Resolve names (gap policy) the same way the runner does.
    const pipeline::PositioningParams params = pipeline::ParamsFromConfig(bundle.positioning);
    print_bundle(bundle);
    std::cout << "\nresolved gap_policy=" << positioning::GapPolicyName(params.gap_policy) << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Config load failed: " << e.what() << "\n";
    return 2;
  }
}
