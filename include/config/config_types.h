#pragma once
/**
 * @file config_types.h
 * @brief Plain-old-data structures holding parsed positioning configuration.
 *
 * Design goals:
 *  - Keep types simple and stable.
 *  - Parse/validation is handled by ConfigLoader.
 *  - Library-level parameter structs (store, window, regressor) are filled from
 *    these by the pipeline; nothing here depends on them.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cfg {

// ------------------------------
// System wiring (system.xml)
// ------------------------------
struct ActiveSelection {
  std::string store_profile_id;
};

struct SystemRefs {
  std::string base_dir;  // optional
  std::string store_href;
  std::string positioning_href;
  std::string performance_href;  // optional
};

struct SystemConfig {
  ActiveSelection active;
  SystemRefs refs;
};

// ------------------------------
// Store profiles (store.xml)
// ------------------------------
struct SqliteCfg {
  std::string db_uri;        // file path or ":memory:"
  std::string journal_mode;  // optional, e.g. WAL
  std::string synchronous;   // optional, e.g. NORMAL
};

struct StoreProfile {
  std::string id;
  std::string backend;  // "sqlite" | "memory"
  SqliteCfg sqlite{};
};

struct StoreCfg {
  std::map<std::string, StoreProfile> by_id;
};

// ------------------------------
// Positioning (positioning.xml)
// ------------------------------
struct WindowCfg {
  int warmup_size = 10;
  int window_size = 10;
};

struct RegressorCfg {
  std::string type = "random_forest";
  double alpha = 1e-3;
  int k = 3;
  int n_estimators = 100;
  int max_depth = 0;
  int min_samples_split = 2;
  int max_features = 0;
  std::uint64_t seed = 0;
};

struct ModelCfg {
  int feature_count = 0;            // 0 = full feature vector
  std::string gap_policy = "fail";  // fail | skip_row
  RegressorCfg regressor{};
};

struct OutputCfg {
  bool write_back = true;
  std::string directory = "./logs";
};

struct PositioningCfg {
  WindowCfg window{};
  ModelCfg model{};
  OutputCfg output{};
};

// ------------------------------
// Performance (performance.xml)
// ------------------------------
struct ThreadsCfg {
  int default_omp_threads = 0;  // 0 = leave OpenMP default
  bool allow_env_override = true;
  bool set_env_defaults_if_unset = true;
};

struct EnvVar {
  std::string name;
  std::string value;
};

struct DiagnosticsCfg {
  bool print_startup_summary = true;
  bool print_timing_stats = false;
};

struct PerformanceCfg {
  ThreadsCfg threads{};
  std::vector<EnvVar> env_defaults;
  DiagnosticsCfg diagnostics{};
};

// ------------------------------
// Resolved bundle (what the app uses)
// ------------------------------
struct ResolvedPaths {
  std::string system_xml;
  std::string xsd_dir;  // optional
  std::string store_xml;
  std::string positioning_xml;
  std::string performance_xml;  // optional
};

struct ConfigBundle {
  ResolvedPaths paths;

  SystemConfig system;
  StoreProfile store_profile;
  PositioningCfg positioning;

  PerformanceCfg performance;  // default-initialized if not present
  bool has_performance = false;
};

} // namespace cfg
