/**
 * @file positioning_driver.cpp
 * @brief Config-driven batch positioning driver.
 *
 * Loads system.xml (+ optional XSD validation), opens the active reading store,
 * runs one positioning pass and reports:
 *  - the per-tag error table (MAE_x, MAE_y, MAE_avg; 4 decimals) on stdout,
 *  - positions_<stamp>.csv and errors_<stamp>.csv under <output>/archive/<date>/,
 *  - one summary row appended to <output>/runs.csv.
 *
 * CLI overrides: --config, --xsd-dir, --output-dir, --no-writeback,
 * --feature-count, --warmup, --window, --regressor, --gap-policy, --seed.
 */

#include "pipeline/positioning_driver.h"
#include "rfpos.h"
#include "rfpos_version.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;

namespace {

// ------------------------------
// CLI parsing
// ------------------------------
struct CliArgs {
  std::string system_xml;
  std::string xsd_dir;
  std::string output_dir;        // empty: use positioning.xml Output/Directory
  bool no_writeback = false;
  // Numeric overrides are set only when the flag was given; 0 feature count means full length.
  std::optional<std::size_t> feature_count;
  std::optional<int> warmup;
  std::optional<int> window;
  std::optional<std::uint64_t> seed;
  std::string regressor;
  std::string gap_policy;
  bool show_rows = false;
};

std::string arg_value(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key && i + 1 < argc) {
      return std::string(argv[i + 1]);
    }
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key) return true;
  }
  return false;
}

// Integer value of a numeric flag, or nullopt when the flag is absent.
std::optional<long long> arg_integer(int argc, char** argv, const std::string& key, long long min_value,
                                     long long max_value) {
  if (!has_flag(argc, argv, key)) return std::nullopt;
  const std::string s = arg_value(argc, argv, key, "");
  if (s.empty()) {
    throw rfpos::ConfigurationError("Missing value for " + key);
  }

  long long v = 0;
  std::size_t pos = 0;
  try {
    v = std::stoll(s, &pos);
  } catch (const std::logic_error&) {
    throw rfpos::ConfigurationError("Invalid value for " + key + ": '" + s + "'");
  }
  if (pos != s.size()) {
    throw rfpos::ConfigurationError("Invalid value for " + key + ": '" + s + "'");
  }
  if (v < min_value || v > max_value) {
    throw rfpos::ConfigurationError("Value for " + key + " out of range [" + std::to_string(min_value) +
                                    ", " + std::to_string(max_value) + "]: " + s);
  }
  return v;
}

CliArgs parse_cli(int argc, char** argv) {
  constexpr long long kIntMax = std::numeric_limits<int>::max();
  constexpr long long kInt64Max = std::numeric_limits<long long>::max();

  CliArgs cli;
  cli.system_xml    = arg_value(argc, argv, "--config", "./config/system.xml");
  cli.xsd_dir       = arg_value(argc, argv, "--xsd-dir", "./schemas");
  cli.output_dir    = arg_value(argc, argv, "--output-dir", "");
  cli.no_writeback  = has_flag(argc, argv, "--no-writeback");
  cli.regressor     = arg_value(argc, argv, "--regressor", "");
  cli.gap_policy    = arg_value(argc, argv, "--gap-policy", "");
  cli.show_rows     = has_flag(argc, argv, "--show-rows");

  // Window sizes keep their sign so ValidateWindowConfig reports non-positive values.
  if (auto v = arg_integer(argc, argv, "--warmup", -kIntMax, kIntMax)) cli.warmup = static_cast<int>(*v);
  if (auto v = arg_integer(argc, argv, "--window", -kIntMax, kIntMax)) cli.window = static_cast<int>(*v);
  if (auto v = arg_integer(argc, argv, "--feature-count", 0, kInt64Max)) {
    cli.feature_count = static_cast<std::size_t>(*v);
  }
  if (auto v = arg_integer(argc, argv, "--seed", 0, kInt64Max)) cli.seed = static_cast<std::uint64_t>(*v);
  return cli;
}

void print_usage() {
  std::cout
    << "Usage: rfpos_run [--config <system.xml>] [--xsd-dir <dir|\"\">] [--output-dir <dir>]\n"
       "                 [--no-writeback] [--feature-count N] [--warmup N] [--window N]\n"
       "                 [--regressor random_forest|ridge|knn] [--gap-policy fail|skip_row]\n"
       "                 [--seed N] [--show-rows]\n";
}

// ------------------------------
// Performance settings
// ------------------------------
void apply_performance(const cfg::ConfigBundle& cfg) {
  if (!cfg.has_performance) return;
  const cfg::PerformanceCfg& p = cfg.performance;

  if (p.threads.set_env_defaults_if_unset) {
    for (const cfg::EnvVar& v : p.env_defaults) {
      if (setenv(v.name.c_str(), v.value.c_str(), 0) != 0 && rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
        std::cerr << "WARNING: failed to set environment default " << v.name << "\n";
      }
    }
  }

#ifdef _OPENMP
  const char* env_threads = std::getenv("OMP_NUM_THREADS");
  const bool env_wins = p.threads.allow_env_override && env_threads && *env_threads;
  if (p.threads.default_omp_threads > 0 && !env_wins) {
    omp_set_num_threads(p.threads.default_omp_threads);
  }
#else
  if (p.threads.default_omp_threads > 1 && rfpos::ShouldLog(rfpos::LogLevel::DEBUG)) {
    rfpos::Log(rfpos::LogLevel::DEBUG, "DefaultOmpThreads ignored (built without OpenMP)");
  }
#endif
}

int active_threads() {
#ifdef _OPENMP
  return omp_get_max_threads();
#else
  return 1;
#endif
}

// ------------------------------
// Output
// ------------------------------
std::tm local_tm_now() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

std::string format_tm(const std::tm& tm, const char* fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

std::string opt_text(const rfpos::OptDouble& v) {
  if (!v) return "";
  std::ostringstream oss;
  oss << std::setprecision(10) << *v;
  return oss.str();
}

void print_error_table(const pipeline::PositioningReport& report) {
  std::cout << std::left << std::setw(16) << "TagID" << std::right
            << std::setw(10) << "MAE_x" << std::setw(10) << "MAE_y" << std::setw(10) << "MAE_avg" << "\n";
  std::cout << std::fixed << std::setprecision(4);
  for (const auto& e : report.errors) {
    std::cout << std::left << std::setw(16) << e.tag_id << std::right
              << std::setw(10) << e.mae_x << std::setw(10) << e.mae_y << std::setw(10) << e.mae_avg << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout << std::setprecision(6);
}

void print_target_positions(const pipeline::PositioningReport& report) {
  if (report.target_positions.empty()) return;
  std::cout << "\nTarget positions" << (report.wrote_back ? "" : " (not written back)") << ":\n";
  std::cout << std::fixed << std::setprecision(4);
  for (const auto& kv : report.target_positions) {
    std::cout << "  " << kv.first << " x=" << kv.second.x << " y=" << kv.second.y
              << " at " << rfpos::FormatTimestamp(kv.second.timestamp) << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout << std::setprecision(6);
}

void print_rows(const pipeline::PositioningReport& report) {
  std::cout << "\nRow predictions:\n";
  for (const auto& p : report.predictions) {
    std::cout << "  " << p.tag_id << " " << rfpos::FormatTimestamp(p.timestamp)
              << " pred=(" << opt_text(p.pred_x) << "," << opt_text(p.pred_y) << ")"
              << " true=(" << opt_text(p.true_x) << "," << opt_text(p.true_y) << ")\n";
  }
}

void print_timings(const pipeline::PositioningReport& r) {
  std::cout << "\nTiming (s): load=" << r.timings.load_s
            << " assemble=" << r.timings.assemble_s
            << " extract=" << r.timings.extract_s
            << " train=" << r.timings.train_s
            << " evaluate=" << r.timings.evaluate_s
            << " write_back=" << r.timings.write_back_s << "\n";
}

bool write_positions_csv(const std::string& path, const pipeline::PositioningReport& report) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) return false;
  out << "tag_id,read_time,pred_x,pred_y,true_x,true_y\n";
  for (const auto& p : report.predictions) {
    out << p.tag_id << ',' << rfpos::FormatTimestamp(p.timestamp) << ','
        << opt_text(p.pred_x) << ',' << opt_text(p.pred_y) << ','
        << opt_text(p.true_x) << ',' << opt_text(p.true_y) << "\n";
  }
  return static_cast<bool>(out);
}

bool write_errors_csv(const std::string& path, const pipeline::PositioningReport& report) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) return false;
  out << "tag_id,rows,mae_x,mae_y,mae_avg\n";
  out << std::fixed << std::setprecision(4);
  for (const auto& e : report.errors) {
    out << e.tag_id << ',' << e.rows << ',' << e.mae_x << ',' << e.mae_y << ',' << e.mae_avg << "\n";
  }
  return static_cast<bool>(out);
}

/**
 * @brief Write per-run CSVs and append to the rolling runs.csv.
 */
void write_csvs(const std::string& output_dir,
                const CliArgs& cli,
                const pipeline::PositioningParams& params,
                const pipeline::PositioningReport& report) {
  if (!rfpos::pathu::EnsureDirectory(output_dir)) {
    if (rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
      std::cerr << "WARNING: failed to create output directory '" << output_dir << "'.\n";
    }
    return;
  }

  const std::tm run_tm = local_tm_now();
  const std::string stamp = format_tm(run_tm, "%Y%m%d_%H%M%S");
  const fs::path archive_dir = fs::path(output_dir) / "archive" / format_tm(run_tm, "%Y%m%d");
  if (!rfpos::pathu::EnsureDirectory(archive_dir.string())) {
    if (rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
      std::cerr << "WARNING: failed to create archive directory '" << archive_dir.string() << "'.\n";
    }
    return;
  }

  const std::string positions_path = (archive_dir / ("positions_" + stamp + ".csv")).string();
  const std::string errors_path = (archive_dir / ("errors_" + stamp + ".csv")).string();
  if (!write_positions_csv(positions_path, report) && rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
    std::cerr << "WARNING: failed to write '" << positions_path << "'.\n";
  }
  if (!write_errors_csv(errors_path, report) && rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
    std::cerr << "WARNING: failed to write '" << errors_path << "'.\n";
  }

  double mae_avg_mean = 0.0;
  for (const auto& e : report.errors) mae_avg_mean += e.mae_avg;
  if (!report.errors.empty()) mae_avg_mean /= static_cast<double>(report.errors.size());

  auto write_header = [](std::ostream& os) {
    os << "date,time,version,system_xml,regressor,warmup,window,feature_count,gap_policy,"
          "antennas,readings,rows,training_rows,skipped_rows,tags_with_truth,mean_mae_avg,"
          "targets_positioned,wrote_back,train_s,evaluate_s\n";
  };
  auto write_row = [&](std::ostream& os) {
    os << format_tm(run_tm, "%Y-%m-%d") << ','
       << format_tm(run_tm, "%H:%M:%S") << ','
       << RFPOS_VERSION_STRING << ','
       << cli.system_xml << ','
       << params.regressor.type << ','
       << params.window.warmup_size << ','
       << params.window.window_size << ','
       << report.feature_count << ','
       << positioning::GapPolicyName(params.gap_policy) << ','
       << report.axis.size() << ','
       << report.reading_count << ','
       << report.predictions.size() << ','
       << report.training_rows << ','
       << report.skipped_rows << ','
       << report.errors.size() << ','
       << mae_avg_mean << ','
       << report.target_positions.size() << ','
       << (report.wrote_back ? 1 : 0) << ','
       << report.timings.train_s << ','
       << report.timings.evaluate_s << "\n";
  };

  const fs::path append_path = fs::path(output_dir) / "runs.csv";
  std::error_code ec;
  bool header_matches = false;
  if (fs::exists(append_path, ec) && !ec && fs::file_size(append_path, ec) > 0 && !ec) {
    std::ifstream in(append_path);
    std::string line;
    if (in && std::getline(in, line)) {
      std::ostringstream expected;
      write_header(expected);
      std::string expected_line = expected.str();
      if (!expected_line.empty() && expected_line.back() == '\n') expected_line.pop_back();
      header_matches = (line == expected_line);
    }
  }
  std::ofstream append_out(append_path, std::ios::app);
  if (append_out) {
    // Header again whenever the existing file was written with a different layout.
    if (!header_matches) write_header(append_out);
    write_row(append_out);
  } else if (rfpos::ShouldLog(rfpos::LogLevel::WARN)) {
    std::cerr << "WARNING: failed to open run summary CSV at '" << append_path.string() << "'.\n";
  }

  std::cout << "\nWrote " << positions_path << "\n      " << errors_path << "\n";
}

} // namespace

/**
 * @brief Driver entrypoint.
 */
int pipeline::RunPositioningCli(int argc, char** argv) try {
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage();
    return 0;
  }
  const CliArgs cli = parse_cli(argc, argv);

  // Load config (with optional schema validation depending on xsd_dir)
  cfg::ConfigBundle cfg;
  try {
    cfg = cfg::ConfigLoader::Load(cli.system_xml, cli.xsd_dir);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: config load failed: " << e.what() << "\n";
    return 2;
  }
  apply_performance(cfg);

  PositioningParams params = ParamsFromConfig(cfg.positioning);
  if (cli.feature_count) params.feature_count = *cli.feature_count;
  if (cli.warmup) params.window.warmup_size = *cli.warmup;
  if (cli.window) params.window.window_size = *cli.window;
  if (!cli.regressor.empty()) params.regressor.type = cli.regressor;
  if (!cli.gap_policy.empty()) params.gap_policy = positioning::ParseGapPolicy(cli.gap_policy);
  if (cli.seed) params.regressor.seed = *cli.seed;
  if (cli.no_writeback) params.write_back = false;

  // Reject bad overrides before anything is printed or opened.
  fp::ValidateWindowConfig(params.window);
  model::ValidateRegressorConfig(params.regressor);

  const std::string output_dir = cli.output_dir.empty() ? cfg.positioning.output.directory : cli.output_dir;
  const bool print_summary = !cfg.has_performance || cfg.performance.diagnostics.print_startup_summary;

  if (print_summary) {
    std::cout << "rfpos " << RFPOS_VERSION_STRING << "\n";
    std::cout << "Config:    " << cfg.paths.system_xml << "\n";
    std::cout << "XSD:       " << (cfg.paths.xsd_dir.empty() ? "(none)" : cfg.paths.xsd_dir) << "\n";
    std::cout << "Store:     " << cfg.store_profile.id << " (" << cfg.store_profile.backend
              << (cfg.store_profile.sqlite.db_uri.empty() ? "" : " " + cfg.store_profile.sqlite.db_uri) << ")\n";
    std::cout << "Window:    warmup=" << params.window.warmup_size << " window=" << params.window.window_size << "\n";
    std::cout << "Model:     " << params.regressor.type << " feature_count="
              << (params.feature_count == 0 ? std::string("full") : std::to_string(params.feature_count))
              << " gap_policy=" << positioning::GapPolicyName(params.gap_policy)
              << " seed=" << params.regressor.seed << "\n";
    std::cout << "Threads:   " << active_threads() << "\n\n";
  }

  std::unique_ptr<store::IReadingStore> reading_store =
      store::CreateReadingStore(pipeline::StoreConfigFromProfile(cfg.store_profile));

  const PositioningReport report = RunPositioning(*reading_store, params);

  print_error_table(report);
  print_target_positions(report);
  if (cli.show_rows) print_rows(report);
  if (cfg.has_performance && cfg.performance.diagnostics.print_timing_stats) print_timings(report);

  write_csvs(output_dir, cli, params, report);
  return 0;

} catch (const rfpos::ConfigurationError& e) {
  std::cerr << "FATAL: " << e.what() << "\n";
  return 2;
} catch (const std::exception& e) {
  std::cerr << "FATAL: " << e.what() << "\n";
  return 1;
}
