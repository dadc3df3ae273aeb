#include "pipeline/positioning_pipeline.h"

#include "fingerprint/fingerprint_assembler.h"
#include "positioning/coordinate_model_trainer.h"
#include "common/errors.h"
#include "common/log.h"

#include <chrono>
#include <set>
#include <sstream>
#include <string>

namespace pipeline {
namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

PositioningParams ParamsFromConfig(const cfg::PositioningCfg& c) {
  PositioningParams p;
  p.window.warmup_size = c.window.warmup_size;
  p.window.window_size = c.window.window_size;
  p.feature_count = static_cast<std::size_t>(c.model.feature_count < 0 ? 0 : c.model.feature_count);
  p.gap_policy = positioning::ParseGapPolicy(c.model.gap_policy);

  p.regressor.type = c.model.regressor.type;
  p.regressor.alpha = c.model.regressor.alpha;
  p.regressor.k = c.model.regressor.k;
  p.regressor.n_estimators = c.model.regressor.n_estimators;
  p.regressor.max_depth = c.model.regressor.max_depth;
  p.regressor.min_samples_split = c.model.regressor.min_samples_split;
  p.regressor.max_features = c.model.regressor.max_features;
  p.regressor.seed = c.model.regressor.seed;

  p.write_back = c.output.write_back;
  return p;
}

store::ReadingStoreConfig StoreConfigFromProfile(const cfg::StoreProfile& p) {
  store::ReadingStoreConfig s;
  s.backend = p.backend;
  s.sqlite_db_uri = p.sqlite.db_uri;
  s.journal_mode = p.sqlite.journal_mode;
  s.synchronous = p.sqlite.synchronous;
  return s;
}

PositioningReport RunPositioning(store::IReadingStore& store, const PositioningParams& params) {
  PositioningReport report;

  // Load
  auto t0 = std::chrono::steady_clock::now();
  const std::vector<store::Antenna> antennas = store.ListAntennas();
  const std::vector<store::Tag> tags = store.ListTags();
  const std::vector<store::Reading> readings = store.ListReadings();
  report.timings.load_s = seconds_since(t0);
  report.reading_count = readings.size();

  if (antennas.empty()) {
    throw rfpos::ConfigurationError("Reading store has no antennas; the fingerprint axis is empty");
  }
  if (readings.empty()) {
    throw rfpos::ConfigurationError("Reading store has no readings; nothing to position");
  }

  std::set<rfpos::TagId> reference_tags;
  std::set<rfpos::TagId> target_tags;
  for (const store::Tag& t : tags) {
    if (t.role == store::TagRole::REFERENCE) {
      reference_tags.insert(t.tag_id);
    } else {
      target_tags.insert(t.tag_id);
    }
  }

  // Assemble
  t0 = std::chrono::steady_clock::now();
  const fp::FingerprintAssembler assembler(fp::BuildAntennaAxis(antennas));
  const std::vector<fp::FingerprintRow> fingerprints =
      assembler.Assemble(readings, fp::BuildTruthMap(tags));
  report.timings.assemble_s = seconds_since(t0);
  report.axis = assembler.axis();
  report.fingerprint_rows = fingerprints.size();

  // Extract
  t0 = std::chrono::steady_clock::now();
  const fp::WindowFeatureExtractor extractor(report.axis.size(), params.window);
  const std::vector<fp::FeatureRow> features = extractor.Extract(fingerprints);
  report.timings.extract_s = seconds_since(t0);

  const fp::FeatureLayout layout = extractor.layout();
  report.feature_count = (params.feature_count == 0) ? layout.Length() : params.feature_count;

  if (rfpos::ShouldLog(rfpos::LogLevel::INFO)) {
    std::ostringstream oss;
    oss << "Positioning input: antennas=" << report.axis.size() << " tags=" << tags.size()
        << " (ref=" << reference_tags.size() << ") readings=" << readings.size()
        << " rows=" << features.size() << " L=" << layout.Length()
        << " feature_count=" << report.feature_count;
    rfpos::Log(rfpos::LogLevel::INFO, oss.str());
  }

  // Train
  t0 = std::chrono::steady_clock::now();
  positioning::TrainerConfig tcfg;
  tcfg.feature_count = report.feature_count;
  tcfg.gap_policy = params.gap_policy;
  tcfg.regressor = params.regressor;
  const positioning::CoordinateModelTrainer trainer(tcfg);
  const positioning::CoordinateModel coord_model = trainer.Train(features, reference_tags, layout);
  report.timings.train_s = seconds_since(t0);
  report.training_rows = coord_model.training_rows;

  // Evaluate
  t0 = std::chrono::steady_clock::now();
  const positioning::PositionEvaluator evaluator(params.gap_policy);
  positioning::EvaluationResult eval = evaluator.Evaluate(features, coord_model);
  report.timings.evaluate_s = seconds_since(t0);
  report.skipped_rows = coord_model.skipped_rows + eval.skipped_rows;
  report.predictions = std::move(eval.predictions);
  report.errors = std::move(eval.errors);

  for (const auto& kv : eval.latest) {
    if (target_tags.count(kv.first) != 0) report.target_positions[kv.first] = kv.second;
  }

  std::set<rfpos::TagId> observed;
  for (const store::Reading& r : readings) observed.insert(r.tag_id);
  report.observed_tags = observed.size();

  // Write back
  if (params.write_back) {
    t0 = std::chrono::steady_clock::now();
    store::WriteBatch batch(store);
    for (const auto& kv : report.target_positions) {
      store.SetPredictedPosition(kv.first, kv.second.x, kv.second.y);
    }
    for (const rfpos::TagId& id : observed) {
      store.MarkObserved(id);
    }
    batch.Commit();
    report.timings.write_back_s = seconds_since(t0);
    report.wrote_back = true;

    if (rfpos::ShouldLog(rfpos::LogLevel::DEBUG)) {
      rfpos::Log(rfpos::LogLevel::DEBUG,
                 "Wrote " + std::to_string(report.target_positions.size()) + " predicted positions, marked " +
                     std::to_string(observed.size()) + " tags observed");
    }
  }

  return report;
}

} // namespace pipeline
