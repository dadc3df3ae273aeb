#pragma once
/**
 * @file positioning_pipeline.h
 * @brief One batch positioning run over a reading store snapshot.
 *
 * Steps: load antennas, tags and readings; assemble fingerprints; extract window
 * features; train X/Y regressors on the reference tags; predict every row; write the
 * target tags' latest predictions back and mark every tag with readings as observed.
 */

#include "config/config_types.h"
#include "fingerprint/fingerprint_row.h"
#include "fingerprint/window_feature_extractor.h"
#include "model/regressor.h"
#include "positioning/gap_policy.h"
#include "positioning/position_evaluator.h"
#include "store/reading_store.h"

#include <cstddef>
#include <map>
#include <vector>

namespace pipeline {

struct PositioningParams {
  fp::WindowConfig window{};
  std::size_t feature_count = 0;  // 0 = full feature vector
  positioning::GapPolicy gap_policy = positioning::GapPolicy::FAIL;
  model::RegressorConfig regressor{};
  bool write_back = true;
};

struct StageTimings {
  double load_s = 0.0;
  double assemble_s = 0.0;
  double extract_s = 0.0;
  double train_s = 0.0;
  double evaluate_s = 0.0;
  double write_back_s = 0.0;
};

struct PositioningReport {
  fp::AntennaAxis axis;
  std::size_t feature_count = 0;
  std::size_t reading_count = 0;
  std::size_t fingerprint_rows = 0;
  std::size_t training_rows = 0;
  std::size_t skipped_rows = 0;  // rows left out by GapPolicy::SKIP_ROW (training + evaluation)

  std::vector<positioning::RowPrediction> predictions;  // ordered by timestamp, then tag id
  std::vector<positioning::TagErrorSummary> errors;     // by tag id

  // Target tags whose predicted position was written to the store (or would be,
  // when write-back is disabled).
  std::map<rfpos::TagId, positioning::LatestPosition> target_positions;
  std::size_t observed_tags = 0;
  bool wrote_back = false;

  StageTimings timings{};
};

// Translate loaded XML settings into run parameters (names validated later by the stages).
PositioningParams ParamsFromConfig(const cfg::PositioningCfg& c);
store::ReadingStoreConfig StoreConfigFromProfile(const cfg::StoreProfile& p);

/**
 * @brief Execute one positioning run against `store`.
 *
 * @throws rfpos::ConfigurationError (also for a store without antennas or readings),
 *         rfpos::DataGapError, rfpos::DataError,
 *         rfpos::StoreError from the individual stages. Nothing is written back
 *         unless training and evaluation both succeed, and the write-back itself
 *         is one batch: a failing write leaves the store as it was.
 */
PositioningReport RunPositioning(store::IReadingStore& store, const PositioningParams& params);

} // namespace pipeline
