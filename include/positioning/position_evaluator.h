#pragma once
/**
 * @file position_evaluator.h
 * @brief Predict coordinates for every feature row and summarise errors per tag.
 */

#include "fingerprint/fingerprint_row.h"
#include "positioning/coordinate_model_trainer.h"
#include "positioning/gap_policy.h"

#include <map>
#include <vector>

namespace positioning {

struct RowPrediction {
  rfpos::TagId tag_id;
  rfpos::Timestamp timestamp = 0;
  rfpos::OptDouble pred_x;  // unset when the row was skipped for a gap
  rfpos::OptDouble pred_y;
  rfpos::OptDouble true_x;
  rfpos::OptDouble true_y;
};

// Mean absolute error over the rows of one tag that have both truth and a prediction.
struct TagErrorSummary {
  rfpos::TagId tag_id;
  std::size_t rows = 0;
  double mae_x = 0.0;
  double mae_y = 0.0;
  double mae_avg = 0.0;
};

struct LatestPosition {
  rfpos::Timestamp timestamp = 0;
  double x = 0.0;
  double y = 0.0;
};

struct EvaluationResult {
  std::vector<RowPrediction> predictions;          // same order as the input rows
  std::vector<TagErrorSummary> errors;             // by tag id
  std::map<rfpos::TagId, LatestPosition> latest;   // most recent predicted row per tag
  std::size_t skipped_rows = 0;
};

class PositionEvaluator {
public:
  explicit PositionEvaluator(GapPolicy gap_policy = GapPolicy::FAIL);

  /**
   * @throws rfpos::ConfigurationError if the model is not fitted.
   * @throws rfpos::DataGapError for an unset prefix value under GapPolicy::FAIL.
   */
  EvaluationResult Evaluate(const std::vector<fp::FeatureRow>& rows,
                            const CoordinateModel& model) const;

private:
  GapPolicy gap_policy_;
};

} // namespace positioning
