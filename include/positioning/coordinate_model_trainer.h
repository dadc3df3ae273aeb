#pragma once
/**
 * @file coordinate_model_trainer.h
 * @brief Fit one regressor per coordinate axis on the reference tags' feature rows.
 */

#include "fingerprint/fingerprint_row.h"
#include "model/regressor.h"
#include "positioning/gap_policy.h"

#include <cstddef>
#include <memory>
#include <set>
#include <vector>

namespace positioning {

struct TrainerConfig {
  std::size_t feature_count = 0; // prefix length, 0 < feature_count <= L
  GapPolicy gap_policy = GapPolicy::FAIL;
  model::RegressorConfig regressor;
};

struct CoordinateModel {
  std::unique_ptr<model::IRegressor> reg_x;
  std::unique_ptr<model::IRegressor> reg_y;
  std::size_t feature_count = 0;
  std::size_t training_rows = 0;
  std::size_t skipped_rows = 0;  // reference rows left out by GapPolicy::SKIP_ROW
};

class CoordinateModelTrainer {
public:
  explicit CoordinateModelTrainer(const TrainerConfig& cfg);

  /**
   * @brief Train X and Y regressors independently on the reference rows.
   *
   * Inputs are the first `feature_count` entries of each row whose tag is in
   * `reference_tags`; labels are the row's true coordinates.
   *
   * @throws rfpos::ConfigurationError if no row belongs to a reference tag, a
   *         reference row lacks true coordinates, or feature_count is 0 or above
   *         the layout length.
   * @throws rfpos::DataGapError for an unset prefix value under GapPolicy::FAIL.
   */
  CoordinateModel Train(const std::vector<fp::FeatureRow>& rows,
                        const std::set<rfpos::TagId>& reference_tags,
                        const fp::FeatureLayout& layout) const;

  const TrainerConfig& config() const { return cfg_; }

private:
  TrainerConfig cfg_;
};

} // namespace positioning
