#include "positioning/coordinate_model_trainer.h"

#include "positioning/feature_selection.h"
#include "common/errors.h"
#include "common/log.h"

#include <sstream>
#include <string>

namespace positioning {

CoordinateModelTrainer::CoordinateModelTrainer(const TrainerConfig& cfg) : cfg_(cfg) {
  model::ValidateRegressorConfig(cfg_.regressor);
}

CoordinateModel CoordinateModelTrainer::Train(const std::vector<fp::FeatureRow>& rows,
                                              const std::set<rfpos::TagId>& reference_tags,
                                              const fp::FeatureLayout& layout) const {
  CheckFeatureCount(cfg_.feature_count, layout.Length());

  std::vector<std::size_t> use;
  std::size_t n_reference = 0;
  std::size_t skipped = 0;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const fp::FeatureRow& row = rows[i];
    if (reference_tags.count(row.tag_id) == 0) continue;
    ++n_reference;

    if (row.features.size() != layout.Length()) {
      throw rfpos::DataError("Feature row for tag '" + row.tag_id + "' has length " +
                             std::to_string(row.features.size()) + ", expected " +
                             std::to_string(layout.Length()));
    }
    if (!row.HasTruePosition()) {
      throw rfpos::ConfigurationError("Reference tag '" + row.tag_id + "' has no true coordinates");
    }
    const std::size_t gap = FirstGap(row, cfg_.feature_count);
    if (gap != cfg_.feature_count) {
      if (cfg_.gap_policy == GapPolicy::FAIL) {
        throw rfpos::DataGapError("Reference row for tag '" + row.tag_id + "' at t=" +
                                  std::to_string(row.timestamp) + " has an unset feature at column " +
                                  std::to_string(gap));
      }
      ++skipped;
      continue;
    }
    use.push_back(i);
  }

  if (n_reference == 0) {
    throw rfpos::ConfigurationError("No feature rows belong to a reference tag; cannot train");
  }
  if (use.empty()) {
    throw rfpos::ConfigurationError("Every reference row has a gap in the feature prefix; cannot train");
  }

  const model::Matrix X = BuildFeatureMatrix(rows, use, cfg_.feature_count);
  model::Vector yx((Eigen::Index)use.size());
  model::Vector yy((Eigen::Index)use.size());
  for (std::size_t r = 0; r < use.size(); ++r) {
    yx((Eigen::Index)r) = *rows[use[r]].true_x;
    yy((Eigen::Index)r) = *rows[use[r]].true_y;
  }

  CoordinateModel out;
  out.reg_x = model::CreateRegressor(cfg_.regressor);
  out.reg_y = model::CreateRegressor(cfg_.regressor);
  out.reg_x->Fit(X, yx);
  out.reg_y->Fit(X, yy);
  out.feature_count = cfg_.feature_count;
  out.training_rows = use.size();
  out.skipped_rows = skipped;

  if (rfpos::ShouldLog(rfpos::LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "Trained " << out.reg_x->Name() << " on " << out.training_rows << " rows x "
        << out.feature_count << " features (" << skipped << " skipped)";
    rfpos::Log(rfpos::LogLevel::DEBUG, oss.str());
  }
  if (skipped > 0) {
    rfpos::Log(rfpos::LogLevel::WARN, std::to_string(skipped) +
                                          " reference rows skipped for gaps in the feature prefix");
  }
  return out;
}

} // namespace positioning
