#include "positioning/position_evaluator.h"

#include "positioning/feature_selection.h"
#include "common/errors.h"

#include <cmath>
#include <string>

namespace positioning {
namespace {

struct ErrorAccumulator {
  double abs_x = 0.0;
  double abs_y = 0.0;
  std::size_t n = 0;
};

} // namespace

PositionEvaluator::PositionEvaluator(GapPolicy gap_policy) : gap_policy_(gap_policy) {}

EvaluationResult PositionEvaluator::Evaluate(const std::vector<fp::FeatureRow>& rows,
                                             const CoordinateModel& model) const {
  if (!model.reg_x || !model.reg_y || !model.reg_x->IsFitted() || !model.reg_y->IsFitted()) {
    throw rfpos::ConfigurationError("PositionEvaluator: coordinate model is not trained");
  }
  const std::size_t fc = model.feature_count;

  EvaluationResult out;
  out.predictions.resize(rows.size());

  std::vector<std::size_t> use;
  use.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const fp::FeatureRow& row = rows[i];
    RowPrediction& p = out.predictions[i];
    p.tag_id = row.tag_id;
    p.timestamp = row.timestamp;
    p.true_x = row.true_x;
    p.true_y = row.true_y;

    if (row.features.size() < fc) {
      throw rfpos::DataError("Feature row for tag '" + row.tag_id + "' is shorter than the feature prefix");
    }
    const std::size_t gap = FirstGap(row, fc);
    if (gap != fc) {
      if (gap_policy_ == GapPolicy::FAIL) {
        throw rfpos::DataGapError("Row for tag '" + row.tag_id + "' at t=" + std::to_string(row.timestamp) +
                                  " has an unset feature at column " + std::to_string(gap));
      }
      ++out.skipped_rows;
      continue;
    }
    use.push_back(i);
  }

  if (!use.empty()) {
    const model::Matrix X = BuildFeatureMatrix(rows, use, fc);
    const model::Vector px = model.reg_x->Predict(X);
    const model::Vector py = model.reg_y->Predict(X);
    for (std::size_t r = 0; r < use.size(); ++r) {
      RowPrediction& p = out.predictions[use[r]];
      p.pred_x = px((Eigen::Index)r);
      p.pred_y = py((Eigen::Index)r);
    }
  }

  std::map<rfpos::TagId, ErrorAccumulator> acc;
  for (const RowPrediction& p : out.predictions) {
    if (!p.pred_x || !p.pred_y) continue;

    auto it = out.latest.find(p.tag_id);
    if (it == out.latest.end() || p.timestamp >= it->second.timestamp) {
      LatestPosition& lp = out.latest[p.tag_id];
      lp.timestamp = p.timestamp;
      lp.x = *p.pred_x;
      lp.y = *p.pred_y;
    }

    if (p.true_x && p.true_y) {
      ErrorAccumulator& a = acc[p.tag_id];
      a.abs_x += std::fabs(*p.pred_x - *p.true_x);
      a.abs_y += std::fabs(*p.pred_y - *p.true_y);
      ++a.n;
    }
  }

  out.errors.reserve(acc.size());
  for (const auto& kv : acc) {
    TagErrorSummary s;
    s.tag_id = kv.first;
    s.rows = kv.second.n;
    s.mae_x = kv.second.abs_x / static_cast<double>(kv.second.n);
    s.mae_y = kv.second.abs_y / static_cast<double>(kv.second.n);
    s.mae_avg = 0.5 * (s.mae_x + s.mae_y);
    out.errors.push_back(s);
  }
  return out;
}

} // namespace positioning
