#include "positioning/position_evaluator.h"
#include "common/errors.h"
#include "test_support.h"

#include <gtest/gtest.h>

namespace {

fp::FeatureLayout one_antenna() {
  fp::FeatureLayout l;
  l.antenna_count = 1;
  return l;
}

fp::FeatureRow make_row(const rfpos::TagId& tag, int seconds, double v, rfpos::OptDouble tx,
                        rfpos::OptDouble ty) {
  fp::FeatureRow r;
  r.tag_id = tag;
  r.timestamp = rfpos_test::At(seconds);
  r.features.assign(10, rfpos::OptDouble(v));
  r.true_x = tx;
  r.true_y = ty;
  return r;
}

// Nearest-neighbour model: feature value 0 -> (0,0), 10 -> (10,20).
positioning::CoordinateModel train_model(std::size_t feature_count) {
  positioning::TrainerConfig cfg;
  cfg.feature_count = feature_count;
  cfg.regressor.type = "knn";
  cfg.regressor.k = 1;
  const std::vector<fp::FeatureRow> rows = {make_row("R1", 0, 0.0, 0.0, 0.0),
                                            make_row("R2", 0, 10.0, 10.0, 20.0)};
  return positioning::CoordinateModelTrainer(cfg).Train(rows, {"R1", "R2"}, one_antenna());
}

TEST(PositionEvaluator, PredictsEveryRowInInputOrder) {
  const auto model = train_model(10);
  const std::vector<fp::FeatureRow> rows = {make_row("T1", 2, 9.0, 10.0, 20.0),
                                            make_row("R1", 1, 0.0, 0.0, 0.0)};
  const auto res = positioning::PositionEvaluator().Evaluate(rows, model);

  ASSERT_EQ(res.predictions.size(), 2u);
  EXPECT_EQ(res.predictions[0].tag_id, "T1");
  EXPECT_DOUBLE_EQ(*res.predictions[0].pred_x, 10.0);
  EXPECT_DOUBLE_EQ(*res.predictions[0].pred_y, 20.0);
  EXPECT_DOUBLE_EQ(*res.predictions[1].pred_x, 0.0);
  EXPECT_EQ(res.skipped_rows, 0u);
}

TEST(PositionEvaluator, MeanAbsoluteErrorPerTag) {
  const auto model = train_model(10);
  // T1 truth (4,4), predicted (0,0) then (10,20): x errors 4 and 6, y errors 4 and 16
  const std::vector<fp::FeatureRow> rows = {make_row("T1", 1, 1.0, 4.0, 4.0),
                                            make_row("T1", 2, 9.0, 4.0, 4.0),
                                            make_row("R1", 1, 0.0, 0.0, 0.0)};
  const auto res = positioning::PositionEvaluator().Evaluate(rows, model);

  ASSERT_EQ(res.errors.size(), 2u);
  EXPECT_EQ(res.errors[0].tag_id, "R1");
  EXPECT_DOUBLE_EQ(res.errors[0].mae_avg, 0.0);

  const positioning::TagErrorSummary& t1 = res.errors[1];
  EXPECT_EQ(t1.tag_id, "T1");
  EXPECT_EQ(t1.rows, 2u);
  EXPECT_DOUBLE_EQ(t1.mae_x, 5.0);
  EXPECT_DOUBLE_EQ(t1.mae_y, 10.0);
  EXPECT_DOUBLE_EQ(t1.mae_avg, 7.5);
}

TEST(PositionEvaluator, LatestIsMostRecentPredictedRow) {
  const auto model = train_model(10);
  const std::vector<fp::FeatureRow> rows = {make_row("T1", 5, 9.0, std::nullopt, std::nullopt),
                                            make_row("T1", 3, 1.0, std::nullopt, std::nullopt)};
  const auto res = positioning::PositionEvaluator().Evaluate(rows, model);

  ASSERT_EQ(res.latest.count("T1"), 1u);
  const positioning::LatestPosition& lp = res.latest.at("T1");
  EXPECT_EQ(lp.timestamp, rfpos_test::At(5));
  EXPECT_DOUBLE_EQ(lp.x, 10.0);
  EXPECT_DOUBLE_EQ(lp.y, 20.0);
}

TEST(PositionEvaluator, TagWithoutTruthHasNoErrorSummary) {
  const auto model = train_model(10);
  const std::vector<fp::FeatureRow> rows = {make_row("T9", 1, 1.0, std::nullopt, std::nullopt)};
  const auto res = positioning::PositionEvaluator().Evaluate(rows, model);
  EXPECT_TRUE(res.errors.empty());
  EXPECT_TRUE(res.predictions[0].pred_x.has_value());
}

TEST(PositionEvaluator, GapPolicyControlsRowsWithUnsetPrefix) {
  const auto model = train_model(10);
  std::vector<fp::FeatureRow> rows = {make_row("T1", 1, 9.0, 4.0, 4.0),
                                      make_row("T1", 2, 1.0, 4.0, 4.0)};
  rows[1].features[3].reset();

  EXPECT_THROW(positioning::PositionEvaluator(positioning::GapPolicy::FAIL).Evaluate(rows, model),
               rfpos::DataGapError);

  const auto res =
      positioning::PositionEvaluator(positioning::GapPolicy::SKIP_ROW).Evaluate(rows, model);
  EXPECT_EQ(res.skipped_rows, 1u);
  EXPECT_FALSE(res.predictions[1].pred_x.has_value());
  // skipped row neither counts toward the error nor becomes the latest position
  ASSERT_EQ(res.errors.size(), 1u);
  EXPECT_EQ(res.errors[0].rows, 1u);
  EXPECT_EQ(res.latest.at("T1").timestamp, rfpos_test::At(1));
}

TEST(PositionEvaluator, GapOutsidePrefixDoesNotMatter) {
  const auto model = train_model(3);
  std::vector<fp::FeatureRow> rows = {make_row("T1", 1, 9.0, std::nullopt, std::nullopt)};
  rows[0].features[7].reset();
  const auto res = positioning::PositionEvaluator().Evaluate(rows, model);
  EXPECT_TRUE(res.predictions[0].pred_x.has_value());
}

TEST(PositionEvaluator, UntrainedModelIsRejected) {
  positioning::CoordinateModel empty;
  EXPECT_THROW(positioning::PositionEvaluator().Evaluate({}, empty), rfpos::ConfigurationError);
}

} // namespace
