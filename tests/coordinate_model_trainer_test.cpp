#include "positioning/coordinate_model_trainer.h"
#include "positioning/feature_selection.h"
#include "positioning/gap_policy.h"
#include "common/errors.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// One antenna: L = 10 features per row.
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

positioning::TrainerConfig knn_config(std::size_t feature_count) {
  positioning::TrainerConfig cfg;
  cfg.feature_count = feature_count;
  cfg.regressor.type = "knn";
  cfg.regressor.k = 1;
  return cfg;
}

std::vector<fp::FeatureRow> reference_rows() {
  return {make_row("R1", 1, 0.0, 0.0, 0.0), make_row("R2", 1, 10.0, 5.0, 7.0),
          make_row("X1", 1, 3.0, std::nullopt, std::nullopt)};
}

TEST(GapPolicy, ParsesKnownNames) {
  EXPECT_EQ(positioning::ParseGapPolicy("fail"), positioning::GapPolicy::FAIL);
  EXPECT_EQ(positioning::ParseGapPolicy("SKIP_ROW"), positioning::GapPolicy::SKIP_ROW);
  EXPECT_STREQ(positioning::GapPolicyName(positioning::GapPolicy::SKIP_ROW), "skip_row");
  EXPECT_THROW(positioning::ParseGapPolicy("impute"), rfpos::ConfigurationError);
}

TEST(FeatureSelection, PrefixChecks) {
  fp::FeatureRow r = make_row("R1", 1, 1.0, 0.0, 0.0);
  r.features[4].reset();
  EXPECT_TRUE(positioning::PrefixComplete(r, 4));
  EXPECT_FALSE(positioning::PrefixComplete(r, 5));
  EXPECT_EQ(positioning::FirstGap(r, 10), 4u);
  EXPECT_EQ(positioning::FirstGap(r, 3), 3u);

  EXPECT_THROW(positioning::CheckFeatureCount(0, 10), rfpos::ConfigurationError);
  EXPECT_THROW(positioning::CheckFeatureCount(11, 10), rfpos::ConfigurationError);
  EXPECT_NO_THROW(positioning::CheckFeatureCount(10, 10));
}

TEST(FeatureSelection, MatrixHoldsSelectedRowsAndPrefix) {
  const auto rows = reference_rows();
  const model::Matrix X = positioning::BuildFeatureMatrix(rows, {1, 0}, 3);
  ASSERT_EQ(X.rows(), 2);
  ASSERT_EQ(X.cols(), 3);
  EXPECT_DOUBLE_EQ(X(0, 2), 10.0);
  EXPECT_DOUBLE_EQ(X(1, 0), 0.0);

  auto gappy = rows;
  gappy[0].features[1].reset();
  EXPECT_THROW(positioning::BuildFeatureMatrix(gappy, {0}, 3), rfpos::DataGapError);
}

TEST(FeatureSelection, ShorterPrefixKeepsLeadingColumns) {
  fp::FeatureLayout layout;
  layout.antenna_count = 2;
  const std::size_t L = layout.Length();

  std::vector<fp::FeatureRow> rows;
  for (int r = 0; r < 3; ++r) {
    fp::FeatureRow row = make_row("R" + std::to_string(r), r, 0.0, 0.0, 0.0);
    row.features.resize(L);
    for (std::size_t c = 0; c < L; ++c) row.features[c] = 100.0 * r + static_cast<double>(c);
    rows.push_back(row);
  }

  // raw blocks only, everything up to stddev, and the full vector
  const std::size_t raw_only = layout.BlockWidth(fp::FeatureBlock::RAW_SIGNAL) +
                               layout.BlockWidth(fp::FeatureBlock::RAW_READ_COUNT);
  const std::size_t no_stddev = layout.BlockOffset(fp::FeatureBlock::STDDEV);
  ASSERT_EQ(raw_only, layout.BlockOffset(fp::FeatureBlock::MEAN));
  ASSERT_EQ(no_stddev + layout.BlockWidth(fp::FeatureBlock::STDDEV), L);

  const std::vector<std::size_t> picked = {2, 0, 1};
  const model::Matrix raw = positioning::BuildFeatureMatrix(rows, picked, raw_only);
  const model::Matrix mid = positioning::BuildFeatureMatrix(rows, picked, no_stddev);
  const model::Matrix full = positioning::BuildFeatureMatrix(rows, picked, L);
  ASSERT_EQ(static_cast<std::size_t>(raw.cols()), raw_only);
  ASSERT_EQ(static_cast<std::size_t>(mid.cols()), no_stddev);
  ASSERT_EQ(static_cast<std::size_t>(full.cols()), L);

  for (Eigen::Index i = 0; i < full.rows(); ++i) {
    for (Eigen::Index c = 0; c < mid.cols(); ++c) {
      EXPECT_EQ(mid(i, c), full(i, c)) << "row " << i << " col " << c;
      if (c < raw.cols()) EXPECT_EQ(raw(i, c), full(i, c)) << "row " << i << " col " << c;
    }
  }
  EXPECT_DOUBLE_EQ(full(0, 0), 200.0);
  EXPECT_DOUBLE_EQ(full(1, static_cast<Eigen::Index>(L) - 1), static_cast<double>(L - 1));
}

TEST(CoordinateModelTrainer, TrainsOnReferenceRowsOnly) {
  const positioning::CoordinateModelTrainer trainer(knn_config(10));
  const auto m = trainer.Train(reference_rows(), {"R1", "R2"}, one_antenna());

  ASSERT_TRUE(m.reg_x && m.reg_y);
  EXPECT_EQ(m.training_rows, 2u);
  EXPECT_EQ(m.skipped_rows, 0u);
  EXPECT_EQ(m.feature_count, 10u);

  model::Matrix q = model::Matrix::Constant(1, 10, 9.0);
  EXPECT_DOUBLE_EQ(m.reg_x->Predict(q)(0), 5.0);
  EXPECT_DOUBLE_EQ(m.reg_y->Predict(q)(0), 7.0);
}

TEST(CoordinateModelTrainer, RejectsEmptyReferenceSet) {
  const positioning::CoordinateModelTrainer trainer(knn_config(10));
  EXPECT_THROW(trainer.Train(reference_rows(), {}, one_antenna()), rfpos::ConfigurationError);
  EXPECT_THROW(trainer.Train(reference_rows(), {"NOPE"}, one_antenna()), rfpos::ConfigurationError);
}

TEST(CoordinateModelTrainer, RejectsFeatureCountOutsideLayout) {
  EXPECT_THROW(positioning::CoordinateModelTrainer(knn_config(0))
                   .Train(reference_rows(), {"R1"}, one_antenna()),
               rfpos::ConfigurationError);
  EXPECT_THROW(positioning::CoordinateModelTrainer(knn_config(11))
                   .Train(reference_rows(), {"R1"}, one_antenna()),
               rfpos::ConfigurationError);
}

TEST(CoordinateModelTrainer, ReferenceRowWithoutTruthIsAConfigurationError) {
  const positioning::CoordinateModelTrainer trainer(knn_config(10));
  EXPECT_THROW(trainer.Train(reference_rows(), {"R1", "X1"}, one_antenna()),
               rfpos::ConfigurationError);
}

TEST(CoordinateModelTrainer, GapInPrefixFailsUnderFailPolicy) {
  auto rows = reference_rows();
  rows[0].features[2].reset();
  const positioning::CoordinateModelTrainer trainer(knn_config(10));
  EXPECT_THROW(trainer.Train(rows, {"R1", "R2"}, one_antenna()), rfpos::DataGapError);
}

TEST(CoordinateModelTrainer, GapInPrefixIsSkippedUnderSkipPolicy) {
  auto rows = reference_rows();
  rows[0].features[2].reset();
  positioning::TrainerConfig cfg = knn_config(10);
  cfg.gap_policy = positioning::GapPolicy::SKIP_ROW;

  const auto m = positioning::CoordinateModelTrainer(cfg).Train(rows, {"R1", "R2"}, one_antenna());
  EXPECT_EQ(m.training_rows, 1u);
  EXPECT_EQ(m.skipped_rows, 1u);

  rows[1].features[0].reset();
  EXPECT_THROW(positioning::CoordinateModelTrainer(cfg).Train(rows, {"R1", "R2"}, one_antenna()),
               rfpos::ConfigurationError);
}

TEST(CoordinateModelTrainer, GapOutsidePrefixIsIgnored) {
  auto rows = reference_rows();
  rows[0].features[9].reset();
  const auto m = positioning::CoordinateModelTrainer(knn_config(4))
                     .Train(rows, {"R1", "R2"}, one_antenna());
  EXPECT_EQ(m.training_rows, 2u);
  EXPECT_EQ(m.feature_count, 4u);
}

TEST(CoordinateModelTrainer, InvalidRegressorConfigFailsAtConstruction) {
  positioning::TrainerConfig cfg = knn_config(10);
  cfg.regressor.type = "svm";
  EXPECT_THROW(positioning::CoordinateModelTrainer{cfg}, rfpos::ConfigurationError);
}

} // namespace
