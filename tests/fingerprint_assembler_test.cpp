#include "fingerprint/fingerprint_assembler.h"
#include "common/errors.h"
#include "test_support.h"

#include <gtest/gtest.h>

namespace {

using rfpos_test::At;
using rfpos_test::MakeReading;

fp::FingerprintAssembler MakeAssembler() {
  return fp::FingerprintAssembler(fp::BuildAntennaAxis({{"A2", 1.0, 0.0}, {"A1", 0.0, 0.0}}));
}

TEST(AntennaAxis, SortsAndDeduplicates) {
  const fp::AntennaAxis axis({"A3", "A1", "A2", "A1"});
  ASSERT_EQ(axis.size(), 3u);
  EXPECT_EQ(axis.ids()[0], "A1");
  EXPECT_EQ(axis.IndexOf("A2"), 1u);
  EXPECT_EQ(axis.IndexOf("B9"), fp::AntennaAxis::npos);
}

TEST(FingerprintAssembler, PivotsReadingsPerTagAndTimestamp) {
  const auto rows = MakeAssembler().Assemble(
      {MakeReading("T1", "A2", -60.0, 2, 1), MakeReading("T1", "A1", -50.0, 1, 1),
       MakeReading("T1", "A1", -51.0, 3, 2)},
      fp::TruthMap{});

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].timestamp, At(1));
  EXPECT_DOUBLE_EQ(*rows[0].rssi[0], -50.0);
  EXPECT_DOUBLE_EQ(*rows[0].rssi[1], -60.0);
  EXPECT_DOUBLE_EQ(*rows[0].rc[0], 1.0);
  EXPECT_DOUBLE_EQ(*rows[0].rc[1], 2.0);

  // A2 did not answer at t=2
  EXPECT_DOUBLE_EQ(*rows[1].rssi[0], -51.0);
  EXPECT_FALSE(rows[1].rssi[1].has_value());
  EXPECT_FALSE(rows[1].rc[1].has_value());
}

TEST(FingerprintAssembler, OrdersByTagThenTime) {
  const auto rows = MakeAssembler().Assemble(
      {MakeReading("T2", "A1", -50.0, 1, 1), MakeReading("T1", "A1", -50.0, 1, 5),
       MakeReading("T1", "A1", -50.0, 1, 2)},
      fp::TruthMap{});
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].tag_id, "T1");
  EXPECT_EQ(rows[0].timestamp, At(2));
  EXPECT_EQ(rows[1].timestamp, At(5));
  EXPECT_EQ(rows[2].tag_id, "T2");
}

TEST(FingerprintAssembler, AveragesDuplicateCells) {
  const auto rows = MakeAssembler().Assemble(
      {MakeReading("T1", "A1", -50.0, 1, 1), MakeReading("T1", "A1", -54.0, 3, 1)},
      fp::TruthMap{});
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_DOUBLE_EQ(*rows[0].rssi[0], -52.0);
  EXPECT_DOUBLE_EQ(*rows[0].rc[0], 2.0);
}

TEST(FingerprintAssembler, LeftJoinsTrueCoordinates) {
  const fp::TruthMap truth = fp::BuildTruthMap(
      {rfpos_test::MakeReference("T1", 1.5, 2.5), rfpos_test::MakeTarget("T2")});
  const auto rows = MakeAssembler().Assemble(
      {MakeReading("T1", "A1", -50.0, 1, 1), MakeReading("T2", "A1", -50.0, 1, 1)}, truth);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_DOUBLE_EQ(*rows[0].true_x, 1.5);
  EXPECT_DOUBLE_EQ(*rows[0].true_y, 2.5);
  EXPECT_FALSE(rows[1].true_x.has_value());
}

TEST(FingerprintAssembler, RejectsUnknownAntennaAndEmptyTag) {
  const auto a = MakeAssembler();
  EXPECT_THROW(a.Assemble({MakeReading("T1", "A9", -50.0, 1, 1)}, fp::TruthMap{}), rfpos::DataError);
  EXPECT_THROW(a.Assemble({MakeReading("", "A1", -50.0, 1, 1)}, fp::TruthMap{}), rfpos::DataError);
}

TEST(FingerprintAssembler, NoReadingsGiveNoRows) {
  EXPECT_TRUE(MakeAssembler().Assemble({}, fp::TruthMap{}).empty());
}

TEST(FeatureLayout, BlockOffsetsAndNames) {
  fp::FeatureLayout layout;
  layout.antenna_count = 2;
  const fp::AntennaAxis axis({"A1", "A2"});
  EXPECT_EQ(layout.Length(), 20u);
  EXPECT_EQ(layout.BlockOffset(fp::FeatureBlock::MEAN), 4u);
  EXPECT_EQ(layout.BlockOffset(fp::FeatureBlock::STDDEV), 16u);
  EXPECT_EQ(layout.FeatureName(1, axis), "rssi_A2");
  EXPECT_EQ(layout.FeatureName(2, axis), "rc_A1");
  EXPECT_EQ(layout.FeatureName(7, axis), "mean_rc_A2");
  EXPECT_EQ(layout.FeatureName(19, axis), "stddev_rc_A2");
}

} // namespace
