#include "application/bitrate_policy.hpp"
#include <gtest/gtest.h>

namespace relay_service {
namespace {

TEST(BitratePolicyTest, MaxBitrateFollowsUploadBudget) {
  // (50 * 8000 / 60 - 128) * 0.97
  EXPECT_EQ(maxBitrateFor(60, 50), 6342u);
  // (50 * 8000 / 600 - 128) * 0.97
  EXPECT_EQ(maxBitrateFor(600, 50), 522u);
}

TEST(BitratePolicyTest, MaxBitrateUnknownForZeroDuration) {
  EXPECT_FALSE(maxBitrateFor(0, 50).has_value());
}

TEST(BitratePolicyTest, MaxBitrateNeverNegative) {
  // a ten hour video leaves less than the audio reserve
  EXPECT_EQ(maxBitrateFor(36000, 50), 0u);
}

TEST(BitratePolicyTest, QualityCutoffIsEightyFivePercent) {
  EXPECT_EQ(qualityCutoff(1000), 850u);
  EXPECT_EQ(qualityCutoff(999), 849u);
  EXPECT_EQ(qualityCutoff(0), 0u);
}

TEST(BitratePolicyTest, SourceBelowBudgetIsNotReduced) {
  auto decision = decideBitrate(ProbeMetadata{60, 2000, 1920, 1080}, 50, false);
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->max_bitrate, 6342u);
  EXPECT_FALSE(decision->reduced);
  EXPECT_FALSE(decision->target_bitrate.has_value());
}

TEST(BitratePolicyTest, LargeDropRejectedWithoutFallback) {
  auto decision = decideBitrate(ProbeMetadata{600, 2000, 1920, 1080}, 50, false);
  ASSERT_FALSE(decision.has_value());
  EXPECT_EQ(decision.error().kind, ErrorKind::QualityDegradation);
  EXPECT_NE(decision.error().message.find("2000 kbps to 522 kbps"), std::string::npos);
}

TEST(BitratePolicyTest, LargeDropAcceptedWithFallback) {
  auto decision = decideBitrate(ProbeMetadata{600, 2000, 1920, 1080}, 50, true);
  ASSERT_TRUE(decision.has_value());
  EXPECT_TRUE(decision->reduced);
  EXPECT_EQ(decision->target_bitrate, 522u);
}

TEST(BitratePolicyTest, SmallDropAcceptedWithoutFallback) {
  // cutoff for 600 kbps is 510, budget is 522
  auto decision = decideBitrate(ProbeMetadata{600, 600, 1280, 720}, 50, false);
  ASSERT_TRUE(decision.has_value());
  EXPECT_TRUE(decision->reduced);
  EXPECT_EQ(decision->target_bitrate, 522u);
}

TEST(BitratePolicyTest, UnknownDurationSkipsReduction) {
  auto decision = decideBitrate(ProbeMetadata{0, 5000, 1280, 720}, 50, false);
  ASSERT_TRUE(decision.has_value());
  EXPECT_FALSE(decision->max_bitrate.has_value());
  EXPECT_FALSE(decision->reduced);
}

TEST(BitratePolicyTest, UnknownOriginalBitrateSkipsQualityCheck) {
  // zero is below any budget, so the encode is left unconstrained
  auto decision = decideBitrate(ProbeMetadata{600, 0, 1280, 720}, 50, false);
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->max_bitrate, 522u);
  EXPECT_FALSE(decision->reduced);
  EXPECT_FALSE(decision->target_bitrate.has_value());
}

TEST(BitratePolicyTest, TenMinutesAtOneMegabitNeedsFallback) {
  // cutoff for 1000 kbps is 850, budget is 522
  auto rejected = decideBitrate(ProbeMetadata{600, 1000, 1280, 720}, 50, false);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, ErrorKind::QualityDegradation);
  EXPECT_NE(rejected.error().message.find("1000 kbps to 522 kbps"), std::string::npos);

  auto accepted = decideBitrate(ProbeMetadata{600, 1000, 1280, 720}, 50, true);
  ASSERT_TRUE(accepted.has_value());
  EXPECT_TRUE(accepted->reduced);
  EXPECT_EQ(accepted->target_bitrate, 522u);
}

} // namespace
} // namespace relay_service
