#include <labelscan/vision/stability_detector.hpp>
#include <gtest/gtest.h>

namespace nv = labelscan::vision;
namespace nc = labelscan::core;

namespace {

constexpr const char* kAddress = "12 rue de la Paix 75002 Paris";

}  // namespace

TEST(Signature, SummarizesNumbersKeywordsAndWords) {
  EXPECT_EQ(nv::compute_signature(kAddress), "12-75002|rue|paris");
  EXPECT_EQ(nv::compute_signature("Paris 75002, rue de la Paix 12"),
            nv::compute_signature(kAddress));
  EXPECT_EQ(nv::compute_signature(""), "");
}

TEST(Signature, LooksLikeAddress) {
  EXPECT_TRUE(nv::looks_like_address(kAddress));
  EXPECT_TRUE(nv::looks_like_address("8 avenue Foch"));
  EXPECT_FALSE(nv::looks_like_address("hello there world"));
  EXPECT_FALSE(nv::looks_like_address("75002"));
}

TEST(StabilityDetector, AdvancesToReading) {
  nv::StabilityDetector detector;
  const nc::Rect box{10, 20, 300, 60};

  auto r = detector.process(kAddress, box);
  EXPECT_EQ(r.phase, nv::ScanPhase::Search);
  EXPECT_EQ(r.stable_count, 1);
  EXPECT_FALSE(r.text_box.has_value());
  EXPECT_TRUE(r.address_like);

  r = detector.process(kAddress, box);
  EXPECT_EQ(r.phase, nv::ScanPhase::Locking);
  EXPECT_FALSE(r.locked_text.has_value());

  r = detector.process(kAddress, box);
  EXPECT_EQ(r.phase, nv::ScanPhase::Reading);
  EXPECT_EQ(r.stable_count, 3);
  ASSERT_TRUE(r.locked_text.has_value());
  EXPECT_EQ(*r.locked_text, kAddress);
  EXPECT_EQ(r.text_box, std::optional<nc::Rect>(box));
}

TEST(StabilityDetector, ContentChangeRestartsCount) {
  nv::StabilityDetector detector;
  detector.process(kAddress);
  detector.process(kAddress);
  const auto r = detector.process("Colis 98765 boulevard Haussmann");
  EXPECT_EQ(r.stable_count, 1);
  EXPECT_EQ(r.phase, nv::ScanPhase::Search);
}

TEST(StabilityDetector, BoxHeldOverOneFrame) {
  nv::StabilityDetector detector;
  const nc::Rect box{10, 20, 300, 60};
  for (int i = 0; i < 3; ++i) detector.process(kAddress, box);

  auto r = detector.process("", std::nullopt);
  EXPECT_EQ(r.phase, nv::ScanPhase::Reading);
  EXPECT_EQ(r.text_box, std::optional<nc::Rect>(box));
  r = detector.process("", std::nullopt);
  EXPECT_FALSE(r.text_box.has_value());
  EXPECT_EQ(detector.unstable_frames(), 2);
}

TEST(StabilityDetector, UnlocksAfterSustainedLoss) {
  nv::StabilityDetector detector;
  for (int i = 0; i < 3; ++i) detector.process(kAddress);
  nv::StabilityResult r;
  for (int i = 0; i < 9; ++i) r = detector.process("short");
  EXPECT_EQ(r.phase, nv::ScanPhase::Reading);
  EXPECT_TRUE(r.locked_text.has_value());

  r = detector.process("short");
  EXPECT_EQ(r.phase, nv::ScanPhase::Search);
  EXPECT_FALSE(r.locked_text.has_value());
  EXPECT_EQ(detector.state().stable_count, 0);
}

TEST(StabilityDetector, ResetClearsState) {
  nv::StabilityDetector detector;
  for (int i = 0; i < 3; ++i) detector.process(kAddress);
  detector.reset();
  EXPECT_EQ(detector.state().phase, nv::ScanPhase::Search);
  EXPECT_TRUE(detector.state().last_signature.empty());
  EXPECT_EQ(detector.process(kAddress).stable_count, 1);
}
