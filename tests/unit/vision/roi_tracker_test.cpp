#include <labelscan/vision/roi_tracker.hpp>
#include <gtest/gtest.h>

namespace nv = labelscan::vision;
namespace nc = labelscan::core;

namespace {

nc::RawObservation address_frame(float y_offset = 0.f) {
  nc::RawObservation obs;
  obs.frame_width = 1000;
  obs.frame_height = 800;
  obs.blocks = {
      {"75002 Paris", nc::Rect{100, 340 + y_offset, 200, 30}},
      {"12 rue de la Paix", nc::Rect{100, 300 + y_offset, 300, 30}},
  };
  return obs;
}

}  // namespace

TEST(RoiTracker, SearchWindowBeforeFirstCluster) {
  nv::RoiTracker tracker;
  nc::RawObservation empty;
  empty.frame_width = 1000;
  empty.frame_height = 800;
  const auto update = tracker.process(empty);
  EXPECT_FALSE(update.cluster_found);
  ASSERT_TRUE(update.roi.has_value());
  EXPECT_EQ(*update.roi, (nc::Rect{50, 240, 900, 320}));
  EXPECT_TRUE(update.roi_text.empty());
  EXPECT_FALSE(tracker.current_roi().has_value());
}

TEST(RoiTracker, CentersRoiOnCluster) {
  nv::RoiTracker tracker;
  const auto update = tracker.process(address_frame());
  EXPECT_TRUE(update.cluster_found);
  ASSERT_TRUE(update.roi.has_value());
  EXPECT_EQ(*update.roi, (nc::Rect{0, 175, 900, 320}));
  ASSERT_EQ(update.roi_blocks.size(), 2u);
  EXPECT_EQ(update.roi_text, "12 rue de la Paix\n75002 Paris");
}

TEST(RoiTracker, SmoothsMovement) {
  nv::RoiTracker tracker;
  tracker.process(address_frame());
  const auto update = tracker.process(address_frame(100.f));
  ASSERT_TRUE(update.roi.has_value());
  // Target moved from 175 to 275; the estimate moves only part of the way.
  EXPECT_GT(update.roi->y, 175.f);
  EXPECT_LT(update.roi->y, 275.f);
  EXPECT_FLOAT_EQ(update.roi->width, 900.f);
}

TEST(RoiTracker, RoiPersistsWithoutCluster) {
  nv::RoiTracker tracker;
  tracker.process(address_frame());
  nc::RawObservation empty;
  empty.frame_width = 1000;
  empty.frame_height = 800;
  const auto update = tracker.process(empty);
  EXPECT_FALSE(update.cluster_found);
  ASSERT_TRUE(update.roi.has_value());
  EXPECT_EQ(*update.roi, (nc::Rect{0, 175, 900, 320}));
}

TEST(RoiTracker, BlocksOutsideRoiAreExcluded) {
  nv::RoiTracker tracker;
  auto obs = address_frame();
  obs.blocks.push_back({"PRIORITAIRE", nc::Rect{100, 700, 200, 40}});
  const auto update = tracker.process(obs);
  EXPECT_EQ(update.roi_text, "12 rue de la Paix\n75002 Paris");
}

TEST(RoiTracker, ResetReturnsToSearchWindow) {
  nv::RoiTracker tracker;
  tracker.set_tap_point(nc::Point{10, 10});
  tracker.process(address_frame());
  tracker.reset();
  EXPECT_FALSE(tracker.current_roi().has_value());
  nc::RawObservation empty;
  empty.frame_width = 1000;
  empty.frame_height = 800;
  EXPECT_EQ(*tracker.process(empty).roi, (nc::Rect{50, 240, 900, 320}));
}
