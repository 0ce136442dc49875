#include <labelscan/app/config.hpp>
#include <labelscan/app/mock_validation_client.hpp>
#include <labelscan/app/scan_session.hpp>
#include <gtest/gtest.h>
#include <memory>

namespace {

using namespace labelscan::core;
using namespace labelscan::vision;
using namespace labelscan::app;
using namespace std::chrono_literals;

RawObservation label_frame() {
  RawObservation obs;
  obs.frame_width = 1000;
  obs.frame_height = 800;
  obs.blocks = {
      {"M. Jean Martin", Rect{100, 300, 250, 30}},
      {"8 rue Victor Hugo", Rect{100, 340, 300, 30}},
      {"33000 Bordeaux", Rect{100, 380, 220, 30}},
      {"x", Rect{900, 20, 4, 4}},
  };
  return obs;
}

std::shared_ptr<MockValidationClient> accepting_client() {
  auto client = std::make_shared<MockValidationClient>();
  ValidationResponse r;
  r.is_valid = true;
  r.confidence = 0.92f;
  r.source = "geocoder";
  r.address.street = "8 Rue Victor Hugo";
  r.address.postal_code = "33000";
  r.address.city = "Bordeaux";
  client->set_response(r);
  return client;
}

}  // namespace

TEST(ScanSession, FramesToValidatedRecord) {
  auto client = accepting_client();
  ScanSession session(default_config(), client);
  const auto t0 = ScanSession::Clock::now();

  auto update = session.process_frame(label_frame(), t0);
  EXPECT_TRUE(update.tracker.cluster_found);
  EXPECT_EQ(update.tracker.roi_text, "M. Jean Martin\n8 rue Victor Hugo\n33000 Bordeaux");
  EXPECT_EQ(update.stability.phase, ScanPhase::Search);

  update = session.process_frame(label_frame(), t0 + 100ms);
  EXPECT_EQ(update.stability.phase, ScanPhase::Locking);

  update = session.process_frame(label_frame(), t0 + 200ms);
  EXPECT_EQ(update.stability.phase, ScanPhase::Reading);
  EXPECT_TRUE(update.stability.text_box.has_value());

  session.flush(t0 + 200ms);
  ASSERT_TRUE(session.last_parsed().has_value());
  EXPECT_EQ(session.last_parsed()->postal_code, "33000");
  EXPECT_EQ(session.last_parsed()->street, "8 rue Victor Hugo");
  EXPECT_EQ(session.validator().status(), ValidationStatus::Validating);
  EXPECT_EQ(client->call_count(), 0u);

  EXPECT_EQ(session.poll(t0 + 700ms), ValidationStatus::Validated);
  EXPECT_EQ(client->call_count(), 1u);
  const auto record = session.validator().final_record();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->street, "8 Rue Victor Hugo");
  EXPECT_EQ(record->first_name, "Jean");
  EXPECT_EQ(record->last_name, "Martin");

  // Further identical frames neither reparse nor revalidate.
  update = session.process_frame(label_frame(), t0 + 800ms);
  EXPECT_FALSE(update.submitted);
  EXPECT_EQ(update.status, ValidationStatus::Validated);
  EXPECT_EQ(client->call_count(), 1u);
}

TEST(ScanSession, EmptyFramesStayIdle) {
  ScanSession session(default_config(), std::make_shared<MockValidationClient>());
  RawObservation empty;
  empty.frame_width = 1000;
  empty.frame_height = 800;
  const auto t0 = ScanSession::Clock::now();
  for (int i = 0; i < 5; ++i) {
    const auto update = session.process_frame(empty, t0 + i * 100ms);
    EXPECT_FALSE(update.tracker.cluster_found);
    EXPECT_EQ(update.stability.phase, ScanPhase::Search);
    EXPECT_EQ(update.status, ValidationStatus::Idle);
  }
  EXPECT_FALSE(session.flush(t0 + 1s).has_value());
  EXPECT_FALSE(session.screen_roi(400, 800).has_value());
}

TEST(ScanSession, ScreenRoiFollowsTracker) {
  ScanSession session(default_config(), std::make_shared<MockValidationClient>());
  session.process_frame(label_frame(), ScanSession::Clock::now());
  const auto roi = session.screen_roi(1000, 800);
  ASSERT_TRUE(roi.has_value());
  EXPECT_EQ(*roi, (Rect{0, 195, 900, 320}));
  EXPECT_TRUE(session.screen_roi(400, 800).has_value());
}

TEST(ScanSession, ResetClearsEverything) {
  auto client = accepting_client();
  ScanSession session(default_config(), client);
  const auto t0 = ScanSession::Clock::now();
  for (int i = 0; i < 3; ++i) session.process_frame(label_frame(), t0 + i * 100ms);
  session.flush(t0 + 300ms);

  session.reset();
  EXPECT_FALSE(session.last_parsed().has_value());
  EXPECT_FALSE(session.tracker().current_roi().has_value());
  EXPECT_EQ(session.stability().state().phase, ScanPhase::Search);
  EXPECT_EQ(session.validator().status(), ValidationStatus::Idle);
  session.poll(t0 + 2s);
  EXPECT_EQ(client->call_count(), 0u);
}
