#include <labelscan/app/mock_validation_client.hpp>
#include <gtest/gtest.h>

namespace na = labelscan::app;
namespace nc = labelscan::core;

TEST(MockValidationClient, DefaultOutcomeIsRejection) {
  na::MockValidationClient client;
  auto future = client.validate(na::ValidationRequest{"12 rue de la Paix", "", "", "", ""});
  const auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().kind, nc::ValidationErrorKind::Rejected);
  EXPECT_EQ(client.call_count(), 1u);
  EXPECT_EQ(client.requests()[0].raw_text, "12 rue de la Paix");
}

TEST(MockValidationClient, ScriptedResponse) {
  na::MockValidationClient client;
  na::ValidationResponse r;
  r.is_valid = true;
  r.confidence = 0.8f;
  r.source = "geocoder";
  client.set_response(r);
  const auto outcome = client.validate({}).get();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->source, "geocoder");

  client.set_failure(na::ValidationFailure{nc::ValidationErrorKind::Network, "timeout"});
  const auto failed = client.validate({}).get();
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().message, "timeout");
}

TEST(MockValidationClient, ManualModeResolvesInOrder) {
  na::MockValidationClient client;
  client.set_manual(true);
  auto first = client.validate({});
  auto second = client.validate({});
  EXPECT_EQ(client.pending_count(), 2u);
  EXPECT_NE(first.wait_for(std::chrono::seconds(0)), std::future_status::ready);

  na::ValidationResponse r;
  r.source = "first";
  EXPECT_TRUE(client.complete_next(r));
  EXPECT_EQ(first.get()->source, "first");
  EXPECT_NE(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  EXPECT_TRUE(client.complete_next());
  EXPECT_FALSE(second.get().has_value());
  EXPECT_FALSE(client.complete_next());
}
