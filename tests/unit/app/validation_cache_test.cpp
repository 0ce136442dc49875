#include <labelscan/app/validation_cache.hpp>
#include <gtest/gtest.h>

namespace na = labelscan::app;
using namespace std::chrono_literals;

namespace {

na::ValidationResponse response(std::string source) {
  na::ValidationResponse r;
  r.is_valid = true;
  r.confidence = 0.9f;
  r.source = std::move(source);
  return r;
}

}  // namespace

TEST(ValidationCache, KeyIsNormalized) {
  const na::ValidationCache cache(20, 300000ms, 10);
  EXPECT_EQ(cache.make_key("  12  RUE\n de\tla Paix "), "12 rue de ");
  EXPECT_EQ(cache.make_key(""), "");
}

TEST(ValidationCache, HitIgnoresCaseAndSpacing) {
  na::ValidationCache cache(20, 300000ms);
  const auto now = na::ValidationCache::Clock::now();
  cache.put("12 rue de la Paix\n75002 Paris", response("geocoder"), now);
  const auto hit = cache.get("12 RUE DE LA PAIX   75002 paris", now + 1s);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->source, "geocoder");
  EXPECT_FALSE(cache.get("13 rue de la Paix", now).has_value());
}

TEST(ValidationCache, ExpiredEntryIsRemoved) {
  na::ValidationCache cache(20, 1000ms);
  const auto now = na::ValidationCache::Clock::now();
  cache.put("a", response("x"), now);
  EXPECT_TRUE(cache.get("a", now + 999ms).has_value());
  EXPECT_FALSE(cache.get("a", now + 1000ms).has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST(ValidationCache, EvictsOldestWhenFull) {
  na::ValidationCache cache(2, 300000ms);
  const auto now = na::ValidationCache::Clock::now();
  cache.put("a", response("a"), now);
  cache.put("b", response("b"), now);
  cache.put("a", response("a2"), now);  // refresh moves "a" to newest
  cache.put("c", response("c"), now);
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_FALSE(cache.get("b", now).has_value());
  ASSERT_TRUE(cache.get("a", now).has_value());
  EXPECT_EQ(cache.get("a", now)->source, "a2");
  EXPECT_TRUE(cache.get("c", now).has_value());
}

TEST(ValidationCache, ZeroCapacityStoresNothing) {
  na::ValidationCache cache(0, 300000ms);
  const auto now = na::ValidationCache::Clock::now();
  cache.put("a", response("a"), now);
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get("a", now).has_value());
}

TEST(ValidationCache, Clear) {
  na::ValidationCache cache(5, 300000ms);
  const auto now = na::ValidationCache::Clock::now();
  cache.put("a", response("a"), now);
  cache.put("b", response("b"), now);
  cache.evict_oldest();
  EXPECT_EQ(cache.size(), 1u);
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  cache.evict_oldest();
  EXPECT_EQ(cache.size(), 0u);
}
