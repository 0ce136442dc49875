#include <labelscan/vision/block_clustering.hpp>
#include <gtest/gtest.h>

namespace nv = labelscan::vision;
namespace nc = labelscan::core;

namespace {

nc::TextBlock block(std::string text, float x, float y, float w, float h) {
  return nc::TextBlock{std::move(text), nc::Rect{x, y, w, h}};
}

}  // namespace

TEST(BlockClustering, FilterDropsNoiseAndUnboundedBlocks) {
  const std::vector<nc::TextBlock> blocks = {
      block("12 rue de la Paix", 100, 300, 300, 30),
      block(".", 10, 10, 5, 5),                   // too small
      block("|", 10, 10, 12, 200),                // too tall for its width
      block("------------------", 0, 0, 900, 10),  // too flat
      nc::TextBlock{"no bounds", std::nullopt},
  };
  const auto kept = nv::filter_blocks(blocks, nv::BlockFilterConfig{});
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].text, "12 rue de la Paix");
}

TEST(BlockClustering, GroupsVerticallyAdjacentBlocks) {
  const std::vector<nc::TextBlock> blocks = {
      block("75002 Paris", 100, 340, 200, 30),
      block("12 rue de la Paix", 100, 300, 300, 30),
      block("Fragile", 500, 700, 100, 30),
      block("Haut", 500, 740, 80, 30),
  };
  const auto clusters = nv::cluster_blocks(blocks, 40.f, 2);
  ASSERT_EQ(clusters.size(), 2u);
  ASSERT_EQ(clusters[0].blocks.size(), 2u);
  EXPECT_EQ(clusters[0].blocks[0].text, "12 rue de la Paix");
  EXPECT_EQ(clusters[0].bounds, (nc::Rect{100, 300, 300, 70}));
  EXPECT_FLOAT_EQ(clusters[0].total_area, 9000.f + 6000.f);
  EXPECT_EQ(clusters[0].total_chars, 17u + 11u);
  EXPECT_EQ(clusters[1].bounds, (nc::Rect{500, 700, 100, 70}));
}

TEST(BlockClustering, SmallClustersAreDiscarded) {
  const std::vector<nc::TextBlock> blocks = {
      block("alone", 100, 100, 100, 30),
      block("line one", 100, 400, 100, 30),
      block("line two", 100, 440, 100, 30),
  };
  const auto clusters = nv::cluster_blocks(blocks, 40.f, 2);
  ASSERT_EQ(clusters.size(), 1u);
  EXPECT_EQ(clusters[0].blocks[0].text, "line one");
  EXPECT_TRUE(nv::cluster_blocks({}, 40.f, 2).empty());
}

TEST(BlockClustering, SelectPrefersLargerTextMass) {
  const std::vector<nc::TextBlock> blocks = {
      block("ab", 100, 100, 50, 20),
      block("cd", 100, 130, 50, 20),
      block("12 rue de la Paix", 100, 500, 300, 30),
      block("75002 Paris", 100, 540, 200, 30),
  };
  const auto clusters = nv::cluster_blocks(blocks, 40.f, 2);
  ASSERT_EQ(clusters.size(), 2u);
  const auto index = nv::select_cluster(clusters, nv::ClusterSelection{});
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 1u);
  EXPECT_FALSE(nv::select_cluster({}, nv::ClusterSelection{}).has_value());
}

TEST(BlockClustering, TapSelectsNearbyCluster) {
  const std::vector<nc::TextBlock> blocks = {
      block("ab", 100, 100, 50, 20),
      block("cd", 100, 130, 50, 20),
      block("12 rue de la Paix", 100, 500, 300, 30),
      block("75002 Paris", 100, 540, 200, 30),
  };
  const auto clusters = nv::cluster_blocks(blocks, 40.f, 2);
  nv::ClusterSelection selection;
  selection.tap = nc::Point{120, 120};
  EXPECT_EQ(nv::select_cluster(clusters, selection), std::optional<std::size_t>{0});

  // Outside the radius the tap is ignored.
  selection.tap = nc::Point{900, 100};
  selection.tap_radius = 150.f;
  EXPECT_EQ(nv::select_cluster(clusters, selection), std::optional<std::size_t>{1});
}
