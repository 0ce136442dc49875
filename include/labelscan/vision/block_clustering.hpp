#pragma once

#include <labelscan/core/geometry.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace labelscan::vision {

/// Geometry limits below/above which a block is treated as noise rather than a text line.
struct BlockFilterConfig {
  float min_width{10.f};
  float min_height{8.f};
  float min_area{150.f};
  float min_aspect_ratio{0.2f};  // width / height
  float max_aspect_ratio{40.f};
};

/// Vertically adjacent text blocks.
struct TextCluster {
  std::vector<core::TextBlock> blocks;  // top to bottom
  core::Rect bounds;
  float total_area{0.f};
  std::size_t total_chars{0};
};

/// Blocks with bounds that pass every geometry limit; degenerate blocks are dropped.
[[nodiscard]] std::vector<core::TextBlock> filter_blocks(const std::vector<core::TextBlock>& blocks,
                                                         const BlockFilterConfig& config);

/// Groups blocks whose top lies within \p max_gap_y of the current cluster's
/// bottom edge; clusters with fewer than \p min_blocks blocks are discarded.
[[nodiscard]] std::vector<TextCluster> cluster_blocks(std::vector<core::TextBlock> blocks,
                                                      float max_gap_y, std::size_t min_blocks);

struct ClusterSelection {
  std::optional<core::Point> tap;  // pending user tap, frame coordinates
  float tap_radius{150.f};
  float area_weight{0.6f};
  float chars_weight{0.4f};
};

/// Index of the cluster containing or nearest to the tap (within its radius),
/// else of the one maximizing the weighted normalized area and character count.
[[nodiscard]] std::optional<std::size_t> select_cluster(const std::vector<TextCluster>& clusters,
                                                        const ClusterSelection& selection);

}  // namespace labelscan::vision
