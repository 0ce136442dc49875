#include <labelscan/vision/block_clustering.hpp>
#include "rect_cv_utils.hpp"

#include <algorithm>
#include <limits>

namespace labelscan::vision {

std::vector<core::TextBlock> filter_blocks(const std::vector<core::TextBlock>& blocks,
                                           const BlockFilterConfig& config) {
  std::vector<core::TextBlock> out;
  for (const auto& block : blocks) {
    if (!block.bounds) continue;
    const core::Rect& r = *block.bounds;
    if (r.width < config.min_width || r.height < config.min_height) continue;
    if (r.area() < config.min_area || r.height <= 0.f) continue;
    const float aspect = r.width / r.height;
    if (aspect < config.min_aspect_ratio || aspect > config.max_aspect_ratio) continue;
    out.push_back(block);
  }
  return out;
}

std::vector<TextCluster> cluster_blocks(std::vector<core::TextBlock> blocks, float max_gap_y,
                                        std::size_t min_blocks) {
  std::vector<TextCluster> clusters;
  std::erase_if(blocks, [](const core::TextBlock& b) { return !b.bounds; });
  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const core::TextBlock& a, const core::TextBlock& b) {
                     return a.bounds->y < b.bounds->y;
                   });

  std::vector<TextCluster> open;
  cv::Rect2f current;
  for (auto& block : blocks) {
    const cv::Rect2f r = detail::to_cv(*block.bounds);
    if (open.empty() || r.y - (current.y + current.height) > max_gap_y) {
      if (!open.empty()) {
        open.back().bounds = detail::from_cv(current);
        clusters.push_back(std::move(open.back()));
        open.clear();
      }
      open.emplace_back();
      current = r;
    } else {
      current |= r;
    }
    TextCluster& c = open.back();
    c.total_area += r.area();
    c.total_chars += block.text.size();
    c.blocks.push_back(std::move(block));
  }
  if (!open.empty()) {
    open.back().bounds = detail::from_cv(current);
    clusters.push_back(std::move(open.back()));
  }

  std::erase_if(clusters, [min_blocks](const TextCluster& c) { return c.blocks.size() < min_blocks; });
  return clusters;
}

std::optional<std::size_t> select_cluster(const std::vector<TextCluster>& clusters,
                                          const ClusterSelection& selection) {
  if (clusters.empty()) return std::nullopt;

  if (selection.tap) {
    const cv::Point2f tap(selection.tap->x, selection.tap->y);
    std::optional<std::size_t> nearest;
    float nearest_distance = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < clusters.size(); ++i) {
      const float d = detail::distance_to(detail::to_cv(clusters[i].bounds), tap);
      if (d < nearest_distance) {
        nearest_distance = d;
        nearest = i;
      }
    }
    if (nearest && nearest_distance <= selection.tap_radius) return nearest;
  }

  float max_area = 0.f;
  std::size_t max_chars = 0;
  for (const auto& c : clusters) {
    max_area = std::max(max_area, c.total_area);
    max_chars = std::max(max_chars, c.total_chars);
  }
  std::size_t best = 0;
  float best_score = -1.f;
  for (std::size_t i = 0; i < clusters.size(); ++i) {
    const float area = max_area > 0.f ? clusters[i].total_area / max_area : 0.f;
    const float chars = max_chars > 0
                            ? static_cast<float>(clusters[i].total_chars) / static_cast<float>(max_chars)
                            : 0.f;
    const float score = selection.area_weight * area + selection.chars_weight * chars;
    if (score > best_score) {
      best_score = score;
      best = i;
    }
  }
  return best;
}

}  // namespace labelscan::vision
