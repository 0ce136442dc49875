#include <labelscan/vision/roi_tracker.hpp>
#include <labelscan/core/logging.hpp>
#include "rect_cv_utils.hpp"

#include <algorithm>

namespace labelscan::vision {

namespace {

// Fixed search window used before the first cluster is found.
constexpr float kSearchOffsetX = 0.05f;
constexpr float kSearchOffsetY = 0.30f;

}  // namespace

RoiTracker::RoiTracker(TrackerConfig config)
    : config_(config),
      x_(config.process_noise, config.measurement_noise),
      y_(config.process_noise, config.measurement_noise),
      width_(config.process_noise, config.measurement_noise),
      height_(config.process_noise, config.measurement_noise) {}

core::Rect RoiTracker::search_window(float frame_width, float frame_height) const {
  return core::Rect{frame_width * kSearchOffsetX, frame_height * kSearchOffsetY,
                    frame_width * config_.roi_width_ratio, frame_height * config_.roi_height_ratio};
}

core::Rect RoiTracker::target_for(const TextCluster& cluster, float frame_width,
                                  float frame_height) const {
  const float w = frame_width * config_.roi_width_ratio;
  const float h = frame_height * config_.roi_height_ratio;
  const float x = std::clamp(cluster.bounds.center_x() - w * 0.5f, 0.f, std::max(0.f, frame_width - w));
  const float y = std::clamp(cluster.bounds.center_y() - h * 0.5f, 0.f, std::max(0.f, frame_height - h));
  return core::Rect{x, y, w, h};
}

TrackerUpdate RoiTracker::process(const core::RawObservation& observation) {
  TrackerUpdate update;
  const auto blocks = filter_blocks(observation.blocks, config_.filter);
  const auto clusters =
      cluster_blocks(blocks, config_.cluster_max_gap_y, config_.min_cluster_blocks);

  ClusterSelection selection;
  selection.tap = tap_;
  selection.tap_radius = config_.tap_radius;
  selection.area_weight = config_.area_weight;
  selection.chars_weight = config_.chars_weight;

  if (const auto index = select_cluster(clusters, selection)) {
    const core::Rect target =
        target_for(clusters[*index], observation.frame_width, observation.frame_height);
    roi_ = core::Rect{x_.update(target.x), y_.update(target.y), width_.update(target.width),
                      height_.update(target.height)};
    update.cluster_found = true;
    core::logger()->trace("roi: {} clusters, picked {} -> ({:.1f},{:.1f} {:.1f}x{:.1f})",
                          clusters.size(), *index, roi_->x, roi_->y, roi_->width, roi_->height);
  }

  const core::Rect window = roi_ ? *roi_
                                 : search_window(observation.frame_width, observation.frame_height);
  update.roi = roi_ ? roi_ : std::optional<core::Rect>(window);

  for (const auto& block : blocks) {
    if (core::overlap_ratio(*block.bounds, window) >= config_.min_block_overlap) {
      update.roi_blocks.push_back(block);
    }
  }
  std::stable_sort(update.roi_blocks.begin(), update.roi_blocks.end(),
                   [](const core::TextBlock& a, const core::TextBlock& b) {
                     if (a.bounds->y != b.bounds->y) return a.bounds->y < b.bounds->y;
                     return a.bounds->x < b.bounds->x;
                   });
  for (const auto& block : update.roi_blocks) {
    if (block.text.empty()) continue;
    if (!update.roi_text.empty()) update.roi_text += '\n';
    update.roi_text += block.text;
  }
  return update;
}

void RoiTracker::reset() {
  x_.reset();
  y_.reset();
  width_.reset();
  height_.reset();
  roi_.reset();
  tap_.reset();
}

}  // namespace labelscan::vision
