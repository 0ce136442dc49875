#pragma once

#include <labelscan/core/geometry.hpp>
#include <labelscan/vision/axis_filter.hpp>
#include <labelscan/vision/block_clustering.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace labelscan::vision {

struct TrackerConfig {
  BlockFilterConfig filter;
  float cluster_max_gap_y{40.f};
  std::size_t min_cluster_blocks{2};
  float area_weight{0.6f};
  float chars_weight{0.4f};
  float tap_radius{150.f};
  float roi_width_ratio{0.9f};
  float roi_height_ratio{0.4f};
  float process_noise{0.08f};
  float measurement_noise{3.f};
  float min_block_overlap{0.3f};  // share of a block inside the ROI for its text to count
};

/// Result of one processed frame.
struct TrackerUpdate {
  std::optional<core::Rect> roi;           // smoothed, frame coordinates
  bool cluster_found{false};
  std::vector<core::TextBlock> roi_blocks;  // blocks inside the ROI, reading order
  std::string roi_text;                     // their text, one block per line
};

/// Frame-by-frame ROI state machine: filter blocks, cluster them, pick a target,
/// center a fixed-size rectangle on it and smooth each axis independently.
///
/// Before any cluster has been seen the ROI is the fixed search window
/// (centered horizontally, 30% from the top). Once tracking starts the last
/// smoothed ROI persists across frames without a usable cluster.
class RoiTracker {
 public:
  explicit RoiTracker(TrackerConfig config = {});

  TrackerUpdate process(const core::RawObservation& observation);

  /// Prefer the cluster under this point until cleared or reset.
  void set_tap_point(core::Point point) noexcept { tap_ = point; }
  void clear_tap_point() noexcept { tap_.reset(); }

  /// Clears all axis estimators, the ROI and the tap point.
  void reset();

  [[nodiscard]] const std::optional<core::Rect>& current_roi() const noexcept { return roi_; }
  [[nodiscard]] const TrackerConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] core::Rect target_for(const TextCluster& cluster, float frame_width,
                                      float frame_height) const;
  [[nodiscard]] core::Rect search_window(float frame_width, float frame_height) const;

  TrackerConfig config_;
  AxisFilter x_;
  AxisFilter y_;
  AxisFilter width_;
  AxisFilter height_;
  std::optional<core::Rect> roi_;
  std::optional<core::Point> tap_;
};

}  // namespace labelscan::vision
