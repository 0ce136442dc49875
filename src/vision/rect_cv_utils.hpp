#pragma once

#include <labelscan/core/geometry.hpp>
#include <opencv2/core/types.hpp>

namespace labelscan::vision::detail {

[[nodiscard]] cv::Rect2f to_cv(const core::Rect& r);

[[nodiscard]] core::Rect from_cv(const cv::Rect2f& r);

/// Distance from \p p to the nearest point of \p r (0 when inside).
[[nodiscard]] float distance_to(const cv::Rect2f& r, const cv::Point2f& p);

}  // namespace labelscan::vision::detail
