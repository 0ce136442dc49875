#include "rect_cv_utils.hpp"

#include <algorithm>
#include <cmath>

namespace labelscan::vision::detail {

cv::Rect2f to_cv(const core::Rect& r) { return cv::Rect2f(r.x, r.y, r.width, r.height); }

core::Rect from_cv(const cv::Rect2f& r) { return core::Rect{r.x, r.y, r.width, r.height}; }

float distance_to(const cv::Rect2f& r, const cv::Point2f& p) {
  const float dx = std::max({r.x - p.x, 0.f, p.x - (r.x + r.width)});
  const float dy = std::max({r.y - p.y, 0.f, p.y - (r.y + r.height)});
  return std::hypot(dx, dy);
}

}  // namespace labelscan::vision::detail
