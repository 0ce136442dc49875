#include <labelscan/core/geometry.hpp>
#include <algorithm>
#include <limits>

namespace labelscan::core {

float overlap_ratio(const Rect& inner, const Rect& outer) noexcept {
  const float inner_area = inner.area();
  if (inner_area <= 0.f) return 0.f;
  const float x_overlap =
      std::max(0.f, std::min(inner.right(), outer.right()) - std::max(inner.x, outer.x));
  const float y_overlap =
      std::max(0.f, std::min(inner.bottom(), outer.bottom()) - std::max(inner.y, outer.y));
  return (x_overlap * y_overlap) / inner_area;
}

std::optional<Rect> bounding_box(const std::vector<TextBlock>& blocks) {
  float min_x = std::numeric_limits<float>::max();
  float min_y = std::numeric_limits<float>::max();
  float max_x = std::numeric_limits<float>::lowest();
  float max_y = std::numeric_limits<float>::lowest();
  bool any = false;
  for (const auto& b : blocks) {
    if (!b.bounds) continue;
    any = true;
    min_x = std::min(min_x, b.bounds->x);
    min_y = std::min(min_y, b.bounds->y);
    max_x = std::max(max_x, b.bounds->right());
    max_y = std::max(max_y, b.bounds->bottom());
  }
  if (!any) return std::nullopt;
  return Rect{min_x, min_y, max_x - min_x, max_y - min_y};
}

Rect scale_rect_to_screen(const Rect& roi, float frame_width, float frame_height,
                          float screen_width, float screen_height) noexcept {
  if (frame_width <= 0.f || frame_height <= 0.f) return Rect{};

  const bool frame_landscape = frame_width > frame_height;
  const bool screen_portrait = screen_height > screen_width;
  if (frame_landscape && screen_portrait) {
    // Rotated frame: its height spans the screen width.
    const float sx = screen_width / frame_height;
    const float sy = screen_height / frame_width;
    return Rect{(frame_height - roi.y - roi.height) * sx, roi.x * sy,
                roi.height * sx, roi.width * sy};
  }

  const float sx = screen_width / frame_width;
  const float sy = screen_height / frame_height;
  return Rect{roi.x * sx, roi.y * sy, roi.width * sx, roi.height * sy};
}

}  // namespace labelscan::core
