#pragma once

#include <optional>
#include <string>
#include <vector>

namespace labelscan::core {

/// Axis-aligned rectangle in frame or screen pixels.
struct Rect {
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};

  [[nodiscard]] float area() const noexcept { return width * height; }
  [[nodiscard]] float right() const noexcept { return x + width; }
  [[nodiscard]] float bottom() const noexcept { return y + height; }
  [[nodiscard]] float center_x() const noexcept { return x + width * 0.5f; }
  [[nodiscard]] float center_y() const noexcept { return y + height * 0.5f; }

  bool operator==(const Rect&) const = default;
};

struct Point {
  float x{0.f};
  float y{0.f};
};

/// One OCR text block; bounds are absent when the engine gave none.
struct TextBlock {
  std::string text;
  std::optional<Rect> bounds;
};

/// Output of one camera frame as delivered by the OCR engine.
struct RawObservation {
  std::vector<TextBlock> blocks;
  float frame_width{0.f};
  float frame_height{0.f};
};

/// Fraction of \p inner's area that lies inside \p outer (0 when inner is degenerate).
[[nodiscard]] float overlap_ratio(const Rect& inner, const Rect& outer) noexcept;

/// Smallest rectangle containing every bounded block; nullopt when none has bounds.
[[nodiscard]] std::optional<Rect> bounding_box(const std::vector<TextBlock>& blocks);

/// Map a frame-space rectangle to screen space.
/// A landscape frame shown on a portrait screen is rotated 90 degrees clockwise
/// before scaling; otherwise the axes are scaled independently.
[[nodiscard]] Rect scale_rect_to_screen(const Rect& roi, float frame_width,
                                        float frame_height, float screen_width,
                                        float screen_height) noexcept;

}  // namespace labelscan::core
