#pragma once

#include <labelscan/core/geometry.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace labelscan::vision {

enum class ScanPhase {
  Search,
  Locking,
  Reading,
};

[[nodiscard]] std::string_view to_string(ScanPhase phase) noexcept;

struct StabilityConfig {
  std::size_t min_text_length{8};
  float similarity_threshold{0.8f};  // strictly greater counts as the same content
  int locking_frames{2};
  int reading_frames{3};
  int unlock_frames{10};       // consecutive unusable frames before a full reset
  int box_holdover_frames{1};  // frames the last stable box stays visible
};

struct StabilityState {
  std::string last_signature;
  int stable_count{0};
  std::optional<std::string> locked_text;
  ScanPhase phase{ScanPhase::Search};
};

struct StabilityResult {
  ScanPhase phase{ScanPhase::Search};
  int stable_count{0};
  std::optional<std::string> locked_text;
  std::optional<core::Rect> text_box;  // only once reading (or held over)
  bool address_like{false};
  std::string signature;
};

/// Order-independent content summary: "<numbers>|<keywords>|<long words>", where
/// numbers are the sorted 2+ digit runs, keywords the sorted logistics/address
/// terms present, and long words up to three sorted 5+ letter tokens.
[[nodiscard]] std::string compute_signature(std::string_view text);

/// True when the text carries a postal-code token or a street keyword and is at least 10 characters.
[[nodiscard]] bool looks_like_address(std::string_view text);

/// Advances search -> locking -> reading as the signature of the ROI text stays
/// the same across frames.
class StabilityDetector {
 public:
  explicit StabilityDetector(StabilityConfig config = {});

  StabilityResult process(std::string_view filtered_text,
                          std::optional<core::Rect> text_box = std::nullopt);

  void reset();

  [[nodiscard]] const StabilityState& state() const noexcept { return state_; }
  [[nodiscard]] int unstable_frames() const noexcept { return unstable_frames_; }

 private:
  [[nodiscard]] std::optional<core::Rect> visible_box(bool reading,
                                                      std::optional<core::Rect> text_box);

  StabilityConfig config_;
  StabilityState state_;
  int unstable_frames_{0};
  std::optional<core::Rect> last_box_;
  int holdover_left_{0};
};

}  // namespace labelscan::vision
