#pragma once

#include <labelscan/app/config.hpp>
#include <labelscan/app/parse_queue.hpp>
#include <labelscan/app/validation_client.hpp>
#include <labelscan/app/validation_workflow.hpp>
#include <labelscan/core/geometry.hpp>
#include <labelscan/core/parsed_address.hpp>
#include <labelscan/vision/roi_tracker.hpp>
#include <labelscan/vision/stability_detector.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace labelscan::app {

/// What one processed frame produced.
struct SessionUpdate {
  vision::TrackerUpdate tracker;
  vision::StabilityResult stability;
  std::optional<core::ParsedAddress> parsed;  // parse that completed during this frame
  bool submitted{false};                      // parsed record handed to the validator
  ValidationStatus status{ValidationStatus::Idle};
};

/// One scanner session: ROI tracking, stability, background parsing and validation.
///
/// process_frame() is meant for the frame-delivery thread and does not wait on
/// parsing: locked text is queued, and a parse that has finished by a later
/// frame is picked up then. A record similar to the previous one is not
/// resubmitted for validation.
class ScanSession {
 public:
  using Clock = std::chrono::steady_clock;

  ScanSession(ScannerConfig config, std::shared_ptr<IValidationClient> client);

  SessionUpdate process_frame(const core::RawObservation& observation, Clock::time_point now);

  /// Waits for the queued parse, if any, and hands it to the validator.
  std::optional<core::ParsedAddress> flush(Clock::time_point now);

  /// Advances validation without a new frame.
  ValidationStatus poll(Clock::time_point now) { return validator_.poll(now); }

  void set_tap_point(core::Point point) noexcept { tracker_.set_tap_point(point); }
  void clear_tap_point() noexcept { tracker_.clear_tap_point(); }

  /// Current ROI mapped to screen coordinates; nullopt until a cluster has been tracked.
  [[nodiscard]] std::optional<core::Rect> screen_roi(float screen_width, float screen_height) const;

  /// Ends the session: pending parses are cancelled and every component returns to its initial state.
  void reset();

  [[nodiscard]] const HybridValidator& validator() const noexcept { return validator_; }
  [[nodiscard]] HybridValidator& validator() noexcept { return validator_; }
  [[nodiscard]] const vision::RoiTracker& tracker() const noexcept { return tracker_; }
  [[nodiscard]] const vision::StabilityDetector& stability() const noexcept { return stability_; }
  [[nodiscard]] const std::optional<core::ParsedAddress>& last_parsed() const noexcept {
    return last_parsed_;
  }

 private:
  bool collect(ParseOutcome outcome, Clock::time_point now, SessionUpdate& update);

  ScannerConfig config_;
  vision::RoiTracker tracker_;
  vision::StabilityDetector stability_;
  HybridValidator validator_;
  ParseQueue queue_;
  std::optional<ParseFuture> pending_parse_;
  std::string pending_text_;
  std::string queued_text_;  // last locked text sent to the queue
  std::optional<core::ParsedAddress> last_parsed_;
  float frame_width_{0.f};
  float frame_height_{0.f};
};

}  // namespace labelscan::app
