#include <labelscan/app/scan_session.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/text/address_parser.hpp>
#include <utility>

namespace labelscan::app {

ScanSession::ScanSession(ScannerConfig config, std::shared_ptr<IValidationClient> client)
    : config_(std::move(config)),
      tracker_(config_.tracker),
      stability_(config_.stability),
      validator_(std::move(client), config_.validation),
      queue_(config_.queue) {}

SessionUpdate ScanSession::process_frame(const core::RawObservation& observation,
                                         Clock::time_point now) {
  SessionUpdate update;
  frame_width_ = observation.frame_width;
  frame_height_ = observation.frame_height;

  update.tracker = tracker_.process(observation);
  update.stability =
      stability_.process(update.tracker.roi_text, core::bounding_box(update.tracker.roi_blocks));

  const auto& locked = update.stability.locked_text;
  if (update.stability.phase == vision::ScanPhase::Reading && locked && *locked != queued_text_) {
    queued_text_ = *locked;
    pending_text_ = *locked;
    pending_parse_ = queue_.submit(*locked);
  }

  if (pending_parse_ &&
      pending_parse_->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    auto outcome = pending_parse_->get();
    pending_parse_.reset();
    collect(std::move(outcome), now, update);
  }

  update.status = validator_.poll(now);
  return update;
}

std::optional<core::ParsedAddress> ScanSession::flush(Clock::time_point now) {
  if (!pending_parse_) return std::nullopt;
  auto outcome = pending_parse_->get();
  pending_parse_.reset();
  SessionUpdate update;
  collect(std::move(outcome), now, update);
  validator_.poll(now);
  return update.parsed;
}

bool ScanSession::collect(ParseOutcome outcome, Clock::time_point now, SessionUpdate& update) {
  if (!outcome) {
    core::logger()->debug("session: parse dropped (error {})", static_cast<int>(outcome.error()));
    return false;
  }
  update.parsed = *outcome;
  const bool similar = last_parsed_ && text::results_similar(*last_parsed_, *outcome);
  last_parsed_ = std::move(*outcome);
  if (similar) {
    core::logger()->trace("session: record similar to previous, not resubmitted");
    return false;
  }
  validator_.submit(pending_text_, *last_parsed_, now);
  update.submitted = true;
  return true;
}

std::optional<core::Rect> ScanSession::screen_roi(float screen_width, float screen_height) const {
  const auto& roi = tracker_.current_roi();
  if (!roi) return std::nullopt;
  return core::scale_rect_to_screen(*roi, frame_width_, frame_height_, screen_width, screen_height);
}

void ScanSession::reset() {
  queue_.cancel_all();
  pending_parse_.reset();
  pending_text_.clear();
  queued_text_.clear();
  last_parsed_.reset();
  tracker_.reset();
  stability_.reset();
  validator_.reset();
  frame_width_ = 0.f;
  frame_height_ = 0.f;
}

}  // namespace labelscan::app
