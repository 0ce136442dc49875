#pragma once

#include <labelscan/app/validation_cache.hpp>
#include <labelscan/app/validation_client.hpp>
#include <labelscan/core/parsed_address.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan::app {

enum class ValidationStatus {
  Idle,
  Scanning,    // local record on display
  Validating,  // waiting for debounce or server
  Validated,
  Error,
};

[[nodiscard]] std::string_view to_string(ValidationStatus status) noexcept;

struct ValidationConfig {
  float scanning_min_confidence{0.3f};
  float validation_min_confidence{0.15f};
  std::chrono::milliseconds debounce{500};
  std::size_t cache_capacity{20};
  std::chrono::milliseconds cache_ttl{300000};
  std::size_t cache_key_max_length{200};
  float min_server_confidence{0.5f};
  std::chrono::milliseconds manual_fallback{3000};
};

struct ValidationState {
  ValidationStatus status{ValidationStatus::Idle};
  std::string raw_text;
  std::optional<core::ParsedAddress> local_parsed;
  std::optional<ValidationResponse> server_result;
  std::string error;
  bool is_network_error{false};
};

/// Address to hand to the caller: server-corrected when validated, local otherwise.
struct BestAddress {
  std::string street;
  std::string postal_code;
  std::string city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  bool is_validated{false};
  float confidence{0.f};
};

struct BestContact {
  std::string first_name;
  std::string last_name;
  std::string phone;
  std::string company;
};

/// Two-phase validation of parsed records for one scan session.
///
/// show_local() only exposes a record for live display (scanning). submit()
/// does the same and, for new raw text, either answers from the cache or arms
/// the debounce deadline. poll() issues the
/// call once the deadline passes and commits finished calls. Each new raw text
/// bumps a generation counter; a call finishing under an older generation is
/// dropped. Time is supplied by the caller.
class HybridValidator {
 public:
  using Clock = std::chrono::steady_clock;

  /// Throws std::invalid_argument when \p client is null.
  HybridValidator(std::shared_ptr<IValidationClient> client, ValidationConfig config = {});

  /// Phase 1 only. Records below the scanning threshold are ignored; a record for
  /// the text already being validated only refreshes the local data. A different
  /// text starts a new generation, so calls in flight for the old one are dropped.
  ValidationStatus show_local(std::string_view raw_text, const core::ParsedAddress& parsed);

  /// Phases 1 and 2. Returns the status after the submission.
  ValidationStatus submit(std::string_view raw_text, const core::ParsedAddress& parsed,
                          Clock::time_point now);

  /// Issues a due call and commits any finished one. Never blocks.
  ValidationStatus poll(Clock::time_point now);

  /// Manual fallback: treat the local record as final.
  void accept_local();

  /// True once an error has been on display for the manual-fallback grace period.
  [[nodiscard]] bool should_offer_manual_fallback(Clock::time_point now) const noexcept;

  [[nodiscard]] std::optional<BestAddress> best_address() const;
  [[nodiscard]] std::optional<BestContact> best_contact() const;

  /// Local record with server corrections applied; nullopt before any submission.
  [[nodiscard]] std::optional<core::ParsedAddress> final_record() const;

  /// Back to idle. Calls still in flight are dropped when they finish.
  void reset();

  [[nodiscard]] const ValidationState& state() const noexcept { return state_; }
  [[nodiscard]] ValidationStatus status() const noexcept { return state_.status; }
  [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
  [[nodiscard]] bool debounce_pending() const noexcept { return deadline_.has_value(); }
  [[nodiscard]] std::size_t in_flight() const noexcept { return calls_.size(); }
  [[nodiscard]] const ValidationCache& cache() const noexcept { return cache_; }

 private:
  struct Call {
    std::uint64_t generation;
    std::string raw_text;
    std::future<ValidationOutcome> future;
  };

  void issue_call();
  void commit(Call& call, ValidationOutcome outcome, Clock::time_point now);

  std::shared_ptr<IValidationClient> client_;
  ValidationConfig config_;
  ValidationCache cache_;
  ValidationState state_;
  std::uint64_t generation_{0};
  std::string tracked_text_;  // raw text of the current generation
  std::optional<Clock::time_point> deadline_;
  std::optional<Clock::time_point> error_since_;
  std::vector<Call> calls_;
};

}  // namespace labelscan::app
