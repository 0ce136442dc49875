#pragma once

#include <labelscan/app/validation_client.hpp>
#include <cstddef>
#include <deque>
#include <vector>

namespace labelscan::app {

/// Scripted validation client for tests and the CLI demo.
///
/// By default every call resolves immediately with the scripted outcome. In
/// manual mode calls stay pending until complete_next() resolves them in order.
class MockValidationClient : public IValidationClient {
 public:
  MockValidationClient();

  /// Outcome for subsequent calls.
  void set_response(ValidationResponse response);
  void set_failure(ValidationFailure failure);

  void set_manual(bool manual) noexcept { manual_ = manual; }

  [[nodiscard]] std::future<ValidationOutcome> validate(const ValidationRequest& request) override;

  /// Resolve the oldest pending call with the scripted outcome; false when none is pending.
  bool complete_next();
  /// Resolve the oldest pending call with \p outcome.
  bool complete_next(ValidationOutcome outcome);

  [[nodiscard]] std::size_t call_count() const noexcept { return requests_.size(); }
  [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
  [[nodiscard]] const std::vector<ValidationRequest>& requests() const noexcept { return requests_; }

 private:
  ValidationOutcome outcome_;
  bool manual_{false};
  std::deque<std::promise<ValidationOutcome>> pending_;
  std::vector<ValidationRequest> requests_;
};

}  // namespace labelscan::app
