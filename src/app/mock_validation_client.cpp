#include <labelscan/app/mock_validation_client.hpp>
#include <utility>

namespace labelscan::app {

MockValidationClient::MockValidationClient()
    : outcome_(std::unexpected(
          ValidationFailure{core::ValidationErrorKind::Rejected, "no scripted response"})) {}

void MockValidationClient::set_response(ValidationResponse response) {
  outcome_ = std::move(response);
}

void MockValidationClient::set_failure(ValidationFailure failure) {
  outcome_ = std::unexpected(std::move(failure));
}

std::future<ValidationOutcome> MockValidationClient::validate(const ValidationRequest& request) {
  requests_.push_back(request);
  std::promise<ValidationOutcome> promise;
  auto future = promise.get_future();
  if (manual_) {
    pending_.push_back(std::move(promise));
  } else {
    promise.set_value(outcome_);
  }
  return future;
}

bool MockValidationClient::complete_next() {
  return complete_next(outcome_);
}

bool MockValidationClient::complete_next(ValidationOutcome outcome) {
  if (pending_.empty()) return false;
  auto promise = std::move(pending_.front());
  pending_.pop_front();
  promise.set_value(std::move(outcome));
  return true;
}

}  // namespace labelscan::app
