#pragma once

#include <labelscan/core/error.hpp>
#include <expected>
#include <future>
#include <optional>
#include <string>

namespace labelscan::app {

/// Outbound validation request: the raw OCR text plus locally extracted contact hints.
struct ValidationRequest {
  std::string raw_text;
  std::string first_name;
  std::string last_name;
  std::string phone;
  std::string company;
};

struct ValidatedAddress {
  std::string street;
  std::string postal_code;
  std::string city;
  std::string formatted;
  std::optional<double> latitude;
  std::optional<double> longitude;
};

struct ValidatedContact {
  std::string first_name;
  std::string last_name;
  std::string phone;
  std::string company;
};

struct ValidationResponse {
  bool is_valid{false};
  float confidence{0.f};
  std::string source;  // e.g. "geocoder", "llm"
  ValidatedAddress address;
  std::optional<ValidatedContact> contact;
};

struct ValidationFailure {
  core::ValidationErrorKind kind{core::ValidationErrorKind::Network};
  std::string message;
};

using ValidationOutcome = std::expected<ValidationResponse, ValidationFailure>;

/// Remote address validation. The transport belongs to the embedding application.
///
/// validate() must not block; the returned future is polled without waiting.
/// Futures whose destructor blocks (std::async) are allowed but stall the
/// caller when a superseded call is dropped before it completes.
class IValidationClient {
 public:
  virtual ~IValidationClient() = default;

  [[nodiscard]] virtual std::future<ValidationOutcome> validate(const ValidationRequest& request) = 0;
};

}  // namespace labelscan::app
