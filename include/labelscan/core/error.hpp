#pragma once

namespace labelscan::core {

/// Parse job error codes; used with std::expected for recoverable failures.
enum class ParseError {
  None = 0,
  Cancelled,
  QueueStopped,
};

/// Classification of a failed validation call.
enum class ValidationErrorKind {
  Network,   // no response reached us
  Rejected,  // server answered but refused the address
};

/// Configuration loading errors.
enum class ConfigError {
  None = 0,
  FileNotFound,
};

}  // namespace labelscan::core
