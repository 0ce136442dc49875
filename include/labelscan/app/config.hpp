#pragma once

#include <labelscan/app/validation_workflow.hpp>
#include <labelscan/core/error.hpp>
#include <labelscan/vision/roi_tracker.hpp>
#include <labelscan/vision/stability_detector.hpp>
#include <expected>
#include <string>

namespace labelscan::app {

struct QueueConfig {
  bool memoize{true};  // return the previous job's result for identical text
};

/// Scanner configuration: tracker, stability, validation and queue settings.
struct ScannerConfig {
  vision::TrackerConfig tracker;
  vision::StabilityConfig stability;
  ValidationConfig validation;
  QueueConfig queue;
  std::string log_level{"info"};
};

/// Read a key=value file (one per line, '#' comments, keys dotted by section).
/// Unknown keys and malformed values are logged and skipped.
[[nodiscard]] std::expected<ScannerConfig, core::ConfigError> read_config(const std::string& path);

/// Load config from a key=value file, falling back to defaults when it cannot be read.
ScannerConfig load_config(const std::string& path);

/// Default config when no file is provided.
ScannerConfig default_config();

}  // namespace labelscan::app
