#pragma once

#include <memory>

namespace labelscan::vision {

/// One-dimensional recursive estimator for a single ROI axis (x, y, width or height).
///
/// Constant-position model: predict adds \p process_noise to the error covariance,
/// correct blends the measurement with gain P / (P + measurement_noise). The first
/// measurement after construction or reset() seeds the state with covariance 1.
class AxisFilter {
 public:
  AxisFilter(float process_noise, float measurement_noise);
  ~AxisFilter();
  AxisFilter(AxisFilter&&) noexcept;
  AxisFilter& operator=(AxisFilter&&) noexcept;

  /// Feed one measurement; returns the smoothed value.
  float update(float measurement);

  void reset();

  [[nodiscard]] bool initialized() const noexcept { return initialized_; }
  [[nodiscard]] float value() const;
  [[nodiscard]] float error_covariance() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  bool initialized_{false};
};

}  // namespace labelscan::vision
