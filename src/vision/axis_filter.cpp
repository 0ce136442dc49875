#include <labelscan/vision/axis_filter.hpp>
#include <opencv2/video/tracking.hpp>

namespace labelscan::vision {

struct AxisFilter::Impl {
  cv::KalmanFilter kf;
  float process_noise;
  float measurement_noise;

  Impl(float q, float r) : kf(1, 1, 0, CV_32F), process_noise(q), measurement_noise(r) {
    kf.transitionMatrix = cv::Mat::eye(1, 1, CV_32F);
    kf.measurementMatrix = cv::Mat::eye(1, 1, CV_32F);
    kf.processNoiseCov = cv::Mat(1, 1, CV_32F, cv::Scalar(q));
    kf.measurementNoiseCov = cv::Mat(1, 1, CV_32F, cv::Scalar(r));
    seed(0.f);
  }

  void seed(float value) {
    kf.statePost.at<float>(0) = value;
    kf.statePre.at<float>(0) = value;
    kf.errorCovPost.at<float>(0) = 1.f;
  }
};

AxisFilter::AxisFilter(float process_noise, float measurement_noise)
    : impl_(std::make_unique<Impl>(process_noise, measurement_noise)) {}

AxisFilter::~AxisFilter() = default;
AxisFilter::AxisFilter(AxisFilter&&) noexcept = default;
AxisFilter& AxisFilter::operator=(AxisFilter&&) noexcept = default;

float AxisFilter::update(float measurement) {
  if (!initialized_) {
    impl_->seed(measurement);
    initialized_ = true;
    return measurement;
  }
  impl_->kf.predict();
  const cv::Mat z(1, 1, CV_32F, cv::Scalar(measurement));
  const cv::Mat& corrected = impl_->kf.correct(z);
  return corrected.at<float>(0);
}

void AxisFilter::reset() {
  impl_->seed(0.f);
  initialized_ = false;
}

float AxisFilter::value() const { return impl_->kf.statePost.at<float>(0); }

float AxisFilter::error_covariance() const { return impl_->kf.errorCovPost.at<float>(0); }

}  // namespace labelscan::vision
