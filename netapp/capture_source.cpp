#include "netapp/capture_source.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>

#include "netapp/avutils.hpp"
#include "netapp/errors.hpp"
#include "netapp/time_utils.hpp"

namespace netapp {

VideoCaptureSource::VideoCaptureSource(const std::string& uri,
                                       cv::Size target_size)
    : description_(uri), target_size_(target_size) {
  capture_.open(uri);
  this->check_opened();
}

VideoCaptureSource::VideoCaptureSource(int device, cv::Size target_size)
    : description_("device " + std::to_string(device)),
      target_size_(target_size) {
  capture_.open(device);
  this->check_opened();
}

void VideoCaptureSource::check_opened() {
  if (!capture_.isOpened()) {
    throw ConfigurationError("Could not open video source " + description_);
  }
  std::cout << *this << "opened, "
            << capture_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
            << capture_.get(cv::CAP_PROP_FRAME_HEIGHT) << " @ " << this->fps()
            << " fps" << std::endl;
}

std::optional<Frame> VideoCaptureSource::next_frame() {
  cv::Mat image;
  if (!capture_.read(image) || image.empty()) {
    std::cout << *this << "end of stream after " << sequence_ << " frames"
              << std::endl;
    return std::nullopt;
  }
  Frame frame;
  frame.timestamp = now_ns();
  frame.sequence  = sequence_++;
  if (!target_size_.empty() && image.size() != target_size_) {
    cv::resize(image, frame.image, target_size_);
  } else {
    frame.image = image;
  }
  return frame;
}

double VideoCaptureSource::fps() const {
  const double fps = capture_.get(cv::CAP_PROP_FPS);
  return fps > 0 ? fps : 0;
}

SyntheticSource::SyntheticSource(const Config& config) : config_(config) {
  if (config_.width <= 0 || config_.height <= 0) {
    throw ConfigurationError("Synthetic source needs a positive size");
  }
  if (!(config_.fps > 0)) {
    throw ConfigurationError("Synthetic source needs a positive frame rate");
  }
  step_ = config_.timestamp_step >= 0
              ? config_.timestamp_step
              : static_cast<std::int64_t>(1e9 / config_.fps);
}

std::optional<Frame> SyntheticSource::next_frame() {
  if (config_.frame_count > 0 && sequence_ >= config_.frame_count) {
    return std::nullopt;
  }
  Frame frame;
  frame.image = cv::Mat(config_.height, config_.width, CV_8UC3);
  avutils::generatePattern(frame.image,
                           static_cast<unsigned char>(sequence_ % 256));
  frame.sequence  = sequence_;
  frame.timestamp = config_.first_timestamp +
                    static_cast<std::int64_t>(sequence_) * step_;
  if (config_.stamp) {
    stamp_image(frame.image, frame.timestamp);
  }
  ++sequence_;
  return frame;
}

}  // namespace netapp
