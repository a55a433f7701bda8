#ifndef CAPTURE_SOURCE_HPP_M3WJ7PXC
#define CAPTURE_SOURCE_HPP_M3WJ7PXC

#include <cstdint>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace netapp {

/**
 * @brief   One captured image with its timestamp (ns) and position in the
 * stream
 */
struct Frame {
  cv::Mat image;  ///< BGR8
  std::int64_t timestamp = 0;
  std::uint64_t sequence = 0;
  std::string metadata;
};

/**
 * @brief   Produces frames until the end of its stream
 */
class CaptureSource {
public:
  virtual ~CaptureSource() = default;

  /**
   * @return    the next frame, `std::nullopt` at end of stream
   */
  virtual std::optional<Frame> next_frame() = 0;

  /// nominal frame rate, 0 if unknown
  virtual double fps() const = 0;
};

/**
 * @brief   Frames from an opencv `VideoCapture`: a file, a stream URL, a
 * gstreamer pipeline or a camera. Timestamps are the wall clock at capture.
 */
class VideoCaptureSource : public CaptureSource {
  cv::VideoCapture capture_;
  std::string description_;
  cv::Size target_size_;
  std::uint64_t sequence_ = 0;

  void check_opened();

public:
  /**
   * @param uri file path, URL or gstreamer pipeline (ending in appsink)
   * @param target_size frames are resized to this unless empty
   *
   * @throws ConfigurationError if the source cannot be opened
   */
  explicit VideoCaptureSource(const std::string& uri,
                              cv::Size target_size = cv::Size());

  /**
   * @param device  camera index
   * @param target_size frames are resized to this unless empty
   */
  explicit VideoCaptureSource(int device, cv::Size target_size = cv::Size());

  std::optional<Frame> next_frame() override;
  double fps() const override;

  friend std::ostream& operator<<(std::ostream& os,
                                  const VideoCaptureSource& s) {
    os << "VideoCaptureSource " << s.description_ << ": ";
    return os;
  }
};

/**
 * @brief   Moving-cross test pattern with deterministic timestamps
 * `first_timestamp + sequence * timestamp_step`
 */
class SyntheticSource : public CaptureSource {
public:
  struct Config {
    int width                    = 640;
    int height                   = 480;
    double fps                   = 30;
    std::uint64_t frame_count    = 0;  ///< 0: never ends
    std::int64_t first_timestamp = 0;
    std::int64_t timestamp_step  = -1;  ///< < 0: one frame period in ns
    bool stamp                   = false;  ///< burn the timestamp into the image
  };

  /**
   * @throws ConfigurationError for a non-positive size or frame rate
   */
  explicit SyntheticSource(const Config& config);

  std::optional<Frame> next_frame() override;
  double fps() const override { return config_.fps; }

private:
  Config config_;
  std::int64_t step_;
  std::uint64_t sequence_ = 0;
};

}  // namespace netapp

#endif /* end of include guard: CAPTURE_SOURCE_HPP_M3WJ7PXC */
