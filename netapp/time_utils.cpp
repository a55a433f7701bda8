#include "netapp/time_utils.hpp"

#include <chrono>
#include <ctime>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

using namespace std::chrono;

namespace netapp {

std::int64_t now_ns() {
  return duration_cast<nanoseconds>(system_clock::now().time_since_epoch())
      .count();
}

double current_millis() {
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
             .count() /
         1000.0;
}

std::string format_timestamp(std::int64_t timestamp_ns) {
  const nanoseconds since_epoch(timestamp_ns);
  const auto whole = floor<seconds>(since_epoch);
  const auto ms    = duration_cast<milliseconds>(since_epoch - whole).count();

  const std::time_t t = static_cast<std::time_t>(whole.count());
  std::tm utc{};
  if (!gmtime_r(&t, &utc)) {
    throw std::runtime_error("Timestamp out of calendar range: " +
                             std::to_string(timestamp_ns));
  }
  return cv::format("%04d-%02d-%02d %02d:%02d:%02d.%03d", utc.tm_year + 1900,
                    utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                    utc.tm_sec, static_cast<int>(ms));
}

void stamp_image(cv::Mat& image, std::int64_t timestamp_ns, float ypos) {
  cv::putText(image, format_timestamp(timestamp_ns),
              cv::Point(10, static_cast<int>(ypos * image.rows)),
              cv::FONT_HERSHEY_SIMPLEX, 1, cv::Scalar(0, 0, 255), 2);
}

}  // namespace netapp
