#ifndef TIMEUTILS_HPP_SQ9GVNJU
#define TIMEUTILS_HPP_SQ9GVNJU

#include <cstdint>
#include <opencv2/core.hpp>
#include <string>

namespace netapp {

/**
 * @brief   Wall-clock time in nanoseconds since the epoch. Default timestamp
 * for frames and messages.
 */
std::int64_t now_ns();

/// Wall-clock seconds with millisecond resolution, for measuring durations
double current_millis();

/**
 * @brief   UTC `YYYY-MM-DD HH:MM:SS.mmm` of a timestamp in ns since the epoch
 */
std::string format_timestamp(std::int64_t timestamp_ns);

/**
 * @brief   Burn a frame's timestamp into its image, to judge latency by eye on
 * the receiving end
 *
 * @param ypos    vertical position as a fraction of the image height
 */
void stamp_image(cv::Mat& image, std::int64_t timestamp_ns, float ypos = 0.2);

}  // namespace netapp

#endif /* end of include guard: TIMEUTILS_HPP_SQ9GVNJU */
