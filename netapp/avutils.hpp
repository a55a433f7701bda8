#ifndef AVUTILS_HPP_L0JIDQTW
#define AVUTILS_HPP_L0JIDQTW

#include <opencv2/core.hpp>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

namespace netapp {

constexpr int KB = 1024;

namespace avutils {

/**
 * @brief   Get string name of ffmpeg error code
 *
 * @param errnum    Error code
 *
 * @return  screen name
 */
std::string av_strerror2(int errnum);

/**
 * @brief   Parametrize an encoding context for low latency h264
 *
 * @param codec_ctx encoding context
 * @param width width of the video
 * @param height    height of the video
 * @param fps   target fps of the stream
 * @param target_bitrate    desired bitrate, 0 leaves rate control to the
 * encoder defaults
 * @param gop_size  group-of-picture parameter (distance between keyframes)
 * @param thread_count  encoder threads, 0 lets the encoder decide
 */
void set_codec_params(AVCodecContext* codec_ctx,
                      int width,
                      int height,
                      int fps,
                      int target_bitrate = 0,
                      int gop_size       = 12,
                      int thread_count   = 0);

/**
 * @brief   Open an encoder with the private options that minimize latency.
 * Options the encoder does not know are reported and ignored.
 *
 * @param codec_ctx encoding context, parametrized with `set_codec_params`
 * @param codec codec used
 * @param zero_latency  use the fastest preset and disable lookahead
 *
 * @return error code
 */
int open_encoder(AVCodecContext* codec_ctx,
                 const AVCodec* codec,
                 bool zero_latency);

/**
 * @brief   Create a new frame with buffers matching the context's pixel format
 * and size. Must be freed with `av_frame_free()`.
 *
 * @param codec_ctx Codec context to get pixel format and size from
 *
 * @return new frame, nullptr on allocation failure
 */
AVFrame* allocate_frame_buffer(const AVCodecContext* codec_ctx);

/**
 * @brief   Convert (and scale) a BGR8 image into a preallocated frame.
 *
 * @param swsctx    cached scaler, created or replaced as needed
 * @param image BGR8 interleaved image of any size
 * @param frame destination frame
 *
 * @return  0 on success, < 0 on error
 */
int bgr_to_frame(SwsContext*& swsctx, const cv::Mat& image, AVFrame* frame);

/**
 * @brief   Convert a decoded frame (any pixel format) to an opencv Mat (BGR8
 * interleaved)
 *
 * @param swsctx    cached scaler, created or replaced as needed
 * @param frame Input frame (decoded from stream)
 *
 * @return  Matrix with BGR8 data, empty on failure
 */
cv::Mat frame_to_bgr(SwsContext*& swsctx, const AVFrame* frame);

/**
 * @brief   Generate dummy data in opencv mat
 *
 * @param image dst image
 * @param i position of the moving cross, 0-255
 */
void generatePattern(cv::Mat& image, unsigned char i);

}  // namespace avutils
}  // namespace netapp
#endif
