#include "netapp/avutils.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>
#include <vector>

extern "C" {
#include <libavutil/dict.h>
}

namespace netapp {
namespace avutils {

std::string av_strerror2(int errnum) {
  std::vector<char> v(KB, '\0');
  av_strerror(errnum, v.data(), v.size());
  return std::string(v.data());
}

void set_codec_params(AVCodecContext* codec_ctx,
                      int width,
                      int height,
                      int fps,
                      int target_bitrate,
                      int gop_size,
                      int thread_count) {
  const AVRational dst_fps = {fps, 1};

  codec_ctx->codec_tag = 0;
  if (target_bitrate > 0) {
    codec_ctx->bit_rate           = target_bitrate;
    codec_ctx->rc_max_rate        = target_bitrate;
    codec_ctx->rc_buffer_size     = target_bitrate;
    codec_ctx->bit_rate_tolerance = 0;
  }
  codec_ctx->thread_count = thread_count;
  codec_ctx->codec_id     = AV_CODEC_ID_H264;
  codec_ctx->codec_type   = AVMEDIA_TYPE_VIDEO;
  codec_ctx->width        = width;
  codec_ctx->height       = height;
  codec_ctx->gop_size     = gop_size;
  // no reordering: packets leave the encoder in presentation order
  codec_ctx->max_b_frames = 0;
  codec_ctx->pix_fmt      = AV_PIX_FMT_YUV420P;
  codec_ctx->framerate    = dst_fps;
  codec_ctx->time_base    = av_inv_q(dst_fps);
}

int open_encoder(AVCodecContext* codec_ctx,
                 const AVCodec* codec,
                 bool zero_latency) {
  AVDictionary* codec_options = nullptr;
  if (zero_latency) {
    av_dict_set(&codec_options, "preset", "ultrafast", 0);
    av_dict_set(&codec_options, "tune", "zerolatency", 0);
  } else {
    av_dict_set(&codec_options, "preset", "veryfast", 0);
  }
  av_dict_set(&codec_options, "profile", "baseline", 0);

  int ret = avcodec_open2(codec_ctx, codec, &codec_options);

  AVDictionaryEntry* e = nullptr;
  while ((e = av_dict_get(codec_options, "", e, AV_DICT_IGNORE_SUFFIX))) {
    std::cout << "Encoder " << codec->name << " ignored option " << e->key
              << "=" << e->value << std::endl;
  }
  av_dict_free(&codec_options);
  return ret;
}

AVFrame* allocate_frame_buffer(const AVCodecContext* codec_ctx) {
  AVFrame* frame = av_frame_alloc();
  if (!frame) {
    return nullptr;
  }
  frame->width  = codec_ctx->width;
  frame->height = codec_ctx->height;
  frame->format = static_cast<int>(codec_ctx->pix_fmt);
  frame->pts    = 0;

  if (av_frame_get_buffer(frame, 0) < 0) {
    av_frame_free(&frame);
    return nullptr;
  }
  return frame;
}

int bgr_to_frame(SwsContext*& swsctx, const cv::Mat& image, AVFrame* frame) {
  swsctx = sws_getCachedContext(
      swsctx, image.cols, image.rows, AV_PIX_FMT_BGR24, frame->width,
      frame->height, static_cast<AVPixelFormat>(frame->format), SWS_BICUBIC,
      nullptr, nullptr, nullptr);
  if (!swsctx) {
    return AVERROR(EINVAL);
  }
  int ret = av_frame_make_writable(frame);
  if (ret < 0) {
    return ret;
  }
  const std::uint8_t* src[] = {image.data};
  const int stride[]        = {static_cast<int>(image.step[0])};
  sws_scale(swsctx, src, stride, 0, image.rows, frame->data, frame->linesize);
  return 0;
}

cv::Mat frame_to_bgr(SwsContext*& swsctx, const AVFrame* frame) {
  const auto height = frame->height;
  const auto width  = frame->width;
  swsctx            = sws_getCachedContext(
      swsctx, width, height, static_cast<AVPixelFormat>(frame->format), width,
      height, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!swsctx) {
    return cv::Mat();
  }
  cv::Mat image(height, width, CV_8UC3);
  std::uint8_t* dst[] = {image.data};
  const int stride[]  = {static_cast<int>(image.step[0])};
  sws_scale(swsctx, frame->data, frame->linesize, 0, height, dst, stride);
  return image;
}

void generatePattern(cv::Mat& image, unsigned char i) {
  image.setTo(cv::Scalar(255, 255, 255));
  float perc_height = 1.0 * i / 256;
  float perc_width  = 1.0 * i / 256;
  image.row(perc_height * image.rows).setTo(cv::Scalar(0, 0, 0));
  image.col(perc_width * image.cols).setTo(cv::Scalar(0, 0, 0));
}

}  // namespace avutils
}  // namespace netapp
