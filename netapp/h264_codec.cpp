#include <cstring>
#include <iostream>
#include <vector>

#include "netapp/avutils.hpp"
#include "netapp/codec.hpp"
#include "netapp/errors.hpp"

namespace netapp {

/**
 * @brief   libav decoding state kept across fragments of one channel
 */
struct H264Codec::DecoderState {
  AVCodecContext* dec_ctx = nullptr;  ///< decoding context
  AVFrame* frame          = nullptr;
  AVPacket* pkt           = nullptr;
  SwsContext* swsctx      = nullptr;
  std::vector<std::uint8_t> buffer;

  // keep some stats for printing
  int successes         = 0;
  size_t bytes_received = 0;

  DecoderState() {
    const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
    if (!codec) {
      throw ConfigurationError("Could not find h264 decoder");
    }
    dec_ctx = avcodec_alloc_context3(codec);
    if (!dec_ctx) {
      throw ConfigurationError("Could not allocate decoder context");
    }
    dec_ctx->codec_tag    = 0;
    dec_ctx->codec_type   = AVMEDIA_TYPE_VIDEO;
    dec_ctx->thread_count = 1;
    dec_ctx->flags |= AV_CODEC_FLAG_LOW_DELAY;
    int res = avcodec_open2(dec_ctx, codec, nullptr);
    if (res < 0) {
      avcodec_free_context(&dec_ctx);
      throw ConfigurationError("Could not open decoder context: " +
                               avutils::av_strerror2(res));
    }
    frame = av_frame_alloc();
    pkt   = av_packet_alloc();
    if (!frame || !pkt) {
      av_frame_free(&frame);
      av_packet_free(&pkt);
      avcodec_free_context(&dec_ctx);
      throw ConfigurationError("Could not allocate decoder frame/packet");
    }
  }

  ~DecoderState() {
    sws_freeContext(swsctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
    avcodec_free_context(&dec_ctx);
  }

  /**
   * @brief Send one access unit to the decoder and collect every picture it
   * completes.
   *
   * @return    the last completed picture, empty if none
   */
  cv::Mat decode(const Bytes& payload) {
    bytes_received += payload.size();
    buffer.resize(payload.size() + AV_INPUT_BUFFER_PADDING_SIZE);
    std::memcpy(buffer.data(), payload.data(), payload.size());
    std::memset(buffer.data() + payload.size(), 0,
                AV_INPUT_BUFFER_PADDING_SIZE);
    pkt->data = buffer.data();
    pkt->size = static_cast<int>(payload.size());

    int ret = avcodec_send_packet(dec_ctx, pkt);
    pkt->data = nullptr;
    pkt->size = 0;
    if (ret < 0) {
      throw CodecError("Error sending packet for decoding: " +
                       avutils::av_strerror2(ret));
    }

    cv::Mat image;
    while (true) {
      ret = avcodec_receive_frame(dec_ctx, frame);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
        break;
      } else if (ret < 0) {
        throw CodecError("Error during decoding: " +
                         avutils::av_strerror2(ret));
      }
      ++successes;
      image = avutils::frame_to_bgr(swsctx, frame);
      av_frame_unref(frame);
      if (image.empty()) {
        throw CodecError("Could not convert decoded picture to BGR");
      }
    }
    return image;
  }
};

H264Codec::H264Codec() = default;

H264Codec::~H264Codec() {
  if (decoder_) {
    std::cout << "H264Codec: decoded " << decoder_->successes
              << " frames from " << decoder_->bytes_received / KB << " KB"
              << std::endl;
  }
}

Value H264Codec::decode(const Bytes& payload) {
  if (payload.empty()) {
    throw CodecError("Empty h264 fragment");
  }
  // created lazily, outbound-only channels never pay for a decoder
  if (!decoder_) {
    decoder_ = std::make_unique<DecoderState>();
  }
  return decoder_->decode(payload);
}

}  // namespace netapp
