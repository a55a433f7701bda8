#include "netapp/encode_pipeline.hpp"

#include <iostream>
#include <iterator>

#include "netapp/errors.hpp"

namespace netapp {

std::string to_string(PipelineState state) {
  switch (state) {
    case PipelineState::UNINITIALIZED:
      return "UNINITIALIZED";
    case PipelineState::CONFIGURED:
      return "CONFIGURED";
    case PipelineState::STREAMING:
      return "STREAMING";
    case PipelineState::STOPPED:
      return "STOPPED";
  }
  throw std::invalid_argument("Invalid pipeline state");
}

namespace {

void validate(const PipelineConfig& config) {
  if (config.width <= 0 || config.height <= 0) {
    throw ConfigurationError("Frame size must be positive, got " +
                             std::to_string(config.width) + "x" +
                             std::to_string(config.height));
  }
  if (config.width % 2 != 0 || config.height % 2 != 0) {
    throw ConfigurationError("Frame size must be even for YUV420P, got " +
                             std::to_string(config.width) + "x" +
                             std::to_string(config.height));
  }
  if (config.fps <= 0) {
    throw ConfigurationError("fps must be positive, got " +
                             std::to_string(config.fps));
  }
  if (config.bitrate < 0) {
    throw ConfigurationError("bitrate must not be negative");
  }
  if (config.gop_size <= 0) {
    throw ConfigurationError("GOP size must be positive");
  }
  if (config.queue_size <= 0) {
    throw ConfigurationError("Queue size must be positive");
  }
}

}  // namespace

H264EncodePipeline::H264EncodePipeline(const PipelineConfig& config,
                                       ChunkSink sink)
    : config_(config), sink_(std::move(sink)) {
  validate(config_);
  if (!sink_) {
    throw ConfigurationError("Encode pipeline needs a chunk sink");
  }

  const AVCodec* codec =
      config_.encoder_name.empty()
          ? avcodec_find_encoder(AV_CODEC_ID_H264)
          : avcodec_find_encoder_by_name(config_.encoder_name.c_str());
  if (!codec) {
    throw ConfigurationError(
        "Could not find encoder " +
        (config_.encoder_name.empty() ? std::string("for h264")
                                      : config_.encoder_name));
  }

  try {
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
      throw ConfigurationError("Could not allocate output codec context");
    }
    avutils::set_codec_params(codec_ctx_, config_.width, config_.height,
                              config_.fps, config_.bitrate, config_.gop_size);
    int success = avutils::open_encoder(
        codec_ctx_, codec, config_.latency == LatencyMode::LOW);
    if (success < 0) {
      throw ConfigurationError("Could not open encoder " +
                               std::string(codec->name) + ": " +
                               avutils::av_strerror2(success));
    }
    frame_ = avutils::allocate_frame_buffer(codec_ctx_);
    pkt_   = av_packet_alloc();
    if (!frame_ || !pkt_) {
      throw ConfigurationError("Could not allocate frame buffer");
    }
  } catch (...) {
    this->release();
    throw;
  }

  queue_ = std::make_unique<Queue>(static_cast<std::size_t>(config_.queue_size));
  state_ = PipelineState::CONFIGURED;
  std::cout << *this << "encoder " << codec->name << " ready" << std::endl;
}

H264EncodePipeline::~H264EncodePipeline() {
  try {
    this->stop();
  } catch (const std::exception& ex) {
    std::cerr << *this << "error while stopping: " << ex.what() << std::endl;
  }
  this->release();
}

void H264EncodePipeline::release() {
  sws_freeContext(swsctx_);
  swsctx_ = nullptr;
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
  avcodec_free_context(&codec_ctx_);
}

void H264EncodePipeline::start() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ == PipelineState::STREAMING) {
    return;
  }
  if (state_ != PipelineState::CONFIGURED) {
    throw PipelineStopped("Cannot start a stopped pipeline" +
                          (fault_.empty() ? std::string() : ": " + fault_));
  }
  state_  = PipelineState::STREAMING;
  worker_ = std::thread(&H264EncodePipeline::run, this);
}

void H264EncodePipeline::push(Frame frame) {
  if (frame.image.empty() || frame.image.type() != CV_8UC3) {
    throw EncodingMismatch("Encode pipeline expects 8 bit 3 channel images");
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (state_) {
      case PipelineState::UNINITIALIZED:
      case PipelineState::CONFIGURED:
        throw ConfigurationError("Pipeline not started");
      case PipelineState::STOPPED:
        throw PipelineStopped(fault_.empty() ? "Pipeline stopped" : fault_);
      case PipelineState::STREAMING:
        break;
    }
  }
  if (queue_->wait_push_back(std::move(frame)) ==
      boost::queue_op_status::closed) {
    const auto reason = this->fault();
    throw PipelineStopped(reason.empty() ? "Pipeline stopped" : reason);
  }
}

void H264EncodePipeline::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == PipelineState::UNINITIALIZED ||
        state_ == PipelineState::CONFIGURED) {
      state_ = PipelineState::STOPPED;
    }
  }
  if (queue_) {
    queue_->close();
  }
  this->join_worker();
}

void H264EncodePipeline::abort(const std::string& reason) {
  if (this->state() == PipelineState::STOPPED) {
    return;
  }
  aborted_ = true;
  this->set_fault(reason);
  this->stop();
}

PipelineState H264EncodePipeline::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::string H264EncodePipeline::fault() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return fault_;
}

void H264EncodePipeline::set_fault(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (fault_.empty()) {
      fault_ = reason;
    }
  }
  std::cerr << *this << reason << std::endl;
  if (queue_) {
    queue_->close();
  }
}

void H264EncodePipeline::join_worker() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (!worker_.joinable()) {
    return;
  }
  if (worker_.get_id() == std::this_thread::get_id()) {
    // called from the sink; the worker finishes once it returns
    return;
  }
  worker_.join();
}

void H264EncodePipeline::run() {
  Frame frame;
  bool failed = false;
  while (queue_->wait_pull_front(frame) == boost::queue_op_status::success) {
    if (aborted_.load()) {
      break;
    }
    try {
      this->encode(frame);
    } catch (const std::exception& ex) {
      this->set_fault(ex.what());
      failed = true;
      break;
    }
  }
  if (!failed && !aborted_.load()) {
    try {
      this->flush();
    } catch (const std::exception& ex) {
      this->set_fault(ex.what());
    }
  }
  queue_->close();

  std::lock_guard<std::mutex> lock(state_mutex_);
  state_ = PipelineState::STOPPED;
  std::cout << *this << "stopped after " << chunks_emitted_.load()
            << " chunks" << std::endl;
}

void H264EncodePipeline::encode(const Frame& frame) {
  int success = avutils::bgr_to_frame(swsctx_, frame.image, frame_);
  if (success < 0) {
    throw std::runtime_error("Could not convert frame: " +
                             avutils::av_strerror2(success));
  }
  frame_->pts = next_pts_++;
  pending_[frame_->pts] = std::make_pair(frame.timestamp, frame.metadata);

  success = avcodec_send_frame(codec_ctx_, frame_);
  if (success < 0) {
    throw std::runtime_error("Could not send frame to encoder: " +
                             avutils::av_strerror2(success));
  }
  this->drain_packets();
}

void H264EncodePipeline::flush() {
  int success = avcodec_send_frame(codec_ctx_, nullptr);
  if (success < 0 && success != AVERROR_EOF) {
    throw std::runtime_error("Could not flush encoder: " +
                             avutils::av_strerror2(success));
  }
  this->drain_packets();
}

void H264EncodePipeline::drain_packets() {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, pkt_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return;
    } else if (ret < 0) {
      throw std::runtime_error("Error during encoding: " +
                               avutils::av_strerror2(ret));
    }
    this->emit(pkt_);
  }
}

void H264EncodePipeline::emit(AVPacket* pkt) {
  EncodedChunk chunk;
  chunk.data.assign(pkt->data, pkt->data + pkt->size);
  chunk.keyframe = (pkt->flags & AV_PKT_FLAG_KEY) != 0;
  const std::int64_t pts = pkt->pts;
  av_packet_unref(pkt);

  // no B-frames, so every packet carries the pts of exactly one pushed frame
  auto it = pending_.find(pts);
  if (it == pending_.end()) {
    throw std::runtime_error("Encoder produced a packet for unknown pts " +
                             std::to_string(pts));
  }
  chunk.timestamp = it->second.first;
  chunk.metadata  = std::move(it->second.second);
  pending_.erase(pending_.begin(), std::next(it));

  try {
    sink_(chunk);
  } catch (const std::exception& ex) {
    std::cerr << *this << "could not emit chunk with timestamp "
              << chunk.timestamp << std::endl;
    throw PipelineStopped(std::string("Chunk sink failed: ") + ex.what());
  }
  ++chunks_emitted_;
}

}  // namespace netapp
