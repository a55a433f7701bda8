#ifndef ENCODE_PIPELINE_HPP_B5ZG1RKE
#define ENCODE_PIPELINE_HPP_B5ZG1RKE

#include <atomic>
#include <boost/thread/sync_bounded_queue.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <utility>

#include "netapp/avutils.hpp"
#include "netapp/capture_source.hpp"
#include "netapp/channel_type.hpp"

namespace netapp {

enum class PipelineState { UNINITIALIZED, CONFIGURED, STREAMING, STOPPED };

std::string to_string(PipelineState state);

enum class LatencyMode {
  LOW,     ///< ultrafast preset, zerolatency tune
  NORMAL,  ///< veryfast preset, lookahead allowed
};

struct PipelineConfig {
  int width         = 0;
  int height        = 0;
  int fps           = 30;
  int bitrate       = 0;  ///< bits per second, 0 for encoder default
  int gop_size      = 30;
  LatencyMode latency = LatencyMode::LOW;
  int queue_size    = 30;  ///< frames waiting for the encoder
  std::string encoder_name;  ///< empty: default h264 encoder
};

/**
 * @brief   One packet produced by the encoder, stamped with the timestamp of
 * the frame it was made from
 */
struct EncodedChunk {
  Bytes data;
  std::int64_t timestamp = 0;
  bool keyframe          = false;
  std::string metadata;
};

/**
 * @brief   Encodes frames to H.264 on a worker thread and hands every packet
 * to a sink, in presentation order.
 *
 * Frames are queued by `push` and encoded by the worker. The sink runs on the
 * worker thread. If it throws, the pipeline stops and keeps the reason.
 */
class H264EncodePipeline {
public:
  using ChunkSink = std::function<void(const EncodedChunk&)>;

  /**
   * @brief Validate the configuration and open the encoder. Leaves the
   * pipeline CONFIGURED.
   *
   * @throws ConfigurationError on invalid parameters or if the encoder cannot
   * be opened
   */
  H264EncodePipeline(const PipelineConfig& config, ChunkSink sink);
  ~H264EncodePipeline();

  H264EncodePipeline(const H264EncodePipeline&) = delete;
  H264EncodePipeline& operator=(const H264EncodePipeline&) = delete;

  /**
   * @brief CONFIGURED -> STREAMING, spawns the worker
   *
   * @throws PipelineStopped    if stopped
   */
  void start();

  /**
   * @brief Queue a frame for encoding, blocking while the queue is full
   *
   * @throws EncodingMismatch   if the image is not 8 bit 3 channel
   * @throws ConfigurationError if not started
   * @throws PipelineStopped    if stopped or faulted
   */
  void push(Frame frame);

  /**
   * @brief Encode what is queued, flush the encoder, then STOPPED.
   * Idempotent.
   */
  void stop();

  /**
   * @brief Stop without draining, remembering `reason` as the fault
   */
  void abort(const std::string& reason);

  PipelineState state() const;

  /// Why the pipeline stopped on its own, empty if it did not
  std::string fault() const;

  const PipelineConfig& config() const { return config_; }

  std::uint64_t chunks_emitted() const { return chunks_emitted_.load(); }

  friend std::ostream& operator<<(std::ostream& os,
                                  const H264EncodePipeline& p) {
    os << "H264EncodePipeline " << p.config_.width << "x" << p.config_.height
       << "@" << p.config_.fps << ": ";
    return os;
  }

private:
  using Queue = boost::sync_bounded_queue<Frame>;

  const PipelineConfig config_;
  ChunkSink sink_;

  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_            = nullptr;
  AVPacket* pkt_             = nullptr;
  SwsContext* swsctx_        = nullptr;

  // only touched by the worker
  std::int64_t next_pts_ = 0;
  std::map<std::int64_t, std::pair<std::int64_t, std::string>> pending_;

  std::unique_ptr<Queue> queue_;
  std::thread worker_;
  std::mutex join_mutex_;
  std::atomic<bool> aborted_{false};
  std::atomic<std::uint64_t> chunks_emitted_{0};

  mutable std::mutex state_mutex_;
  PipelineState state_ = PipelineState::UNINITIALIZED;
  std::string fault_;

  void run();
  void encode(const Frame& frame);
  void flush();
  void drain_packets();
  void emit(AVPacket* pkt);
  void set_fault(const std::string& reason);
  void join_worker();
  void release();
};

}  // namespace netapp

#endif /* end of include guard: ENCODE_PIPELINE_HPP_B5ZG1RKE */
