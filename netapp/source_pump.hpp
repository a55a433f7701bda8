#ifndef SOURCE_PUMP_HPP_X9HAE4QL
#define SOURCE_PUMP_HPP_X9HAE4QL

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "netapp/capture_source.hpp"

namespace netapp {

/**
 * @brief   Moves frames from a capture source into a sink on its own thread,
 * e.g. into `NetAppClient::send_image` or `H264EncodePipeline::push`.
 */
class SourcePump {
public:
  using FrameSink = std::function<void(Frame)>;

  /**
   * @param source  frames to pump
   * @param sink    called for every frame on the pump thread; an exception
   * stops the pump
   * @param paced   sleep between frames to hold the source's frame rate
   */
  SourcePump(std::unique_ptr<CaptureSource> source,
             FrameSink sink,
             bool paced = true);
  ~SourcePump();

  SourcePump(const SourcePump&) = delete;
  SourcePump& operator=(const SourcePump&) = delete;

  void start();

  /// Stop after the current frame and join; safe to call repeatedly
  void stop();

  /// Block until the source ends, the sink fails or `stop` is called
  void join();

  bool running() const { return running_.load(); }

  std::uint64_t frames_pumped() const { return frames_pumped_.load(); }

private:
  std::unique_ptr<CaptureSource> source_;
  FrameSink sink_;
  bool paced_;
  std::thread worker_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> frames_pumped_{0};

  void run();
};

}  // namespace netapp

#endif /* end of include guard: SOURCE_PUMP_HPP_X9HAE4QL */
