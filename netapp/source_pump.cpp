#include "netapp/source_pump.hpp"

#include <chrono>
#include <iostream>

#include "netapp/errors.hpp"

using namespace std::chrono;

namespace netapp {

SourcePump::SourcePump(std::unique_ptr<CaptureSource> source,
                       FrameSink sink,
                       bool paced)
    : source_(std::move(source)), sink_(std::move(sink)), paced_(paced) {
  if (!source_ || !sink_) {
    throw ConfigurationError("SourcePump needs a source and a sink");
  }
}

SourcePump::~SourcePump() { this->stop(); }

void SourcePump::start() {
  if (worker_.joinable()) {
    throw ConfigurationError("SourcePump already started");
  }
  stop_    = false;
  running_ = true;
  worker_  = std::thread(&SourcePump::run, this);
}

void SourcePump::stop() {
  stop_ = true;
  this->join();
}

void SourcePump::join() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

void SourcePump::run() {
  const double fps = source_->fps();
  const bool pace  = paced_ && fps > 0;
  const auto budget =
      pace ? duration_cast<steady_clock::duration>(duration<double>(1.0 / fps))
           : steady_clock::duration::zero();
  const auto begin = steady_clock::now();
  std::int64_t i   = 0;

  while (!stop_.load()) {
    std::optional<Frame> frame;
    try {
      frame = source_->next_frame();
    } catch (const std::exception& ex) {
      std::cerr << "SourcePump: capture failed: " << ex.what() << std::endl;
      break;
    }
    if (!frame) {
      break;
    }
    try {
      sink_(std::move(*frame));
    } catch (const std::exception& ex) {
      std::cerr << "SourcePump: sink failed after " << frames_pumped_.load()
                << " frames: " << ex.what() << std::endl;
      break;
    }
    ++frames_pumped_;
    ++i;

    if (pace) {
      const auto desired_end_time = begin + budget * i;
      const auto remaining        = desired_end_time - steady_clock::now();
      if (remaining.count() > 0) {
        std::this_thread::sleep_for(remaining);
      }
    }
  }
  running_ = false;
}

}  // namespace netapp
