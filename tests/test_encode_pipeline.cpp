#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "netapp/avutils.hpp"
#include "netapp/codec.hpp"
#include "netapp/encode_pipeline.hpp"
#include "netapp/errors.hpp"

using namespace netapp;

namespace {

PipelineConfig small_config() {
  PipelineConfig config;
  config.width    = 160;
  config.height   = 120;
  config.fps      = 30;
  config.gop_size = 10;
  config.latency  = LatencyMode::LOW;
  return config;
}

Frame make_frame(std::int64_t timestamp) {
  Frame frame;
  frame.image = cv::Mat(120, 160, CV_8UC3);
  avutils::generatePattern(frame.image,
                           static_cast<unsigned char>(timestamp * 8));
  frame.timestamp = timestamp;
  frame.sequence  = static_cast<std::uint64_t>(timestamp);
  return frame;
}

struct ChunkCollector {
  std::mutex mutex;
  std::vector<EncodedChunk> chunks;

  H264EncodePipeline::ChunkSink sink() {
    return [this](const EncodedChunk& chunk) {
      std::lock_guard<std::mutex> lock(mutex);
      chunks.push_back(chunk);
    };
  }
};

bool wait_for_state(const H264EncodePipeline& pipeline, PipelineState state) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (pipeline.state() != state) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

}  // namespace

TEST_CASE("Thirty frames produce ordered chunks", "[pipeline]") {
  ChunkCollector collector;
  H264EncodePipeline pipeline(small_config(), collector.sink());
  CHECK(pipeline.state() == PipelineState::CONFIGURED);

  pipeline.start();
  CHECK(pipeline.state() == PipelineState::STREAMING);
  for (std::int64_t ts = 0; ts < 30; ++ts) {
    pipeline.push(make_frame(ts));
  }
  pipeline.stop();
  CHECK(pipeline.state() == PipelineState::STOPPED);
  CHECK(pipeline.fault().empty());

  std::lock_guard<std::mutex> lock(collector.mutex);
  const auto& chunks = collector.chunks;
  REQUIRE_FALSE(chunks.empty());
  CHECK(pipeline.chunks_emitted() == chunks.size());
  CHECK(chunks.front().keyframe);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    CHECK_FALSE(chunks[i].data.empty());
    CHECK(chunks[i].timestamp >= 0);
    CHECK(chunks[i].timestamp <= 29);
    if (i > 0) {
      CHECK(chunks[i].timestamp >= chunks[i - 1].timestamp);
    }
  }
  CHECK(chunks.back().timestamp == 29);
}

TEST_CASE("Chunks decode back to pictures of the configured size",
          "[pipeline][h264]") {
  ChunkCollector collector;
  H264EncodePipeline pipeline(small_config(), collector.sink());
  pipeline.start();
  for (std::int64_t ts = 0; ts < 10; ++ts) {
    pipeline.push(make_frame(ts));
  }
  pipeline.stop();

  H264Codec decoder;
  int pictures = 0;
  std::lock_guard<std::mutex> lock(collector.mutex);
  for (const auto& chunk : collector.chunks) {
    const cv::Mat image = std::get<cv::Mat>(decoder.decode(chunk.data));
    if (!image.empty()) {
      ++pictures;
      CHECK(image.cols == 160);
      CHECK(image.rows == 120);
    }
  }
  CHECK(pictures > 0);
}

TEST_CASE("Frames of another size are scaled", "[pipeline]") {
  ChunkCollector collector;
  H264EncodePipeline pipeline(small_config(), collector.sink());
  pipeline.start();
  Frame frame;
  frame.image     = cv::Mat(240, 320, CV_8UC3, cv::Scalar(10, 20, 30));
  frame.timestamp = 5;
  frame.metadata  = "big";
  pipeline.push(frame);
  pipeline.stop();

  std::lock_guard<std::mutex> lock(collector.mutex);
  REQUIRE_FALSE(collector.chunks.empty());
  CHECK(collector.chunks.front().timestamp == 5);
  CHECK(collector.chunks.front().metadata == "big");
}

TEST_CASE("Chunks keep the timestamps of their frames", "[pipeline]") {
  ChunkCollector collector;
  H264EncodePipeline pipeline(small_config(), collector.sink());
  pipeline.start();
  Frame later    = make_frame(10);
  later.metadata = "first";
  Frame earlier    = make_frame(5);
  earlier.metadata = "second";
  pipeline.push(later);
  pipeline.push(earlier);
  pipeline.stop();
  CHECK(pipeline.fault().empty());

  std::lock_guard<std::mutex> lock(collector.mutex);
  REQUIRE(collector.chunks.size() == 2);
  CHECK(collector.chunks[0].timestamp == 10);
  CHECK(collector.chunks[0].metadata == "first");
  CHECK(collector.chunks[1].timestamp == 5);
  CHECK(collector.chunks[1].metadata == "second");
}

TEST_CASE("Invalid pipeline configuration", "[pipeline]") {
  ChunkCollector collector;
  auto config = small_config();

  SECTION("odd width") { config.width = 161; }
  SECTION("zero height") { config.height = 0; }
  SECTION("zero fps") { config.fps = 0; }
  SECTION("negative bitrate") { config.bitrate = -1; }
  SECTION("zero gop") { config.gop_size = 0; }
  SECTION("zero queue") { config.queue_size = 0; }
  SECTION("unknown encoder") { config.encoder_name = "no_such_encoder"; }

  CHECK_THROWS_AS(H264EncodePipeline(config, collector.sink()),
                  ConfigurationError);
}

TEST_CASE("Pipeline state rules", "[pipeline]") {
  ChunkCollector collector;
  H264EncodePipeline pipeline(small_config(), collector.sink());

  SECTION("push before start") {
    CHECK_THROWS_AS(pipeline.push(make_frame(0)), ConfigurationError);
  }

  SECTION("push after stop") {
    pipeline.start();
    pipeline.push(make_frame(0));
    pipeline.stop();
    CHECK_THROWS_AS(pipeline.push(make_frame(1)), PipelineStopped);
  }

  SECTION("stop is idempotent") {
    pipeline.start();
    pipeline.stop();
    const auto emitted = pipeline.chunks_emitted();
    pipeline.stop();
    CHECK(pipeline.state() == PipelineState::STOPPED);
    CHECK(pipeline.chunks_emitted() == emitted);
  }

  SECTION("stop before start") {
    pipeline.stop();
    CHECK(pipeline.state() == PipelineState::STOPPED);
    CHECK_THROWS_AS(pipeline.start(), PipelineStopped);
  }

  SECTION("wrong image type") {
    pipeline.start();
    Frame gray;
    gray.image = cv::Mat(120, 160, CV_8UC1, cv::Scalar(0));
    CHECK_THROWS_AS(pipeline.push(gray), EncodingMismatch);
  }

  SECTION("abort keeps the reason") {
    pipeline.start();
    pipeline.abort("connection lost");
    CHECK(pipeline.state() == PipelineState::STOPPED);
    CHECK(pipeline.fault() == "connection lost");
    try {
      pipeline.push(make_frame(0));
      FAIL("push after abort must throw");
    } catch (const PipelineStopped& ex) {
      CHECK(std::string(ex.what()) == "connection lost");
    }
  }
}

TEST_CASE("A failing sink stops the pipeline", "[pipeline]") {
  H264EncodePipeline pipeline(small_config(), [](const EncodedChunk&) {
    throw std::runtime_error("transport gone");
  });
  pipeline.start();
  pipeline.push(make_frame(0));

  REQUIRE(wait_for_state(pipeline, PipelineState::STOPPED));
  CHECK_FALSE(pipeline.fault().empty());
  CHECK(pipeline.chunks_emitted() == 0);
  CHECK_THROWS_AS(pipeline.push(make_frame(1)), PipelineStopped);
}
