#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <tclap/CmdLine.h>
#include <thread>

#include "netapp/capture_source.hpp"
#include "netapp/client.hpp"
#include "netapp/errors.hpp"
#include "netapp/source_pump.hpp"
#include "netapp/time_utils.hpp"

extern "C" {
#include <libavutil/log.h>
}

using namespace std;
using namespace std::chrono;
using namespace TCLAP;
using namespace netapp;

namespace {

std::atomic<bool> stop_requested{false};

void on_signal(int) { stop_requested = true; }

bool is_number(const string& s) {
  return !s.empty() && s.find_first_not_of("0123456789") == string::npos;
}

unique_ptr<CaptureSource> open_source(const string& source,
                                      cv::Size size,
                                      int fps,
                                      unsigned long frames,
                                      bool stamp) {
  if (source == "synthetic") {
    SyntheticSource::Config cfg;
    cfg.width       = size.empty() ? 640 : size.width;
    cfg.height      = size.empty() ? 480 : size.height;
    cfg.fps         = fps;
    cfg.frame_count = frames;
    cfg.stamp       = stamp;
    cfg.first_timestamp = now_ns();
    return make_unique<SyntheticSource>(cfg);
  }
  if (is_number(source)) {
    return make_unique<VideoCaptureSource>(stoi(source), size);
  }
  return make_unique<VideoCaptureSource>(source, size);
}

}  // namespace

int main(int argc, char* argv[]) {
  const NetAppLocation env_location = NetAppLocation::from_environment();

  CmdLine cmdline("Stream video to a NetApp and print its results");
  ValueArg<string> host("H", "host", "NetApp host (env NETAPP_ADDRESS)", false,
                        env_location.host, "Host as String", cmdline);
  ValueArg<int> port("p", "port", "NetApp port (env NETAPP_PORT)", false,
                     env_location.port, "Port as Integer", cmdline);
  ValueArg<string> source(
      "s", "source",
      "'synthetic', a camera index, a video file or a gstreamer pipeline",
      false, "synthetic", "source", cmdline);
  ValueArg<string> encoding("e", "encoding", "jpeg or h264", false, "jpeg",
                            "encoding", cmdline);
  ValueArg<string> channel("c", "channel", "channel images are sent on",
                           false, "image", "name", cmdline);
  ValueArg<string> results("r", "results", "channel results arrive on", false,
                           "results", "name", cmdline);
  ValueArg<int> fps("f", "fps", "fps of stream", false, 30, "fps as Integer",
                    cmdline);
  ValueArg<int> bitrate("b", "bitrate", "h264 bitrate, 0 for default", false,
                        0, "Bitrate as Integer", cmdline);
  ValueArg<int> width("", "width", "resize frames to this width", false, 0,
                      "pixels", cmdline);
  ValueArg<int> height("", "height", "resize frames to this height", false, 0,
                       "pixels", cmdline);
  ValueArg<unsigned long> frames("n", "frames",
                                 "frames from the synthetic source, 0 forever",
                                 false, 0, "count", cmdline);
  ValueArg<int> back_pressure("", "back-pressure",
                              "outbound messages queued before dropping",
                              false, 5, "count", cmdline);
  SwitchArg drop("d", "drop", "drop jpeg frames instead of waiting", cmdline,
                 false);
  SwitchArg stamp("", "stamp", "burn the capture time into frames", cmdline,
                  false);
  SwitchArg wait("w", "wait", "wait until the NetApp is available", cmdline,
                 false);
  ValueArg<int> wait_timeout("", "wait-timeout",
                             "seconds to wait for the NetApp, < 0 forever",
                             false, -1, "seconds", cmdline);
  SwitchArg verbose("v", "verbose", "libav logging", cmdline, false);
  cmdline.parse(argc, argv);

  av_log_set_level(verbose.getValue() ? AV_LOG_INFO : AV_LOG_ERROR);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  ChannelType type;
  try {
    type = channel_type_from_string(encoding.getValue());
  } catch (const CodecError& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }
  if (type != ChannelType::JPEG && type != ChannelType::H264) {
    std::cerr << "Encoding must be jpeg or h264" << std::endl;
    return 1;
  }

  ClientConfig config;
  config.location.host       = host.getValue();
  config.location.port       = port.getValue();
  config.wait_until_available = wait.getValue();
  config.wait_timeout         = seconds(wait_timeout.getValue());
  config.back_pressure_size   = back_pressure.getValue();

  std::atomic<unsigned long> n_results{0};
  std::map<string, CallbackInfo> callbacks;
  callbacks[results.getValue()] = CallbackInfo(
      ChannelType::JSON,
      [&n_results](const Value& value, int64_t timestamp) {
        ++n_results;
        const double latency_ms = (now_ns() - timestamp) / 1e6;
        std::cout << "Result (" << std::setprecision(2) << std::fixed
                  << latency_ms << " ms): " << get<nlohmann::json>(value).dump()
                  << std::endl;
      },
      [](const Bytes& payload, const string& reason) {
        std::cerr << "Bad result (" << payload.size() << " bytes): " << reason
                  << std::endl;
      });
  callbacks[COMMAND_RESULT_CHANNEL] =
      CallbackInfo(ChannelType::JSON, [](const Value& value, int64_t) {
        std::cout << "Command result: " << get<nlohmann::json>(value).dump()
                  << std::endl;
      });
  callbacks[COMMAND_ERROR_CHANNEL] =
      CallbackInfo(ChannelType::JSON, [](const Value& value, int64_t) {
        std::cerr << "Command failed: " << get<nlohmann::json>(value).dump()
                  << std::endl;
      });

  try {
    NetAppClient client(callbacks, config);

    const cv::Size size(width.getValue(), height.getValue());
    auto capture = open_source(source.getValue(), size, fps.getValue(),
                               frames.getValue(), stamp.getValue());

    nlohmann::json args = {{"fps", fps.getValue()}};
    client.connect(args);

    EncodingOptions options;
    options.fps     = fps.getValue();
    options.bitrate = bitrate.getValue();
    options.width   = size.width;
    options.height  = size.height;

    std::atomic<unsigned long> n_dropped{0};
    const bool can_be_dropped = drop.getValue() && type == ChannelType::JPEG;
    SourcePump pump(
        std::move(capture),
        [&](Frame frame) {
          try {
            client.send_image(frame.image, channel.getValue(), type,
                              frame.timestamp, options, frame.metadata,
                              can_be_dropped);
          } catch (const BackPressureError&) {
            ++n_dropped;
          }
        },
        true);

    const double begin = current_millis();
    pump.start();
    while (!stop_requested.load() && pump.running() && client.is_connected()) {
      std::this_thread::sleep_for(milliseconds(100));
    }
    pump.stop();
    client.disconnect();

    const double elapsed = current_millis() - begin;
    std::cout << "Sent " << pump.frames_pumped() << " frames in " << elapsed
              << " s (" << pump.frames_pumped() / std::max(elapsed, 1e-3)
              << " fps), dropped " << n_dropped.load() << ", received "
              << n_results.load() << " results" << std::endl;
  } catch (const NetAppError& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
