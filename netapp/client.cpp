#include "netapp/client.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <thread>

#include "netapp/errors.hpp"
#include "netapp/time_utils.hpp"
#include "netapp/zmq_transport.hpp"

using namespace std::chrono;

namespace netapp {

namespace {

int int_arg(const nlohmann::json& args, const char* key, int fallback) {
  const auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return fallback;
  }
  double value = std::nan("");
  if (it->is_number()) {
    value = it->get<double>();
  } else if (it->is_string()) {
    const std::string text = it->get<std::string>();
    std::size_t used       = 0;
    try {
      value = std::stod(text, &used);
    } catch (const std::exception&) {
      used = 0;
    }
    if (used == 0 || used != text.size()) {
      value = std::nan("");
    }
  }
  if (!std::isfinite(value) ||
      std::fabs(value) > std::numeric_limits<int>::max()) {
    throw ConfigurationError(std::string("Invalid value for ") + key + ": " +
                             it->dump());
  }
  return static_cast<int>(value);
}

}  // namespace

std::optional<EncodingOptions> encoding_from_args(const nlohmann::json& args) {
  if (!args.is_object()) {
    return std::nullopt;
  }
  const auto h264 = args.find("h264");
  if (h264 == args.end() || h264->is_null()) {
    return std::nullopt;
  }
  if (!h264->is_boolean()) {
    throw ConfigurationError("Invalid value for h264: " + h264->dump());
  }
  if (!h264->get<bool>()) {
    return std::nullopt;
  }
  EncodingOptions options;
  options.width  = int_arg(args, "width", 0);
  options.height = int_arg(args, "height", 0);
  options.fps    = int_arg(args, "fps", 30);
  if (options.width < 0 || options.height < 0 || options.fps <= 0) {
    throw ConfigurationError("Invalid h264 stream size or fps: " +
                             args.dump());
  }
  return options;
}

std::string NetAppLocation::endpoint() const {
  return "tcp://" + host + ":" + std::to_string(port);
}

NetAppLocation NetAppLocation::from_environment() {
  NetAppLocation location;
  if (const char* address = std::getenv("NETAPP_ADDRESS")) {
    location.host = address;
  }
  if (const char* port = std::getenv("NETAPP_PORT")) {
    try {
      location.port = std::stoi(port);
    } catch (const std::exception&) {
      throw ConfigurationError(std::string("Invalid NETAPP_PORT: ") + port);
    }
  }
  return location;
}

NetAppClient::NetAppClient(const std::map<std::string, CallbackInfo>& callbacks,
                           const ClientConfig& config,
                           CodecRegistry registry,
                           std::unique_ptr<Transport> transport)
    : config_(config), transport_(std::move(transport)) {
  if (config_.back_pressure_size < 1) {
    throw ConfigurationError("Invalid value for back_pressure_size.");
  }
  if (!transport_) {
    ZmqTransportOptions options;
    options.send_hwm = config_.back_pressure_size;
    transport_ =
        std::make_unique<ZmqTransport>(config_.location.endpoint(), options);
  }
  mux_ = std::make_unique<ChannelMultiplexer>(*transport_, std::move(registry));
  for (const auto& entry : callbacks) {
    mux_->register_channel(entry.first, entry.second);
  }
  transport_->on_disconnect(
      [this](const std::string& reason) { this->on_transport_lost(reason); });
}

NetAppClient::~NetAppClient() {
  try {
    this->disconnect();
  } catch (const std::exception& ex) {
    std::cerr << *this << "error while disconnecting: " << ex.what()
              << std::endl;
  }
  transport_->on_disconnect(nullptr);
}

void NetAppClient::connect(const nlohmann::json& args) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (transport_->is_connected()) {
    throw AlreadyConnected("Already connected to " +
                           config_.location.endpoint());
  }

  // bad arguments must fail before anything goes out on the wire
  const std::optional<EncodingOptions> encoding = encoding_from_args(args);

  const auto start = steady_clock::now();
  while (true) {
    try {
      transport_->connect(config_.connect_timeout);
      break;
    } catch (const FailedToConnect& ex) {
      const bool expired =
          config_.wait_timeout.count() >= 0 &&
          steady_clock::now() - start >= config_.wait_timeout;
      if (!config_.wait_until_available || expired) {
        throw;
      }
      std::cerr << *this << ex.what() << ". Retrying in 1 second."
                << std::endl;
      std::this_thread::sleep_for(seconds(1));
    }
  }

  {
    // a pipeline left over from the last connection is stopped for good
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    pipeline_.reset();
    h264_channel_.clear();
    default_encoding_ = encoding;
  }
  this->set_connected(true);

  try {
    ControlCommand cmd;
    cmd.type        = ControlCmdType::SET_STATE;
    cmd.clear_queue = true;
    cmd.data        = args.is_null() ? nlohmann::json::object() : args;
    this->send_control_command(cmd);
  } catch (const std::exception& ex) {
    std::cerr << *this << "initial set_state failed: " << ex.what()
              << std::endl;
    transport_->disconnect();
    this->set_connected(false);
    throw;
  }
  std::cout << *this << "connected" << std::endl;
}

void NetAppClient::disconnect() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::shared_ptr<H264EncodePipeline> pipeline;
  {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    pipeline = pipeline_;
  }
  if (pipeline) {
    pipeline->stop();
  }
  transport_->disconnect();
  this->set_connected(false);
}

bool NetAppClient::is_connected() const { return transport_->is_connected(); }

void NetAppClient::wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_changed_.wait(lock, [this] { return !connected_; });
}

void NetAppClient::set_connected(bool connected) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    connected_ = connected;
  }
  state_changed_.notify_all();
}

void NetAppClient::on_transport_lost(const std::string& reason) {
  std::cerr << *this << "connection lost: " << reason << std::endl;
  std::shared_ptr<H264EncodePipeline> pipeline;
  {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    pipeline = pipeline_;
  }
  if (pipeline) {
    pipeline->abort("Connection lost: " + reason);
  }
  this->set_connected(false);
}

void NetAppClient::ensure_channel(const std::string& name, ChannelType type) {
  mux_->register_channel(name, type, std::shared_ptr<ChannelHandler>());
}

std::shared_ptr<H264EncodePipeline>
NetAppClient::get_pipeline(const std::string& channel,
                           const cv::Mat& frame,
                           const std::optional<EncodingOptions>& options) {
  std::lock_guard<std::mutex> lock(pipeline_mutex_);
  if (pipeline_) {
    if (channel != h264_channel_) {
      throw ConfigurationError("H.264 already streams on channel " +
                               h264_channel_ + ", cannot use " + channel);
    }
    return pipeline_;
  }

  const EncodingOptions opts =
      options ? *options : default_encoding_.value_or(EncodingOptions());
  PipelineConfig config;
  config.width    = opts.width > 0 ? opts.width : frame.cols;
  config.height   = opts.height > 0 ? opts.height : frame.rows;
  config.fps      = opts.fps;
  config.bitrate  = opts.bitrate;
  config.gop_size = opts.gop_size;
  config.latency  = opts.latency;

  this->ensure_channel(channel, ChannelType::H264);
  ChannelMultiplexer* mux = mux_.get();
  auto pipeline = std::make_shared<H264EncodePipeline>(
      config, [mux, channel](const EncodedChunk& chunk) {
        mux->send(channel, Value(chunk.data), chunk.timestamp, chunk.metadata);
      });
  pipeline->start();
  pipeline_     = pipeline;
  h264_channel_ = channel;
  return pipeline;
}

std::int64_t
NetAppClient::send_image(const cv::Mat& frame,
                         const std::string& channel,
                         ChannelType type,
                         std::optional<std::int64_t> timestamp,
                         const std::optional<EncodingOptions>& options,
                         const std::string& metadata,
                         bool can_be_dropped) {
  if (!transport_->is_connected()) {
    throw NotConnected("Cannot send image on channel " + channel +
                       ": not connected");
  }
  if (type == ChannelType::JPEG) {
    this->ensure_channel(channel, type);
    return mux_->send(channel, Value(frame), timestamp, metadata,
                      can_be_dropped);
  }
  if (type != ChannelType::H264) {
    throw EncodingMismatch("Images are sent on jpeg or h264 channels, not " +
                           to_string(type));
  }

  auto pipeline = this->get_pipeline(channel, frame, options);
  Frame f;
  f.image     = frame;
  f.timestamp = timestamp ? *timestamp : now_ns();
  f.metadata  = metadata;
  const std::int64_t used = f.timestamp;
  pipeline->push(std::move(f));
  return used;
}

std::int64_t NetAppClient::send_data(const nlohmann::json& data,
                                     const std::string& channel,
                                     ChannelType type,
                                     std::optional<std::int64_t> timestamp,
                                     bool can_be_dropped) {
  if (type != ChannelType::JSON && type != ChannelType::JSON_LZ4) {
    throw EncodingMismatch("Data is sent on json or json_lz4 channels, not " +
                           to_string(type));
  }
  this->ensure_channel(channel, type);
  return mux_->send(channel, Value(data), timestamp, "", can_be_dropped);
}

void NetAppClient::send_control_command(const ControlCommand& cmd) {
  this->ensure_channel(COMMAND_CHANNEL, ChannelType::JSON);
  mux_->send(COMMAND_CHANNEL, Value(nlohmann::json(cmd)));
}

std::map<std::string, ChannelType> NetAppClient::channels() const {
  return mux_->channels();
}

}  // namespace netapp
