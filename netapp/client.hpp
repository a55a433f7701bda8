#ifndef CLIENT_HPP_N4PLR8DY
#define CLIENT_HPP_N4PLR8DY

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

#include "netapp/channel_mux.hpp"
#include "netapp/codec.hpp"
#include "netapp/control_command.hpp"
#include "netapp/encode_pipeline.hpp"
#include "netapp/transport.hpp"

namespace netapp {

/// Default port of the NetApp server
constexpr int NETAPP_PORT = 5896;

struct NetAppLocation {
  std::string host = "127.0.0.1";
  int port         = NETAPP_PORT;

  /// zmq endpoint, `tcp://host:port`
  std::string endpoint() const;

  /**
   * @brief Location from `NETAPP_ADDRESS` and `NETAPP_PORT`, falling back to
   * the defaults
   *
   * @throws ConfigurationError if `NETAPP_PORT` is not a number
   */
  static NetAppLocation from_environment();
};

struct ClientConfig {
  NetAppLocation location;
  std::chrono::milliseconds connect_timeout{10000};
  /// keep retrying every second until `wait_timeout` runs out
  bool wait_until_available = false;
  std::chrono::seconds wait_timeout{-1};  ///< < 0: forever
  /// outbound messages queued before sends block or get dropped
  int back_pressure_size = 5;
};

/**
 * @brief   Parameters of the H.264 stream, fixed when the first frame is sent
 */
struct EncodingOptions {
  int width           = 0;  ///< 0: size of the first frame
  int height          = 0;
  int fps             = 30;
  int bitrate         = 0;
  int gop_size        = 30;
  LatencyMode latency = LatencyMode::LOW;
};

/**
 * @brief Stream parameters from the `set_state` arguments of `connect`
 *
 * `h264` must be a boolean; `width`, `height` and `fps` may be numbers or
 * numeric strings.
 *
 * @return    options when `h264` is true, nothing otherwise
 * @throws ConfigurationError on values of the wrong type
 */
std::optional<EncodingOptions> encoding_from_args(const nlohmann::json& args);

/**
 * @brief   Client of one NetApp. Owns the connection, the channel multiplexer
 * and at most one H.264 encode pipeline.
 *
 * Received values are delivered to the handlers given at construction, on a
 * single thread owned by the transport. Handlers must not call `connect` or
 * `disconnect`.
 */
class NetAppClient {
public:
  /**
   * @param callbacks   inbound channels and their handlers
   * @param config  where and how to connect
   * @param registry    codecs for the channel types
   * @param transport   connection to use, a `ZmqTransport` to the configured
   * location if null
   *
   * @throws ConfigurationError for invalid configuration
   * @throws DuplicateChannel   if a callback conflicts with a reserved channel
   */
  NetAppClient(const std::map<std::string, CallbackInfo>& callbacks,
               const ClientConfig& config,
               CodecRegistry registry = CodecRegistry::with_defaults(),
               std::unique_ptr<Transport> transport = nullptr);
  ~NetAppClient();

  NetAppClient(const NetAppClient&) = delete;
  NetAppClient& operator=(const NetAppClient&) = delete;

  /**
   * @brief Connect and initialize the NetApp with a `set_state` command
   * carrying `args`. `{"h264": true, "width": .., "height": .., "fps": ..}`
   * sets the default encoding options.
   *
   * @throws AlreadyConnected   if connected
   * @throws FailedToConnect    if the NetApp cannot be reached
   */
  void connect(const nlohmann::json& args = nlohmann::json::object());

  /**
   * @brief Flush and stop the encode pipeline, then close the connection.
   * Safe to call repeatedly.
   */
  void disconnect();

  bool is_connected() const;

  /// Block until disconnected, locally or by the NetApp
  void wait();

  /**
   * @brief Send an image, as JPEG or through the H.264 pipeline
   *
   * @param frame   BGR8 image
   * @param channel channel name, registered on first use
   * @param type    JPEG or H264
   * @param timestamp   ns, wall clock if not given
   * @param options H.264 stream parameters, used when the pipeline is
   * created
   * @param metadata    passed along with the image
   * @param can_be_dropped  JPEG only: fail with `BackPressureError` instead
   * of waiting for a full queue
   *
   * @return    timestamp the image was sent with
   * @throws NotConnected, EncodingMismatch, DuplicateChannel,
   * BackPressureError, PipelineStopped
   * @throws ConfigurationError if a second H.264 channel is used
   */
  std::int64_t send_image(const cv::Mat& frame,
                          const std::string& channel = "image",
                          ChannelType type           = ChannelType::JPEG,
                          std::optional<std::int64_t> timestamp = std::nullopt,
                          const std::optional<EncodingOptions>& options =
                              std::nullopt,
                          const std::string& metadata = "",
                          bool can_be_dropped         = false);

  /**
   * @brief Send a JSON document on a JSON or JSON_LZ4 channel
   *
   * @return    timestamp the data was sent with
   */
  std::int64_t send_data(const nlohmann::json& data,
                         const std::string& channel = "json",
                         ChannelType type           = ChannelType::JSON,
                         std::optional<std::int64_t> timestamp = std::nullopt,
                         bool can_be_dropped                   = false);

  void send_control_command(const ControlCommand& cmd);

  /// Registered channels, inbound and outbound
  std::map<std::string, ChannelType> channels() const;

  const ClientConfig& config() const { return config_; }

  friend std::ostream& operator<<(std::ostream& os, const NetAppClient& c) {
    os << "NetAppClient " << c.config_.location.endpoint() << ": ";
    return os;
  }

private:
  const ClientConfig config_;
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<ChannelMultiplexer> mux_;

  std::mutex pipeline_mutex_;
  std::shared_ptr<H264EncodePipeline> pipeline_;
  std::string h264_channel_;
  std::optional<EncodingOptions> default_encoding_;

  std::mutex lifecycle_mutex_;
  mutable std::mutex state_mutex_;
  std::condition_variable state_changed_;
  bool connected_ = false;

  void ensure_channel(const std::string& name, ChannelType type);
  std::shared_ptr<H264EncodePipeline>
  get_pipeline(const std::string& channel,
               const cv::Mat& frame,
               const std::optional<EncodingOptions>& options);
  void on_transport_lost(const std::string& reason);
  void set_connected(bool connected);
};

}  // namespace netapp

#endif /* end of include guard: CLIENT_HPP_N4PLR8DY */
