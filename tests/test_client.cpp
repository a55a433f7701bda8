#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iterator>
#include <mutex>
#include <thread>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include "fake_transport.hpp"
#include "netapp/client.hpp"
#include "netapp/envelope.hpp"

using namespace netapp;
using namespace std::chrono;

namespace {

/**
 * @brief   ROUTER on a free loopback port that answers JSON on "json" with the
 * same value on "results", like a NetApp echoing its input
 */
class LoopbackNetApp {
  zmq::context_t ctx_;
  zmq::socket_t router_;
  std::thread thread_;
  std::atomic<bool> running_{true};
  int port_ = 0;
  mutable std::mutex mutex_;
  std::vector<Message> received_;

  void run() {
    while (running_.load()) {
      zmq::pollitem_t items[] = {{router_.handle(), 0, ZMQ_POLLIN, 0}};
      zmq::poll(items, 1, milliseconds(20));
      if (!(items[0].revents & ZMQ_POLLIN)) {
        continue;
      }
      std::vector<zmq::message_t> incoming;
      if (!zmq::recv_multipart(router_, std::back_inserter(incoming)) ||
          incoming.size() != envelope::NUM_PARTS + 1) {
        continue;
      }
      Parts parts;
      for (std::size_t i = 1; i < incoming.size(); ++i) {
        const auto* data = static_cast<const std::uint8_t*>(incoming[i].data());
        parts.emplace_back(data, data + incoming[i].size());
      }
      Message message;
      try {
        message = envelope::unpack(parts);
      } catch (const CodecError&) {
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(message);
      }
      if (message.channel != "json") {
        continue;
      }
      message.channel = "results";
      std::vector<zmq::const_buffer> reply;
      reply.push_back(zmq::buffer(incoming[0].data(), incoming[0].size()));
      const Parts out = envelope::pack(message);
      for (const auto& part : out) {
        reply.push_back(zmq::buffer(part.data(), part.size()));
      }
      zmq::send_multipart(router_, reply);
    }
    router_.close();
  }

public:
  LoopbackNetApp() : ctx_(1), router_(ctx_, zmq::socket_type::router) {
    router_.set(zmq::sockopt::linger, 0);
    router_.bind("tcp://127.0.0.1:*");
    const std::string endpoint = router_.get(zmq::sockopt::last_endpoint);
    port_   = std::stoi(endpoint.substr(endpoint.rfind(':') + 1));
    thread_ = std::thread(&LoopbackNetApp::run, this);
  }

  ~LoopbackNetApp() { this->stop(); }

  /// Close the socket, which drops every client connection
  void stop() {
    running_ = false;
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  int port() const { return port_; }

  std::vector<Message> received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }
};

ClientConfig config_for(int port) {
  ClientConfig config;
  config.location.host   = "127.0.0.1";
  config.location.port   = port;
  config.connect_timeout = milliseconds(2000);
  return config;
}

int unused_port() {
  zmq::context_t ctx(1);
  zmq::socket_t socket(ctx, zmq::socket_type::router);
  socket.set(zmq::sockopt::linger, 0);
  socket.bind("tcp://127.0.0.1:*");
  const std::string endpoint = socket.get(zmq::sockopt::last_endpoint);
  return std::stoi(endpoint.substr(endpoint.rfind(':') + 1));
}

template <typename Predicate>
bool eventually(Predicate predicate) {
  const auto deadline = steady_clock::now() + seconds(5);
  while (!predicate()) {
    if (steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  return true;
}

}  // namespace

TEST_CASE("Location and configuration", "[client]") {
  NetAppLocation location;
  CHECK(location.endpoint() == "tcp://127.0.0.1:5896");

  ClientConfig config;
  config.back_pressure_size = 0;
  CHECK_THROWS_AS(NetAppClient({}, config), ConfigurationError);
}

TEST_CASE("Stream options from connect arguments", "[client]") {
  SECTION("no h264") {
    CHECK_FALSE(encoding_from_args(nlohmann::json()).has_value());
    CHECK_FALSE(encoding_from_args({{"fps", 30}}).has_value());
    CHECK_FALSE(encoding_from_args({{"h264", false}}).has_value());
  }

  SECTION("numbers and numeric strings") {
    const auto options = encoding_from_args(
        {{"h264", true}, {"width", "640"}, {"height", 480}, {"fps", "29.97"}});
    REQUIRE(options.has_value());
    CHECK(options->width == 640);
    CHECK(options->height == 480);
    CHECK(options->fps == 29);
  }

  SECTION("defaults") {
    const auto options = encoding_from_args({{"h264", true}});
    REQUIRE(options.has_value());
    CHECK(options->width == 0);
    CHECK(options->fps == 30);
  }

  SECTION("wrong types") {
    CHECK_THROWS_AS(encoding_from_args({{"h264", 1}}), ConfigurationError);
    CHECK_THROWS_AS(encoding_from_args({{"h264", "yes"}}), ConfigurationError);
    CHECK_THROWS_AS(encoding_from_args({{"h264", true}, {"width", "wide"}}),
                    ConfigurationError);
    CHECK_THROWS_AS(encoding_from_args({{"h264", true}, {"width", "64x"}}),
                    ConfigurationError);
    CHECK_THROWS_AS(
        encoding_from_args({{"h264", true}, {"height", nlohmann::json::array()}}),
        ConfigurationError);
    CHECK_THROWS_AS(encoding_from_args({{"h264", true}, {"fps", 0}}),
                    ConfigurationError);
    CHECK_THROWS_AS(encoding_from_args({{"h264", true}, {"width", 1e12}}),
                    ConfigurationError);
  }
}

TEST_CASE("Client over an in-memory transport", "[client]") {
  auto transport = std::make_unique<FakeTransport>();
  FakeTransport& fake = *transport;
  NetAppClient client({}, ClientConfig(), CodecRegistry::with_defaults(),
                      std::move(transport));

  SECTION("sending before connect") {
    CHECK_THROWS_AS(client.send_data({{"x", 1}}), NotConnected);
    CHECK_THROWS_AS(client.send_image(cv::Mat(16, 16, CV_8UC3)),
                    NotConnected);
    CHECK(fake.sent().empty());
  }

  SECTION("connect initializes the NetApp") {
    client.connect({{"fps", 30}});
    CHECK(client.is_connected());
    const auto sent = fake.sent();
    REQUIRE(sent.size() == 1);
    const Message message = envelope::unpack(sent[0]);
    CHECK(message.channel == COMMAND_CHANNEL);
    const auto cmd = nlohmann::json::parse(message.payload.begin(),
                                           message.payload.end());
    CHECK(cmd["cmd_type"] == "set_state");
    CHECK(cmd["clear_queue"] == true);
    CHECK(cmd["data"] == nlohmann::json{{"fps", 30}});

    CHECK_THROWS_AS(client.connect(), AlreadyConnected);
  }

  SECTION("bad arguments leave the transport alone") {
    CHECK_THROWS_AS(client.connect({{"h264", 1}}), ConfigurationError);
    CHECK_THROWS_AS(client.connect({{"h264", true}, {"width", "wide"}}),
                    ConfigurationError);
    CHECK_FALSE(client.is_connected());
    CHECK(fake.connect_calls == 0);
    CHECK(fake.sent().empty());

    client.connect({{"h264", true}, {"width", "160"}, {"height", "120"}});
    CHECK(client.is_connected());
    CHECK(fake.sent().size() == 1);
  }

  SECTION("channels are registered on first use") {
    client.connect();
    client.send_data({{"x", 1}}, "telemetry", ChannelType::JSON_LZ4);
    client.send_image(cv::Mat(16, 16, CV_8UC3, cv::Scalar(1, 2, 3)), "image");
    const auto channels = client.channels();
    CHECK(channels.at("telemetry") == ChannelType::JSON_LZ4);
    CHECK(channels.at("image") == ChannelType::JPEG);
    CHECK_THROWS_AS(client.send_data({{"x", 1}}, "image"), DuplicateChannel);
    CHECK_THROWS_AS(client.send_data({{"x", 1}}, "d", ChannelType::JPEG),
                    EncodingMismatch);
  }

  SECTION("h264 goes through one pipeline") {
    client.connect();
    const cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(40, 80, 120));
    for (std::int64_t ts = 0; ts < 5; ++ts) {
      CHECK(client.send_image(frame, "video", ChannelType::H264, ts) == ts);
    }
    CHECK_THROWS_AS(client.send_image(frame, "other", ChannelType::H264),
                    ConfigurationError);
    client.disconnect();

    std::vector<std::int64_t> timestamps;
    for (const auto& parts : fake.sent()) {
      const Message message = envelope::unpack(parts);
      if (message.channel == "video") {
        CHECK(message.type == ChannelType::H264);
        timestamps.push_back(message.timestamp);
      }
    }
    REQUIRE_FALSE(timestamps.empty());
    for (std::size_t i = 1; i < timestamps.size(); ++i) {
      CHECK(timestamps[i] >= timestamps[i - 1]);
    }
    CHECK(timestamps.back() == 4);
  }

  SECTION("losing the transport stops the client") {
    client.connect();
    const cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(40, 80, 120));
    client.send_image(frame, "video", ChannelType::H264, 0);
    fake.lose_connection("peer gone");
    CHECK_FALSE(client.is_connected());
    client.wait();
    CHECK_THROWS_AS(client.send_image(frame, "video", ChannelType::H264, 1),
                    NotConnected);

    // reconnecting starts a fresh pipeline
    client.connect();
    client.send_image(frame, "video", ChannelType::H264, 2);
    client.disconnect();
  }

  SECTION("disconnect twice") {
    client.connect();
    client.disconnect();
    client.disconnect();
    CHECK_FALSE(client.is_connected());
    client.wait();
  }
}

TEST_CASE("Client against a loopback NetApp", "[client][zmq]") {
  LoopbackNetApp netapp;

  std::promise<std::pair<nlohmann::json, std::int64_t>> result;
  std::atomic<bool> delivered{false};
  std::map<std::string, CallbackInfo> callbacks;
  callbacks["results"] = CallbackInfo(
      ChannelType::JSON, [&](const Value& value, std::int64_t ts) {
        if (!delivered.exchange(true)) {
          result.set_value(std::make_pair(std::get<nlohmann::json>(value), ts));
        }
      });

  NetAppClient client(callbacks, config_for(netapp.port()));

  SECTION("json round trip") {
    client.connect({{"mode", "echo"}});
    const auto ts = client.send_data({{"x", 1}}, "json");

    auto future = result.get_future();
    REQUIRE(future.wait_for(seconds(5)) == std::future_status::ready);
    const auto received = future.get();
    CHECK(received.first == nlohmann::json{{"x", 1}});
    CHECK(received.second == ts);

    const auto messages = netapp.received();
    REQUIRE(messages.size() >= 2);
    CHECK(messages[0].channel == COMMAND_CHANNEL);
    CHECK(messages[1].channel == "json");

    client.disconnect();
    client.disconnect();
    CHECK_FALSE(client.is_connected());
  }

  SECTION("peer going away disconnects the client") {
    client.connect();
    netapp.stop();
    CHECK(eventually([&] { return !client.is_connected(); }));
    client.wait();
    CHECK_THROWS_AS(client.send_data({{"x", 1}}, "json"), NotConnected);
  }
}

TEST_CASE("Connecting to nothing", "[client][zmq]") {
  auto config            = config_for(unused_port());
  config.connect_timeout = milliseconds(200);

  SECTION("single attempt") {
    NetAppClient client({}, config);
    CHECK_THROWS_AS(client.connect(), FailedToConnect);
    CHECK_FALSE(client.is_connected());
  }

  SECTION("waiting gives up after the timeout") {
    config.wait_until_available = true;
    config.wait_timeout         = seconds(1);
    NetAppClient client({}, config);
    const auto begin = steady_clock::now();
    CHECK_THROWS_AS(client.connect(), FailedToConnect);
    CHECK(steady_clock::now() - begin >= seconds(1));
  }
}
