#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iterator>
#include <string>
#include <thread>
#include <vector>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include "netapp/errors.hpp"
#include "netapp/zmq_transport.hpp"

using namespace netapp;
using namespace std::chrono;

namespace {

/**
 * @brief   ROUTER that accepts connections and never reads, so whatever a
 * client sends piles up until the socket buffers are full
 */
class StalledNetApp {
  zmq::context_t ctx_;
  zmq::socket_t router_;
  std::string endpoint_;

public:
  StalledNetApp() : ctx_(1), router_(ctx_, zmq::socket_type::router) {
    router_.set(zmq::sockopt::linger, 0);
    router_.set(zmq::sockopt::rcvhwm, 1);
    router_.set(zmq::sockopt::rcvbuf, 4096);
    router_.bind("tcp://127.0.0.1:*");
    endpoint_ = router_.get(zmq::sockopt::last_endpoint);
  }

  const std::string& endpoint() const { return endpoint_; }
};

Parts big_message() {
  Parts parts(5);
  parts[0] = Bytes{'i', 'm', 'g'};
  parts[4] = Bytes(1 << 20, 0x5a);
  return parts;
}

/// Sends droppable messages until one is refused; false if none ever is
bool fill_until_back_pressure(ZmqTransport& transport, const Parts& parts) {
  for (int i = 0; i < 1000; ++i) {
    try {
      transport.send(parts, true);
    } catch (const BackPressureError&) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST_CASE("Back pressure against a peer that does not read",
          "[transport][zmq]") {
  StalledNetApp netapp;
  ZmqTransportOptions options;
  options.send_hwm = 1;
  ZmqTransport transport(netapp.endpoint(), options);
  transport.connect(milliseconds(2000));
  REQUIRE(transport.is_connected());

  const Parts parts = big_message();
  REQUIRE(fill_until_back_pressure(transport, parts));
  CHECK(transport.is_connected());

  SECTION("droppable messages keep being refused") {
    CHECK_THROWS_AS(transport.send(parts, true), BackPressureError);
  }

  SECTION("disconnect releases a blocked sender") {
    std::atomic<bool> finished{false};
    std::promise<std::string> outcome;
    std::thread sender([&] {
      try {
        transport.send(parts, false);
        outcome.set_value("sent");
      } catch (const NotConnected&) {
        outcome.set_value("not connected");
      } catch (const std::exception& ex) {
        outcome.set_value(std::string("other: ") + ex.what());
      }
      finished = true;
    });

    std::this_thread::sleep_for(milliseconds(100));
    CHECK_FALSE(finished.load());

    auto result = outcome.get_future();
    transport.disconnect();
    const auto status = result.wait_for(seconds(5));
    sender.join();
    REQUIRE(status == std::future_status::ready);
    CHECK(result.get() == "not connected");
    CHECK_FALSE(transport.is_connected());
  }
}

TEST_CASE("Sending without a connection", "[transport][zmq]") {
  StalledNetApp netapp;
  ZmqTransport transport(netapp.endpoint());
  CHECK_THROWS_AS(transport.send(big_message(), false), NotConnected);
  CHECK_THROWS_AS(transport.send(big_message(), true), NotConnected);

  transport.connect(milliseconds(2000));
  CHECK_THROWS_AS(transport.connect(milliseconds(2000)), AlreadyConnected);
  transport.disconnect();
  CHECK_THROWS_AS(transport.send(big_message(), false), NotConnected);
}

TEST_CASE("Lifecycle calls from a receive handler", "[transport][zmq]") {
  zmq::context_t ctx(1);
  zmq::socket_t router(ctx, zmq::socket_type::router);
  router.set(zmq::sockopt::linger, 0);
  router.set(zmq::sockopt::rcvtimeo, 5000);
  router.bind("tcp://127.0.0.1:*");
  const std::string endpoint = router.get(zmq::sockopt::last_endpoint);

  std::promise<std::string> outcome;
  {
    ZmqTransport transport(endpoint);
    transport.on_receive([&](Parts) {
      transport.disconnect();
      std::string result = "connected again";
      try {
        transport.connect(milliseconds(100));
      } catch (const NetAppError& ex) {
        result = ex.what();
      }
      outcome.set_value(result);
    });
    transport.connect(milliseconds(2000));
    transport.send(Parts{Bytes{'h', 'i'}}, false);

    std::vector<zmq::message_t> incoming;
    REQUIRE(zmq::recv_multipart(router, std::back_inserter(incoming))
                .has_value());
    REQUIRE(incoming.size() == 2);
    std::vector<zmq::const_buffer> reply;
    reply.push_back(zmq::buffer(incoming[0].data(), incoming[0].size()));
    reply.push_back(zmq::str_buffer("back"));
    zmq::send_multipart(router, reply);

    auto result = outcome.get_future();
    REQUIRE(result.wait_for(seconds(5)) == std::future_status::ready);
    CHECK(result.get() ==
          "connect() must not be called from a receive handler");
    CHECK_FALSE(transport.is_connected());
    // destroyed here, joining the dispatch thread that ran the handler
  }
}
