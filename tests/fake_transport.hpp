#ifndef FAKE_TRANSPORT_HPP_Z2RC8KOW
#define FAKE_TRANSPORT_HPP_Z2RC8KOW

#include <atomic>
#include <mutex>
#include <vector>

#include "netapp/errors.hpp"
#include "netapp/transport.hpp"

namespace netapp {

/**
 * @brief   In-memory transport: records what is sent, delivers on demand
 */
class FakeTransport : public Transport {
public:
  std::atomic<bool> connected{false};
  std::atomic<int> connect_calls{0};

  void connect(std::chrono::milliseconds) override {
    ++connect_calls;
    if (connected.exchange(true)) {
      throw AlreadyConnected("fake already connected");
    }
  }
  void disconnect() override { connected = false; }
  bool is_connected() const override { return connected.load(); }

  void send(const Parts& parts, bool) override {
    if (!connected.load()) {
      throw NotConnected("fake not connected");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(parts);
  }

  void on_receive(ReceiveHandler handler) override {
    receive_handler_ = std::move(handler);
  }
  void on_disconnect(DisconnectHandler handler) override {
    disconnect_handler_ = std::move(handler);
  }

  /// Hand a message to the receive handler, as the dispatch thread would
  void deliver(const Parts& parts) {
    if (receive_handler_) {
      receive_handler_(parts);
    }
  }

  /// Drop the connection the way a vanished peer does
  void lose_connection(const std::string& reason) {
    connected = false;
    if (disconnect_handler_) {
      disconnect_handler_(reason);
    }
  }

  std::vector<Parts> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<Parts> sent_;
  ReceiveHandler receive_handler_;
  DisconnectHandler disconnect_handler_;
};

}  // namespace netapp

#endif /* end of include guard: FAKE_TRANSPORT_HPP_Z2RC8KOW */
