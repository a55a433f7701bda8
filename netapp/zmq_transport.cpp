#include "netapp/zmq_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <exception>
#include <iostream>
#include <iterator>
#include <zmq_addon.hpp>

#include "netapp/errors.hpp"

namespace netapp {

/**
 * @brief   Watches the socket for the peer connecting and going away
 */
class ZmqTransport::ConnectionMonitor : public zmq::monitor_t {
public:
  std::atomic<bool> connected{false};
  std::atomic<bool> disconnected{false};

  void on_event_connected(const zmq_event_t&, const char*) override {
    connected = true;
  }
  void on_event_disconnected(const zmq_event_t&, const char*) override {
    disconnected = true;
  }
};

namespace {

std::string monitor_address(const void* owner) {
  static std::atomic<unsigned long> counter{0};
  return "inproc://netapp-monitor-" +
         std::to_string(reinterpret_cast<std::uintptr_t>(owner)) + "-" +
         std::to_string(counter++);
}

constexpr int MAX_MESSAGES_PER_POLL = 64;

}  // namespace

ZmqTransport::ZmqTransport(std::string endpoint, ZmqTransportOptions options)
    : endpoint_(std::move(endpoint)), options_(options), ctx_(1) {}

ZmqTransport::~ZmqTransport() {
  if (dispatch_thread_.joinable() &&
      dispatch_thread_.get_id() == std::this_thread::get_id()) {
    std::cerr << *this << "destroyed from its own receive handler"
              << std::endl;
    std::terminate();
  }
  // joins the dispatch thread too, also when a handler disconnected
  this->disconnect();
}

void ZmqTransport::connect(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (connected_.load()) {
    throw AlreadyConnected("Already connected to " + endpoint_);
  }
  if (dispatch_thread_.joinable() &&
      dispatch_thread_.get_id() == std::this_thread::get_id()) {
    throw NetAppError("connect() must not be called from a receive handler");
  }
  // leftovers of a connection the peer dropped
  this->join_threads();
  this->close_socket();

  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    socket_ = std::make_unique<zmq::socket_t>(ctx_, zmq::socket_type::dealer);
    socket_->set(zmq::sockopt::linger, 0);
    socket_->set(zmq::sockopt::immediate, true);
    socket_->set(zmq::sockopt::sndhwm, options_.send_hwm);
    socket_->set(zmq::sockopt::rcvhwm, options_.receive_hwm);
    monitor_ = std::make_unique<ConnectionMonitor>();
    monitor_->init(*socket_, monitor_address(this),
                   ZMQ_EVENT_CONNECTED | ZMQ_EVENT_DISCONNECTED);
    try {
      socket_->connect(endpoint_);
    } catch (const zmq::error_t& ex) {
      monitor_.reset();
      socket_.reset();
      throw FailedToConnect("Could not connect to " + endpoint_ + ": " +
                            ex.what());
    }
    std::cout << *this << "connecting" << std::endl;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!monitor_->connected.load()) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        break;
      }
      monitor_->check_event(static_cast<int>(
          std::min<std::chrono::milliseconds::rep>(remaining.count(), 100)));
    }
    if (!monitor_->connected.load()) {
      monitor_.reset();
      socket_.reset();
      throw FailedToConnect("Timed out after " +
                            std::to_string(timeout.count()) +
                            " ms connecting to " + endpoint_);
    }
  }

  inbound_ = std::make_unique<Queue>(options_.inbound_queue_size);
  running_   = true;
  connected_ = true;
  io_thread_       = std::thread(&ZmqTransport::io_loop, this);
  dispatch_thread_ = std::thread(&ZmqTransport::dispatch_loop, this);
  std::cout << *this << "connected" << std::endl;
}

void ZmqTransport::disconnect() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  const bool was_connected = connected_.exchange(false);
  running_                 = false;
  writable_.notify_all();
  this->join_threads();
  this->close_socket();
  if (was_connected) {
    std::cout << *this << "disconnected" << std::endl;
  }
}

bool ZmqTransport::is_connected() const { return connected_.load(); }

void ZmqTransport::send(const Parts& parts, bool can_be_dropped) {
  std::vector<zmq::const_buffer> buffers;
  buffers.reserve(parts.size());
  for (const auto& part : parts) {
    buffers.push_back(zmq::buffer(part.data(), part.size()));
  }

  std::unique_lock<std::mutex> lock(socket_mutex_);
  while (true) {
    if (!connected_.load() || !socket_) {
      throw NotConnected("Not connected to " + endpoint_);
    }
    zmq::send_result_t sent;
    try {
      sent = zmq::send_multipart(*socket_, buffers, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& ex) {
      throw NotConnected("Sending to " + endpoint_ + " failed: " + ex.what());
    }
    if (sent) {
      return;
    }
    if (can_be_dropped) {
      throw BackPressureError("Outbound queue to " + endpoint_ +
                              " is full, message dropped");
    }
    writable_.wait_for(lock, options_.poll_interval);
  }
}

void ZmqTransport::on_receive(ReceiveHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  receive_handler_ = std::move(handler);
}

void ZmqTransport::on_disconnect(DisconnectHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  disconnect_handler_ = std::move(handler);
}

void ZmqTransport::receive_pending(std::vector<Parts>& received) {
  zmq::pollitem_t items[] = {{socket_->handle(), 0, ZMQ_POLLIN, 0}};
  zmq::poll(items, 1, std::chrono::milliseconds(0));
  if (!(items[0].revents & ZMQ_POLLIN)) {
    return;
  }
  for (int i = 0; i < MAX_MESSAGES_PER_POLL; ++i) {
    std::vector<zmq::message_t> incoming;
    auto result = zmq::recv_multipart(*socket_, std::back_inserter(incoming),
                                      zmq::recv_flags::dontwait);
    if (!result) {
      break;
    }
    Parts parts;
    parts.reserve(incoming.size());
    for (const auto& msg : incoming) {
      const auto* data = static_cast<const std::uint8_t*>(msg.data());
      parts.emplace_back(data, data + msg.size());
    }
    received.push_back(std::move(parts));
  }
}

void ZmqTransport::io_loop() {
  std::vector<Parts> received;
  while (running_.load()) {
    received.clear();
    bool lost = false;
    try {
      std::lock_guard<std::mutex> lock(socket_mutex_);
      if (!socket_) {
        return;
      }
      monitor_->check_event(0);
      lost = monitor_->disconnected.load();
      if (!lost) {
        this->receive_pending(received);
      }
    } catch (const zmq::error_t& ex) {
      if (ex.num() == EINTR) {
        continue;
      }
      this->fault(std::string("socket error: ") + ex.what());
      return;
    }
    if (lost) {
      this->fault("connection to peer lost");
      return;
    }
    for (auto& parts : received) {
      if (inbound_->wait_push_back(std::move(parts)) ==
          boost::queue_op_status::closed) {
        return;
      }
    }
    if (received.empty()) {
      std::this_thread::sleep_for(options_.poll_interval);
    }
  }
}

void ZmqTransport::dispatch_loop() {
  Parts parts;
  while (inbound_->wait_pull_front(parts) == boost::queue_op_status::success) {
    ReceiveHandler handler;
    {
      std::lock_guard<std::mutex> lock(handler_mutex_);
      handler = receive_handler_;
    }
    if (!handler) {
      std::cerr << *this << "no receive handler, dropping message" << std::endl;
      continue;
    }
    try {
      handler(std::move(parts));
    } catch (const std::exception& ex) {
      std::cerr << *this << "receive handler failed: " << ex.what()
                << std::endl;
    }
  }
}

void ZmqTransport::fault(const std::string& reason) {
  if (!connected_.exchange(false)) {
    return;
  }
  running_ = false;
  std::cerr << *this << reason << std::endl;
  writable_.notify_all();
  inbound_->close();

  DisconnectHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = disconnect_handler_;
  }
  if (handler) {
    handler(reason);
  }
}

void ZmqTransport::join_threads() {
  // closing first releases an I/O thread blocked on a full inbound queue
  if (inbound_) {
    inbound_->close();
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  if (dispatch_thread_.joinable()) {
    if (dispatch_thread_.get_id() == std::this_thread::get_id()) {
      // disconnect() from inside a handler: the dispatch loop ends by itself
      // once the handler returns, joined by the next connect() or destructor
      return;
    }
    dispatch_thread_.join();
  }
  inbound_.reset();
}

void ZmqTransport::close_socket() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  // the monitor must be detached while the monitored socket still exists
  monitor_.reset();
  socket_.reset();
}

}  // namespace netapp
