#ifndef ZMQ_TRANSPORT_HPP_C4UJ9LSD
#define ZMQ_TRANSPORT_HPP_C4UJ9LSD

#include <atomic>
#include <boost/thread/sync_bounded_queue.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <zmq.hpp>

#include "netapp/transport.hpp"

namespace netapp {

struct ZmqTransportOptions {
  int send_hwm = 5;  ///< outbound messages queued before back pressure kicks in
  int receive_hwm = 1000;
  std::size_t inbound_queue_size = 256;  ///< messages waiting for dispatch
  std::chrono::milliseconds poll_interval{2};
};

/**
 * @brief   Transport over a zmq DEALER socket, talking to the NetApp's ROUTER.
 *
 * One I/O thread reads the socket and queues whole messages; one dispatch
 * thread drains that queue and calls the receive handler, so handlers run
 * one at a time and in arrival order. Senders and the I/O thread share the
 * socket under a mutex.
 */
class ZmqTransport : public Transport {
  class ConnectionMonitor;
  using Queue = boost::sync_bounded_queue<Parts>;

  const std::string endpoint_;
  const ZmqTransportOptions options_;

  zmq::context_t ctx_;
  std::unique_ptr<zmq::socket_t> socket_;  ///< guarded by socket_mutex_
  std::unique_ptr<ConnectionMonitor> monitor_;
  mutable std::mutex socket_mutex_;
  std::condition_variable writable_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::unique_ptr<Queue> inbound_;
  std::thread io_thread_;
  std::thread dispatch_thread_;

  std::mutex handler_mutex_;
  ReceiveHandler receive_handler_;
  DisconnectHandler disconnect_handler_;

  void io_loop();
  void dispatch_loop();
  void receive_pending(std::vector<Parts>& received);
  void fault(const std::string& reason);
  void join_threads();
  void close_socket();

public:
  /**
   * @param endpoint    zmq endpoint of the NetApp, e.g. tcp://127.0.0.1:5896
   * @param options tuning
   */
  explicit ZmqTransport(std::string endpoint,
                        ZmqTransportOptions options = ZmqTransportOptions());
  /**
   * @brief Disconnects and joins both threads. Destroying the transport from
   * one of its receive handlers terminates the process.
   */
  ~ZmqTransport() override;

  ZmqTransport(const ZmqTransport&) = delete;
  ZmqTransport& operator=(const ZmqTransport&) = delete;

  void connect(std::chrono::milliseconds timeout) override;
  void disconnect() override;
  bool is_connected() const override;
  void send(const Parts& parts, bool can_be_dropped) override;
  void on_receive(ReceiveHandler handler) override;
  void on_disconnect(DisconnectHandler handler) override;

  const std::string& endpoint() const { return endpoint_; }

  friend std::ostream& operator<<(std::ostream& os, const ZmqTransport& t) {
    os << "ZmqTransport " << t.endpoint_ << ": ";
    return os;
  }
};

}  // namespace netapp

#endif /* end of include guard: ZMQ_TRANSPORT_HPP_C4UJ9LSD */
