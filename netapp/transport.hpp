#ifndef TRANSPORT_HPP_P5XE0WGM
#define TRANSPORT_HPP_P5XE0WGM

#include <chrono>
#include <functional>
#include <string>

#include "netapp/envelope.hpp"

namespace netapp {

/**
 * @brief   An ordered, bidirectional message transport to one NetApp. A
 * message is a list of parts, written and delivered atomically.
 */
class Transport {
public:
  using ReceiveHandler    = std::function<void(Parts)>;
  using DisconnectHandler = std::function<void(const std::string& reason)>;

  virtual ~Transport() = default;

  /**
   * @brief Establish the connection
   *
   * @throws AlreadyConnected   if connected
   * @throws FailedToConnect    if the peer cannot be reached within the
   * timeout
   */
  virtual void connect(std::chrono::milliseconds timeout) = 0;

  /// Tear down the connection; safe to call repeatedly
  virtual void disconnect() = 0;

  virtual bool is_connected() const = 0;

  /**
   * @brief Write one message. Concurrent callers are serialized.
   *
   * @param parts   message parts
   * @param can_be_dropped  fail fast when the outbound queue is full instead
   * of waiting for it to drain
   *
   * @throws NotConnected   if not connected, or the connection is lost while
   * waiting
   * @throws BackPressureError  if `can_be_dropped` and the queue is full
   */
  virtual void send(const Parts& parts, bool can_be_dropped) = 0;

  /// Handler for inbound messages, called from a single drain thread
  virtual void on_receive(ReceiveHandler handler) = 0;

  /// Handler called once when the peer goes away
  virtual void on_disconnect(DisconnectHandler handler) = 0;
};

}  // namespace netapp

#endif /* end of include guard: TRANSPORT_HPP_P5XE0WGM */
