#ifndef CHANNEL_MUX_HPP_T6BQ0NZW
#define CHANNEL_MUX_HPP_T6BQ0NZW

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "netapp/codec.hpp"
#include "netapp/transport.hpp"

namespace netapp {

/**
 * @brief   Receives the decoded values of one channel. Called from the
 * transport's dispatch thread, so implementations must not block.
 */
class ChannelHandler {
public:
  virtual ~ChannelHandler() = default;

  /**
   * @brief A value arrived. Images are never empty: an H.264 fragment that
   * does not complete a picture produces no call.
   *
   * @param timestamp   timestamp the sender attached to the message
   */
  virtual void on_value(const Value& value, std::int64_t timestamp) = 0;

  /**
   * @brief A payload on this channel could not be decoded
   *
   * @param payload raw payload as received
   * @param reason  what went wrong
   */
  virtual void on_error(const Bytes& /*payload*/,
                        const std::string& /*reason*/) {}

  /// false: decode failures are only logged
  virtual bool handles_errors() const { return false; }
};

using ValueCallback = std::function<void(const Value&, std::int64_t)>;
using ErrorCallback =
    std::function<void(const Bytes&, const std::string& reason)>;

/**
 * @brief   `ChannelHandler` made of two callbacks
 */
class CallbackHandler : public ChannelHandler {
  ValueCallback on_value_;
  ErrorCallback on_error_;

public:
  explicit CallbackHandler(ValueCallback on_value,
                           ErrorCallback on_error = nullptr)
      : on_value_(std::move(on_value)), on_error_(std::move(on_error)) {}

  void on_value(const Value& value, std::int64_t timestamp) override {
    if (on_value_) {
      on_value_(value, timestamp);
    }
  }
  void on_error(const Bytes& payload, const std::string& reason) override {
    if (on_error_) {
      on_error_(payload, reason);
    }
  }
  bool handles_errors() const override { return static_cast<bool>(on_error_); }
};

/**
 * @brief   Type of a channel and who receives its messages. A channel without
 * handler is outbound-only.
 */
struct CallbackInfo {
  ChannelType type = ChannelType::JSON;
  std::shared_ptr<ChannelHandler> handler;

  CallbackInfo() = default;
  CallbackInfo(ChannelType type, std::shared_ptr<ChannelHandler> handler)
      : type(type), handler(std::move(handler)) {}
  CallbackInfo(ChannelType type,
               ValueCallback on_value,
               ErrorCallback on_error = nullptr)
      : type(type) {
    if (on_value || on_error) {
      handler = std::make_shared<CallbackHandler>(std::move(on_value),
                                                  std::move(on_error));
    }
  }
};

/**
 * @brief   Routes messages between named channels and one transport. Each
 * channel has a fixed type and its own codec instance.
 */
class ChannelMultiplexer {
  struct Channel {
    ChannelType type;
    std::unique_ptr<Codec> codec;
    std::shared_ptr<ChannelHandler> handler;
  };

  Transport& transport_;
  const CodecRegistry registry_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Channel>> channels_;
  std::atomic<std::int64_t> last_timestamp_{0};

  std::shared_ptr<Channel> find(const std::string& name) const;
  std::int64_t next_timestamp();

public:
  /**
   * @brief Installs itself as the transport's receive handler
   *
   * @param transport   must outlive the multiplexer
   * @param registry    codecs for the channel types
   */
  ChannelMultiplexer(Transport& transport, CodecRegistry registry);
  ~ChannelMultiplexer();

  ChannelMultiplexer(const ChannelMultiplexer&) = delete;
  ChannelMultiplexer& operator=(const ChannelMultiplexer&) = delete;

  /**
   * @brief Bind a name to a type and a handler
   *
   * @param name    channel name
   * @param type    channel type
   * @param handler receives the channel's values, nullptr for outbound-only
   *
   * @return    false if the channel already existed with this type (the old
   * handler stays)
   * @throws DuplicateChannel   if the name is bound to another type
   * @throws ConfigurationError if the registry has no codec for the type
   */
  bool register_channel(const std::string& name,
                        ChannelType type,
                        std::shared_ptr<ChannelHandler> handler);

  bool register_channel(const std::string& name,
                        ChannelType type,
                        ValueCallback on_success,
                        ErrorCallback on_error = nullptr);

  bool register_channel(const std::string& name, const CallbackInfo& info) {
    return register_channel(name, info.type, info.handler);
  }

  /**
   * @brief Encode a value and write it to the transport as one message
   *
   * @param name    registered channel
   * @param value   value matching the channel's type
   * @param timestamp   used as is when given, otherwise wall-clock ns,
   * strictly increasing across such sends
   * @param metadata    passed along with the message
   * @param can_be_dropped  fail with `BackPressureError` instead of waiting
   * when the outbound queue is full
   *
   * @return    the timestamp the message was sent with
   * @throws UnknownChannel, NotConnected, EncodingMismatch, BackPressureError
   */
  std::int64_t send(const std::string& name,
                    const Value& value,
                    std::optional<std::int64_t> timestamp = std::nullopt,
                    const std::string& metadata           = "",
                    bool can_be_dropped                   = false);

  /**
   * @brief Deliver one received message to its channel's handler. Malformed
   * or unroutable messages are logged and dropped.
   */
  void on_message(const Parts& parts);

  std::optional<ChannelType> channel_type(const std::string& name) const;

  std::map<std::string, ChannelType> channels() const;

  friend std::ostream& operator<<(std::ostream& os,
                                  const ChannelMultiplexer&) {
    os << "ChannelMultiplexer: ";
    return os;
  }
};

}  // namespace netapp

#endif /* end of include guard: CHANNEL_MUX_HPP_T6BQ0NZW */
