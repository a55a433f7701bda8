#include "netapp/channel_mux.hpp"

#include <algorithm>
#include <iostream>

#include "netapp/envelope.hpp"
#include "netapp/errors.hpp"
#include "netapp/time_utils.hpp"

namespace netapp {

ChannelMultiplexer::ChannelMultiplexer(Transport& transport,
                                       CodecRegistry registry)
    : transport_(transport), registry_(std::move(registry)) {
  transport_.on_receive([this](Parts parts) { this->on_message(parts); });
}

ChannelMultiplexer::~ChannelMultiplexer() { transport_.on_receive(nullptr); }

bool ChannelMultiplexer::register_channel(
    const std::string& name,
    ChannelType type,
    std::shared_ptr<ChannelHandler> handler) {
  if (name.empty()) {
    throw ConfigurationError("Channel name must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(name);
  if (it != channels_.end()) {
    if (it->second->type != type) {
      throw DuplicateChannel("Channel " + name + " is already registered as " +
                             to_string(it->second->type) + ", not " +
                             to_string(type));
    }
    return false;
  }
  auto channel     = std::make_shared<Channel>();
  channel->type    = type;
  channel->codec   = registry_.create(type);
  channel->handler = std::move(handler);
  channels_.emplace(name, std::move(channel));
  return true;
}

bool ChannelMultiplexer::register_channel(const std::string& name,
                                          ChannelType type,
                                          ValueCallback on_success,
                                          ErrorCallback on_error) {
  return register_channel(name, CallbackInfo(type, std::move(on_success),
                                             std::move(on_error)));
}

std::shared_ptr<ChannelMultiplexer::Channel>
ChannelMultiplexer::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(name);
  if (it == channels_.end()) {
    return nullptr;
  }
  return it->second;
}

std::int64_t ChannelMultiplexer::next_timestamp() {
  const std::int64_t now = now_ns();
  std::int64_t last      = last_timestamp_.load();
  std::int64_t next;
  do {
    next = std::max(now, last + 1);
  } while (!last_timestamp_.compare_exchange_weak(last, next));
  return next;
}

std::int64_t ChannelMultiplexer::send(const std::string& name,
                                      const Value& value,
                                      std::optional<std::int64_t> timestamp,
                                      const std::string& metadata,
                                      bool can_be_dropped) {
  auto channel = this->find(name);
  if (!channel) {
    throw UnknownChannel(name);
  }
  if (!transport_.is_connected()) {
    throw NotConnected("Cannot send on channel " + name + ": not connected");
  }

  Message message;
  message.channel   = name;
  message.type      = channel->type;
  message.timestamp = timestamp ? *timestamp : this->next_timestamp();
  message.metadata  = metadata;
  message.payload   = channel->codec->encode(value);

  transport_.send(envelope::pack(message), can_be_dropped);
  return message.timestamp;
}

void ChannelMultiplexer::on_message(const Parts& parts) {
  Message message;
  try {
    message = envelope::unpack(parts);
  } catch (const CodecError& ex) {
    std::cerr << *this << "dropping malformed message: " << ex.what()
              << std::endl;
    return;
  }

  auto channel = this->find(message.channel);
  if (!channel) {
    std::cerr << *this << "dropping message for unknown channel "
              << message.channel << std::endl;
    return;
  }
  if (!channel->handler) {
    std::cerr << *this << "dropping message on outbound-only channel "
              << message.channel << std::endl;
    return;
  }

  std::string failure;
  Value value;
  if (message.type != channel->type) {
    failure = "Received " + to_string(message.type) + " on channel " +
              message.channel + " of type " + to_string(channel->type);
  } else {
    try {
      value = channel->codec->decode(message.payload);
    } catch (const std::exception& ex) {
      failure = ex.what();
    }
  }

  try {
    if (failure.empty()) {
      const auto* image = std::get_if<cv::Mat>(&value);
      if (image && image->empty()) {
        // decoder still waiting for the rest of a picture
        return;
      }
      channel->handler->on_value(value, message.timestamp);
    } else if (channel->handler->handles_errors()) {
      channel->handler->on_error(message.payload, failure);
    } else {
      std::cerr << *this << "channel " << message.channel << ": " << failure
                << std::endl;
    }
  } catch (const std::exception& ex) {
    std::cerr << *this << "handler of channel " << message.channel
              << " failed: " << ex.what() << std::endl;
  }
}

std::optional<ChannelType>
ChannelMultiplexer::channel_type(const std::string& name) const {
  auto channel = this->find(name);
  if (!channel) {
    return std::nullopt;
  }
  return channel->type;
}

std::map<std::string, ChannelType> ChannelMultiplexer::channels() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, ChannelType> result;
  for (const auto& entry : channels_) {
    result.emplace(entry.first, entry.second->type);
  }
  return result;
}

}  // namespace netapp
