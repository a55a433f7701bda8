#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <tclap/CmdLine.h>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include "netapp/client.hpp"
#include "netapp/codec.hpp"
#include "netapp/control_command.hpp"
#include "netapp/envelope.hpp"
#include "netapp/errors.hpp"

extern "C" {
#include <libavutil/log.h>
}

using namespace std;
using namespace TCLAP;
using namespace netapp;

namespace {

std::atomic<bool> stop_requested{false};

void on_signal(int) { stop_requested = true; }

/**
 * @brief   Stand-in NetApp: decodes what clients send and answers on the
 * results channel. Keeps one codec per client and channel, like a real NetApp
 * keeps one decoder per stream.
 */
class EchoNetApp {
  zmq::context_t ctx_;
  zmq::socket_t socket_;
  const CodecRegistry registry_;
  const string results_channel_;
  map<pair<string, string>, unique_ptr<Codec>> codecs_;
  nlohmann::json state_ = nlohmann::json::object();
  unsigned long n_received_ = 0;

  Codec& codec_for(const string& client, const Message& message) {
    auto& codec = codecs_[make_pair(client, message.channel)];
    if (!codec || codec->type() != message.type) {
      codec = registry_.create(message.type);
    }
    return *codec;
  }

  void reply(const zmq::message_t& identity,
             const string& channel,
             const nlohmann::json& value,
             int64_t timestamp) {
    Message message;
    message.channel   = channel;
    message.type      = ChannelType::JSON;
    message.timestamp = timestamp;
    message.payload   = registry_.encode(ChannelType::JSON, Value(value));

    vector<zmq::const_buffer> buffers;
    buffers.push_back(zmq::buffer(identity.data(), identity.size()));
    const Parts parts = envelope::pack(message);
    for (const auto& part : parts) {
      buffers.push_back(zmq::buffer(part.data(), part.size()));
    }
    zmq::send_multipart(socket_, buffers);
  }

  void handle_command(const zmq::message_t& identity, const Message& message) {
    ControlCommand cmd;
    try {
      const Value value = registry_.decode(message.type, message.payload);
      const auto* json  = get_if<nlohmann::json>(&value);
      if (!json) {
        throw CodecError("Control command is not JSON");
      }
      cmd = json->get<ControlCommand>();
    } catch (const exception& ex) {
      std::cerr << *this << "bad command: " << ex.what() << std::endl;
      reply(identity, COMMAND_ERROR_CHANNEL, {{"error", ex.what()}},
            message.timestamp);
      return;
    }
    std::cout << *this << "command " << cmd << std::endl;
    switch (cmd.type) {
      case ControlCmdType::SET_STATE:
        state_ = cmd.data;
        break;
      case ControlCmdType::RESET_STATE:
        state_ = nlohmann::json::object();
        break;
      case ControlCmdType::GET_STATE:
        break;
    }
    reply(identity, COMMAND_RESULT_CHANNEL,
          {{"cmd_type", to_string(cmd.type)}, {"state", state_}},
          message.timestamp);
  }

  void handle(const zmq::message_t& identity, const Message& message) {
    ++n_received_;
    if (message.channel == COMMAND_CHANNEL) {
      handle_command(identity, message);
      return;
    }
    const string client = identity.to_string();
    Value value;
    try {
      value = codec_for(client, message).decode(message.payload);
    } catch (const exception& ex) {
      std::cerr << *this << "could not decode " << message.type << " on "
                << message.channel << ": " << ex.what() << std::endl;
      return;
    }

    if (const auto* json = get_if<nlohmann::json>(&value)) {
      reply(identity, results_channel_, *json, message.timestamp);
    } else if (const auto* image = get_if<cv::Mat>(&value)) {
      if (image->empty()) {
        return;  // decoder needs more data
      }
      reply(identity, results_channel_,
            {{"channel", message.channel},
             {"width", image->cols},
             {"height", image->rows},
             {"metadata", message.metadata}},
            message.timestamp);
    }
  }

public:
  EchoNetApp(int port, string results_channel)
      : ctx_(1),
        socket_(ctx_, zmq::socket_type::router),
        registry_(CodecRegistry::with_defaults()),
        results_channel_(std::move(results_channel)) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.bind("tcp://*:" + to_string(port));
    std::cout << *this << "listening" << std::endl;
  }

  void run() {
    while (!stop_requested.load()) {
      zmq::pollitem_t items[] = {{socket_.handle(), 0, ZMQ_POLLIN, 0}};
      try {
        zmq::poll(items, 1, std::chrono::milliseconds(100));
      } catch (const zmq::error_t& ex) {
        if (ex.num() == EINTR) {
          continue;
        }
        throw;
      }
      if (!(items[0].revents & ZMQ_POLLIN)) {
        continue;
      }
      vector<zmq::message_t> incoming;
      if (!zmq::recv_multipart(socket_, back_inserter(incoming))) {
        continue;
      }
      if (incoming.size() != envelope::NUM_PARTS + 1) {
        std::cerr << *this << "dropping message with " << incoming.size()
                  << " parts" << std::endl;
        continue;
      }
      Parts parts;
      for (size_t i = 1; i < incoming.size(); ++i) {
        const auto* data = static_cast<const uint8_t*>(incoming[i].data());
        parts.emplace_back(data, data + incoming[i].size());
      }
      try {
        handle(incoming[0], envelope::unpack(parts));
      } catch (const NetAppError& ex) {
        std::cerr << *this << ex.what() << std::endl;
      }
    }
    std::cout << *this << "received " << n_received_ << " messages"
              << std::endl;
  }

  friend ostream& operator<<(ostream& os, const EchoNetApp&) {
    os << "EchoNetApp: ";
    return os;
  }
};

}  // namespace

int main(int argc, char* argv[]) {
  CmdLine cmdline("Minimal NetApp: decodes what clients send and answers");
  ValueArg<int> port("p", "port", "port to listen on (env NETAPP_PORT)", false,
                     NetAppLocation::from_environment().port,
                     "Port as Integer", cmdline);
  ValueArg<string> results("r", "results", "channel results are sent on",
                           false, "results", "name", cmdline);
  SwitchArg verbose("v", "verbose", "libav logging", cmdline, false);
  cmdline.parse(argc, argv);

  av_log_set_level(verbose.getValue() ? AV_LOG_INFO : AV_LOG_ERROR);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    EchoNetApp app(port.getValue(), results.getValue());
    app.run();
  } catch (const zmq::error_t& ex) {
    std::cerr << "zmq error: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
