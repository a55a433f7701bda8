#include "netapp/envelope.hpp"

#include "netapp/errors.hpp"

namespace netapp {
namespace envelope {

namespace {

Bytes to_bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

std::string to_text(const Bytes& b) { return std::string(b.begin(), b.end()); }

}  // namespace

Parts pack(const Message& message) {
  Bytes stamp(8);
  const auto ts = static_cast<std::uint64_t>(message.timestamp);
  for (int i = 0; i < 8; ++i) {
    stamp[i] = static_cast<std::uint8_t>((ts >> (8 * i)) & 0xff);
  }

  Parts parts;
  parts.reserve(NUM_PARTS);
  parts.push_back(to_bytes(message.channel));
  parts.push_back(to_bytes(to_string(message.type)));
  parts.push_back(std::move(stamp));
  parts.push_back(to_bytes(message.metadata));
  parts.push_back(message.payload);
  return parts;
}

Message unpack(const Parts& parts) {
  if (parts.size() != NUM_PARTS) {
    throw CodecError("Envelope has " + std::to_string(parts.size()) +
                     " parts, expected " + std::to_string(NUM_PARTS));
  }
  if (parts[0].empty()) {
    throw CodecError("Envelope without channel name");
  }
  if (parts[2].size() != 8) {
    throw CodecError("Envelope timestamp has " +
                     std::to_string(parts[2].size()) + " bytes, expected 8");
  }

  Message message;
  message.channel = to_text(parts[0]);
  message.type    = channel_type_from_string(to_text(parts[1]));
  std::uint64_t ts = 0;
  for (int i = 0; i < 8; ++i) {
    ts |= static_cast<std::uint64_t>(parts[2][i]) << (8 * i);
  }
  message.timestamp = static_cast<std::int64_t>(ts);
  message.metadata  = to_text(parts[3]);
  message.payload   = parts[4];
  return message;
}

}  // namespace envelope
}  // namespace netapp
