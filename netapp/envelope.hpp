#ifndef ENVELOPE_HPP_H2N6DVUA
#define ENVELOPE_HPP_H2N6DVUA

#include <cstdint>
#include <string>
#include <vector>

#include "netapp/channel_type.hpp"

namespace netapp {

/// One frame list as it travels over the transport
using Parts = std::vector<Bytes>;

/**
 * @brief   A message on one channel. The payload encoding is given by the
 * channel's type.
 */
struct Message {
  std::string channel;
  ChannelType type = ChannelType::JSON;
  std::int64_t timestamp = 0;
  std::string metadata;
  Bytes payload;
};

namespace envelope {

constexpr std::size_t NUM_PARTS = 5;

/**
 * @brief   Lay a message out as
 * `[channel][type tag][timestamp, 8 bytes LE][metadata][payload]`
 */
Parts pack(const Message& message);

/**
 * @brief   Inverse of `pack`
 *
 * @throws CodecError if the parts do not form a valid envelope
 */
Message unpack(const Parts& parts);

}  // namespace envelope
}  // namespace netapp

#endif /* end of include guard: ENVELOPE_HPP_H2N6DVUA */
