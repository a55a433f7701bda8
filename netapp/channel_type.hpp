#ifndef CHANNEL_TYPE_HPP_W1F4CX7B
#define CHANNEL_TYPE_HPP_W1F4CX7B

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace netapp {

using Bytes = std::vector<std::uint8_t>;

enum class ChannelType { JSON, JSON_LZ4, H264, JPEG };

/**
 * @brief   Tag used for the type on the wire ("json", "json_lz4", "h264",
 * "jpeg")
 */
std::string to_string(ChannelType type);

/**
 * @brief   Parse a wire tag
 *
 * @param tag   tag as produced by `to_string`
 *
 * @return  channel type
 * @throws CodecError for unknown tags
 */
ChannelType channel_type_from_string(const std::string& tag);

std::ostream& operator<<(std::ostream& os, ChannelType type);

}  // namespace netapp

#endif /* end of include guard: CHANNEL_TYPE_HPP_W1F4CX7B */
