#include "netapp/channel_type.hpp"

#include "netapp/errors.hpp"

namespace netapp {

std::string to_string(ChannelType type) {
  switch (type) {
    case ChannelType::JSON:
      return "json";
    case ChannelType::JSON_LZ4:
      return "json_lz4";
    case ChannelType::H264:
      return "h264";
    case ChannelType::JPEG:
      return "jpeg";
  }
  throw std::invalid_argument("Invalid channel type");
}

ChannelType channel_type_from_string(const std::string& tag) {
  if (tag == "json") {
    return ChannelType::JSON;
  } else if (tag == "json_lz4") {
    return ChannelType::JSON_LZ4;
  } else if (tag == "h264") {
    return ChannelType::H264;
  } else if (tag == "jpeg") {
    return ChannelType::JPEG;
  }
  throw CodecError("Unknown channel type tag '" + tag + "'");
}

std::ostream& operator<<(std::ostream& os, ChannelType type) {
  os << to_string(type);
  return os;
}

}  // namespace netapp
