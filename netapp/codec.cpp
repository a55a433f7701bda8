#include "netapp/codec.hpp"

#include <lz4.h>

#include <limits>
#include <opencv2/imgcodecs.hpp>
#include <string>

#include "netapp/errors.hpp"

namespace netapp {

namespace {

const nlohmann::json& expect_json(const Value& value, ChannelType type) {
  const auto* json = std::get_if<nlohmann::json>(&value);
  if (!json) {
    throw EncodingMismatch("Channel type " + to_string(type) +
                           " expects a JSON value");
  }
  return *json;
}

std::string dump_json(const nlohmann::json& json) {
  try {
    return json.dump();
  } catch (const nlohmann::json::exception& ex) {
    throw EncodingMismatch(std::string("JSON value cannot be serialized: ") +
                           ex.what());
  }
}

nlohmann::json parse_json(const char* begin, const char* end) {
  try {
    return nlohmann::json::parse(begin, end);
  } catch (const nlohmann::json::exception& ex) {
    throw CodecError(std::string("Invalid JSON payload: ") + ex.what());
  }
}

}  // namespace

Bytes JsonCodec::encode(const Value& value) const {
  const std::string text = dump_json(expect_json(value, type()));
  return Bytes(text.begin(), text.end());
}

Value JsonCodec::decode(const Bytes& payload) {
  const char* begin = reinterpret_cast<const char*>(payload.data());
  return parse_json(begin, begin + payload.size());
}

Bytes Lz4JsonCodec::encode(const Value& value) const {
  const std::string text = dump_json(expect_json(value, type()));
  if (text.size() > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE)) {
    throw EncodingMismatch("JSON value too large for lz4 block compression");
  }
  const int src_size = static_cast<int>(text.size());
  const int bound    = LZ4_compressBound(src_size);

  Bytes out(4 + bound);
  const auto size = static_cast<std::uint32_t>(src_size);
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<std::uint8_t>((size >> (8 * i)) & 0xff);
  }
  const int written =
      LZ4_compress_default(text.data(), reinterpret_cast<char*>(&out[4]),
                           src_size, bound);
  if (written <= 0) {
    throw EncodingMismatch("lz4 compression failed");
  }
  out.resize(4 + written);
  return out;
}

Value Lz4JsonCodec::decode(const Bytes& payload) {
  if (payload.size() < 4) {
    throw CodecError("lz4 block too short: " + std::to_string(payload.size()) +
                     " bytes");
  }
  std::uint32_t size = 0;
  for (int i = 0; i < 4; ++i) {
    size |= static_cast<std::uint32_t>(payload[i]) << (8 * i);
  }
  if (size > MAX_DECOMPRESSED_SIZE) {
    throw CodecError("lz4 block announces implausible size " +
                     std::to_string(size));
  }
  const std::size_t compressed_size = payload.size() - 4;
  if (compressed_size == 0) {
    throw CodecError("lz4 payload has no block after the size prefix");
  }
  if (compressed_size > static_cast<std::size_t>(
                            std::numeric_limits<int>::max())) {
    throw CodecError("lz4 block too large");
  }

  std::string text(size, '\0');
  const int read = LZ4_decompress_safe(
      reinterpret_cast<const char*>(payload.data()) + 4, &text[0],
      static_cast<int>(compressed_size), static_cast<int>(size));
  if (read < 0 || static_cast<std::uint32_t>(read) != size) {
    throw CodecError("Corrupt or truncated lz4 block");
  }
  return parse_json(text.data(), text.data() + text.size());
}

JpegCodec::JpegCodec(int quality) : quality_(quality) {
  if (quality_ < 0 || quality_ > 100) {
    throw ConfigurationError("JPEG quality must be within [0, 100], got " +
                             std::to_string(quality_));
  }
}

Bytes JpegCodec::encode(const Value& value) const {
  const auto* image = std::get_if<cv::Mat>(&value);
  if (!image || image->empty()) {
    throw EncodingMismatch("Channel type jpeg expects a non-empty image");
  }
  if (image->depth() != CV_8U ||
      (image->channels() != 1 && image->channels() != 3)) {
    throw EncodingMismatch("JPEG needs an 8 bit gray or BGR image");
  }
  Bytes out;
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality_};
  if (!cv::imencode(".jpg", *image, out, params)) {
    throw EncodingMismatch("cv::imencode failed");
  }
  return out;
}

Value JpegCodec::decode(const Bytes& payload) {
  if (payload.empty()) {
    throw CodecError("Empty JPEG payload");
  }
  cv::Mat image;
  try {
    image = cv::imdecode(payload, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    throw CodecError(std::string("Could not decode JPEG: ") + ex.what());
  }
  if (image.empty()) {
    throw CodecError("Could not decode JPEG");
  }
  return image;
}

Bytes H264Codec::encode(const Value& value) const {
  const auto* bitstream = std::get_if<Bytes>(&value);
  if (!bitstream) {
    throw EncodingMismatch(
        "Channel type h264 expects an encoded bitstream fragment");
  }
  return *bitstream;
}

CodecRegistry CodecRegistry::with_defaults() {
  CodecRegistry registry;
  registry.add(ChannelType::JSON, [] { return std::make_unique<JsonCodec>(); });
  registry.add(ChannelType::JSON_LZ4,
               [] { return std::make_unique<Lz4JsonCodec>(); });
  registry.add(ChannelType::JPEG, [] { return std::make_unique<JpegCodec>(); });
  registry.add(ChannelType::H264, [] { return std::make_unique<H264Codec>(); });
  return registry;
}

void CodecRegistry::add(ChannelType type, Factory factory) {
  factories_[type] = std::move(factory);
}

bool CodecRegistry::supports(ChannelType type) const {
  return factories_.count(type) > 0;
}

std::unique_ptr<Codec> CodecRegistry::create(ChannelType type) const {
  auto it = factories_.find(type);
  if (it == factories_.end()) {
    throw ConfigurationError("No codec registered for channel type " +
                             to_string(type));
  }
  auto codec = it->second();
  if (!codec) {
    throw ConfigurationError("Codec factory for " + to_string(type) +
                             " returned nothing");
  }
  return codec;
}

Bytes CodecRegistry::encode(ChannelType type, const Value& value) const {
  return create(type)->encode(value);
}

Value CodecRegistry::decode(ChannelType type, const Bytes& payload) const {
  return create(type)->decode(payload);
}

}  // namespace netapp
