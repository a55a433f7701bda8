#ifndef CODEC_HPP_R7TB2YQE
#define CODEC_HPP_R7TB2YQE

#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <variant>

#include "netapp/channel_type.hpp"

namespace netapp {

/**
 * @brief   Structured value exchanged with the codecs: a JSON document, an
 * image (BGR8) or raw bytes (an H.264 bitstream fragment)
 */
using Value = std::variant<nlohmann::json, cv::Mat, Bytes>;

/**
 * @brief   Translates between the bytes of a message payload and a `Value`.
 * One instance serves one channel; `decode` may keep state between calls.
 */
class Codec {
public:
  virtual ~Codec() = default;

  virtual ChannelType type() const = 0;

  /**
   * @brief Encode a value for the wire
   *
   * @throws EncodingMismatch if the value does not fit the codec's type
   */
  virtual Bytes encode(const Value& value) const = 0;

  /**
   * @brief Decode a payload received on the wire
   *
   * @throws CodecError if the payload is corrupt
   */
  virtual Value decode(const Bytes& payload) = 0;
};

class JsonCodec : public Codec {
public:
  ChannelType type() const override { return ChannelType::JSON; }
  Bytes encode(const Value& value) const override;
  Value decode(const Bytes& payload) override;
};

/**
 * @brief   JSON compressed with the lz4 block format, prefixed by the 4 byte
 * little endian size of the uncompressed text
 */
class Lz4JsonCodec : public Codec {
public:
  static constexpr std::size_t MAX_DECOMPRESSED_SIZE = 64 * 1024 * 1024;

  ChannelType type() const override { return ChannelType::JSON_LZ4; }
  Bytes encode(const Value& value) const override;
  Value decode(const Bytes& payload) override;
};

class JpegCodec : public Codec {
  int quality_;

public:
  explicit JpegCodec(int quality = 95);

  ChannelType type() const override { return ChannelType::JPEG; }
  Bytes encode(const Value& value) const override;
  Value decode(const Bytes& payload) override;
};

/**
 * @brief   H.264 fragments. Encoding passes already compressed bytes through
 * (compression happens in `H264EncodePipeline`); decoding feeds a persistent
 * decoder, so fragments must arrive in stream order.
 */
class H264Codec : public Codec {
  struct DecoderState;
  std::unique_ptr<DecoderState> decoder_;

public:
  H264Codec();
  ~H264Codec() override;

  ChannelType type() const override { return ChannelType::H264; }
  Bytes encode(const Value& value) const override;

  /**
   * @brief Decode a fragment
   *
   * @return    the last picture completed by this fragment, or an empty
   * `cv::Mat` if the decoder needs more data
   */
  Value decode(const Bytes& payload) override;
};

/**
 * @brief   Maps a channel type to a codec factory. Built once at client start
 * and handed to the multiplexer, which creates one codec per channel.
 */
class CodecRegistry {
public:
  using Factory = std::function<std::unique_ptr<Codec>()>;

  /**
   * @brief Registry with the JSON, JSON_LZ4, JPEG and H264 codecs
   */
  static CodecRegistry with_defaults();

  /**
   * @brief Add or replace the factory for a type
   */
  void add(ChannelType type, Factory factory);

  bool supports(ChannelType type) const;

  /**
   * @throws ConfigurationError if no factory is registered for the type
   */
  std::unique_ptr<Codec> create(ChannelType type) const;

  /// One-shot encode with a fresh codec
  Bytes encode(ChannelType type, const Value& value) const;

  /// One-shot decode with a fresh codec (stateless types only make sense
  /// here)
  Value decode(ChannelType type, const Bytes& payload) const;

private:
  std::map<ChannelType, Factory> factories_;
};

}  // namespace netapp

#endif /* end of include guard: CODEC_HPP_R7TB2YQE */
