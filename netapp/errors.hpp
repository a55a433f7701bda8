#ifndef ERRORS_HPP_Q3M8ZK1T
#define ERRORS_HPP_Q3M8ZK1T

#include <stdexcept>
#include <string>

namespace netapp {

/**
 * @brief   Base of everything the client library throws
 */
class NetAppError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief   Bad pipeline, channel or client setup. Fatal to the operation that
 * raised it.
 */
class ConfigurationError : public NetAppError {
public:
  using NetAppError::NetAppError;
};

/**
 * @brief   A payload could not be decoded, or an envelope is malformed
 */
class CodecError : public NetAppError {
public:
  using NetAppError::NetAppError;
};

/**
 * @brief   The value handed to a codec does not fit the channel's type
 */
class EncodingMismatch : public CodecError {
public:
  using CodecError::CodecError;
};

class UnknownChannel : public NetAppError {
public:
  explicit UnknownChannel(const std::string& name)
      : NetAppError("Unknown channel: " + name) {}
};

class DuplicateChannel : public NetAppError {
public:
  using NetAppError::NetAppError;
};

class NotConnected : public NetAppError {
public:
  using NetAppError::NetAppError;
};

class AlreadyConnected : public NetAppError {
public:
  using NetAppError::NetAppError;
};

class FailedToConnect : public NetAppError {
public:
  using NetAppError::NetAppError;
};

/**
 * @brief   The outbound queue is full and the message was allowed to be dropped
 */
class BackPressureError : public NetAppError {
public:
  using NetAppError::NetAppError;
};

/**
 * @brief   The encode pipeline is stopped (explicitly or by a fault) and takes
 * no more frames
 */
class PipelineStopped : public NetAppError {
public:
  using NetAppError::NetAppError;
};

}  // namespace netapp

#endif /* end of include guard: ERRORS_HPP_Q3M8ZK1T */
