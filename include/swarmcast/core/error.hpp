#pragma once

#include <exception>
#include <string>
#include <utility>

namespace swarmcast {

enum class ErrorCode {
  InvalidArgument,
  IoError,
  TruncatedInput,
  UnknownTypeTag,
  UnsupportedType,
  IntegerOverflow,
  CodecError,
  OracleUnavailable,
  TransportError,
  SubmissionConflict,
  ConfigurationError,
  Timeout,
  Unsupported,
  Internal,
};

class Error : public std::exception {
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};

public:
  Error() = default;
  Error(ErrorCode c, std::string m) : code_(c), message_(std::move(m)) {}
  explicit Error(std::string m) : message_(std::move(m)) {}

  const char *what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }
  const std::string &message() const noexcept { return message_; }
};

const char *error_code_name(ErrorCode code) noexcept;

// Malformed bytes read from the store; isolated to a single entry.
bool is_decode_error(ErrorCode code) noexcept;

// Failures that polling loops retry on their next tick.
bool is_transient(ErrorCode code) noexcept;

} // namespace swarmcast
