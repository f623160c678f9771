#include "swarmcast/core/error.hpp"

namespace swarmcast {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::IoError:
      return "io_error";
    case ErrorCode::TruncatedInput:
      return "truncated_input";
    case ErrorCode::UnknownTypeTag:
      return "unknown_type_tag";
    case ErrorCode::UnsupportedType:
      return "unsupported_type";
    case ErrorCode::IntegerOverflow:
      return "integer_overflow";
    case ErrorCode::CodecError:
      return "codec_error";
    case ErrorCode::OracleUnavailable:
      return "oracle_unavailable";
    case ErrorCode::TransportError:
      return "transport_error";
    case ErrorCode::SubmissionConflict:
      return "submission_conflict";
    case ErrorCode::ConfigurationError:
      return "configuration_error";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

bool is_decode_error(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::TruncatedInput:
    case ErrorCode::UnknownTypeTag:
    case ErrorCode::IntegerOverflow:
    case ErrorCode::CodecError:
      return true;
    default:
      return false;
  }
}

bool is_transient(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::IoError:
    case ErrorCode::OracleUnavailable:
    case ErrorCode::TransportError:
    case ErrorCode::Timeout:
      return true;
    default:
      return false;
  }
}

}  // namespace swarmcast
