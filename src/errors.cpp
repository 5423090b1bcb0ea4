// -----------------------------------------------------------------------------
// errors.cpp: names and families for slipframe::ErrorCode
//
// The strings returned here end up in log lines and CLI output, so they are
// part of the observable surface. Keep them stable.
// -----------------------------------------------------------------------------
#include "slipframe/errors.hpp"

namespace slipframe {

ErrorKind kind_of(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                     return ErrorKind::None;
    case ErrorCode::ConfigByteOutOfRange:
    case ErrorCode::ConfigBytesCollide:
    case ErrorCode::ConfigMaxLengthInvalid:
    case ErrorCode::ConfigParse:            return ErrorKind::Configuration;
    case ErrorCode::MalformedEscape:
    case ErrorCode::TruncatedEscape:        return ErrorKind::Framing;
    case ErrorCode::FrameTooLarge:
    case ErrorCode::EncodeTooLarge:         return ErrorKind::FrameTooLarge;
    case ErrorCode::InboxFull:              return ErrorKind::Delivery;
    case ErrorCode::TransportOpen:          return ErrorKind::Transport;
    case ErrorCode::TransportLost:          return ErrorKind::Transport;
  }
  return ErrorKind::None;
}

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                     return "ok";
    case ErrorCode::ConfigByteOutOfRange:   return "config_byte_out_of_range";
    case ErrorCode::ConfigBytesCollide:     return "config_bytes_collide";
    case ErrorCode::ConfigMaxLengthInvalid: return "config_max_length_invalid";
    case ErrorCode::ConfigParse:            return "config_parse";
    case ErrorCode::MalformedEscape:        return "malformed_escape";
    case ErrorCode::TruncatedEscape:        return "truncated_escape";
    case ErrorCode::FrameTooLarge:          return "frame_too_large";
    case ErrorCode::EncodeTooLarge:         return "encode_too_large";
    case ErrorCode::InboxFull:              return "inbox_full";
    case ErrorCode::TransportOpen:          return "transport_open";
    case ErrorCode::TransportLost:          return "transport_lost";
  }
  return "unknown";
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:          return "none";
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::Framing:       return "framing";
    case ErrorKind::FrameTooLarge: return "frame_too_large";
    case ErrorKind::Delivery:      return "delivery";
    case ErrorKind::Transport:     return "transport";
  }
  return "unknown";
}

} // namespace slipframe
