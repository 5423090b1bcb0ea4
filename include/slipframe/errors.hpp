/**
 * @file errors.hpp
 * @brief Slipframe error codes and their families.
 *
 * @details
 * Nothing in slipframe throws. Every fallible call returns an @ref ErrorCode
 * (or a plain bool where only one failure is possible), and stream-level
 * problems found while reassembling are reported through the link's error
 * handler. Codes are grouped into a small number of @ref ErrorKind families so
 * callers can decide policy without switching on every value:
 *
 * | Kind           | Meaning                                           | Policy                       |
 * |----------------|---------------------------------------------------|------------------------------|
 * | Configuration  | protocol bytes/limits invalid or unreadable       | fatal to link setup          |
 * | Framing        | malformed escape inside one frame                 | frame dropped, stream goes on|
 * | FrameTooLarge  | frame exceeds message_max_length (rx) or guard (tx)| resync / refuse              |
 * | Delivery       | bounded inbox full                                | newest message dropped       |
 * | Transport      | transport could not be opened                     | surfaced to caller           |
 *
 * Write and drain failures from the transport are not mapped here. They are
 * handed to completion callbacks verbatim as errno-style integers.
 */
#pragma once

#include <cstdint>

namespace slipframe {

/// Error families used for policy decisions.
enum class ErrorKind : uint8_t {
  None          = 0,
  Configuration = 1,
  Framing       = 2,
  FrameTooLarge = 3,
  Delivery      = 4,
  Transport     = 5,
};

/// Individual error codes.
enum class ErrorCode : uint8_t {
  Ok = 0,

  // Configuration
  ConfigByteOutOfRange,    ///< a special byte is outside 0..255
  ConfigBytesCollide,      ///< two special bytes share a value
  ConfigMaxLengthInvalid,  ///< message_max_length <= 0 or above the limit
  ConfigParse,             ///< config text unreadable or not the expected shape

  // Framing
  MalformedEscape,         ///< ESC followed by neither ESC_END nor ESC_ESC
  TruncatedEscape,         ///< ESC is the last byte of a frame

  // Size
  FrameTooLarge,           ///< receive side: pending frame exceeds message_max_length
  EncodeTooLarge,          ///< send side: payload above ENCODE_INPUT_MAX

  // Delivery
  InboxFull,               ///< pull inbox at capacity, message dropped

  // Transport
  TransportOpen,           ///< ITransport::begin() failed
  TransportLost,           ///< transport closed itself while the link was open
};

/// Family of @p code. ErrorCode::Ok maps to ErrorKind::None.
ErrorKind kind_of(ErrorCode code);

/// Stable snake_case name, used in log lines (e.g. "frame_too_large").
const char* to_string(ErrorCode code);

/// Stable snake_case name of a family.
const char* to_string(ErrorKind kind);

inline bool is_ok(ErrorCode code) { return code == ErrorCode::Ok; }

} // namespace slipframe
