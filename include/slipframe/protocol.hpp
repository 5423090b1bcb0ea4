/**
 * @file protocol.hpp
 * @brief SLIP protocol definition: the four special bytes and the message size cap.
 *
 * @details
 * SLIP defines four special byte values:
 *   END       (0xC0) marks the end of a frame.
 *   ESC       (0xDB) introduces a two-byte escape.
 *   ESC_END   (0xDC) stands in for END inside a payload.
 *   ESC_ESC   (0xDD) stands in for ESC inside a payload.
 *
 * Some links reuse SLIP framing with other byte values, so all four are
 * configurable, together with the largest decoded message the receiver will
 * accept. A @ref ProtocolOverrides carries whatever the caller chose to set;
 * @ref resolve_protocol fills the rest from the defaults and validates the
 * result. The resolved @ref ProtocolDefinition is then copied into the codec
 * users (reassembler, link) and never changes for the lifetime of a link.
 *
 * Override fields are deliberately wider than a byte. A config file saying
 * `"endByte": 300` must be rejected, not silently truncated to 44.
 *
 * @code
 *   slipframe::ProtocolOverrides ov;
 *   ov.message_max_length = 512;
 *   slipframe::ProtocolDefinition proto;
 *   if (slipframe::resolve_protocol(ov, proto) != slipframe::ErrorCode::Ok) {
 *     // refuse to open the link
 *   }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "slipframe/errors.hpp"

namespace slipframe {

/// @name Standard SLIP values (RFC 1055)
/// @{
static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Default receive cap. RFC 1055 suggests 1006 byte datagrams.
static constexpr size_t MESSAGE_MAX_LENGTH_DEFAULT = 1006;

/// Upper bound accepted for message_max_length. The reassembler allocates
/// twice this value up front.
static constexpr size_t MESSAGE_MAX_LENGTH_LIMIT = 1u << 20;
/// @}

/**
 * @brief Fully resolved protocol parameters.
 *
 * Build one with @ref resolve_protocol or @ref default_protocol. If you fill
 * the fields by hand, run @ref validate_protocol before handing it to a link.
 */
struct ProtocolDefinition {
  uint8_t end_byte{END};
  uint8_t esc_byte{ESC};
  uint8_t esc_end_byte{ESC_END};
  uint8_t esc_esc_byte{ESC_ESC};
  size_t  message_max_length{MESSAGE_MAX_LENGTH_DEFAULT};

  bool operator==(const ProtocolDefinition& o) const {
    return end_byte == o.end_byte && esc_byte == o.esc_byte &&
           esc_end_byte == o.esc_end_byte && esc_esc_byte == o.esc_esc_byte &&
           message_max_length == o.message_max_length;
  }
  bool operator!=(const ProtocolDefinition& o) const { return !(*this == o); }
};

/**
 * @brief Partial configuration. Unset fields take the defaults.
 */
struct ProtocolOverrides {
  std::optional<int>     end_byte;
  std::optional<int>     esc_byte;
  std::optional<int>     esc_end_byte;
  std::optional<int>     esc_esc_byte;
  std::optional<int64_t> message_max_length;
};

/// The standard SLIP definition (C0/DB/DC/DD, 1006 byte cap).
ProtocolDefinition default_protocol();

/**
 * @brief Check the invariants of an already built definition.
 *
 * @retval ErrorCode::Ok                     definition is usable
 * @retval ErrorCode::ConfigBytesCollide     two special bytes are equal
 * @retval ErrorCode::ConfigMaxLengthInvalid cap is 0 or above MESSAGE_MAX_LENGTH_LIMIT
 */
ErrorCode validate_protocol(const ProtocolDefinition& def);

/**
 * @brief Merge @p overrides over the defaults and validate.
 *
 * @param overrides  fields the caller chose to set
 * @param out        receives the resolved definition; untouched on failure
 *
 * @retval ErrorCode::Ok                     @p out written
 * @retval ErrorCode::ConfigByteOutOfRange   a set byte field is outside 0..255
 * @retval ErrorCode::ConfigBytesCollide     two special bytes are equal after merging
 * @retval ErrorCode::ConfigMaxLengthInvalid cap is <= 0 or above MESSAGE_MAX_LENGTH_LIMIT
 *
 * Resolving the same overrides twice yields equal definitions.
 */
ErrorCode resolve_protocol(const ProtocolOverrides& overrides, ProtocolDefinition& out);

} // namespace slipframe
