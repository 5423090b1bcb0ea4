/**
 * @file codec.hpp
 * @brief Stateless SLIP escape codec: escape, unescape, and build one wire frame.
 *
 * @details
 * HOW THE ESCAPING WORKS
 * ----------------------
 * A frame on the wire is the escaped payload followed by one END byte.
 * Inside the payload:
 *   - a literal END is written as ESC, ESC_END
 *   - a literal ESC is written as ESC, ESC_ESC
 *   - every other byte passes through unchanged
 *
 * So an escaped frame never contains END except as its terminator, and never
 * contains ESC except as the first byte of an escape pair. All four byte values
 * come from the @ref ProtocolDefinition, so the same code serves links that
 * reuse SLIP framing with different sentinels.
 *
 * DECODING POLICY
 * ---------------
 * RFC 1055 suggests passing an unknown escape through. We reject instead:
 * ESC followed by anything other than ESC_END/ESC_ESC, or ESC as the very last
 * byte, fails the whole frame. A wrong byte silently spliced into a message is
 * worse than a dropped message.
 *
 * These functions hold no state and never touch the terminator search. Frame
 * boundaries across chunks are the reassembler's job (reassembler.hpp).
 *
 * EXAMPLE
 * -------
 * @code
 *   const auto proto = slipframe::default_protocol();
 *   const uint8_t payload[] = {0x01, 0xC0, 0x02};
 *   std::vector<uint8_t> wire;
 *   slipframe::build_frame(proto, payload, sizeof(payload), wire);
 *   // wire: 01 DB DC 02 C0
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "slipframe/errors.hpp"
#include "slipframe/protocol.hpp"

namespace slipframe {

/// Largest payload encode() will accept (guards against pathological allocations).
static constexpr size_t ENCODE_INPUT_MAX = 16u * 1024u * 1024u;

/**
 * @brief Escape a raw payload.
 *
 * @param proto  protocol bytes
 * @param in     payload bytes (may be nullptr when @p n is 0)
 * @param n      payload length
 * @param out    cleared, then receives the escaped bytes (no terminator)
 *
 * @return false if @p n exceeds ENCODE_INPUT_MAX; @p out is left empty.
 *
 * @note Reserves worst case capacity (2*n) up front.
 */
bool encode(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
            std::vector<uint8_t>& out);

/// @overload
bool encode(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
            std::vector<uint8_t>& out);

/**
 * @brief Unescape one frame body (terminator already stripped).
 *
 * @param proto  protocol bytes
 * @param in     escaped bytes
 * @param n      escaped length
 * @param out    cleared, then receives the payload
 *
 * @retval ErrorCode::Ok              @p out holds the payload
 * @retval ErrorCode::MalformedEscape ESC followed by an unexpected byte; @p out cleared
 * @retval ErrorCode::TruncatedEscape ESC was the last byte; @p out cleared
 */
ErrorCode decode(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
                 std::vector<uint8_t>& out);

/// @overload
ErrorCode decode(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
                 std::vector<uint8_t>& out);

/**
 * @brief Escape a payload and append the END terminator: one complete wire frame.
 *
 * There is no receive-side cap here. A peer may still refuse a frame larger
 * than its own message_max_length.
 *
 * @return false if @p n exceeds ENCODE_INPUT_MAX; @p out is left empty.
 */
bool build_frame(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
                 std::vector<uint8_t>& out);

/// @overload
bool build_frame(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
                 std::vector<uint8_t>& out);

} // namespace slipframe
