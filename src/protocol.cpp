// -----------------------------------------------------------------------------
// protocol.cpp: defaulting and validation for slipframe::ProtocolDefinition
//
// API contract: see include/slipframe/protocol.hpp
// -----------------------------------------------------------------------------
#include "slipframe/protocol.hpp"

namespace slipframe {

namespace {

// Copy an optional override into a byte field. False if the value does not fit.
bool apply_byte(const std::optional<int>& v, uint8_t& field) {
  if (!v) return true;                          // not set: keep default
  if (*v < 0 || *v > 0xFF) return false;        // must be a single byte
  field = static_cast<uint8_t>(*v);
  return true;
}

} // namespace

ProtocolDefinition default_protocol() {
  return ProtocolDefinition{};
}

ErrorCode validate_protocol(const ProtocolDefinition& def) {
  const uint8_t b[4] = {def.end_byte, def.esc_byte, def.esc_end_byte, def.esc_esc_byte};
  for (int i = 0; i < 4; ++i) {
    for (int j = i + 1; j < 4; ++j) {
      if (b[i] == b[j]) return ErrorCode::ConfigBytesCollide;
    }
  }

  if (def.message_max_length == 0 ||
      def.message_max_length > MESSAGE_MAX_LENGTH_LIMIT) {
    return ErrorCode::ConfigMaxLengthInvalid;
  }
  return ErrorCode::Ok;
}

ErrorCode resolve_protocol(const ProtocolOverrides& overrides, ProtocolDefinition& out) {
  ProtocolDefinition def = default_protocol();

  if (!apply_byte(overrides.end_byte, def.end_byte) ||
      !apply_byte(overrides.esc_byte, def.esc_byte) ||
      !apply_byte(overrides.esc_end_byte, def.esc_end_byte) ||
      !apply_byte(overrides.esc_esc_byte, def.esc_esc_byte)) {
    return ErrorCode::ConfigByteOutOfRange;
  }

  if (overrides.message_max_length) {
    const int64_t n = *overrides.message_max_length;
    if (n <= 0 || static_cast<uint64_t>(n) > MESSAGE_MAX_LENGTH_LIMIT) {
      return ErrorCode::ConfigMaxLengthInvalid;
    }
    def.message_max_length = static_cast<size_t>(n);
  }

  const ErrorCode rc = validate_protocol(def);
  if (rc != ErrorCode::Ok) return rc;

  out = def;
  return ErrorCode::Ok;
}

} // namespace slipframe
