// ============================================================================
// codec.cpp: implementation for codec.hpp
// For the escaping rules and decoding policy see the matching header.
// ============================================================================
#include "slipframe/codec.hpp"

namespace slipframe {

bool encode(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
            std::vector<uint8_t>& out) {
  out.clear();
  if (n > ENCODE_INPUT_MAX) return false;
  out.reserve(n * 2);                           // worst case: every byte escapes

  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];

    if (b == proto.end_byte) {                  // raw END cannot appear in a frame body
      out.push_back(proto.esc_byte);
      out.push_back(proto.esc_end_byte);
    } else if (b == proto.esc_byte) {           // nor can a raw ESC
      out.push_back(proto.esc_byte);
      out.push_back(proto.esc_esc_byte);
    } else {
      out.push_back(b);
    }
  }
  return true;
}

bool encode(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
            std::vector<uint8_t>& out) {
  return encode(proto, in.data(), in.size(), out);
}

ErrorCode decode(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
                 std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n);                               // decoded is never longer than escaped

  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];

    if (b != proto.esc_byte) {
      out.push_back(b);
      continue;
    }

    if (i + 1 >= n) {                           // ESC with nothing after it
      out.clear();
      return ErrorCode::TruncatedEscape;
    }

    const uint8_t code = in[++i];
    if (code == proto.esc_end_byte) {
      out.push_back(proto.end_byte);
    } else if (code == proto.esc_esc_byte) {
      out.push_back(proto.esc_byte);
    } else {
      out.clear();
      return ErrorCode::MalformedEscape;
    }
  }
  return ErrorCode::Ok;
}

ErrorCode decode(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
                 std::vector<uint8_t>& out) {
  return decode(proto, in.data(), in.size(), out);
}

bool build_frame(const ProtocolDefinition& proto, const uint8_t* in, size_t n,
                 std::vector<uint8_t>& out) {
  if (!encode(proto, in, n, out)) return false;
  out.push_back(proto.end_byte);
  return true;
}

bool build_frame(const ProtocolDefinition& proto, const std::vector<uint8_t>& in,
                 std::vector<uint8_t>& out) {
  return build_frame(proto, in.data(), in.size(), out);
}

} // namespace slipframe
