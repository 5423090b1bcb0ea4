#include <doctest/doctest.h>
#include "slipframe/protocol.hpp"

#include <string>

using namespace slipframe;

TEST_CASE("Empty overrides resolve to standard SLIP bytes") {
    ProtocolDefinition p;
    p.end_byte = 0x00; // make sure resolve overwrites it

    REQUIRE(resolve_protocol(ProtocolOverrides{}, p) == ErrorCode::Ok);
    CHECK(p.end_byte == 0xC0);
    CHECK(p.esc_byte == 0xDB);
    CHECK(p.esc_end_byte == 0xDC);
    CHECK(p.esc_esc_byte == 0xDD);
    CHECK(p.message_max_length == MESSAGE_MAX_LENGTH_DEFAULT);
    CHECK(p == default_protocol());
}

TEST_CASE("Each field can be overridden on its own") {
    ProtocolOverrides ov;
    ov.end_byte = 0x7E;
    ov.message_max_length = 64;

    ProtocolDefinition p;
    REQUIRE(resolve_protocol(ov, p) == ErrorCode::Ok);
    CHECK(p.end_byte == 0x7E);
    CHECK(p.esc_byte == ESC);          // untouched fields keep defaults
    CHECK(p.esc_end_byte == ESC_END);
    CHECK(p.esc_esc_byte == ESC_ESC);
    CHECK(p.message_max_length == 64);
}

TEST_CASE("Resolving the same overrides twice gives equal definitions") {
    ProtocolOverrides ov;
    ov.esc_byte = 0x10;
    ov.esc_end_byte = 0x11;

    ProtocolDefinition a, b;
    REQUIRE(resolve_protocol(ov, a) == ErrorCode::Ok);
    REQUIRE(resolve_protocol(ov, b) == ErrorCode::Ok);
    CHECK(a == b);
}

TEST_CASE("Byte values outside 0..255 are rejected") {
    ProtocolDefinition p = default_protocol();
    p.message_max_length = 77; // sentinel: must survive a failed resolve

    ProtocolOverrides hi;
    hi.end_byte = 256;
    CHECK(resolve_protocol(hi, p) == ErrorCode::ConfigByteOutOfRange);

    ProtocolOverrides lo;
    lo.esc_esc_byte = -1;
    CHECK(resolve_protocol(lo, p) == ErrorCode::ConfigByteOutOfRange);
    CHECK(kind_of(ErrorCode::ConfigByteOutOfRange) == ErrorKind::Configuration);

    CHECK(p.message_max_length == 77);
}

TEST_CASE("Colliding special bytes are rejected") {
    ProtocolDefinition p;

    ProtocolOverrides end_is_esc;
    end_is_esc.end_byte = ESC;
    CHECK(resolve_protocol(end_is_esc, p) == ErrorCode::ConfigBytesCollide);

    ProtocolOverrides codes_equal;
    codes_equal.esc_end_byte = 0x01;
    codes_equal.esc_esc_byte = 0x01;
    CHECK(resolve_protocol(codes_equal, p) == ErrorCode::ConfigBytesCollide);
}

TEST_CASE("messageMaxLength must be positive and bounded") {
    ProtocolDefinition p;

    ProtocolOverrides zero;
    zero.message_max_length = 0;
    CHECK(resolve_protocol(zero, p) == ErrorCode::ConfigMaxLengthInvalid);

    ProtocolOverrides negative;
    negative.message_max_length = -5;
    CHECK(resolve_protocol(negative, p) == ErrorCode::ConfigMaxLengthInvalid);

    ProtocolOverrides huge;
    huge.message_max_length = static_cast<int64_t>(MESSAGE_MAX_LENGTH_LIMIT) + 1;
    CHECK(resolve_protocol(huge, p) == ErrorCode::ConfigMaxLengthInvalid);

    ProtocolOverrides edge;
    edge.message_max_length = static_cast<int64_t>(MESSAGE_MAX_LENGTH_LIMIT);
    CHECK(resolve_protocol(edge, p) == ErrorCode::Ok);
}

TEST_CASE("validate_protocol checks hand-built definitions") {
    ProtocolDefinition p = default_protocol();
    CHECK(validate_protocol(p) == ErrorCode::Ok);

    p.esc_end_byte = p.end_byte;
    CHECK(validate_protocol(p) == ErrorCode::ConfigBytesCollide);

    p = default_protocol();
    p.message_max_length = 0;
    CHECK(validate_protocol(p) == ErrorCode::ConfigMaxLengthInvalid);
}

TEST_CASE("Error names are stable") {
    CHECK(std::string(to_string(ErrorCode::FrameTooLarge)) == "frame_too_large");
    CHECK(std::string(to_string(ErrorCode::MalformedEscape)) == "malformed_escape");
    CHECK(std::string(to_string(ErrorKind::Framing)) == "framing");
    CHECK(kind_of(ErrorCode::Ok) == ErrorKind::None);
    CHECK(kind_of(ErrorCode::TruncatedEscape) == ErrorKind::Framing);
    CHECK(kind_of(ErrorCode::EncodeTooLarge) == ErrorKind::FrameTooLarge);
    CHECK(kind_of(ErrorCode::InboxFull) == ErrorKind::Delivery);
    CHECK(kind_of(ErrorCode::TransportOpen) == ErrorKind::Transport);
    CHECK(kind_of(ErrorCode::TransportLost) == ErrorKind::Transport);
    CHECK(std::string(to_string(ErrorCode::TransportLost)) == "transport_lost");
}
