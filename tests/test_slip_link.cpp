#include <doctest/doctest.h>
#include "slipframe/slip_link.hpp"
#include "slipframe/transport/transport_loopback.hpp"

#include <cerrno>

using namespace slipframe;
using transport::LoopbackConfig;
using transport::LoopbackTransport;
using Bytes = std::vector<uint8_t>;

static LoopbackConfig chunked(size_t n, bool echo = true) {
    LoopbackConfig cfg;
    cfg.read_chunk = n;
    cfg.echo = echo;
    return cfg;
}

TEST_CASE("send_message puts one escaped frame on the wire") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(64, false)) == ErrorCode::Ok);

    int result = -1;
    link.send_message(Bytes{0x01, 0xC0, 0x02}, [&](int err) { result = err; });

    CHECK(result == 0);
    CHECK(loop.wire() == Bytes{0x01, 0xDB, 0xDC, 0x02, 0xC0});
    CHECK(loop.unflushed() == 5);   // fire-and-forget: no drain
    CHECK(loop.drains() == 0);
    CHECK(link.messages_sent() == 1);
}

TEST_CASE("send_message_and_drain completes after the drain") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(64, false)) == ErrorCode::Ok);

    int result = -1;
    size_t unflushed_at_completion = 99;
    link.send_message_and_drain(Bytes{0x10, 0x20}, [&](int err) {
        result = err;
        unflushed_at_completion = loop.unflushed();
    });

    CHECK(result == 0);
    CHECK(unflushed_at_completion == 0);
    CHECK(loop.drains() == 1);
}

TEST_CASE("Transport errors reach the completion untouched") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(64, false)) == ErrorCode::Ok);

    SUBCASE("write error on fire-and-forget") {
        loop.set_write_error(EIO);
        int result = 0;
        link.send_message(Bytes{1}, [&](int err) { result = err; });
        CHECK(result == EIO);
        CHECK(link.messages_sent() == 0);
    }

    SUBCASE("write error skips the drain") {
        loop.set_write_error(EAGAIN);
        int result = 0;
        link.send_message_and_drain(Bytes{1}, [&](int err) { result = err; });
        CHECK(result == EAGAIN);
        CHECK(loop.drains() == 0);
    }

    SUBCASE("drain error is passed through") {
        loop.set_drain_error(ETIMEDOUT);
        int result = 0;
        link.send_message_and_drain(Bytes{1}, [&](int err) { result = err; });
        CHECK(result == ETIMEDOUT);
        CHECK(loop.wire().size() == 2);   // the write itself went out
    }
}

TEST_CASE("Sending without a completion callback is allowed") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(64, false)) == ErrorCode::Ok);
    link.send_message(Bytes{7});
    link.send_message_and_drain(Bytes{8});
    CHECK(loop.wire() == Bytes{7, 0xC0, 8, 0xC0});
}

TEST_CASE("Messages echo back through the link in tiny chunks (pull mode)") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(1)) == ErrorCode::Ok);

    link.send_message(Bytes{0x01, 0xC0, 0x02});
    link.send_message(Bytes{0xDB});
    link.service();

    CHECK(loop.chunks_delivered() == 5 + 3);
    CHECK(link.inbox_size() == 2);

    Message m;
    REQUIRE(link.get_message(m));
    CHECK(m == Bytes{0x01, 0xC0, 0x02});
    REQUIRE(link.get_message(m));
    CHECK(m == Bytes{0xDB});
    CHECK_FALSE(link.get_message(m));
}

TEST_CASE("With a handler set, messages are pushed instead of queued") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    std::vector<Bytes> got;
    link.set_message_handler([&](Message&& m) { got.push_back(std::move(m)); });
    REQUIRE(link.open(chunked(3)) == ErrorCode::Ok);

    link.send_message(Bytes{'a', 'b', 'c', 'd'});
    link.service();

    REQUIRE(got.size() == 1);
    CHECK(got[0] == Bytes{'a', 'b', 'c', 'd'});
    CHECK(link.inbox_size() == 0);
}

TEST_CASE("A full inbox drops new messages and says so") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    std::vector<ErrorCode> errors;
    link.set_error_handler([&](ErrorCode c) { errors.push_back(c); });
    REQUIRE(link.open(chunked(256)) == ErrorCode::Ok);

    for (size_t i = 0; i < SlipLink::INBOX_CAP + 2; ++i) {
        link.send_message(Bytes{static_cast<uint8_t>(i)});
    }
    link.service();

    CHECK(link.inbox_size() == SlipLink::INBOX_CAP);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0] == ErrorCode::InboxFull);
    CHECK(kind_of(errors[0]) == ErrorKind::Delivery);

    Message m;
    REQUIRE(link.get_message(m));
    CHECK(m == Bytes{0});   // oldest kept, arrival order preserved
}

TEST_CASE("Framing errors from the peer are reported and the stream continues") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    std::vector<ErrorCode> errors;
    link.set_error_handler([&](ErrorCode c) { errors.push_back(c); });
    REQUIRE(link.open(chunked(2, false)) == ErrorCode::Ok);

    loop.inject(Bytes{0x01, 0xDB, 0x00, 0xC0, 0x05, 0xC0});
    link.service();

    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == ErrorCode::MalformedEscape);
    Message m;
    REQUIRE(link.get_message(m));
    CHECK(m == Bytes{0x05});
}

TEST_CASE("Oversize frames from the peer are reported, then the link resyncs") {
    ProtocolOverrides ov;
    ov.message_max_length = 4;
    ProtocolDefinition proto;
    REQUIRE(resolve_protocol(ov, proto) == ErrorCode::Ok);

    LoopbackTransport loop;
    SlipLink link(loop, proto);
    std::vector<ErrorCode> errors;
    link.set_error_handler([&](ErrorCode c) { errors.push_back(c); });
    REQUIRE(link.open(chunked(3, false)) == ErrorCode::Ok);

    loop.inject(Bytes{1, 2, 3, 4, 5, 6, 7, 0xC0, 9, 0xC0});
    link.service();

    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == ErrorCode::FrameTooLarge);
    Message m;
    REQUIRE(link.get_message(m));
    CHECK(m == Bytes{9});
    CHECK(link.reassembler().stats().frames_dropped_oversize == 1);
}

TEST_CASE("open() refuses a bad protocol before touching the transport") {
    ProtocolDefinition bad = default_protocol();
    bad.esc_byte = bad.end_byte;

    LoopbackTransport loop;
    SlipLink link(loop, bad);
    const ErrorCode rc = link.open(chunked(8));
    CHECK(rc == ErrorCode::ConfigBytesCollide);
    CHECK(kind_of(rc) == ErrorKind::Configuration);
    CHECK_FALSE(loop.is_open());
    CHECK_FALSE(link.is_open());
}

TEST_CASE("close() stops delivery and ends the transport") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    REQUIRE(link.open(chunked(8)) == ErrorCode::Ok);
    link.close();
    CHECK_FALSE(loop.is_open());

    int result = 0;
    link.send_message(Bytes{1}, [&](int err) { result = err; });
    CHECK(result == EBADF);   // the transport reports it, the link passes it on
}

TEST_CASE("An absurd message cap is refused by open() instead of allocated") {
    ProtocolDefinition huge = default_protocol();
    huge.message_max_length = static_cast<size_t>(uint64_t{1} << 42);

    LoopbackTransport loop;
    SlipLink link(loop, huge);                   // must not allocate or throw
    CHECK(link.reassembler().capacity() == 0);
    CHECK(link.open(chunked(8)) == ErrorCode::ConfigMaxLengthInvalid);
    CHECK_FALSE(loop.is_open());
}

TEST_CASE("A transport that drops out is reported once and closes the link") {
    LoopbackTransport loop;
    SlipLink link(loop, default_protocol());
    std::vector<ErrorCode> errors;
    link.set_error_handler([&](ErrorCode c) { errors.push_back(c); });
    REQUIRE(link.open(chunked(8)) == ErrorCode::Ok);

    loop.hang_up();
    link.service();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == ErrorCode::TransportLost);
    CHECK(kind_of(errors[0]) == ErrorKind::Transport);
    CHECK_FALSE(link.is_open());

    link.service();
    CHECK(errors.size() == 1);
}
