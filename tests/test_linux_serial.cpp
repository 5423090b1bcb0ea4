#include <doctest/doctest.h>

#if defined(__linux__)

#include "slipframe/slip_link.hpp"
#include "slipframe/transport/transport_linux_serial.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace slipframe;
using transport::LinuxSerial;
using transport::SerialConfig;
using Bytes = std::vector<uint8_t>;

// Pseudo-terminal pair: the port opens the slave, the test plays the far end
// on the master and can "unplug" it by closing the master.
struct PtyPair {
    int master{-1};
    std::string slave_path;

    PtyPair() {
        master = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master < 0) return;
        if (::grantpt(master) != 0 || ::unlockpt(master) != 0) { unplug(); return; }
        const char* name = ::ptsname(master);
        if (name) slave_path = name;
    }
    ~PtyPair() { unplug(); }

    bool ok() const { return master >= 0 && !slave_path.empty(); }

    void unplug() {
        if (master >= 0) { ::close(master); master = -1; }
    }

    bool send(const Bytes& b) {
        return ::write(master, b.data(), b.size()) == static_cast<ssize_t>(b.size());
    }

    Bytes receive(size_t want) {
        Bytes out;
        uint8_t buf[64];
        while (out.size() < want) {
            pollfd pfd{master, POLLIN, 0};
            if (::poll(&pfd, 1, 1000) <= 0) break;
            const ssize_t r = ::read(master, buf, sizeof(buf));
            if (r <= 0) break;
            out.insert(out.end(), buf, buf + r);
        }
        return out;
    }
};

static SerialConfig config_for(const PtyPair& pty) {
    SerialConfig cfg;
    cfg.path = pty.slave_path;
    cfg.baud = 115200;
    return cfg;
}

TEST_CASE("LinuxSerial moves frames both ways over a pty") {
    PtyPair pty;
    REQUIRE(pty.ok());

    LinuxSerial port;
    SlipLink link(port, default_protocol());
    std::vector<Bytes> got;
    link.set_message_handler([&](Message&& m) { got.push_back(std::move(m)); });
    REQUIRE(link.open(config_for(pty)) == ErrorCode::Ok);

    REQUIRE(pty.send(Bytes{0x01, 0xDB, 0xDC, 0x02, 0xC0}));
    REQUIRE(port.wait_readable(1000));
    link.service();
    REQUIRE(got.size() == 1);
    CHECK(got[0] == Bytes{0x01, 0xC0, 0x02});

    int result = -1;
    link.send_message(Bytes{0xDB}, [&](int err) { result = err; });
    CHECK(result == 0);
    CHECK(pty.receive(3) == Bytes{0xDB, 0xDD, 0xC0});

    // Nothing pending is not a failure.
    link.service();
    CHECK(link.is_open());
    CHECK(port.last_error() == 0);
}

TEST_CASE("A vanished peer closes the port and the link hears about it") {
    PtyPair pty;
    REQUIRE(pty.ok());

    LinuxSerial port;
    SlipLink link(port, default_protocol());
    std::vector<ErrorCode> errors;
    link.set_error_handler([&](ErrorCode c) { errors.push_back(c); });
    REQUIRE(link.open(config_for(pty)) == ErrorCode::Ok);

    pty.unplug();
    CHECK(port.wait_readable(1000));
    link.service();

    CHECK_FALSE(port.is_open());
    CHECK(port.last_error() == EIO);
    CHECK_FALSE(link.is_open());
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == ErrorCode::TransportLost);
}

#endif // __linux__
