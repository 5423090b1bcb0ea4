#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport (header-only, termios raw 8N1, non-blocking fd).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h. Linux-only.
 *
 * write() loops over partial writes, waiting on POLLOUT when the driver
 * buffer is full, so its completion means "all bytes accepted by the kernel".
 * drain() is tcdrain(): it returns once the UART has shifted everything out.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "slipframe/transport/transport_base.hpp"

#include <string>
#include <vector>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <poll.h>

namespace slipframe::transport {

struct SerialConfig : public Config {
  std::string path;         // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int write_timeout_ms{1000};
};

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(const std::string& dev_path = {}, int baud = 115200)
  : dev_path_(dev_path), baud_(baud) {}

  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const Config& cfg) override {
    // Call sites pass a SerialConfig; anything else is a programmer error.
    const auto& sc = static_cast<const SerialConfig&>(cfg);

    if (!sc.path.empty()) dev_path_ = sc.path;
    baud_ = sc.baud;
    write_timeout_ms_ = sc.write_timeout_ms;
    rx_.assign(sc.read_chunk > 0 ? sc.read_chunk : 256, 0);

    if (dev_path_.empty()) return false;
    end();

    last_error_ = 0;
    fd_ = ::open(dev_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return false;

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) { end(); return false; }
    ::cfmakeraw(&tio);

    speed_t sp = B115200;
    switch (baud_) {
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
#ifdef B230400
      case 230400: sp = B230400; break;
#endif
#ifdef B460800
      case 460800: sp = B460800; break;
#endif
      default:     sp = B115200; break;
    }

    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= CLOCAL | CREAD;   // enable receiver, ignore modem ctrl
    tio.c_cflag &= ~CRTSCTS;         // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) { end(); return false; }
    ::tcflush(fd_, TCIOFLUSH);       // drop boot chatter
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  /**
   * Deliver everything the driver has buffered. A read error or a hangup
   * (adapter unplugged, pty master gone) closes the port and records the
   * errno in last_error(); is_open() turns false.
   */
  void poll() override {
    if (fd_ < 0 || rx_.empty()) return;
    for (;;) {
      ssize_t r = ::read(fd_, rx_.data(), rx_.size());
      if (r > 0) {
        if (on_data_) on_data_(rx_.data(), static_cast<std::size_t>(r));
        continue;
      }
      if (r < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        fail(errno);
        return;
      }
      // VMIN=0/VTIME=0: 0 means "no data" and also "hung up". Ask the fd.
      if (hung_up()) fail(EIO);
      return;
    }
  }

  /// Block up to timeout_ms for input. True if poll() has something to do,
  /// which includes reporting a hangup or error.
  bool wait_readable(int timeout_ms) const {
    if (fd_ < 0) return false;
    pollfd pfd{fd_, POLLIN, 0};
    return ::poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
  }

  /// errno of the failure that closed the port in poll(); 0 if none.
  int last_error() const { return last_error_; }

  void set_data_handler(DataHandler handler) override { on_data_ = std::move(handler); }

  void write(const uint8_t* data, std::size_t len, Completion done) override {
    const int err = write_all(data, len);
    if (done) done(err);
  }

  void drain(Completion done) override {
    int err = 0;
    if (fd_ < 0) err = EBADF;
    else if (::tcdrain(fd_) != 0) err = errno;
    if (done) done(err);
  }

  const char* name() const override { return "linux-serial"; }

  int fd() const { return fd_; }

private:
  bool hung_up() const {
    pollfd pfd{fd_, POLLIN, 0};
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLHUP | POLLERR | POLLNVAL));
  }

  void fail(int err) {
    last_error_ = err;
    end();
  }

  int write_all(const uint8_t* data, std::size_t len) {
    if (fd_ < 0) return EBADF;
    std::size_t off = 0;
    while (off < len) {
      ssize_t w = ::write(fd_, data + off, len - off);
      if (w > 0) { off += static_cast<std::size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return errno;

      // Driver buffer full: wait for room.
      pollfd pfd{fd_, POLLOUT, 0};
      int pr = ::poll(&pfd, 1, write_timeout_ms_);
      if (pr == 0) return ETIMEDOUT;
      if (pr < 0 && errno != EINTR) return errno;
    }
    return 0;
  }

  int fd_{-1};
  int last_error_{0};
  std::string dev_path_;
  int baud_{115200};
  int write_timeout_ms_{1000};
  std::vector<uint8_t> rx_;
  DataHandler on_data_;
};

} // namespace slipframe::transport
