#pragma once
/**
 * @file transport_loopback.hpp
 * @brief In-memory transport: what you write comes back on poll(), chunked.
 *
 * Used by the tests and by `slipframe-cli --loopback` to exercise a link
 * without hardware. Received bytes are handed out in read_chunk sized pieces,
 * so a small chunk size reproduces the worst a serial driver can do to frame
 * boundaries. Write and drain failures can be injected to check that the
 * link passes them through.
 */

#include "slipframe/transport/transport_base.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

namespace slipframe::transport {

struct LoopbackConfig : public Config {
  bool echo{true};   ///< feed written bytes back as received data
};

class LoopbackTransport : public ITransport {
public:
  LoopbackTransport() = default;

  bool begin(const Config& cfg) override {
    const auto& lc = static_cast<const LoopbackConfig&>(cfg);
    chunk_ = lc.read_chunk > 0 ? lc.read_chunk : 1;
    echo_ = lc.echo;
    open_ = true;
    return true;
  }

  void end() override {
    open_ = false;
    rx_.clear();
  }

  bool is_open() const override { return open_; }

  void poll() override {
    if (!open_) return;
    // Snapshot first: the handler may write (and so append to rx_) while we deliver.
    std::vector<uint8_t> pending;
    pending.swap(rx_);
    for (std::size_t off = 0; off < pending.size(); off += chunk_) {
      const std::size_t n = std::min(chunk_, pending.size() - off);
      ++chunks_delivered_;
      if (on_data_) on_data_(pending.data() + off, n);
    }
  }

  void set_data_handler(DataHandler handler) override { on_data_ = std::move(handler); }

  void write(const uint8_t* data, std::size_t len, Completion done) override {
    int err = open_ ? write_error_ : EBADF;
    if (err == 0) {
      wire_.insert(wire_.end(), data, data + len);
      if (echo_) rx_.insert(rx_.end(), data, data + len);
      unflushed_ += len;
    }
    if (done) done(err);
  }

  void drain(Completion done) override {
    int err = open_ ? drain_error_ : EBADF;
    if (err == 0) {
      unflushed_ = 0;
      ++drains_;
    }
    if (done) done(err);
  }

  const char* name() const override { return "loopback"; }

  /// Queue bytes as if the peer had sent them.
  void inject(const uint8_t* data, std::size_t len) { rx_.insert(rx_.end(), data, data + len); }
  void inject(const std::vector<uint8_t>& bytes) { inject(bytes.data(), bytes.size()); }

  /// Drop the link as an unplugged adapter would; is_open() turns false.
  void hang_up() {
    open_ = false;
    rx_.clear();
  }

  void set_write_error(int err) { write_error_ = err; }
  void set_drain_error(int err) { drain_error_ = err; }

  /// Everything successfully written, in order.
  const std::vector<uint8_t>& wire() const { return wire_; }
  /// Bytes written since the last successful drain.
  std::size_t unflushed() const { return unflushed_; }
  std::size_t drains() const { return drains_; }
  std::size_t chunks_delivered() const { return chunks_delivered_; }

private:
  bool open_{false};
  bool echo_{true};
  std::size_t chunk_{256};
  int write_error_{0};
  int drain_error_{0};
  std::vector<uint8_t> rx_;
  std::vector<uint8_t> wire_;
  std::size_t unflushed_{0};
  std::size_t drains_{0};
  std::size_t chunks_delivered_{0};
  DataHandler on_data_;
};

} // namespace slipframe::transport
