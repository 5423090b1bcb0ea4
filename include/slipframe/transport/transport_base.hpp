#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal byte transport capability the SLIP link is driven by.
 *
 * The link never inherits from a transport. It holds a reference to one of
 * these and uses exactly three things: a data-arrival notification, a write
 * with completion, and a drain with completion.
 */

#include <cstddef>
#include <cstdint>
#include <functional>

namespace slipframe::transport {

/// Chunk of received bytes. Only valid for the duration of the call.
using DataHandler = std::function<void(const uint8_t* data, std::size_t len)>;

/// Completion for write/drain: 0 on success, otherwise an errno value passed
/// through untouched.
using Completion = std::function<void(int err)>;

struct Config {
  // Extend per transport (see SerialConfig, LoopbackConfig).
  std::size_t read_chunk{256};  ///< max bytes handed to the data handler per call
};

/**
 * @brief Transport trait every link can rely on.
 *
 * Contract:
 *  - begin(cfg) opens/initialises the port. end() releases it.
 *  - poll() does non-blocking service work and delivers whatever arrived to
 *    the data handler, in order, one call at a time.
 *  - write(data,len,done) hands bytes to the outgoing path. done fires once
 *    they are accepted locally, not once they are on the wire.
 *  - drain(done) fires done once everything written so far has left the
 *    local buffer.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual void        poll() = 0;
  virtual void        set_data_handler(DataHandler handler) = 0;
  virtual void        write(const uint8_t* data, std::size_t len, Completion done) = 0;
  virtual void        drain(Completion done) = 0;
  virtual const char* name() const = 0;
};

} // namespace slipframe::transport
