/**
 * @file slip_link.hpp
 * @brief SlipLink: a byte transport plus SLIP framing, for one connection.
 *
 * @details
 * ## Field brief
 * A SlipLink does not know what a tty is. It holds a reference to an
 * @ref slipframe::transport::ITransport, frames outgoing messages with the
 * escape codec, and turns incoming chunks into messages with its own
 * @ref slipframe::FrameReassembler. One link per connection; links never share
 * buffers.
 *
 * ---
 *
 * @par Operational model
 * ```
 *   send_message(payload) ──► build_frame() ──► transport.write() ──► done(err)
 *   send_message_and_drain(payload) ──► write ──► drain ──► done(err)
 *
 *   transport data ──► reassembler.ingest() ──► message handler   (push)
 *                                          └──► inbox (bounded) ──► get_message() (pull)
 *                                   errors ──► error handler
 * ```
 *
 * - **Push or pull.** With a message handler set, each message goes straight to
 *   it. Without one, messages wait in a bounded inbox (@ref INBOX_CAP) until
 *   get_message() picks them up, the same add/get discipline a tick loop uses.
 * - **Two send contracts.** send_message() completes once the transport has
 *   accepted the bytes. send_message_and_drain() completes only after the
 *   transport reports its buffer drained, which is what you want before
 *   closing a port.
 *
 * ---
 *
 * @par Failure model
 * - **Bad protocol definition:** open() returns the Configuration error; the
 *   transport is never started.
 * - **Transport would not open:** open() returns ErrorCode::TransportOpen.
 * - **Transport closed itself** (unplugged adapter): service() reports
 *   TransportLost once and the link is closed.
 * - **Write/drain error:** passed verbatim to the completion callback. A write
 *   error on send_message_and_drain() skips the drain.
 * - **Payload above ENCODE_INPUT_MAX:** nothing is written; the error handler
 *   gets EncodeTooLarge and the completion gets EMSGSIZE.
 * - **Bad frame / oversize frame on receive:** reported through the error
 *   handler, dropped; the stream continues.
 * - **Inbox full (pull mode):** the new message is dropped and InboxFull is
 *   reported.
 *
 * ---
 *
 * @par Minimal usage
 * @code
 * slipframe::transport::LinuxSerial port;
 * slipframe::transport::SerialConfig cfg;
 * cfg.path = "/dev/ttyUSB0";
 *
 * slipframe::SlipLink link(port, slipframe::default_protocol());
 * link.set_message_handler([](slipframe::Message&& m) { handle(m); });
 * if (link.open(cfg) != slipframe::ErrorCode::Ok) return;
 *
 * link.send_message(payload, [](int err) { if (err) log(err); });
 * for (;;) {
 *   if (port.wait_readable(100)) link.service();
 * }
 * @endcode
 *
 * @par Threading
 * Single consumer. service() and the send calls must come from one thread, or
 * be serialised by the caller.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "etl/deque.h"

#include "slipframe/errors.hpp"
#include "slipframe/protocol.hpp"
#include "slipframe/reassembler.hpp"
#include "slipframe/transport/transport_base.hpp"

namespace slipframe {

class SlipLink {
public:
  /// Messages held for get_message() when no handler is set.
  static constexpr size_t INBOX_CAP = 16;

  using MessageHandler = FrameReassembler::MessageHandler;
  using ErrorHandler   = FrameReassembler::ErrorHandler;
  using Completion     = transport::Completion;

  /**
   * @param transport  byte transport; must outlive the link
   * @param proto      protocol definition; open() rejects an invalid one
   */
  SlipLink(transport::ITransport& transport, const ProtocolDefinition& proto);

  /// Detaches from the transport's data notification. Does not end() it.
  ~SlipLink();

  SlipLink(const SlipLink&) = delete;
  SlipLink& operator=(const SlipLink&) = delete;

  /**
   * @brief Validate the protocol, start the transport, subscribe to its data.
   *
   * @retval ErrorCode::Ok             link ready
   * @retval Configuration error       from validate_protocol(); transport untouched
   * @retval ErrorCode::TransportOpen  transport.begin() failed
   */
  ErrorCode open(const transport::Config& cfg);

  /// Unsubscribe, drop any partial frame, and end the transport.
  void close();

  bool is_open() const { return open_; }

  /**
   * @brief Frame @p payload and hand it to the transport (fire-and-forget).
   *
   * @param done  optional; receives 0 or the transport's errno value
   */
  void send_message(const uint8_t* payload, size_t n, Completion done = nullptr);
  void send_message(const std::vector<uint8_t>& payload, Completion done = nullptr) {
    send_message(payload.data(), payload.size(), std::move(done));
  }

  /**
   * @brief Frame @p payload, write it, then wait for the transport to drain.
   *
   * @param done  optional; receives the write error if there was one,
   *              otherwise the drain result
   */
  void send_message_and_drain(const uint8_t* payload, size_t n, Completion done = nullptr);
  void send_message_and_drain(const std::vector<uint8_t>& payload, Completion done = nullptr) {
    send_message_and_drain(payload.data(), payload.size(), std::move(done));
  }

  /// Let the transport deliver whatever it has received. Non-blocking.
  /// Reports TransportLost and closes the link if the transport dropped.
  void service();

  /// Push delivery. Pass nullptr to go back to the inbox.
  void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
  void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

  /**
   * @brief Pull the oldest queued message.
   *
   * @retval true  @p out holds the message, removed from the inbox
   * @retval false inbox empty
   */
  bool get_message(Message& out);

  size_t inbox_size() const { return inbox_.size(); }

  const ProtocolDefinition& protocol() const { return proto_; }
  const FrameReassembler& reassembler() const { return reassembler_; }
  uint32_t messages_sent() const { return messages_sent_; }

private:
  void on_data(const uint8_t* data, size_t n);
  void deliver(Message&& msg);
  void report(ErrorCode code);
  bool frame(const uint8_t* payload, size_t n, std::vector<uint8_t>& wire);

  transport::ITransport& transport_;
  ProtocolDefinition proto_;
  FrameReassembler reassembler_;
  etl::deque<Message, INBOX_CAP> inbox_;

  MessageHandler on_message_;
  ErrorHandler on_error_;
  bool open_{false};
  uint32_t messages_sent_{0};
};

} // namespace slipframe

