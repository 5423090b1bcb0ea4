/**
 * @file reassembler.hpp
 * @brief Chunked SLIP input → complete decoded messages.
 *
 * @details
 * ## What it does
 * A serial port hands us bytes in whatever chunks the driver felt like: half a
 * frame, three frames and a bit, a lone END. @ref FrameReassembler takes those
 * chunks in arrival order and emits each complete message exactly once, in the
 * order its terminator arrived.
 *
 * ## Operational model
 * ```
 *   chunk ──► ingest() ──► scan for END ──► append bytes before it to buffer
 *                               │
 *                               ├─ END found, buffer empty  → skip (empty frame)
 *                               ├─ END found, buffer filled → decode() → on_message
 *                               │                                   └─ error → on_error, drop
 *                               └─ no END                   → keep bytes for next chunk
 * ```
 *
 * ## States
 * - **Idle**: nothing buffered.
 * - **Accumulating**: one or more escaped bytes of an unterminated frame buffered.
 * - **Discarding**: a frame overflowed; every byte up to and including the next
 *   END is dropped, then back to Idle.
 *
 * ## Buffer
 * Allocated once at construction, sized for the worst case escaped form of a
 * maximum length message (2 * message_max_length), and only for a valid
 * definition. After each extracted frame the consumed span is zeroed and the
 * cursor returns to 0. The buffer
 * belongs to this instance only; give every connection its own reassembler.
 *
 * ## Failure model
 * - **Malformed escape** inside a frame: that frame is dropped,
 *   MalformedEscape/TruncatedEscape goes to the error handler, the next frame
 *   is unaffected.
 * - **Oversize frame**: as soon as the decoded length of the pending frame
 *   would exceed message_max_length (or its escaped form would exceed the
 *   buffer), FrameTooLarge is reported once and the reassembler resyncs on the
 *   next END.
 * - **Empty frame** (END END, or a leading END): skipped without a message or
 *   an error. Many senders emit a leading END to flush line noise.
 *
 * ## Threading
 * None. ingest() must not be called concurrently or re-entered from a handler.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "slipframe/errors.hpp"
#include "slipframe/protocol.hpp"

namespace slipframe {

/// One decoded application message.
using Message = std::vector<uint8_t>;

class FrameReassembler {
public:
  enum class State : uint8_t { Idle = 0, Accumulating = 1, Discarding = 2 };

  /// Receives each decoded message; ownership moves to the handler.
  using MessageHandler = std::function<void(Message&&)>;
  /// Receives MalformedEscape, TruncatedEscape and FrameTooLarge.
  using ErrorHandler   = std::function<void(ErrorCode)>;

  /// Running counters since construction.
  struct Stats {
    uint32_t frames_received{0};          ///< messages emitted
    uint32_t frames_dropped_malformed{0}; ///< bad escape sequences
    uint32_t frames_dropped_oversize{0};  ///< overflows (one per resync)
    uint32_t empty_frames_skipped{0};     ///< END with nothing buffered
  };

  /**
   * @param proto  a definition that passed validate_protocol(). Anything else
   *               leaves the buffer empty (capacity() == 0) instead of
   *               allocating; nothing is thrown.
   */
  explicit FrameReassembler(const ProtocolDefinition& proto);

  void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
  void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

  /**
   * @brief Feed one received chunk.
   *
   * Emits zero or more messages and errors through the handlers before
   * returning. Bytes after the last END stay buffered for the next call.
   * Without a message handler, frames are still counted but discarded.
   */
  void ingest(const uint8_t* data, size_t n);

  /// @overload
  void ingest(const std::vector<uint8_t>& chunk) { ingest(chunk.data(), chunk.size()); }

  /// Drop pending bytes (and any resync in progress) and return to Idle.
  void reset();

  State state() const { return state_; }
  bool is_discarding() const { return state_ == State::Discarding; }

  /// Escaped bytes currently buffered.
  size_t pending() const { return cursor_; }

  /// Buffer capacity in escaped bytes.
  size_t capacity() const { return buffer_.size(); }

  const Stats& stats() const { return stats_; }
  const ProtocolDefinition& protocol() const { return proto_; }

private:
  bool append(const uint8_t* data, size_t n);
  void complete_frame();
  void clear();
  void report(ErrorCode code);

  ProtocolDefinition proto_;
  std::vector<uint8_t> buffer_;  ///< fixed size, escaped bytes of the open frame
  size_t cursor_{0};             ///< next free offset in buffer_
  size_t escapes_{0};            ///< ESC bytes in buffer_[0, cursor_)
  State state_{State::Idle};
  Stats stats_{};

  MessageHandler on_message_;
  ErrorHandler on_error_;
};

} // namespace slipframe
