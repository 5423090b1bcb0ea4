// -----------------------------------------------------------------------------
// reassembler.cpp: Implementation of slipframe::FrameReassembler
//
// API & state machine description:
//   see include/slipframe/reassembler.hpp
//
// The buffer never holds an END byte: ingest() splits every chunk at its
// terminators and only appends the bytes in between. That keeps extraction to
// one decode per terminator with no compaction of leftover bytes.
// -----------------------------------------------------------------------------
#include "slipframe/reassembler.hpp"

#include <algorithm>
#include <cstring>

#include "slipframe/codec.hpp"

namespace slipframe {

// An invalid definition gets no buffer: a huge message_max_length must not
// reach the allocator (or wrap the doubling). Every non-empty frame then
// overflows, and SlipLink::open() refuses the definition before any byte flows.
FrameReassembler::FrameReassembler(const ProtocolDefinition& proto)
: proto_(proto),
  buffer_(validate_protocol(proto) == ErrorCode::Ok ? proto.message_max_length * 2 : 0, 0) {
}

void FrameReassembler::ingest(const uint8_t* data, size_t n) {
  size_t pos = 0;

  while (pos < n) {
    const void* hit = std::memchr(data + pos, proto_.end_byte, n - pos);
    const size_t seg_end = hit ? static_cast<size_t>(static_cast<const uint8_t*>(hit) - data) : n;
    const size_t seg_len = seg_end - pos;

    if (state_ == State::Discarding) {
      // Oversize frame in progress: the terminator closes it, nothing is emitted.
      if (hit) state_ = State::Idle;
    } else if (!append(data + pos, seg_len)) {
      ++stats_.frames_dropped_oversize;
      clear();
      state_ = hit ? State::Idle : State::Discarding;
      report(ErrorCode::FrameTooLarge);
    } else if (hit) {
      complete_frame();
    }

    pos = hit ? seg_end + 1 : n;   // step over the terminator
  }
}

void FrameReassembler::reset() {
  clear();
}

// append(): copy escaped bytes behind the cursor; false on overflow.
// Two limits: the decoded size of the open frame, and the raw buffer space
// (a run of ESC bytes decodes to nothing but still takes room).
bool FrameReassembler::append(const uint8_t* data, size_t n) {
  if (n == 0) return true;
  if (n > buffer_.size() - cursor_) return false;

  const size_t esc = static_cast<size_t>(std::count(data, data + n, proto_.esc_byte));
  const size_t decoded = (cursor_ + n) - (escapes_ + esc);
  if (decoded > proto_.message_max_length) return false;

  std::memcpy(buffer_.data() + cursor_, data, n);
  cursor_  += n;
  escapes_ += esc;
  state_ = State::Accumulating;
  return true;
}

// complete_frame(): a terminator arrived; decode and emit whatever is buffered.
void FrameReassembler::complete_frame() {
  if (cursor_ == 0) {              // END at offset 0: empty frame, skip quietly
    ++stats_.empty_frames_skipped;
    return;
  }

  Message msg;
  const ErrorCode rc = decode(proto_, buffer_.data(), cursor_, msg);
  clear();                         // the frame is consumed either way

  if (rc != ErrorCode::Ok) {
    ++stats_.frames_dropped_malformed;
    report(rc);
    return;
  }

  ++stats_.frames_received;
  if (on_message_) on_message_(std::move(msg));
}

void FrameReassembler::clear() {
  std::fill(buffer_.begin(), buffer_.begin() + cursor_, uint8_t{0});
  cursor_  = 0;
  escapes_ = 0;
  state_   = State::Idle;
}

void FrameReassembler::report(ErrorCode code) {
  if (on_error_) on_error_(code);
}

} // namespace slipframe
