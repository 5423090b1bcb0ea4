// -----------------------------------------------------------------------------
// slip_link.cpp: Implementation of slipframe::SlipLink
//
// API & failure model:
//   see include/slipframe/slip_link.hpp
//
// Usage tests:
//   see tests/test_slip_link.cpp (runs against LoopbackTransport)
// -----------------------------------------------------------------------------
#include "slipframe/slip_link.hpp"

#include <cerrno>

#include "slipframe/codec.hpp"

namespace slipframe {

SlipLink::SlipLink(transport::ITransport& transport, const ProtocolDefinition& proto)
: transport_(transport),
  proto_(proto),
  reassembler_(proto) {
  reassembler_.set_message_handler([this](Message&& msg) { deliver(std::move(msg)); });
  reassembler_.set_error_handler([this](ErrorCode code) { report(code); });
}

SlipLink::~SlipLink() {
  if (open_) transport_.set_data_handler(nullptr);   // transport may outlive us
}

ErrorCode SlipLink::open(const transport::Config& cfg) {
  const ErrorCode rc = validate_protocol(proto_);
  if (rc != ErrorCode::Ok) return rc;                 // never touch the port with bad bytes

  if (!transport_.begin(cfg)) return ErrorCode::TransportOpen;

  reassembler_.reset();
  transport_.set_data_handler([this](const uint8_t* data, size_t n) { on_data(data, n); });
  open_ = true;
  return ErrorCode::Ok;
}

void SlipLink::close() {
  if (!open_) return;
  transport_.set_data_handler(nullptr);
  transport_.end();
  reassembler_.reset();
  open_ = false;
}

void SlipLink::send_message(const uint8_t* payload, size_t n, Completion done) {
  std::vector<uint8_t> wire;
  if (!frame(payload, n, wire)) {
    if (done) done(EMSGSIZE);
    return;
  }

  transport_.write(wire.data(), wire.size(), [this, done](int err) {
    if (err == 0) ++messages_sent_;
    if (done) done(err);
  });
}

void SlipLink::send_message_and_drain(const uint8_t* payload, size_t n, Completion done) {
  std::vector<uint8_t> wire;
  if (!frame(payload, n, wire)) {
    if (done) done(EMSGSIZE);
    return;
  }

  transport_.write(wire.data(), wire.size(), [this, done](int err) {
    if (err != 0) {                       // write failed: report it, skip the drain
      if (done) done(err);
      return;
    }
    ++messages_sent_;
    transport_.drain([done](int drain_err) {
      if (done) done(drain_err);
    });
  });
}

void SlipLink::service() {
  if (!open_) return;
  transport_.poll();
  if (transport_.is_open()) return;

  // Port went away under us (read error, hangup). Report once and detach.
  transport_.set_data_handler(nullptr);
  reassembler_.reset();
  open_ = false;
  report(ErrorCode::TransportLost);
}

bool SlipLink::get_message(Message& out) {
  if (inbox_.empty()) return false;
  out = std::move(inbox_.front());
  inbox_.pop_front();
  return true;
}

// ---------- private ----------

void SlipLink::on_data(const uint8_t* data, size_t n) {
  reassembler_.ingest(data, n);
}

// deliver(): push to the handler if there is one, otherwise queue for get_message().
void SlipLink::deliver(Message&& msg) {
  if (on_message_) {
    on_message_(std::move(msg));
    return;
  }
  if (inbox_.full()) {                    // refuse newest, keep arrival order intact
    report(ErrorCode::InboxFull);
    return;
  }
  inbox_.push_back(std::move(msg));
}

void SlipLink::report(ErrorCode code) {
  if (on_error_) on_error_(code);
}

bool SlipLink::frame(const uint8_t* payload, size_t n, std::vector<uint8_t>& wire) {
  if (build_frame(proto_, payload, n, wire)) return true;
  report(ErrorCode::EncodeTooLarge);
  return false;
}

} // namespace slipframe
