/**
 * @file main.cpp
 * @brief slipframe-cli: host-side diagnostic tool around the slipframe library.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and resolve the protocol (defaults, --config JSON, --max-len).
 *  - --encode: print the wire frame for a hex payload.
 *  - --decode: run a hex byte stream through a FrameReassembler, optionally in --chunk sized pieces.
 *  - --loopback: send a payload through a SlipLink over LoopbackTransport and print what comes back.
 *  - --send / --listen: talk to a real serial port through LinuxSerial.
 *
 * Output:
 *  - One key=value record per line on stdout ("frame=...", "message=...", "status=ok ...").
 *  - Errors on stderr as "status=error reason=<reason>".
 *
 * Exit codes: 0 ok, 2 usage, 3 config, 4 transport, 5 framing.
 */

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "slipframe/codec.hpp"
#include "slipframe/config_loader.hpp"
#include "slipframe/errors.hpp"
#include "slipframe/hex.hpp"
#include "slipframe/protocol.hpp"
#include "slipframe/reassembler.hpp"
#include "slipframe/slip_link.hpp"
#include "slipframe/transport/transport_linux_serial.hpp"
#include "slipframe/transport/transport_loopback.hpp"

using namespace slipframe;

namespace {

constexpr int EXIT_USAGE     = 2;
constexpr int EXIT_CONFIG    = 3;
constexpr int EXIT_TRANSPORT = 4;
constexpr int EXIT_FRAMING   = 5;

int fail(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return EXIT_USAGE;
}

int fail(ErrorCode code, int exit_code) {
  std::cerr << "status=error kind=" << to_string(kind_of(code))
            << " reason=" << to_string(code) << "\n";
  return exit_code;
}

int fail_errno(const char* op, int err) {
  std::cerr << "status=error op=" << op << " errno=" << err
            << " reason=" << std::strerror(err) << "\n";
  return EXIT_TRANSPORT;
}

bool parse_payload(const std::string& text, std::vector<uint8_t>& out) {
  if (hex::from_hex(text, out)) return true;
  std::cerr << "status=error reason=bad_hex input=" << text << "\n";
  return false;
}

void print_message(const Message& m) {
  std::cout << "message=" << hex::to_hex(m) << " len=" << m.size() << "\n";
}

// Feed `bytes` in `chunk` sized pieces (0 = one piece).
void feed_chunked(FrameReassembler& r, const std::vector<uint8_t>& bytes, size_t chunk) {
  if (chunk == 0) chunk = bytes.size();
  for (size_t off = 0; off < bytes.size(); off += chunk) {
    const size_t n = std::min(chunk, bytes.size() - off);
    r.ingest(bytes.data() + off, n);
  }
}

uint64_t now_ms_steady() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"slipframe CLI: SLIP encode/decode and serial diagnostics"};

  // ---- commands (exactly one) ----
  std::string encode_hex, decode_hex, loopback_hex, send_hex;
  bool listen = false, print_config = false;

  app.add_option("--encode",   encode_hex,   "Print the SLIP frame for a hex payload");
  app.add_option("--decode",   decode_hex,   "Reassemble messages from a hex byte stream");
  app.add_option("--loopback", loopback_hex, "Send a hex payload through an in-memory link");
  app.add_option("--send",     send_hex,     "Send a hex payload on --dev");
  app.add_flag("--listen",     listen,       "Print messages received on --dev");
  app.add_flag("--print-config", print_config, "Print the resolved protocol as JSON");

  // ---- protocol ----
  std::string config_path;
  int64_t max_len = 0;
  app.add_option("--config",  config_path, "Protocol JSON (endByte, escByte, escEndByte, escEscByte, messageMaxLength)");
  app.add_option("--max-len", max_len,     "Override messageMaxLength");

  // ---- io ----
  std::string dev = "/dev/ttyUSB0";
  int baud = 115200, timeout_ms = 1500, count = 0;
  size_t chunk = 0;
  bool drain = false;
  app.add_option("--dev",     dev,        "Serial device (e.g. /dev/serial/by-id/...)");
  app.add_option("--baud",    baud,       "Baud rate (default 115200)");
  app.add_option("--timeout", timeout_ms, "--listen: stop after this many ms without data");
  app.add_option("--count",   count,      "--listen: stop after N messages (0 = no limit)");
  app.add_option("--chunk",   chunk,      "--decode/--loopback: split input into N byte chunks");
  app.add_flag("--drain",     drain,      "--send: wait for the port to drain before exiting");

  CLI11_PARSE(app, argc, argv);

  int cmds = 0;
  cmds += encode_hex.empty()   ? 0 : 1;
  cmds += decode_hex.empty()   ? 0 : 1;
  cmds += loopback_hex.empty() ? 0 : 1;
  cmds += send_hex.empty()     ? 0 : 1;
  cmds += listen               ? 1 : 0;
  cmds += print_config         ? 1 : 0;
  if (cmds != 1) return fail("need_exactly_one_command");

  // ===== protocol resolution =====
  ProtocolDefinition proto = default_protocol();
  if (!config_path.empty()) {
    const ErrorCode rc = config::load_protocol_file(config_path, proto);
    if (rc != ErrorCode::Ok) return fail(rc, EXIT_CONFIG);
  }
  if (max_len != 0) {
    proto.message_max_length = max_len > 0 ? static_cast<size_t>(max_len) : 0;
    const ErrorCode rc = validate_protocol(proto);
    if (rc != ErrorCode::Ok) return fail(rc, EXIT_CONFIG);
  }

  // -------- print-config --------
  if (print_config) {
    std::cout << config::to_json(proto) << "\n";
    return 0;
  }

  // -------- encode --------
  if (!encode_hex.empty()) {
    std::vector<uint8_t> payload, wire;
    if (!parse_payload(encode_hex, payload)) return EXIT_USAGE;
    if (!build_frame(proto, payload, wire)) return fail(ErrorCode::EncodeTooLarge, EXIT_FRAMING);
    std::cout << "frame=" << hex::to_hex(wire) << " len=" << wire.size() << "\n";
    return 0;
  }

  // -------- decode --------
  if (!decode_hex.empty()) {
    std::vector<uint8_t> stream;
    if (!parse_payload(decode_hex, stream)) return EXIT_USAGE;

    FrameReassembler r(proto);
    int errors = 0;
    r.set_message_handler([](Message&& m) { print_message(m); });
    r.set_error_handler([&errors](ErrorCode code) {
      ++errors;
      std::cerr << "status=error kind=" << to_string(kind_of(code))
                << " reason=" << to_string(code) << "\n";
    });
    feed_chunked(r, stream, chunk);

    const auto& st = r.stats();
    std::cout << "status=ok messages=" << st.frames_received
              << " malformed=" << st.frames_dropped_malformed
              << " oversize=" << st.frames_dropped_oversize
              << " empty=" << st.empty_frames_skipped
              << " pending=" << r.pending() << "\n";
    return errors ? EXIT_FRAMING : 0;
  }

  // -------- loopback --------
  if (!loopback_hex.empty()) {
    std::vector<uint8_t> payload;
    if (!parse_payload(loopback_hex, payload)) return EXIT_USAGE;

    transport::LoopbackTransport loop;
    transport::LoopbackConfig cfg;
    cfg.read_chunk = chunk > 0 ? chunk : 256;

    SlipLink link(loop, proto);
    int errors = 0;
    link.set_error_handler([&errors](ErrorCode code) {
      ++errors;
      std::cerr << "status=error kind=" << to_string(kind_of(code))
                << " reason=" << to_string(code) << "\n";
    });
    const ErrorCode rc = link.open(cfg);
    if (rc != ErrorCode::Ok) return fail(rc, EXIT_TRANSPORT);

    int send_err = 0;
    link.send_message_and_drain(payload, [&send_err](int err) { send_err = err; });
    if (send_err != 0) return fail_errno("send", send_err);
    std::cout << "wire=" << hex::to_hex(loop.wire()) << "\n";

    link.service();
    Message m;
    int received = 0;
    while (link.get_message(m)) { print_message(m); ++received; }
    std::cout << "status=ok chunks=" << loop.chunks_delivered()
              << " messages=" << received << "\n";
    link.close();
    return errors ? EXIT_FRAMING : 0;
  }

  // -------- serial: send / listen --------
  transport::LinuxSerial port;
  transport::SerialConfig scfg;
  scfg.path = dev;
  scfg.baud = baud;

  SlipLink link(port, proto);
  int errors = 0;
  link.set_error_handler([&errors](ErrorCode code) {
    ++errors;
    std::cerr << "status=error kind=" << to_string(kind_of(code))
              << " reason=" << to_string(code) << "\n";
  });

  if (!send_hex.empty()) {
    std::vector<uint8_t> payload;
    if (!parse_payload(send_hex, payload)) return EXIT_USAGE;

    const ErrorCode rc = link.open(scfg);
    if (rc != ErrorCode::Ok) return fail(rc, EXIT_TRANSPORT);

    int send_err = 0;
    auto done = [&send_err](int err) { send_err = err; };
    if (drain) link.send_message_and_drain(payload, done);
    else       link.send_message(payload, done);
    link.close();

    if (send_err != 0) return fail_errno(drain ? "send_drain" : "send", send_err);
    std::cout << "status=ok dev=" << dev << " bytes=" << payload.size()
              << " drained=" << (drain ? 1 : 0) << "\n";
    return 0;
  }

  // listen
  int received = 0;
  link.set_message_handler([&received](Message&& m) { print_message(m); ++received; });
  const ErrorCode rc = link.open(scfg);
  if (rc != ErrorCode::Ok) return fail(rc, EXIT_TRANSPORT);

  uint64_t last_rx = now_ms_steady();
  while (count == 0 || received < count) {
    if (port.wait_readable(50)) {
      link.service();
      if (!link.is_open()) return fail_errno("read", port.last_error());
      last_rx = now_ms_steady();
      continue;
    }
    if (now_ms_steady() - last_rx >= static_cast<uint64_t>(timeout_ms)) break;
  }
  link.close();

  std::cout << "status=ok dev=" << dev << " messages=" << received
            << " errors=" << errors << "\n";
  return errors ? EXIT_FRAMING : 0;
}
