/**
 * @file config_loader.cpp
 * @brief JSON protocol configuration for slipframe links.
 * @details
 *   Turns a JSON object such as
 *   @code
 *   { "endByte": 192, "escByte": 219, "escEndByte": 220,
 *     "escEscByte": 221, "messageMaxLength": 1006 }
 *   @endcode
 *   into @ref slipframe::ProtocolOverrides. Every key is optional; missing keys
 *   fall back to the defaults when the overrides are resolved.
 *
 *   ## Dual Backend Support
 *   - **Desktop/Linux builds** (no @c ARDUINO defined) use
 *     [nlohmann::json](https://github.com/nlohmann/json).
 *   - **Embedded/Arduino builds** (@c ARDUINO defined) use
 *     [ArduinoJson](https://arduinojson.org/) with a fixed-size
 *     @c StaticJsonDocument so memory use is bounded. File loading is not
 *     available there; feed the text from wherever the firmware keeps it.
 *
 *   ## Error Suppression
 *   Parse errors and library exceptions never leave this file. They come back
 *   as ErrorCode::ConfigParse.
 */

#include "slipframe/config_loader.hpp"

#include <cstdint>
#include <limits>

#ifdef ARDUINO

#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::deserializeJson;
using ArduinoJson::serializeJson;
using ArduinoJson::JsonObject;
using ArduinoJson::JsonVariant;

#else

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
using nlohmann::json;

#endif

namespace slipframe {
namespace config {

namespace {

constexpr const char* KEY_END         = "endByte";
constexpr const char* KEY_ESC         = "escByte";
constexpr const char* KEY_ESC_END     = "escEndByte";
constexpr const char* KEY_ESC_ESC     = "escEscByte";
constexpr const char* KEY_MAX_LENGTH  = "messageMaxLength";

// A value that does not fit T is clamped to T's limits, which lie outside
// every valid range, so resolve_protocol() still rejects it. Never truncate:
// 0x1000000C0 must not turn into 0xC0.
template <typename T>
T clamp_signed(int64_t v) {
  if (v < static_cast<int64_t>(std::numeric_limits<T>::min())) return std::numeric_limits<T>::min();
  if (v > static_cast<int64_t>(std::numeric_limits<T>::max())) return std::numeric_limits<T>::max();
  return static_cast<T>(v);
}

template <typename T>
T clamp_unsigned(uint64_t v) {
  if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) return std::numeric_limits<T>::max();
  return static_cast<T>(v);
}

#ifdef ARDUINO

template <typename T>
bool read_int(JsonObject obj, const char* key, std::optional<T>& field) {
  JsonVariant v = obj[key];
  if (v.isNull()) return true;                 // absent: keep default
  if (v.is<unsigned long long>()) {
    field = clamp_unsigned<T>(v.as<unsigned long long>());
    return true;
  }
  if (!v.is<long long>()) return false;        // floats, strings, bools rejected
  field = clamp_signed<T>(v.as<long long>());
  return true;
}

#else

// Integers only.
template <typename T>
bool read_int(const json& j, const char* key, std::optional<T>& field) {
  auto it = j.find(key);
  if (it == j.end()) return true;              // absent: keep default
  if (!it->is_number_integer()) return false;  // floats, strings, bools rejected

  if (it->is_number_unsigned()) field = clamp_unsigned<T>(it->get<uint64_t>());
  else                          field = clamp_signed<T>(it->get<int64_t>());
  return true;
}

#endif

} // namespace

ErrorCode parse_protocol_json(const std::string& text, ProtocolOverrides& out) {
  ProtocolOverrides ov;
#ifdef ARDUINO
  // Embedded path: fixed-size buffer to bound memory usage
  StaticJsonDocument<256> doc;
  auto error = deserializeJson(doc, text);
  if (error || !doc.is<JsonObject>()) {
    return ErrorCode::ConfigParse;
  }
  JsonObject j = doc.as<JsonObject>();
#else
  // Desktop path: full-featured parsing, exceptions contained here
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error&) {
    return ErrorCode::ConfigParse;
  }
  if (!j.is_object()) return ErrorCode::ConfigParse;
#endif

  if (!read_int(j, KEY_END, ov.end_byte) ||
      !read_int(j, KEY_ESC, ov.esc_byte) ||
      !read_int(j, KEY_ESC_END, ov.esc_end_byte) ||
      !read_int(j, KEY_ESC_ESC, ov.esc_esc_byte) ||
      !read_int(j, KEY_MAX_LENGTH, ov.message_max_length)) {
    return ErrorCode::ConfigParse;
  }

  out = ov;
  return ErrorCode::Ok;
}

ErrorCode load_protocol_file(const std::string& path, ProtocolDefinition& out) {
#ifdef ARDUINO
  (void)path;
  (void)out;
  return ErrorCode::ConfigParse;               // no filesystem on the embedded path
#else
  std::ifstream in(path);
  if (!in) return ErrorCode::ConfigParse;
  std::ostringstream ss;
  ss << in.rdbuf();

  ProtocolOverrides ov;
  const ErrorCode rc = parse_protocol_json(ss.str(), ov);
  if (rc != ErrorCode::Ok) return rc;
  return resolve_protocol(ov, out);
#endif
}

std::string to_json(const ProtocolDefinition& def) {
#ifdef ARDUINO
  StaticJsonDocument<256> doc;
  doc[KEY_END]        = def.end_byte;
  doc[KEY_ESC]        = def.esc_byte;
  doc[KEY_ESC_END]    = def.esc_end_byte;
  doc[KEY_ESC_ESC]    = def.esc_esc_byte;
  doc[KEY_MAX_LENGTH] = static_cast<unsigned long>(def.message_max_length);
  std::string s;
  serializeJson(doc, s);
  return s;
#else
  json j;
  j[KEY_END]        = def.end_byte;
  j[KEY_ESC]        = def.esc_byte;
  j[KEY_ESC_END]    = def.esc_end_byte;
  j[KEY_ESC_ESC]    = def.esc_esc_byte;
  j[KEY_MAX_LENGTH] = def.message_max_length;
  return j.dump();
#endif
}

} // namespace config
} // namespace slipframe
