#pragma once

#include <string>

#include "slipframe/errors.hpp"
#include "slipframe/protocol.hpp"

namespace slipframe {
namespace config {

/**
 * @brief Parse a JSON protocol description into overrides.
 * @param text  JSON object; recognised keys are endByte, escByte, escEndByte,
 *              escEscByte and messageMaxLength. Other keys are ignored.
 * @param out   receives the keys that were present; untouched on failure
 * @return ErrorCode::Ok, or ErrorCode::ConfigParse for malformed JSON, a
 *         non-object root, or a recognised key whose value is not an integer.
 *         Range checks happen later in resolve_protocol().
 */
ErrorCode parse_protocol_json(const std::string& text, ProtocolOverrides& out);

/**
 * @brief Read, parse and resolve a protocol file in one step.
 * @param path  file holding the JSON object described above
 * @param out   resolved definition; untouched on failure
 * @return ErrorCode::ConfigParse if the file cannot be read or parsed,
 *         otherwise whatever resolve_protocol() returns.
 */
ErrorCode load_protocol_file(const std::string& path, ProtocolDefinition& out);

/**
 * @brief Serialise a resolved definition with the same key names.
 * @return A JSON object string, e.g. {"endByte":192,...}.
 */
std::string to_json(const ProtocolDefinition& def);

} // namespace config
} // namespace slipframe
