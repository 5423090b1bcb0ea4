#pragma once
/**
 * @file hex.hpp
 * @brief Hex text <-> bytes, for the CLI and for log lines.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace slipframe {
namespace hex {

/**
 * @brief Format bytes as uppercase hex pairs.
 * @param bytes  input
 * @param sep    separator between pairs; '\0' for none
 * @return e.g. "01 DB DC 02 C0"
 */
std::string to_hex(const std::vector<uint8_t>& bytes, char sep = ' ');

/**
 * @brief Parse hex text into bytes.
 *
 * Accepts upper or lower case digits, an optional leading "0x", and spaces,
 * tabs, ':' or '-' between pairs. A pair may not be split by a separator.
 *
 * @param text  input
 * @param out   cleared, then filled; left empty on failure
 * @return false on a non-hex character or an odd digit count
 */
bool from_hex(const std::string& text, std::vector<uint8_t>& out);

} // namespace hex
} // namespace slipframe
