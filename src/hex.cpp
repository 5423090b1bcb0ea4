#include "slipframe/hex.hpp"

#include <iomanip>
#include <sstream>

namespace slipframe {
namespace hex {

namespace {

int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_sep(char c) {
  return c == ' ' || c == '\t' || c == ':' || c == '-';
}

} // namespace

std::string to_hex(const std::vector<uint8_t>& bytes, char sep) {
  std::ostringstream os;
  os << std::uppercase << std::hex << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0 && sep != '\0') os << sep;
    os << std::setw(2) << static_cast<unsigned>(bytes[i]);
  }
  return os.str();
}

bool from_hex(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  size_t i = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) i = 2;

  while (i < text.size()) {
    if (is_sep(text[i])) { ++i; continue; }

    if (i + 1 >= text.size()) { out.clear(); return false; }   // dangling digit
    const int hi = nibble(text[i]);
    const int lo = nibble(text[i + 1]);
    if (hi < 0 || lo < 0) { out.clear(); return false; }

    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    i += 2;
  }
  return true;
}

} // namespace hex
} // namespace slipframe
