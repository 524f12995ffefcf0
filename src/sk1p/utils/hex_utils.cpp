#include "hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace sk1p::utils {

namespace {

constexpr char k_hex_digits[] = "0123456789abcdef";

void append_hex(std::string& out, uint8_t byte) {
  out.push_back(k_hex_digits[byte >> 4]);
  out.push_back(k_hex_digits[byte & 0x0f]);
}

} // namespace

std::string format_offset(uint64_t offset) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(8) << std::setfill('0') << offset;
  return oss.str();
}

std::string format_bytes(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    append_hex(out, bytes[i]);
  }
  return out;
}

std::string escape_bytes(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (uint8_t byte : bytes) {
    if (byte == '\\') {
      out += "\\\\";
    } else if (byte >= 0x20 && byte <= 0x7e) {
      out.push_back(static_cast<char>(byte));
    } else {
      out += "\\x";
      append_hex(out, byte);
    }
  }
  return out;
}

int hex_digit_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace sk1p::utils
