#include "pattern.hpp"
#include "utils/hex_utils.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace sk1p::engine {

namespace {

constexpr std::string_view k_comment_markers[] = {"--", "//", "#", ";"};

// cut each line at its first comment marker
std::string strip_comments(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  while (!text.empty()) {
    size_t newline = text.find('\n');
    std::string_view line = text.substr(0, newline);
    text = newline == std::string_view::npos ? std::string_view() : text.substr(newline + 1);

    size_t cut = line.size();
    for (std::string_view marker : k_comment_markers) {
      cut = std::min(cut, line.find(marker));
    }
    out.append(line.substr(0, cut));
    out.push_back('\n');
  }

  return out;
}

} // namespace

result<std::vector<uint8_t>> parse_hex_pattern(std::string_view hex) {
  const std::string body = strip_comments(hex);

  std::vector<uint8_t> bytes;
  bytes.reserve(body.size() / 2);
  int high = -1;

  for (char c : body) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    int value = utils::hex_digit_value(c);
    if (value < 0) {
      return error_result<std::vector<uint8_t>>(
          error_code::invalid_pattern, std::string("invalid hex digit '") + c + "' in pattern"
      );
    }
    if (high < 0) {
      high = value;
    } else {
      bytes.push_back(static_cast<uint8_t>((high << 4) | value));
      high = -1;
    }
  }

  if (high >= 0) {
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "hex pattern has an odd number of digits");
  }
  if (bytes.empty()) {
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "hex pattern has no bytes");
  }

  return ok_result(std::move(bytes));
}

result<std::vector<uint8_t>> literal_pattern(std::string_view text) {
  if (text.empty()) {
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "pattern must not be empty");
  }
  return ok_result(std::vector<uint8_t>(text.begin(), text.end()));
}

} // namespace sk1p::engine
