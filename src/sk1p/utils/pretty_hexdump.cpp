#include "pretty_hexdump.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sk1p::utils {

namespace {

constexpr auto offset_color = redlog::color::bright_cyan;
constexpr auto byte_color = redlog::color::white;
constexpr auto ascii_color = redlog::color::bright_black;
constexpr auto match_color = redlog::color::bright_green;

// half-open byte range to highlight, in the same coordinates as the dumped offsets
struct highlight {
  uint64_t begin = 0;
  uint64_t end = 0;

  bool contains(uint64_t offset) const noexcept { return offset >= begin && offset < end; }
};

std::string hex_pair(uint8_t byte) {
  std::ostringstream oss;
  oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  return oss.str();
}

void render_line(
    std::ostringstream& out, std::span<const uint8_t> line, uint64_t offset, const highlight& marked,
    const hexdump_options& opts
) {
  std::ostringstream label;
  label << std::hex << std::setw(8) << std::setfill('0') << offset << ":";
  out << redlog::detail::colorize(label.str(), offset_color) << "  ";

  for (size_t i = 0; i < opts.bytes_per_line; ++i) {
    if (i > 0) {
      out << (i == 8 ? "  " : " ");
    }
    if (i < line.size()) {
      auto color = marked.contains(offset + i) ? match_color : byte_color;
      out << redlog::detail::colorize(hex_pair(line[i]), color);
    } else {
      out << "  ";
    }
  }

  if (opts.show_ascii) {
    out << "  |";
    for (size_t i = 0; i < line.size(); ++i) {
      char c = (line[i] >= 0x20 && line[i] <= 0x7e) ? static_cast<char>(line[i]) : '.';
      auto color = marked.contains(offset + i) ? match_color : ascii_color;
      out << redlog::detail::colorize(std::string(1, c), color);
    }
    out << "|";
  }

  out << "\n";
}

std::string render(
    std::span<const uint8_t> data, uint64_t base_offset, const highlight& marked, const hexdump_options& opts
) {
  if (data.empty() || opts.bytes_per_line == 0) {
    return "";
  }

  std::ostringstream out;
  size_t lines = 0;
  for (size_t pos = 0; pos < data.size(); pos += opts.bytes_per_line) {
    if (lines == opts.max_lines) {
      out << "... (" << (data.size() - pos) << " more bytes)\n";
      break;
    }
    auto line = data.subspan(pos, std::min(opts.bytes_per_line, data.size() - pos));
    render_line(out, line, base_offset + pos, marked, opts);
    ++lines;
  }
  return out.str();
}

} // namespace

std::string format_hexdump(std::span<const uint8_t> data, uint64_t base_offset, const hexdump_options& opts) {
  return render(data, base_offset, highlight{}, opts);
}

std::string format_match_hexdump(
    std::span<const uint8_t> text, size_t match_offset, size_t match_size, const hexdump_options& opts
) {
  if (match_offset >= text.size()) {
    return "";
  }

  size_t begin = match_offset - std::min(match_offset, opts.context_bytes);
  size_t end = std::min(text.size(), match_offset + match_size + opts.context_bytes);
  return render(text.subspan(begin, end - begin), begin, highlight{match_offset, match_offset + match_size}, opts);
}

} // namespace sk1p::utils
