#include "pretty_hexdump.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace c3rt::utils {

namespace {

constexpr auto offset_color = redlog::color::bright_cyan;
constexpr auto byte_color = redlog::color::white;
constexpr auto ascii_color = redlog::color::bright_black;
constexpr auto highlight_color = redlog::color::bright_green;

// renders [first, last) of data, where data[0] sits at base; bytes in [mark_first, mark_last) are highlighted
void render_rows(
    std::ostringstream& out, const uint8_t* data, uint64_t base, uint64_t first, uint64_t last, uint64_t mark_first,
    uint64_t mark_last, const hexdump_options& opts
) {
  size_t rows = 0;
  for (uint64_t row = first; row < last; row += opts.bytes_per_line) {
    if (rows++ >= opts.max_lines) {
      out << "... (truncated, " << (last - row) << " more bytes)\n";
      return;
    }

    uint64_t row_end = std::min<uint64_t>(row + opts.bytes_per_line, last);

    std::ostringstream offset;
    offset << std::hex << std::setw(8) << std::setfill('0') << row << ":";
    out << redlog::detail::colorize(offset.str(), offset_color) << "  ";

    std::string ascii;
    for (uint64_t pos = row; pos < row + opts.bytes_per_line; ++pos) {
      if (pos > row) {
        out << (pos - row == 8 ? "  " : " ");
      }
      if (pos >= row_end) {
        out << "  ";
        continue;
      }

      uint8_t byte = data[pos - base];
      bool marked = pos >= mark_first && pos < mark_last;

      std::ostringstream hex;
      hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
      out << redlog::detail::colorize(hex.str(), marked ? highlight_color : byte_color);

      char shown = (byte >= 32 && byte <= 126) ? static_cast<char>(byte) : '.';
      ascii += redlog::detail::colorize(std::string(1, shown), marked ? highlight_color : ascii_color);
    }

    if (opts.show_ascii) {
      out << "  |" << ascii << "|";
    }
    out << "\n";
  }
}

} // namespace

std::string format_hexdump(const uint8_t* data, size_t size, uint64_t base_offset, const hexdump_options& opts) {
  if (!data || size == 0 || opts.bytes_per_line == 0) {
    return "";
  }

  std::ostringstream out;
  render_rows(out, data, base_offset, base_offset, base_offset + size, 0, 0, opts);
  return out.str();
}

std::string format_boundary_hexdump(
    const uint8_t* data, size_t data_size, size_t boundary, size_t highlight_size, const hexdump_options& opts
) {
  if (!data || data_size == 0 || boundary > data_size || opts.bytes_per_line == 0) {
    return "";
  }

  size_t mark_last = std::min(data_size, boundary + highlight_size);
  size_t first = boundary >= opts.context_bytes ? boundary - opts.context_bytes : 0;
  size_t last = std::min(data_size, mark_last + opts.context_bytes);

  std::ostringstream out;
  render_rows(out, data, 0, first, last, boundary, mark_last, opts);
  return out.str();
}

} // namespace c3rt::utils
