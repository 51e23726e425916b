#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace c3rt::utils {

/**
 * options for controlling hexdump formatting and appearance.
 */
struct hexdump_options {
  size_t bytes_per_line = 16; // number of bytes to display per line
  bool show_ascii = true;     // include ascii representation column
  size_t context_bytes = 16;  // context bytes around a highlighted range
  size_t max_lines = 8;       // maximum lines to display (prevents spam)
};

/**
 * plain hexdump of a byte range.
 *
 * @param data pointer to data to dump
 * @param size number of bytes to dump
 * @param base_offset offset of data[0] within the blob, used for display
 * @param opts formatting options
 * @return formatted hexdump string, empty when there is nothing to dump
 */
std::string format_hexdump(
    const uint8_t* data, size_t size, uint64_t base_offset = 0, const hexdump_options& opts = {}
);

/**
 * hexdump of a boundary inside the blob with surrounding context.
 * bytes in [boundary, boundary + highlight_size) are highlighted.
 *
 * @param data full blob
 * @param data_size blob size
 * @param boundary offset of the first highlighted byte
 * @param highlight_size number of highlighted bytes
 * @param opts formatting options, context_bytes controls the surrounding window
 */
std::string format_boundary_hexdump(
    const uint8_t* data, size_t data_size, size_t boundary, size_t highlight_size, const hexdump_options& opts = {}
);

} // namespace c3rt::utils
