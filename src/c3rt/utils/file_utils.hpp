#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c3rt::utils {

// whole-file byte source and sink
std::optional<std::vector<uint8_t>> read_file(const std::string& file_path);
// replaces file_path only once every byte is written; a failed write leaves no output behind
bool write_file(const std::string& file_path, const std::vector<uint8_t>& data);
bool file_exists(const std::string& file_path);

} // namespace c3rt::utils
