#include "file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace c3rt::utils {

std::optional<std::vector<uint8_t>> read_file(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::vector<uint8_t> data;
  data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::nullopt;
  }
  return data;
}

bool write_file(const std::string& file_path, const std::vector<uint8_t>& data) {
  // stage next to the destination so the rename stays on one filesystem
  std::string staging_path = file_path + ".c3rt-tmp";
  std::error_code ec;

  {
    std::ofstream file(staging_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (file.fail()) {
      std::filesystem::remove(staging_path, ec);
      return false;
    }
  }

  std::filesystem::rename(staging_path, file_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(staging_path, cleanup_ec);
    return false;
  }
  return true;
}

bool file_exists(const std::string& file_path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(file_path, ec);
}

} // namespace c3rt::utils
