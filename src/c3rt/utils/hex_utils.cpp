#include "hex_utils.hpp"
#include <sstream>

namespace c3rt::utils {

std::string format_address(uint64_t address) {
  std::ostringstream oss;
  oss << "0x" << std::uppercase << std::hex << address;
  return oss.str();
}

std::string format_range(uint64_t start, uint64_t end) { return format_address(start) + "-" + format_address(end); }

} // namespace c3rt::utils
