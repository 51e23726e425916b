#pragma once

#include <string>
#include <cstdint>

namespace c3rt::utils {

// offset formatting
std::string format_address(uint64_t address);
std::string format_range(uint64_t start, uint64_t end);

} // namespace c3rt::utils
