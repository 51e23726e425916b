#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c3rt::utils {

// parse a comma separated list of signed integers ("0, 2,-1").
// blank tokens are skipped, so "" parses to an empty list.
// returns nullopt when any token is not an integer.
std::optional<std::vector<int64_t>> parse_index_list(const std::string& text);

std::string format_index_list(const std::vector<int64_t>& indices);

} // namespace c3rt::utils
