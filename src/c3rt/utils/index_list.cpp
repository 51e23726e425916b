#include "index_list.hpp"
#include <cctype>
#include <charconv>
#include <sstream>

namespace c3rt::utils {

namespace {

std::string trim(const std::string& token) {
  size_t first = 0;
  while (first < token.size() && std::isspace(static_cast<unsigned char>(token[first]))) {
    ++first;
  }
  size_t last = token.size();
  while (last > first && std::isspace(static_cast<unsigned char>(token[last - 1]))) {
    --last;
  }
  return token.substr(first, last - first);
}

} // namespace

std::optional<std::vector<int64_t>> parse_index_list(const std::string& text) {
  std::vector<int64_t> indices;
  std::istringstream stream(text);
  std::string token;

  while (std::getline(stream, token, ',')) {
    std::string cleaned = trim(token);
    if (cleaned.empty()) {
      continue;
    }

    const char* begin = cleaned.data();
    const char* end = cleaned.data() + cleaned.size();
    if (*begin == '+') {
      ++begin;
      if (begin == end || *begin == '-') {
        return std::nullopt;
      }
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
      return std::nullopt;
    }
    indices.push_back(value);
  }

  return indices;
}

std::string format_index_list(const std::vector<int64_t>& indices) {
  std::ostringstream oss;
  for (size_t i = 0; i < indices.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << indices[i];
  }
  return oss.str();
}

} // namespace c3rt::utils
