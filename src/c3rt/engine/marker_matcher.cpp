#include "marker_matcher.hpp"

namespace c3rt::engine {

marker_matcher::marker_matcher(std::string_view marker) : marker_(marker.begin(), marker.end()) {
  build_shift_table();
}

void marker_matcher::build_shift_table() {
  const size_t marker_len = marker_.size();
  if (marker_len == 0) {
    return;
  }

  shift_table_.fill(marker_len);

  for (size_t i = 0; i + 1 < marker_len; ++i) {
    shift_table_[marker_[i]] = marker_len - 1 - i;
  }
}

std::optional<uint64_t> marker_matcher::find(const uint8_t* data, size_t size, size_t from) const {
  if (!is_valid() || !data || from > size || size - from < marker_.size()) {
    return std::nullopt;
  }

  const size_t marker_len = marker_.size();
  size_t i = from;
  while (i + marker_len <= size) {
    if (matches_at(data, size, i)) {
      return i;
    }
    size_t skip = shift_table_[data[i + marker_len - 1]];
    if (skip == 0) {
      skip = 1;
    }
    i += skip;
  }

  return std::nullopt;
}

bool marker_matcher::matches_at(const uint8_t* data, size_t size, size_t pos) const {
  const size_t marker_len = marker_.size();
  if (!is_valid() || !data || pos > size || size - pos < marker_len) {
    return false;
  }
  for (size_t i = marker_len; i-- > 0;) {
    if (marker_[i] != data[pos + i]) {
      return false;
    }
  }
  return true;
}

} // namespace c3rt::engine
