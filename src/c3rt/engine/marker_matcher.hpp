#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace c3rt::engine {

// literal byte marker search with Boyer-Moore-Horspool
class marker_matcher {
public:
  explicit marker_matcher(std::string_view marker);

  // first occurrence at or after from
  std::optional<uint64_t> find(const uint8_t* data, size_t size, size_t from = 0) const;

  // true when the marker starts exactly at pos
  bool matches_at(const uint8_t* data, size_t size, size_t pos) const;

  size_t marker_size() const { return marker_.size(); }

  bool is_valid() const { return !marker_.empty(); }

private:
  std::vector<uint8_t> marker_;
  std::array<size_t, 256> shift_table_{};

  void build_shift_table();
};

} // namespace c3rt::engine
