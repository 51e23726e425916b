#pragma once

#include "engine/marker_matcher.hpp"
#include "engine/types.hpp"
#include <span>

namespace c3rt::engine {

// finds every pem certificate bundle in a blob.
// back-to-back certificates separated only by space, tab, cr or lf merge into
// one bundle; any other byte between them starts a new one.
class bundle_scanner {
public:
  explicit bundle_scanner(std::span<const uint8_t> blob);

  // bundles in increasing, non-overlapping order; fails with malformed_input
  // when a BEGIN marker has no END marker after it
  result<std::vector<bundle>> scan() const;

private:
  std::span<const uint8_t> blob_;
  marker_matcher begin_matcher_;
  marker_matcher end_matcher_;

  result<bundle> scan_one(uint64_t start) const;
  uint64_t skip_whitespace(uint64_t offset) const;
};

} // namespace c3rt::engine
