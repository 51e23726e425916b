#pragma once

#include "engine/bundle_scanner.hpp"
#include "engine/patcher.hpp"
#include "engine/plan_builder.hpp"
#include "engine/selector.hpp"
#include "engine/types.hpp"
#include <optional>
#include <span>

namespace c3rt::engine {

struct patch_request {
  selection indices;
  std::span<const uint8_t> replacement;
  patch_options options;
};

// one scan of one blob, reused by selection, planning and patching
class session {
public:
  static session for_blob(std::span<const uint8_t> blob);

  size_t blob_size() const noexcept { return blob_.size(); }

  result<std::vector<bundle>> scan() const;
  result<std::vector<size_t>> select(const selection& requested) const;
  result<patch_plan> plan(const patch_request& request) const;
  result<patch_report> patch(const patch_request& request) const;

private:
  explicit session(std::span<const uint8_t> blob);

  std::span<const uint8_t> blob_;
  mutable std::optional<result<std::vector<bundle>>> scan_cache_;
};

} // namespace c3rt::engine
