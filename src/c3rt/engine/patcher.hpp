#pragma once

#include "engine/types.hpp"
#include <span>

namespace c3rt::engine {

// build the patched copy of blob. nothing is produced unless every entry in
// the plan is accepted; each range receives the replacement followed by zero
// padding so the output is exactly as long as the input.
result<patch_report> apply_plan(
    std::span<const uint8_t> blob, const patch_plan& plan, std::span<const uint8_t> replacement
);

// plan and apply in one step against a completed scan
result<patch_report> patch_bundles(
    std::span<const uint8_t> blob, const std::vector<bundle>& bundles, const std::vector<size_t>& targets,
    std::span<const uint8_t> replacement, const patch_options& options
);

} // namespace c3rt::engine
