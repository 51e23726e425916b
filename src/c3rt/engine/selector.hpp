#pragma once

#include "engine/types.hpp"

namespace c3rt::engine {

// resolve requested bundle indices against a scan of bundle_count bundles.
// nullopt selects everything in scan order. negative indices count from the
// end. duplicates keep their first occurrence and the result follows request
// order, not scan order. an explicitly empty list is rejected.
result<std::vector<size_t>> resolve_selection(size_t bundle_count, const selection& requested);

} // namespace c3rt::engine
