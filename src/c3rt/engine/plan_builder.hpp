#pragma once

#include "engine/types.hpp"

namespace c3rt::engine {

class plan_builder {
public:
  plan_builder(const std::vector<bundle>& bundles, patch_options options);

  // pair each target, in the given order, with its reconciliation outcome.
  // rejections are recorded in the plan rather than failing the build.
  result<patch_plan> build(const std::vector<size_t>& targets, size_t replacement_size) const;

private:
  const std::vector<bundle>& bundles_;
  patch_options options_;

  plan_entry reconcile(size_t plan_index, size_t bundle_index, size_t replacement_size) const;
};

} // namespace c3rt::engine
