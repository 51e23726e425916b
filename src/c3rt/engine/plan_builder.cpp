#include "plan_builder.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace c3rt::engine {

plan_builder::plan_builder(const std::vector<bundle>& bundles, patch_options options)
    : bundles_(bundles), options_(options) {}

plan_entry plan_builder::reconcile(size_t plan_index, size_t bundle_index, size_t replacement_size) const {
  plan_entry entry;
  entry.plan_index = plan_index;
  entry.bundle_index = bundle_index;
  entry.target = bundles_[bundle_index];
  entry.replacement_size = replacement_size;

  size_t original_size = entry.target.size();
  if (replacement_size == original_size) {
    entry.outcome = reconcile_outcome::exact_fit;
    return entry;
  }

  error_context context;
  context.plan_index = plan_index;
  context.offset = entry.target.start;
  context.original_size = original_size;
  context.replacement_size = replacement_size;

  if (replacement_size > original_size) {
    entry.outcome = reconcile_outcome::rejected;
    entry.rejection = make_status(
        error_code::oversize_replacement,
        "replacement bundle larger than original (target #" + std::to_string(plan_index) +
            "): " + std::to_string(replacement_size) + " > " + std::to_string(original_size) + " bytes",
        context
    );
    return entry;
  }

  if (options_.strict) {
    entry.outcome = reconcile_outcome::rejected;
    entry.rejection = make_status(
        error_code::undersize_replacement,
        "replacement bundle smaller than original (target #" + std::to_string(plan_index) +
            "): " + std::to_string(replacement_size) + " < " + std::to_string(original_size) +
            " bytes and strict mode is set",
        context
    );
    return entry;
  }

  entry.outcome = reconcile_outcome::padded;
  return entry;
}

result<patch_plan> plan_builder::build(const std::vector<size_t>& targets, size_t replacement_size) const {
  auto log = redlog::get_logger("c3rt.plan_builder");
  log.trc(
      "building patch plan", redlog::field("targets", targets.size()), redlog::field("bundles", bundles_.size()),
      redlog::field("replacement_size", replacement_size), redlog::field("strict", options_.strict)
  );

  patch_plan plan;
  plan.bundle_count = bundles_.size();
  plan.replacement_size = replacement_size;
  plan.strict = options_.strict;
  plan.entries.reserve(targets.size());

  for (size_t bundle_index : targets) {
    if (bundle_index >= bundles_.size()) {
      log.err("plan target does not address a bundle", redlog::field("bundle_index", bundle_index));
      error_context context;
      context.index = static_cast<int64_t>(bundle_index);
      context.bundle_count = bundles_.size();
      return error_result<patch_plan>(
          error_code::invalid_argument, "plan target " + std::to_string(bundle_index) + " is not a scanned bundle",
          context
      );
    }

    plan_entry entry = reconcile(plan.entries.size(), bundle_index, replacement_size);
    if (entry.outcome == reconcile_outcome::rejected) {
      log.wrn(
          "plan entry rejected", redlog::field("plan_index", entry.plan_index),
          redlog::field("range", utils::format_range(entry.target.start, entry.target.end)),
          redlog::field("reason", error_code_name(entry.rejection.code))
      );
    } else {
      log.dbg(
          "plan entry", redlog::field("plan_index", entry.plan_index), redlog::field("bundle_index", bundle_index),
          redlog::field("range", utils::format_range(entry.target.start, entry.target.end)),
          redlog::field("outcome", reconcile_outcome_name(entry.outcome)), redlog::field("padding", entry.padding())
      );
    }
    plan.entries.push_back(std::move(entry));
  }

  log.dbg(
      "built patch plan", redlog::field("entries", plan.entries.size()), redlog::field("accepted", plan.accepted())
  );
  return ok_result(plan);
}

} // namespace c3rt::engine
