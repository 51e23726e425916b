#include "patcher.hpp"
#include "plan_builder.hpp"
#include "pretty_logging.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace c3rt::engine {

namespace {

status check_plan(std::span<const uint8_t> blob, const patch_plan& plan, size_t replacement_size) {
  if (plan.replacement_size != replacement_size) {
    error_context context;
    context.replacement_size = replacement_size;
    return make_status(
        error_code::invalid_argument, "replacement size " + std::to_string(replacement_size) +
                                          " does not match planned size " + std::to_string(plan.replacement_size),
        context
    );
  }

  for (const auto& entry : plan.entries) {
    if (entry.outcome == reconcile_outcome::rejected) {
      return entry.rejection;
    }

    if (entry.replacement_size != replacement_size) {
      error_context context;
      context.plan_index = entry.plan_index;
      context.replacement_size = replacement_size;
      return make_status(
          error_code::invalid_argument, "plan entry #" + std::to_string(entry.plan_index) + " expects " +
                                            std::to_string(entry.replacement_size) + " bytes, replacement has " +
                                            std::to_string(replacement_size),
          context
      );
    }

    const bundle& target = entry.target;
    if (target.start > target.end || target.end > blob.size() || replacement_size > target.size()) {
      error_context context;
      context.plan_index = entry.plan_index;
      context.offset = target.start;
      context.original_size = target.end >= target.start ? target.size() : 0;
      context.replacement_size = replacement_size;
      return make_status(
          error_code::invalid_argument,
          "plan entry #" + std::to_string(entry.plan_index) + " range " + utils::format_range(target.start, target.end) +
              " cannot hold the replacement inside the blob",
          context
      );
    }
  }

  return ok_status();
}

} // namespace

result<patch_report> apply_plan(
    std::span<const uint8_t> blob, const patch_plan& plan, std::span<const uint8_t> replacement
) {
  auto log = redlog::get_logger("c3rt.patcher");
  bool verbose_enabled = static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose);

  auto checked = check_plan(blob, plan, replacement.size());
  if (!checked.ok()) {
    log.err(
        "patch plan refused", redlog::field("error", error_code_name(checked.code)),
        redlog::field("message", checked.message)
    );
    return error_result<patch_report>(checked);
  }

  patch_report report;
  report.total_bundles = plan.bundle_count;
  report.output.assign(blob.begin(), blob.end());
  report.records.reserve(plan.entries.size());

  // every write stays inside [start, end), so original offsets never drift
  for (const auto& entry : plan.entries) {
    const bundle& target = entry.target;
    auto range_begin = report.output.begin() + static_cast<std::ptrdiff_t>(target.start);

    std::copy(replacement.begin(), replacement.end(), range_begin);
    std::fill(
        range_begin + static_cast<std::ptrdiff_t>(replacement.size()),
        report.output.begin() + static_cast<std::ptrdiff_t>(target.end), uint8_t{0}
    );

    patch_record record;
    record.plan_index = entry.plan_index;
    record.bundle_index = entry.bundle_index;
    record.start = target.start;
    record.end = target.end;
    record.original_size = target.size();
    record.replacement_size = replacement.size();
    record.padded = entry.outcome == reconcile_outcome::padded;

    log.inf(
        "patched bundle", redlog::field("target", entry.plan_index),
        redlog::field("range", utils::format_range(target.start, target.end)),
        redlog::field("replacement_size", record.replacement_size), redlog::field("kept", record.original_size)
    );
    if (verbose_enabled) {
      pretty_logging::log_patch_applied(log, record, report.output.data(), report.output.size());
    }

    report.records.push_back(record);
    report.patched++;
  }

  log.dbg(
      "patch plan applied", redlog::field("patched", report.patched), redlog::field("bundles", report.total_bundles),
      redlog::field("output_size", report.output.size())
  );
  return ok_result(std::move(report));
}

result<patch_report> patch_bundles(
    std::span<const uint8_t> blob, const std::vector<bundle>& bundles, const std::vector<size_t>& targets,
    std::span<const uint8_t> replacement, const patch_options& options
) {
  plan_builder builder(bundles, options);
  auto plan = builder.build(targets, replacement.size());
  if (!plan.ok()) {
    return error_result<patch_report>(plan.status);
  }
  return apply_plan(blob, plan.value, replacement);
}

} // namespace c3rt::engine
