#include "session.hpp"
#include <redlog.hpp>

namespace c3rt::engine {

session::session(std::span<const uint8_t> blob) : blob_(blob) {}

session session::for_blob(std::span<const uint8_t> blob) { return session(blob); }

result<std::vector<bundle>> session::scan() const {
  if (!scan_cache_) {
    bundle_scanner scanner(blob_);
    scan_cache_ = scanner.scan();
  }
  return *scan_cache_;
}

result<std::vector<size_t>> session::select(const selection& requested) const {
  auto bundles = scan();
  if (!bundles.ok()) {
    return error_result<std::vector<size_t>>(bundles.status);
  }
  return resolve_selection(bundles.value.size(), requested);
}

result<patch_plan> session::plan(const patch_request& request) const {
  auto log = redlog::get_logger("c3rt.session");

  auto bundles = scan();
  if (!bundles.ok()) {
    return error_result<patch_plan>(bundles.status);
  }
  if (bundles.value.empty()) {
    log.err("no certificate bundles found", redlog::field("blob_size", blob_.size()));
    error_context context;
    context.bundle_count = 0;
    return error_result<patch_plan>(
        error_code::no_bundles_found, "no certificate bundles found in input binary", context
    );
  }

  auto targets = resolve_selection(bundles.value.size(), request.indices);
  if (!targets.ok()) {
    return error_result<patch_plan>(targets.status);
  }

  plan_builder builder(bundles.value, request.options);
  return builder.build(targets.value, request.replacement.size());
}

result<patch_report> session::patch(const patch_request& request) const {
  auto log = redlog::get_logger("c3rt.session");

  auto planned = plan(request);
  if (!planned.ok()) {
    return error_result<patch_report>(planned.status);
  }

  auto report = apply_plan(blob_, planned.value, request.replacement);
  if (report.ok()) {
    log.inf(
        "bundles patched", redlog::field("patched", report.value.patched),
        redlog::field("bundles", report.value.total_bundles)
    );
  }
  return report;
}

} // namespace c3rt::engine
