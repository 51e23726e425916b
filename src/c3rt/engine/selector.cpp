#include "selector.hpp"
#include "utils/index_list.hpp"
#include <redlog.hpp>
#include <unordered_set>

namespace c3rt::engine {

result<std::vector<size_t>> resolve_selection(size_t bundle_count, const selection& requested) {
  auto log = redlog::get_logger("c3rt.selector");

  std::vector<size_t> targets;
  if (!requested) {
    targets.reserve(bundle_count);
    for (size_t i = 0; i < bundle_count; ++i) {
      targets.push_back(i);
    }
    log.trc("selected all bundles", redlog::field("count", bundle_count));
    return ok_result(targets);
  }

  if (requested->empty()) {
    log.err("empty bundle selection");
    error_context context;
    context.bundle_count = bundle_count;
    return error_result<std::vector<size_t>>(error_code::empty_selection, "no bundle indices requested", context);
  }

  const int64_t count = static_cast<int64_t>(bundle_count);
  std::unordered_set<size_t> seen;
  for (int64_t index : *requested) {
    int64_t normalized = index < 0 ? count + index : index;
    if (normalized < 0 || normalized >= count) {
      log.err("bundle index out of range", redlog::field("index", index), redlog::field("count", bundle_count));
      error_context context;
      context.index = index;
      context.bundle_count = bundle_count;
      return error_result<std::vector<size_t>>(
          error_code::index_out_of_range,
          "index " + std::to_string(index) + " out of range - only " + std::to_string(bundle_count) +
              " bundle(s) present",
          context
      );
    }

    size_t target = static_cast<size_t>(normalized);
    if (seen.insert(target).second) {
      targets.push_back(target);
    } else {
      log.dbg("duplicate bundle index collapsed", redlog::field("index", index), redlog::field("bundle", target));
    }
  }

  log.trc(
      "resolved bundle selection", redlog::field("requested", utils::format_index_list(*requested)),
      redlog::field("targets", targets.size())
  );
  return ok_result(targets);
}

} // namespace c3rt::engine
