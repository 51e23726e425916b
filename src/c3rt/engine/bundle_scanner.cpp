#include "bundle_scanner.hpp"
#include "pretty_logging.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace c3rt::engine {

bundle_scanner::bundle_scanner(std::span<const uint8_t> blob)
    : blob_(blob), begin_matcher_(k_cert_begin_marker), end_matcher_(k_cert_end_marker) {}

uint64_t bundle_scanner::skip_whitespace(uint64_t offset) const {
  while (offset < blob_.size() && is_bundle_whitespace(blob_[offset])) {
    ++offset;
  }
  return offset;
}

result<bundle> bundle_scanner::scan_one(uint64_t start) const {
  auto log = redlog::get_logger("c3rt.scanner");
  const uint8_t* data = blob_.data();
  size_t size = blob_.size();

  bundle found;
  found.start = start;

  uint64_t begin = start;
  while (true) {
    auto end_marker = end_matcher_.find(data, size, static_cast<size_t>(begin));
    if (!end_marker) {
      log.err("certificate not terminated", redlog::field("begin", utils::format_address(begin)));
      error_context context;
      context.offset = begin;
      return error_result<bundle>(
          error_code::malformed_input,
          "malformed bundle: BEGIN at " + utils::format_address(begin) + " without matching END", context
      );
    }

    found.certificates++;
    uint64_t end = skip_whitespace(*end_marker + end_matcher_.marker_size());
    found.end = end;

    // the whitespace run must be fully consumed before looking for a chained BEGIN
    if (!begin_matcher_.matches_at(data, size, static_cast<size_t>(end))) {
      break;
    }

    if (static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::trace)) {
      log.trc(
          "chained certificate merged into bundle", redlog::field("bundle_start", utils::format_address(start)),
          redlog::field("begin", utils::format_address(end))
      );
    }
    begin = end;
  }

  return ok_result(found);
}

result<std::vector<bundle>> bundle_scanner::scan() const {
  auto log = redlog::get_logger("c3rt.scanner");
  bool verbose_enabled = static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose);

  log.trc("starting bundle scan", redlog::field("blob_size", blob_.size()));

  std::vector<bundle> bundles;
  uint64_t cursor = 0;
  while (true) {
    auto begin = begin_matcher_.find(blob_.data(), blob_.size(), static_cast<size_t>(cursor));
    if (!begin) {
      break;
    }

    auto found = scan_one(*begin);
    if (!found.ok()) {
      return error_result<std::vector<bundle>>(found.status);
    }

    if (verbose_enabled) {
      pretty_logging::log_bundle_found(log, bundles.size(), found.value, blob_.data(), blob_.size());
    }

    cursor = found.value.end;
    bundles.push_back(found.value);
  }

  log.dbg("bundle scan completed", redlog::field("bundles", bundles.size()));
  return ok_result(bundles);
}

} // namespace c3rt::engine
