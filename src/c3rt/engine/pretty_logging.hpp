#pragma once

#include "engine/types.hpp"
#include "utils/hex_utils.hpp"
#include "utils/pretty_hexdump.hpp"
#include <redlog.hpp>
#include <string>

namespace c3rt::engine::pretty_logging {

inline bool level_enabled(redlog::level level) {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(level);
}

inline void log_bundle_found(redlog::logger& log, size_t index, const bundle& found, const uint8_t* data, size_t size) {
  log.vrb(
      "bundle found", redlog::field("index", index), redlog::field("range", utils::format_range(found.start, found.end)),
      redlog::field("size", found.size()), redlog::field("certificates", found.certificates)
  );

  if (!level_enabled(redlog::level::pedantic)) {
    return;
  }

  // show where the chain stops so merge boundaries can be inspected
  std::string tail_hexdump = utils::format_boundary_hexdump(data, size, static_cast<size_t>(found.end), 1);
  if (!tail_hexdump.empty()) {
    log.ped(redlog::fmt("bundle end\n%s", tail_hexdump));
  }
}

inline void log_patch_applied(redlog::logger& log, const patch_record& record, const uint8_t* output, size_t size) {
  log.vrb(
      "bundle patched", redlog::field("plan_index", record.plan_index),
      redlog::field("bundle_index", record.bundle_index),
      redlog::field("range", utils::format_range(record.start, record.end)),
      redlog::field("replacement_size", record.replacement_size), redlog::field("padded", record.padded)
  );

  if (!level_enabled(redlog::level::debug)) {
    return;
  }

  // replacement tail followed by its zero padding
  size_t replacement_end = static_cast<size_t>(record.start) + record.replacement_size;
  std::string patch_hexdump =
      utils::format_boundary_hexdump(output, size, replacement_end, record.original_size - record.replacement_size);
  if (!patch_hexdump.empty()) {
    log.dbg(redlog::fmt("patched range end\n%s", patch_hexdump));
  }
}

} // namespace c3rt::engine::pretty_logging
