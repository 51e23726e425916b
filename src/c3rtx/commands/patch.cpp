#include "patch.hpp"
#include <c3rt/c3rt.hpp>
#include <redlog.hpp>
#include <iostream>

namespace c3rtx::commands {

int patch(
    const std::string& input_file, const std::string& certs_file, const std::string& output_file,
    const std::optional<std::vector<int64_t>>& indices, bool strict
) {
  auto log = redlog::get_logger("c3rtx.commands.patch");

  log.inf(
      "patching certificate bundles", redlog::field("input", input_file), redlog::field("certs", certs_file),
      redlog::field("output", output_file),
      redlog::field("index", indices ? c3rt::utils::format_index_list(*indices) : "all"),
      redlog::field("strict", strict)
  );

  if (!c3rt::utils::file_exists(input_file)) {
    log.err("input file not found", redlog::field("path", input_file));
    std::cerr << "error: input file not found: " << input_file << std::endl;
    return 1;
  }

  auto blob = c3rt::utils::read_file(input_file);
  if (!blob) {
    log.err("failed to read input file", redlog::field("path", input_file));
    std::cerr << "error: could not read input file: " << input_file << std::endl;
    return 1;
  }

  if (!c3rt::utils::file_exists(certs_file)) {
    log.err("replacement bundle not found", redlog::field("path", certs_file));
    std::cerr << "error: replacement bundle not found: " << certs_file << std::endl;
    return 1;
  }

  auto replacement = c3rt::utils::read_file(certs_file);
  if (!replacement) {
    log.err("failed to read replacement bundle", redlog::field("path", certs_file));
    std::cerr << "error: could not read replacement bundle: " << certs_file << std::endl;
    return 1;
  }

  c3rt::engine::patch_request request;
  request.indices = indices;
  request.replacement = *replacement;
  request.options.strict = strict;

  auto sess = c3rt::engine::session::for_blob(*blob);
  auto report = sess.patch(request);
  if (!report.ok()) {
    log.err(
        "patch failed", redlog::field("error", c3rt::engine::error_code_name(report.status.code)),
        redlog::field("message", report.status.message)
    );
    std::cerr << "error: " << report.status.message << std::endl;
    return 1;
  }

  for (const auto& record : report.value.records) {
    std::cout << "patched bundle #" << record.plan_index << " @" << c3rt::utils::format_range(record.start, record.end)
              << " with " << record.replacement_size << " bytes (kept " << record.original_size << ")" << std::endl;
  }

  if (!c3rt::utils::write_file(output_file, report.value.output)) {
    log.err("failed to write output file", redlog::field("path", output_file));
    std::cerr << "error: failed to write output file: " << output_file << std::endl;
    return 1;
  }

  std::cout << output_file << " written: " << report.value.patched << " of " << report.value.total_bundles
            << " bundle(s) patched" << std::endl;
  return 0;
}

} // namespace c3rtx::commands
