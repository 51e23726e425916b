#include "scan.hpp"
#include <c3rt/c3rt.hpp>
#include <redlog.hpp>
#include <iostream>

namespace c3rtx::commands {

int scan(const std::string& input_file, bool dump) {
  auto log = redlog::get_logger("c3rtx.commands.scan");

  log.inf("scanning for certificate bundles", redlog::field("input", input_file));

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

  auto sess = c3rt::engine::session::for_blob(*blob);
  auto bundles = sess.scan();
  if (!bundles.ok()) {
    log.err("scan failed", redlog::field("error", bundles.status.message));
    std::cerr << "error: " << bundles.status.message << std::endl;
    return 1;
  }

  if (bundles.value.empty()) {
    std::cout << "no certificate bundles found" << std::endl;
    return 0;
  }

  for (size_t i = 0; i < bundles.value.size(); ++i) {
    const auto& found = bundles.value[i];
    std::cout << "bundle #" << i << " @" << c3rt::utils::format_range(found.start, found.end) << " size "
              << found.size() << " certificates " << found.certificates << std::endl;

    if (dump) {
      std::cout << c3rt::utils::format_hexdump(blob->data() + found.start, found.size(), found.start, {16, true, 0, 4});
    }
  }

  std::cout << bundles.value.size() << " bundle(s) found in " << sess.blob_size() << " bytes" << std::endl;
  return 0;
}

} // namespace c3rtx::commands
