#pragma once

#include <string>

namespace c3rtx::commands {

/**
 * @brief List the certificate bundles embedded in a file
 *
 * @param input_file Path to input binary file
 * @param dump Print a hexdump of the head of each bundle
 * @return 0 for success, 1 for failure
 */
int scan(const std::string& input_file, bool dump);

} // namespace c3rtx::commands
