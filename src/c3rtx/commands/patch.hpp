#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c3rtx::commands {

/**
 * @brief Replace embedded certificate bundles in a file
 *
 * @param input_file Path to input binary file
 * @param certs_file Path to replacement PEM bundle
 * @param output_file Path to output binary file, written only on success
 * @param indices Bundle indices to patch, nullopt for all
 * @param strict Refuse replacements shorter than the original bundle
 * @return 0 for success, 1 for failure
 */
int patch(
    const std::string& input_file, const std::string& certs_file, const std::string& output_file,
    const std::optional<std::vector<int64_t>>& indices, bool strict
);

} // namespace c3rtx::commands
