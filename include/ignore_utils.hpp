#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace ignore {

/** Name of the per-repository ignore file read from the repository root. */
constexpr const char* IGNORE_FILE_NAME = ".wscheck.ignore";

/**
 * Read a list of ignore patterns from a file.
 *
 * Each non-empty line is trimmed and kept as one pattern. Lines beginning
 * with '#' are comments. A trailing carriage return is stripped. Missing or
 * unreadable files result in an empty list.
 */
std::vector<std::string> read_ignore_file(const std::filesystem::path& file);

/**
 * Test @p path against shell-style patterns.
 *
 * A pattern without a '/' is matched against the final path component, a
 * pattern containing '/' against the whole generic path. Patterns without
 * wildcards must match exactly.
 */
bool matches(const std::filesystem::path& path, const std::vector<std::string>& patterns);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
