#ifndef FILE_FIXER_HPP
#define FILE_FIXER_HPP
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include "options.hpp"

namespace ws {

/** Tab stops used when expanding tabs. Not configurable. */
constexpr size_t TAB_WIDTH = 4;

/** Suffix of the temporary sibling written before replacing a file. */
constexpr const char* TEMP_SUFFIX = ".wscheck-tmp";

/**
 * Raised when a fixed file cannot be written back. Aborts the whole batch;
 * files fixed earlier in the run stay fixed.
 */
class fix_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Produce the corrected form of a buffer.
 *
 * Per line: tabs are expanded to the next multiple of TAB_WIDTH (every byte
 * advances the column by one), carriage returns are removed, then the
 * trailing run of spaces and tabs is removed. Line feeds are kept as they
 * are, including a missing one on the last line.
 */
std::string fix_content(std::string_view content);

/** @return `<path>.wscheck-tmp`. */
std::string temp_path_for(const std::string& path);

struct FixOutcome {
    bool exec_fixed = false;
    bool content_fixed = false;
    bool error = false; ///< a non-fatal problem was reported for this path

    /** At most one unit of credit per path, however many fixes were applied. */
    bool credited() const { return exec_fixed || content_fixed; }
};

/**
 * @brief Correct one file in place.
 *
 * Clears all execute bits when Options::check_exec is set and the file is
 * executable, reporting `<path>: execute corrected`. When the extension
 * matcher accepts the path and scan_content() finds a problem, the content is
 * rewritten through a temporary sibling that is renamed over the original,
 * reporting `<path>: fixed`. In verbose mode an untouched path reports
 * `<path>: no change`.
 *
 * @param path Target file.
 * @param opts Run configuration.
 * @param out  Stream receiving the per-path report lines.
 * @param err  Stream receiving non-fatal errors (unreadable file, chmod failure).
 * @throws fix_error if the temporary file cannot be created or moved into place.
 */
FixOutcome fix_file(const std::string& path, const Options& opts, std::ostream& out,
                    std::ostream& err);

} // namespace ws

#endif // FILE_FIXER_HPP
