#ifndef FILE_INSPECTOR_HPP
#define FILE_INSPECTOR_HPP
#include <optional>
#include <string>
#include <string_view>
#include "options.hpp"

namespace ws {

/** Issue flags, combined into an IssueSet. */
enum Issue : unsigned {
    ISSUE_NONE = 0,
    ISSUE_EXECUTABLE = 1u << 0,
    ISSUE_TABS = 1u << 1,
    ISSUE_TRAILING = 1u << 2,
    ISSUE_DOS = 1u << 3,
};
using IssueSet = unsigned;

constexpr IssueSet CONTENT_ISSUES = ISSUE_TABS | ISSUE_TRAILING | ISSUE_DOS;

/**
 * @brief Classify whitespace problems in a buffer.
 *
 * - ISSUE_TABS: any tab byte.
 * - ISSUE_TRAILING: a space or tab directly before a line feed, or at the end
 *   of an unterminated last line. A blank before "\r\n" does not count; the
 *   carriage return is reported as ISSUE_DOS instead.
 * - ISSUE_DOS: any carriage-return byte.
 */
IssueSet scan_content(std::string_view content);

/**
 * @brief Build the status label printed for a path.
 *
 * `:` when @p issues is empty. Otherwise `executable:` or `:` followed by
 * `tabs:`, `trailingWhitespace:` and `DOS:` for each content issue, in that
 * order.
 */
std::string issue_label(IssueSet issues);

/** @return true if any execute bit (owner, group, other) is set. */
bool is_executable(const std::string& path);

/**
 * Read a whole file in binary mode.
 *
 * @param error Receives the system error text, taken right after the failing
 *              open or read.
 */
bool read_file(const std::string& path, std::string& out, std::string* error = nullptr);

struct CheckResult {
    IssueSet issues = ISSUE_NONE;
    bool content_checked = false;

    std::string label() const { return issue_label(issues); }
    /** A path fails the check exactly when its label is not `:`. */
    bool failed() const { return issues != ISSUE_NONE; }
};

/**
 * @brief Check one file without modifying it.
 *
 * The execute bit is tested when Options::check_exec is set, independent of
 * the extension. Content is read and scanned only when the extension matcher
 * accepts the path.
 *
 * @param path  File to check.
 * @param opts  Run configuration.
 * @param error Receives a description when the file cannot be read.
 * @return The result, or `std::nullopt` if the content could not be read.
 */
std::optional<CheckResult> inspect_file(const std::string& path, const Options& opts,
                                        std::string* error = nullptr);

} // namespace ws

#endif // FILE_INSPECTOR_HPP
