#include "file_inspector.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include "extension_matcher.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace ws {

static bool is_blank(char c) { return c == ' ' || c == '\t'; }

IssueSet scan_content(std::string_view content) {
    IssueSet issues = ISSUE_NONE;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\t')
            issues |= ISSUE_TABS;
        else if (c == '\r')
            issues |= ISSUE_DOS;
        else if (c == '\n' && i > 0 && is_blank(content[i - 1]))
            issues |= ISSUE_TRAILING;
    }
    if (!content.empty() && is_blank(content.back()))
        issues |= ISSUE_TRAILING;
    return issues;
}

std::string issue_label(IssueSet issues) {
    std::string label = (issues & ISSUE_EXECUTABLE) ? "executable:" : ":";
    if (issues & ISSUE_TABS)
        label += "tabs:";
    if (issues & ISSUE_TRAILING)
        label += "trailingWhitespace:";
    if (issues & ISSUE_DOS)
        label += "DOS:";
    return label;
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    fs::perms p = fs::status(path, ec).permissions();
    if (ec)
        return false;
    const fs::perms exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (p & exec) != fs::perms::none;
}

bool read_file(const std::string& path, std::string& out, std::string* error) {
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        int saved = errno;
        if (error)
            *error = saved ? std::strerror(saved) : "cannot open file";
        return false;
    }
    errno = 0;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        int saved = errno;
        if (error)
            *error = saved ? std::strerror(saved) : "read error";
        return false;
    }
    return true;
}

std::optional<CheckResult> inspect_file(const std::string& path, const Options& opts,
                                        std::string* error) {
    CheckResult result;
    if (opts.check_exec && is_executable(path))
        result.issues |= ISSUE_EXECUTABLE;
    if (!should_check_content(path, opts.extended))
        return result;

    std::string content;
    if (!read_file(path, content, error))
        return std::nullopt;
    result.content_checked = true;
    result.issues |= scan_content(content);
    log_debug("inspected", {{"path", path}, {"label", result.label()}});
    return result;
}

} // namespace ws
