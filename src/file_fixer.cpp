#include "file_fixer.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include "extension_matcher.hpp"
#include "file_inspector.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace ws {

namespace {

const fs::perms EXEC_BITS = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

void fix_line(std::string_view line, std::string& out) {
    size_t col = 0;
    size_t start = out.size();
    for (char c : line) {
        if (c == '\t') {
            size_t n = TAB_WIDTH - col % TAB_WIDTH;
            out.append(n, ' ');
            col += n;
            continue;
        }
        ++col;
        if (c != '\r')
            out.push_back(c);
    }
    size_t end = out.size();
    while (end > start && (out[end - 1] == ' ' || out[end - 1] == '\t'))
        --end;
    out.resize(end);
}

// Write @p content next to @p target and rename it over @p target.
void replace_contents(const fs::path& target, const std::string& content) {
    const std::string tmp = temp_path_for(target.string());
    std::error_code ec;
    bool written = false;
    std::string reason = "not a regular file";
    {
        errno = 0;
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (ofs) {
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            ofs.close();
            written = !ofs.fail();
        }
        if (!written) {
            int saved = errno;
            reason = saved ? std::strerror(saved) : "write failed";
        }
    }
    if (!written || !fs::is_regular_file(tmp, ec)) {
        if (fs::is_regular_file(tmp, ec))
            fs::remove(tmp, ec);
        throw fix_error("Failed to create temporary file " + tmp + ": " + reason);
    }
    fs::permissions(tmp, fs::status(target, ec).permissions(), fs::perm_options::replace, ec);
    if (ec)
        log_warning("could not copy permissions", {{"path", target.string()},
                                                   {"error", ec.message()}});
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw fix_error("Failed to replace " + target.string() + ": " + ec.message());
    }
}

} // namespace

std::string fix_content(std::string_view content) {
    std::string out;
    out.reserve(content.size() + content.size() / 8);
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string_view::npos) {
            fix_line(content.substr(pos), out);
            break;
        }
        fix_line(content.substr(pos, nl - pos), out);
        out.push_back('\n');
        pos = nl + 1;
    }
    return out;
}

std::string temp_path_for(const std::string& path) { return path + TEMP_SUFFIX; }

FixOutcome fix_file(const std::string& path, const Options& opts, std::ostream& out,
                    std::ostream& err) {
    FixOutcome outcome;
    if (opts.check_exec && is_executable(path)) {
        std::error_code ec;
        fs::permissions(path, EXEC_BITS, fs::perm_options::remove, ec);
        if (ec) {
            err << path << ": cannot clear execute bit: " << ec.message() << "\n";
            log_error("chmod failed", {{"path", path}, {"error", ec.message()}});
            outcome.error = true;
        } else {
            out << path << ": execute corrected\n";
            log_info("execute bit cleared", {{"path", path}});
            outcome.exec_fixed = true;
        }
    }

    if (should_check_content(path, opts.extended)) {
        std::string content;
        std::string reason;
        if (!read_file(path, content, &reason)) {
            err << path << ": cannot read: " << reason << "\n";
            log_error("read failed", {{"path", path}, {"error", reason}});
            outcome.error = true;
        } else if (scan_content(content) != ISSUE_NONE) {
            // Rewrite the link target rather than replacing a symlink with a file.
            std::error_code ec;
            fs::path target = fs::is_symlink(path, ec) ? fs::canonical(path, ec) : fs::path(path);
            if (ec)
                target = path;
            replace_contents(target, fix_content(content));
            out << path << ": fixed\n";
            log_info("content fixed", {{"path", path}});
            outcome.content_fixed = true;
        }
    }

    if (!outcome.credited() && !outcome.error && opts.verbose)
        out << path << ": no change\n";
    return outcome;
}

} // namespace ws
