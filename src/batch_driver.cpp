#include "batch_driver.hpp"
#include <filesystem>
#include "file_fixer.hpp"
#include "file_inspector.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace cli {

std::string fix_command(const std::string& prog, const std::vector<std::string>& args) {
    auto quote = [](const std::string& a) {
        if (!a.empty() && a.find_first_of(" \t\n'\"\\$`*?[]{}()<>|&;#~!") == std::string::npos)
            return a;
        std::string q = "'";
        for (char c : a) {
            if (c == '\'')
                q += "'\\''";
            else
                q += c;
        }
        return q + "'";
    };
    std::string cmd = quote(prog) + " -F";
    for (const auto& a : args)
        cmd += " " + quote(a);
    return cmd;
}

BatchDriver::BatchDriver(const Options& opts, std::ostream& out, std::ostream& err)
    : opts_(opts), out_(out), err_(err), ignore_(opts.ignore_patterns) {
    auto from_file = ignore::read_ignore_file(opts.repo / ignore::IGNORE_FILE_NAME);
    ignore_.insert(ignore_.end(), from_file.begin(), from_file.end());
    if (!ignore_.empty())
        log_debug("ignore patterns loaded", {{"count", std::to_string(ignore_.size())}});
}

void BatchDriver::check_path(const std::string& path, RunSummary& summary) {
    std::string error;
    auto result = ws::inspect_file(path, opts_, &error);
    if (!result) {
        err_ << path << ": cannot read: " << error << "\n";
        log_error("read failed", {{"path", path}, {"error", error}});
        ++summary.errors;
        return;
    }
    if (result->failed()) {
        out_ << path << " " << result->label() << "\n";
        ++summary.flagged;
    } else if (opts_.verbose) {
        out_ << path << " :OK\n";
    }
}

void BatchDriver::fix_path(const std::string& path, RunSummary& summary) {
    ws::FixOutcome outcome = ws::fix_file(path, opts_, out_, err_);
    if (outcome.credited())
        ++summary.corrected;
    else if (outcome.error)
        ++summary.errors;
}

RunSummary BatchDriver::run(source::PathSource& paths) {
    RunSummary summary;
    while (auto path = paths.next()) {
        if (ignore::matches(*path, ignore_)) {
            log_debug("ignored", {{"path", *path}});
            ++summary.skipped;
            continue;
        }
        std::error_code ec;
        if (!fs::is_regular_file(*path, ec)) {
            log_warning("not a regular file", {{"path", *path}});
            if (opts_.verbose)
                out_ << *path << ": skipped\n";
            ++summary.skipped;
            continue;
        }
        ++summary.processed;
        if (opts_.fix)
            fix_path(*path, summary);
        else
            check_path(*path, summary);
    }
    return summary;
}

int BatchDriver::finish(const RunSummary& summary, const std::string& prog) const {
    log_info("run finished", {{"mode", opts_.fix ? "fix" : "check"},
                              {"processed", std::to_string(summary.processed)},
                              {"skipped", std::to_string(summary.skipped)},
                              {"failures", std::to_string(summary.failures())}});
    if (summary.failures() == 0)
        return EXIT_CLEAN;
    if (summary.errors > 0)
        out_ << summary.errors << " file(s) could not be processed\n";
    if (opts_.fix) {
        if (summary.corrected > 0)
            out_ << "Corrected " << summary.corrected << " file(s)\n";
    } else if (summary.flagged > 0) {
        out_ << summary.flagged << " file(s) have whitespace issues; to fix them run:\n"
             << "  " << fix_command(prog, opts_.original_args) << "\n";
    }
    return EXIT_ISSUES;
}

} // namespace cli
