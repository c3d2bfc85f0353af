#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "batch_driver.hpp"
#include "cli_commands.hpp"
#include "file_fixer.hpp"
#include "file_source.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace cli {

std::optional<int> handle_info_queries(const Options& opts, const std::string& prog,
                                       std::ostream& out) {
    if (opts.show_help) {
        print_help(prog.c_str(), out);
        return 0;
    }
    if (opts.print_version) {
        out << WSCHECK_VERSION << "\n";
        return 0;
    }
    return std::nullopt;
}

void setup_logging(const Options& opts) {
    const LoggingOptions& log = opts.logging;
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    set_console_logging(opts.debug);
    set_log_level(log.log_level);
    if (!log.log_file.empty() &&
        !init_logger(log.log_file, log.log_level, log.max_log_size, log.max_log_files))
        throw std::runtime_error("Failed to open log file: " + log.log_file);
    if (!opts.config_file.empty())
        log_debug("config loaded", {{"file", opts.config_file.string()}});
}

int handle_batch_run(const Options& opts, const std::string& prog, std::istream& in,
                     std::ostream& out, std::ostream& err) {
    auto start = std::chrono::steady_clock::now();
    std::unique_ptr<git::GitClient> client;
    if (opts.source_mode() != SourceMode::STDIN) {
        std::string error;
        client = git::GitClient::open(opts.repo, &error);
        if (!client)
            throw std::runtime_error("Cannot open repository at " + opts.repo.string() + ": " +
                                     error);
    }
    auto paths = source::resolve(opts, client.get(), in);

    BatchDriver driver(opts, out, err);
    try {
        RunSummary summary = driver.run(*paths);
        int rc = driver.finish(summary, prog);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        log_debug("elapsed", {{"time", format_elapsed(elapsed)}});
        return rc;
    } catch (const ws::fix_error& e) {
        err << e.what() << "\n";
        log_error("fix aborted", {{"error", e.what()}});
        return EXIT_FIX_ABORTED;
    }
}

} // namespace cli
