// options/logging.cpp
//
// Parse log file, level, format and rotation flags.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_options(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                           const CfgOptFn& cfg_opt,
                           const std::map<std::string, std::vector<std::string>>& cfg_opts) {
    auto value_of = [&](const std::string& flag) {
        if (parser.has_flag(flag))
            return parser.get_option(flag);
        return cfg_opt(flag);
    };
    auto given = [&](const std::string& flag) {
        return parser.has_flag(flag) || cfg_opts.count(flag) > 0;
    };

    LoggingOptions& log = opts.logging;
    log.log_file = value_of("--log-file");
    if (given("--log-file") && log.log_file.empty())
        throw usage_error("--log-file requires a file");

    if (opts.debug) {
        log.log_level = LogLevel::DEBUG;
    } else if (given("--log-level")) {
        bool ok = false;
        log.log_level = parse_log_level(value_of("--log-level"), ok);
        if (!ok)
            throw usage_error("Invalid value for --log-level: " + value_of("--log-level"));
    }

    if (given("--max-log-size")) {
        bool ok = false;
        log.max_log_size = parse_bytes(value_of("--max-log-size"), 1, SIZE_MAX, ok);
        if (!ok)
            throw usage_error("Invalid value for --max-log-size");
    }
    if (given("--max-log-files")) {
        bool ok = false;
        log.max_log_files = parse_size_t(value_of("--max-log-files"), 0, 100, ok);
        if (!ok)
            throw usage_error("Invalid value for --max-log-files");
    }
    log.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    log.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
}
