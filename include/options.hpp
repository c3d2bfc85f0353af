#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

/** Where the candidate paths come from. */
enum class SourceMode {
    AUTO,     ///< uncommitted, then patch stack, then outgoing
    STDIN,    ///< `-S`
    MANIFEST, ///< `-a`
    RANGE     ///< `-r <spec>`
};

/**
 * Run configuration. Built once by parse_options() and then only read.
 */
struct Options {
    bool verbose = false;
    bool debug = false;
    bool fix = false;
    bool check_exec = false;
    bool extended = false;
    bool read_stdin = false;
    bool manifest = false;
    std::string rev_spec;
    std::filesystem::path repo = ".";
    std::vector<std::string> ignore_patterns;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool auto_config = false;
    bool show_help = false;
    bool print_version = false;
    std::vector<std::string> original_args;

    SourceMode source_mode() const {
        if (read_stdin)
            return SourceMode::STDIN;
        if (manifest)
            return SourceMode::MANIFEST;
        if (!rev_spec.empty())
            return SourceMode::RANGE;
        return SourceMode::AUTO;
    }
};

/**
 * Raised for bad flags, missing arguments and invalid config values. main()
 * prints the message followed by the usage text.
 */
class usage_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** Long flags accepted on the command line and as config keys. */
const std::set<std::string>& known_flags();

/** Short flag mapping (`-a` to `--all`, ...). */
const std::map<char, std::string>& short_flags();

/** Long flags that take a value. */
const std::set<std::string>& value_flags();

/**
 * Parse command-line arguments and configuration files into an Options
 * instance.
 *
 * Config files named with `--config-yaml`, `--config-json` or found through
 * `--auto-config` are loaded first; command-line values override them.
 *
 * @throws usage_error on unknown flags, stray positional arguments, missing
 *         values or invalid values.
 */
Options parse_options(int argc, char* argv[]);

using CfgFlagFn = std::function<bool(const std::string&)>;
using CfgOptFn = std::function<std::string(const std::string&)>;

/**
 * Fill Options::logging from the parser and the loaded config values.
 */
void parse_logging_options(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                           const CfgOptFn& cfg_opt,
                           const std::map<std::string, std::vector<std::string>>& cfg_opts);

/**
 * Load the config files requested on the command line (or discovered with
 * `--auto-config`) into @p cfg_opts, keyed by long flag.
 *
 * @throws usage_error when a file cannot be loaded.
 */
void load_config_and_auto(int argc, char* argv[],
                          std::map<std::string, std::vector<std::string>>& cfg_opts,
                          std::filesystem::path& config_file);

#endif // OPTIONS_HPP
