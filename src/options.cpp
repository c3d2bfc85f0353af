#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Logging flags are parsed in src/options/logging.cpp, config file loading
// lives in src/options/config.cpp.

const std::set<std::string>& known_flags() {
    static const std::set<std::string> known{"--all",
                                             "--verbose",
                                             "--debug",
                                             "--stdin",
                                             "--extended",
                                             "--fix",
                                             "--rev",
                                             "--exec",
                                             "--repo",
                                             "--ignore",
                                             "--config-yaml",
                                             "--config-json",
                                             "--auto-config",
                                             "--log-file",
                                             "--log-level",
                                             "--json-log",
                                             "--max-log-size",
                                             "--max-log-files",
                                             "--compress-logs",
                                             "--help",
                                             "--version"};
    return known;
}

const std::map<char, std::string>& short_flags() {
    static const std::map<char, std::string> short_opts{{'a', "--all"},
                                                        {'v', "--verbose"},
                                                        {'V', "--debug"},
                                                        {'S', "--stdin"},
                                                        {'E', "--extended"},
                                                        {'F', "--fix"},
                                                        {'r', "--rev"},
                                                        {'x', "--exec"},
                                                        {'C', "--repo"},
                                                        {'I', "--ignore"},
                                                        {'y', "--config-yaml"},
                                                        {'j', "--config-json"},
                                                        {'h', "--help"}};
    return short_opts;
}

const std::set<std::string>& value_flags() {
    static const std::set<std::string> values{"--rev",          "--repo",
                                              "--ignore",       "--config-yaml",
                                              "--config-json",  "--log-file",
                                              "--log-level",    "--max-log-size",
                                              "--max-log-files"};
    return values;
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    ConfigValues cfg_opts;
    load_config_and_auto(argc, argv, cfg_opts, config_file);

    ArgParser parser(argc, argv, known_flags(), short_flags(), value_flags());
    if (!parser.unknown_flags().empty())
        throw usage_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw usage_error(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw usage_error("Unexpected argument: " + parser.positional().front());

    static const std::set<std::string> cli_only{"--config-yaml", "--config-json", "--auto-config",
                                                "--help", "--version"};
    for (const auto& kv : cfg_opts) {
        if (!known_flags().count(kv.first))
            throw usage_error("Unknown option in config: " + kv.first);
        if (cli_only.count(kv.first))
            throw usage_error("Option not allowed in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end() || it->second.empty())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second.back(), ok);
        if (!ok)
            throw usage_error("Invalid value for " + k + " in config: " + it->second.back());
        return v;
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end() || it->second.empty())
            return std::string();
        return it->second.back();
    };

    Options opts;
    opts.config_file = config_file;
    opts.auto_config = parser.has_flag("--auto-config");
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    for (int i = 1; i < argc; ++i)
        opts.original_args.emplace_back(argv[i]);

    opts.debug = parser.has_flag("--debug") || cfg_flag("--debug");
    opts.verbose = opts.debug || parser.has_flag("--verbose") || cfg_flag("--verbose");
    opts.fix = parser.has_flag("--fix") || cfg_flag("--fix");
    opts.check_exec = parser.has_flag("--exec") || cfg_flag("--exec");
    opts.extended = parser.has_flag("--extended") || cfg_flag("--extended");
    opts.read_stdin = parser.has_flag("--stdin") || cfg_flag("--stdin");
    opts.manifest = parser.has_flag("--all") || cfg_flag("--all");

    if (parser.has_flag("--rev")) {
        opts.rev_spec = parser.get_option("--rev");
        if (opts.rev_spec.empty())
            throw usage_error("--rev requires a revision");
    } else {
        opts.rev_spec = cfg_opt("--rev");
    }

    std::string repo = parser.has_flag("--repo") ? parser.get_option("--repo") : cfg_opt("--repo");
    if (parser.has_flag("--repo") && repo.empty())
        throw usage_error("--repo requires a directory");
    if (!repo.empty())
        opts.repo = repo;

    if (cfg_opts.count("--ignore")) {
        for (const auto& pat : cfg_opts.at("--ignore"))
            if (!pat.empty())
                opts.ignore_patterns.push_back(pat);
    }
    for (const auto& pat : parser.get_all_options("--ignore")) {
        if (pat.empty())
            throw usage_error("--ignore requires a pattern");
        opts.ignore_patterns.push_back(pat);
    }

    parse_logging_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    return opts;
}
