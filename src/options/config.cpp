// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

void load_config_and_auto(int argc, char* argv[],
                          std::map<std::string, std::vector<std::string>>& cfg_opts,
                          fs::path& config_file) {
    // Parse with the full flag set so option values are never mistaken for flags.
    ArgParser pre_parser(argc, argv, known_flags(), short_flags(), value_flags());
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw usage_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw usage_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw usage_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw usage_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    if (!config_file.empty() || !pre_parser.has_flag("--auto-config"))
        return;

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        fs::path y = dir / ".wscheck.yaml";
        if (fs::exists(y))
            return y;
        fs::path j = dir / ".wscheck.json";
        if (fs::exists(j))
            return j;
        return {};
    };
    fs::path root_hint;
    if (pre_parser.has_flag("--repo"))
        root_hint = pre_parser.get_option("--repo");
    fs::path cfg_path = find_cfg(root_hint);
    if (cfg_path.empty())
        cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        return;
    std::string err;
    bool ok = cfg_path.extension() == ".yaml" ? load_yaml_config(cfg_path.string(), cfg_opts, err)
                                              : load_json_config(cfg_path.string(), cfg_opts, err);
    if (!ok)
        throw usage_error("Failed to load config " + cfg_path.string() + ": " + err);
    config_file = cfg_path;
}
