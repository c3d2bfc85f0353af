#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "wscheck_cfg.yaml";
    write_file(cfg, "verbose: true\nrev: HEAD~2\nignore:\n  - a.c\n  - \"b/*\"\n");
    ConfigValues opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--verbose"] == std::vector<std::string>{"true"});
    REQUIRE(opts["--rev"] == std::vector<std::string>{"HEAD~2"});
    REQUIRE(opts["--ignore"] == std::vector<std::string>{"a.c", "b/*"});
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories") {
    fs::path cfg = fs::temp_directory_path() / "wscheck_cfg_cat.yaml";
    write_file(cfg, "Basics:\n  fix: true\nLogging:\n  log-level: DEBUG\n");
    ConfigValues opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--fix"].back() == "true");
    REQUIRE(opts["--log-level"].back() == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config errors") {
    fs::path cfg = fs::temp_directory_path() / "wscheck_cfg_bad.yaml";
    write_file(cfg, "- just\n- a list\n");
    ConfigValues opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    write_file(cfg, "key: [unterminated\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(cfg);
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
}

TEST_CASE("JSON config categories") {
    fs::path cfg = fs::temp_directory_path() / "wscheck_cfg_cat.json";
    write_file(cfg, "{\n  \"Basics\": {\n    \"exec\": true,\n    \"max-log-files\": 4\n  },\n  "
                    "\"ignore\": [\"x.h\", \"y/*\"]\n}");
    ConfigValues opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--exec"].back() == "true");
    REQUIRE(opts["--max-log-files"].back() == "4");
    REQUIRE(opts["--ignore"] == std::vector<std::string>{"x.h", "y/*"});
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config errors") {
    fs::path cfg = fs::temp_directory_path() / "wscheck_cfg_bad.json";
    write_file(cfg, "{ \"fix\": ");
    ConfigValues opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    write_file(cfg, "[1, 2]");
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    FS_REMOVE(cfg);
}
