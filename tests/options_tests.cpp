#include "test_common.hpp"

TEST_CASE("parse_options defaults") {
    Argv args{"wscheck"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE_FALSE(opts.fix);
    REQUIRE_FALSE(opts.verbose);
    REQUIRE_FALSE(opts.check_exec);
    REQUIRE_FALSE(opts.extended);
    REQUIRE(opts.repo == fs::path("."));
    REQUIRE(opts.source_mode() == SourceMode::AUTO);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.original_args.empty());
}

TEST_CASE("parse_options short flags") {
    Argv args{"wscheck", "-vFxE", "-C", "src"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.verbose);
    REQUIRE(opts.fix);
    REQUIRE(opts.check_exec);
    REQUIRE(opts.extended);
    REQUIRE(opts.repo == fs::path("src"));
    REQUIRE(opts.original_args == std::vector<std::string>{"-vFxE", "-C", "src"});
}

TEST_CASE("parse_options debug implies verbose and debug log level") {
    Argv args{"wscheck", "-V", "--log-level", "ERROR"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.debug);
    REQUIRE(opts.verbose);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
}

TEST_CASE("parse_options source mode priority") {
    {
        Argv args{"wscheck", "-a", "-r", "HEAD", "-S"};
        REQUIRE(parse_options(args.argc(), args.argv()).source_mode() == SourceMode::STDIN);
    }
    {
        Argv args{"wscheck", "-a", "-r", "HEAD"};
        REQUIRE(parse_options(args.argc(), args.argv()).source_mode() == SourceMode::MANIFEST);
    }
    {
        Argv args{"wscheck", "--rev=HEAD~3"};
        Options opts = parse_options(args.argc(), args.argv());
        REQUIRE(opts.source_mode() == SourceMode::RANGE);
        REQUIRE(opts.rev_spec == "HEAD~3");
    }
}

TEST_CASE("parse_options rejects bad input") {
    {
        Argv args{"wscheck", "--frobnicate"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "-q"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "stray.c"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "-r"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "--rev="};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "--log-level", "LOUD"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    {
        Argv args{"wscheck", "--max-log-files", "500"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
}

TEST_CASE("parse_options logging flags") {
    Argv args{"wscheck", "--log-file", "run.log", "--max-log-size", "1M", "--max-log-files", "5",
              "--json-log", "--compress-logs"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.logging.log_file == "run.log");
    REQUIRE(opts.logging.max_log_size == 1024 * 1024);
    REQUIRE(opts.logging.max_log_files == 5);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
}

TEST_CASE("parse_options merges ignore patterns from config and command line") {
    fs::path dir = fresh_dir("wscheck_opts_ignore");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "ignore:\n  - \"*.pb.cc\"\nexec: true\n");
    Argv args{"wscheck", "-y", cfg.string(), "-I", "gen/*"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.check_exec);
    REQUIRE(opts.config_file == cfg);
    REQUIRE(opts.ignore_patterns == std::vector<std::string>{"*.pb.cc", "gen/*"});
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options command line overrides config values") {
    fs::path dir = fresh_dir("wscheck_opts_override");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, "{\"rev\": \"HEAD~5\", \"log-level\": \"WARNING\"}");
    Argv args{"wscheck", "-j", cfg.string(), "-r", "HEAD"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.rev_spec == "HEAD");
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options rejects unknown and CLI-only config keys") {
    fs::path dir = fresh_dir("wscheck_opts_badcfg");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "interval: 5\n");
    {
        Argv args{"wscheck", "-y", cfg.string()};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    write_file(cfg, "help: true\n");
    {
        Argv args{"wscheck", "-y", cfg.string()};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    write_file(cfg, "fix: sometimes\n");
    {
        Argv args{"wscheck", "-y", cfg.string()};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options auto config discovery") {
    fs::path dir = fresh_dir("wscheck_opts_auto");
    write_file(dir / ".wscheck.yaml", "extended: true\n");
    Argv args{"wscheck", "--auto-config", "-C", dir.string()};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.extended);
    REQUIRE(opts.auto_config);
    REQUIRE(opts.config_file == dir / ".wscheck.yaml");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options missing config file") {
    Argv args{"wscheck", "-y", "/nonexistent/wscheck.yaml"};
    REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), usage_error);
}
