#include "test_common.hpp"
#include <climits>

TEST_CASE("parse_size_t bounds") {
    bool ok = false;
    REQUIRE(parse_size_t("5", 0, 10, ok) == 5);
    REQUIRE(ok);
    parse_size_t("11", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("abc", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2K", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(ok);
    REQUIRE(parse_bytes("1mb", 0, SIZE_MAX, ok) == 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("1G", 0, SIZE_MAX, ok) == 1024ull * 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("3TB", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("0", 1, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_log_level names") {
    bool ok = false;
    REQUIRE(parse_log_level("debug", ok) == LogLevel::DEBUG);
    REQUIRE(ok);
    REQUIRE(parse_log_level("WARN", ok) == LogLevel::WARNING);
    REQUIRE(ok);
    REQUIRE(parse_log_level("Error", ok) == LogLevel::ERR);
    REQUIRE(ok);
    parse_log_level("loud", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepted spellings") {
    bool ok = false;
    for (const char* t : {"", "1", "true", "YES", "on"}) {
        REQUIRE(parse_bool(t, ok));
        REQUIRE(ok);
    }
    for (const char* f : {"0", "false", "No", "off"}) {
        REQUIRE_FALSE(parse_bool(f, ok));
        REQUIRE(ok);
    }
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("format_elapsed uses milliseconds") {
    REQUIRE(format_elapsed(std::chrono::milliseconds(1042)) == "1.042s");
    REQUIRE(format_elapsed(std::chrono::milliseconds(5)) == "0.005s");
}
