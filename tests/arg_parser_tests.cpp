#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help", "--opt"},
                     {{'h', "--help"}, {'o', "--opt"}}, {"--opt"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == std::string("42"));
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-abc"};
    ArgParser parser(2, const_cast<char**>(argv), {"--flag-a", "--flag-b", "--flag-c"},
                     {{'a', "--flag-a"}, {'b', "--flag-b"}, {'c', "--flag-c"}});
    REQUIRE(parser.has_flag("--flag-a"));
    REQUIRE(parser.has_flag("--flag-b"));
    REQUIRE(parser.has_flag("--flag-c"));
}

TEST_CASE("ArgParser switch does not consume the next argument") {
    const char* argv[] = {"prog", "-x", "file.c"};
    ArgParser parser(3, const_cast<char**>(argv), known_flags(), short_flags(), value_flags());
    REQUIRE(parser.has_flag("--exec"));
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "file.c");
}

TEST_CASE("ArgParser value flag ends a short cluster") {
    const char* argv[] = {"prog", "-vFr", "HEAD~2..HEAD"};
    ArgParser parser(3, const_cast<char**>(argv), known_flags(), short_flags(), value_flags());
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.has_flag("--fix"));
    REQUIRE(parser.get_option("--rev") == "HEAD~2..HEAD");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser repeated option keeps every value") {
    const char* argv[] = {"prog", "-I", "*.gen.c", "--ignore", "third_party/*"};
    ArgParser parser(5, const_cast<char**>(argv), known_flags(), short_flags(), value_flags());
    auto all = parser.get_all_options("--ignore");
    REQUIRE(all == std::vector<std::string>{"*.gen.c", "third_party/*"});
    REQUIRE(parser.get_option("--ignore") == "third_party/*");
}

TEST_CASE("ArgParser missing value is reported") {
    const char* argv[] = {"prog", "--rev"};
    ArgParser parser(2, const_cast<char**>(argv), known_flags(), short_flags(), value_flags());
    REQUIRE(parser.missing_values().size() == 1);
    REQUIRE(parser.missing_values()[0] == "--rev");
    REQUIRE_FALSE(parser.has_flag("--rev"));
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-q"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-q");
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--", "--fix"};
    ArgParser parser(3, const_cast<char**>(argv), known_flags(), short_flags(), value_flags());
    REQUIRE_FALSE(parser.has_flag("--fix"));
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "--fix");
}
