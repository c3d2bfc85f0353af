#include "test_common.hpp"

TEST_CASE("scan_content classifies whitespace") {
    REQUIRE(ws::scan_content("") == ws::ISSUE_NONE);
    REQUIRE(ws::scan_content("int x;\nint y;\n") == ws::ISSUE_NONE);
    REQUIRE(ws::scan_content("no newline at end") == ws::ISSUE_NONE);
    REQUIRE(ws::scan_content("\tint x;\n") == ws::ISSUE_TABS);
    REQUIRE(ws::scan_content("int x; \n") == ws::ISSUE_TRAILING);
    REQUIRE(ws::scan_content("int x;\t\n") == (ws::ISSUE_TABS | ws::ISSUE_TRAILING));
    REQUIRE(ws::scan_content("last line ") == ws::ISSUE_TRAILING);
    REQUIRE(ws::scan_content("dos\r\n") == ws::ISSUE_DOS);
    REQUIRE(ws::scan_content("dos \r\n") == ws::ISSUE_DOS);
    REQUIRE(ws::scan_content("a\tb \r\n") == (ws::ISSUE_TABS | ws::ISSUE_DOS));
}

TEST_CASE("issue_label formatting") {
    REQUIRE(ws::issue_label(ws::ISSUE_NONE) == ":");
    REQUIRE(ws::issue_label(ws::ISSUE_EXECUTABLE) == "executable:");
    REQUIRE(ws::issue_label(ws::ISSUE_TABS) == ":tabs:");
    REQUIRE(ws::issue_label(ws::ISSUE_TRAILING | ws::ISSUE_DOS) == ":trailingWhitespace:DOS:");
    REQUIRE(ws::issue_label(ws::ISSUE_EXECUTABLE | ws::ISSUE_TABS | ws::ISSUE_TRAILING |
                            ws::ISSUE_DOS) == "executable:tabs:trailingWhitespace:DOS:");
}

TEST_CASE("inspect_file checks content by extension") {
    fs::path dir = fresh_dir("wscheck_inspect");
    write_file(dir / "dirty.h", "int x; \n");
    write_file(dir / "dirty.txt", "text \t\r\n");
    Options opts;

    auto h = ws::inspect_file((dir / "dirty.h").string(), opts);
    REQUIRE(h);
    REQUIRE(h->content_checked);
    REQUIRE(h->label() == ":trailingWhitespace:");
    REQUIRE(h->failed());

    auto txt = ws::inspect_file((dir / "dirty.txt").string(), opts);
    REQUIRE(txt);
    REQUIRE_FALSE(txt->content_checked);
    REQUIRE(txt->label() == ":");
    REQUIRE_FALSE(txt->failed());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("inspect_file execute bit only with check_exec") {
    fs::path dir = fresh_dir("wscheck_inspect_exec");
    fs::path script = dir / "run.txt";
    write_file(script, "echo hi\n");
    make_executable(script);
    Options opts;
    auto plain = ws::inspect_file(script.string(), opts);
    REQUIRE(plain);
    REQUIRE_FALSE(plain->failed());

    opts.check_exec = true;
    auto flagged = ws::inspect_file(script.string(), opts);
    REQUIRE(flagged);
    REQUIRE(flagged->label() == "executable:");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("inspect_file reports unreadable content") {
    Options opts;
    std::string error;
    auto res = ws::inspect_file("/nonexistent/wscheck/missing.c", opts, &error);
    REQUIRE_FALSE(res);
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("read_file reports why a file cannot be opened") {
    std::string content;
    std::string error;
    REQUIRE_FALSE(ws::read_file("/nonexistent/wscheck/missing.h", content, &error));
    REQUIRE(error == "No such file or directory");

    fs::path dir = fresh_dir("wscheck_read_dir");
    Options opts;
    auto res = ws::inspect_file((dir / "gone.cpp").string(), opts, &error);
    REQUIRE_FALSE(res);
    REQUIRE(error == "No such file or directory");
    FS_REMOVE_ALL(dir);
}
