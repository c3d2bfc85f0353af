/**
 * @file wscheck.cpp
 * @brief CLI entry point for the whitespace checker.
 *
 * Parses the command line, picks the candidate files from the repository or
 * stdin and reports or repairs whitespace problems in them.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 when every file is clean or after help/version; 1 when issues
 *         were reported or fixed, on usage errors and unexpected errors; 2
 *         when a fix could not be written back.
 */
#ifndef WSCHECK_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    const std::string prog = argc > 0 ? argv[0] : "wscheck";
    try {
        Options opts = parse_options(argc, argv);
        if (auto rc = cli::handle_info_queries(opts, prog, std::cout); rc)
            return *rc;
        cli::setup_logging(opts);
        int rc = cli::handle_batch_run(opts, prog, std::cin, std::cout, std::cerr);
        shutdown_logger();
        return rc;
    } catch (const usage_error& e) {
        std::cerr << e.what() << "\n\n";
        print_help(prog.c_str(), std::cerr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        log_error("run failed", {{"error", e.what()}});
        shutdown_logger();
        return 1;
    }
}
#endif // WSCHECK_NO_MAIN
