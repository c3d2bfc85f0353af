#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "options.hpp"

namespace cli {

/**
 * @brief Handle `--help` and `--version`.
 *
 * Returns `0` after printing when either flag was given or `std::nullopt`
 * if the run should continue.
 */
std::optional<int> handle_info_queries(const Options& opts, const std::string& prog,
                                       std::ostream& out);

/**
 * @brief Configure the logger from Options::logging.
 *
 * Opens the log file when one was requested and mirrors log entries to
 * stderr in debug mode.
 *
 * @throws std::runtime_error if the log file cannot be opened.
 */
void setup_logging(const Options& opts);

/**
 * @brief Resolve the candidate paths and check or fix them.
 *
 * The repository at Options::repo is opened unless paths come from stdin.
 *
 * @return The exit code: `0` clean, `1` issues found or fixed, `2` when a
 *         fix could not be written back.
 * @throws std::runtime_error when no repository can be opened or the
 *         revision does not resolve.
 */
int handle_batch_run(const Options& opts, const std::string& prog, std::istream& in,
                     std::ostream& out, std::ostream& err);

} // namespace cli
