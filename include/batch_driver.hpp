#ifndef BATCH_DRIVER_HPP
#define BATCH_DRIVER_HPP
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "file_source.hpp"
#include "options.hpp"

namespace cli {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_ISSUES = 1;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FIX_ABORTED = 2;

struct RunSummary {
    size_t processed = 0; ///< paths handed to the inspector or fixer
    size_t skipped = 0;   ///< ignored or not a regular file
    size_t flagged = 0;   ///< check mode: label other than `:`
    size_t corrected = 0; ///< fix mode: credited paths
    size_t errors = 0;    ///< unreadable files, failed chmod

    /** The failure counter deciding the exit code. */
    size_t failures() const { return flagged + corrected + errors; }
};

/**
 * @brief Build the command line that repeats a check run in fix mode.
 *
 * Arguments containing blanks or shell metacharacters are single-quoted.
 */
std::string fix_command(const std::string& prog, const std::vector<std::string>& args);

/**
 * @brief Runs the inspector or the fixer over every candidate path.
 */
class BatchDriver {
    const Options& opts_;
    std::ostream& out_;
    std::ostream& err_;
    std::vector<std::string> ignore_;

    void check_path(const std::string& path, RunSummary& summary);
    void fix_path(const std::string& path, RunSummary& summary);

  public:
    /**
     * @param opts Run configuration; must outlive the driver.
     * @param out  Per-path report lines and the summary.
     * @param err  Non-fatal per-path errors.
     */
    BatchDriver(const Options& opts, std::ostream& out, std::ostream& err);

    /**
     * @brief Consume @p paths until exhausted.
     *
     * @throws ws::fix_error when a fixed file cannot be written back; the
     *         remaining paths are not processed.
     */
    RunSummary run(source::PathSource& paths);

    /**
     * @brief Print the closing message and pick the exit code.
     *
     * @param summary Result of run().
     * @param prog    Program name used in the suggested fix command.
     * @return EXIT_CLEAN when nothing was flagged, fixed or unreadable,
     *         otherwise EXIT_ISSUES.
     */
    int finish(const RunSummary& summary, const std::string& prog) const;
};

} // namespace cli

#endif // BATCH_DRIVER_HPP
