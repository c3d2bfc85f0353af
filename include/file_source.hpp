#ifndef FILE_SOURCE_HPP
#define FILE_SOURCE_HPP
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "options.hpp"

namespace source {

/**
 * @brief Lazy, finite, single-pass producer of candidate paths.
 */
class PathSource {
  public:
    virtual ~PathSource() = default;
    /** @return The next path, or `std::nullopt` once exhausted. */
    virtual std::optional<std::string> next() = 0;
};

/**
 * @brief Reads one path per line from a stream as it is consumed.
 *
 * A trailing carriage return is dropped and empty lines are skipped; the
 * rest of each line is used as-is.
 */
class StreamPathSource : public PathSource {
    std::istream& in_;

  public:
    explicit StreamPathSource(std::istream& in) : in_(in) {}
    std::optional<std::string> next() override;
};

/** @brief Hands out a precomputed list in order. */
class ListPathSource : public PathSource {
    std::vector<std::string> paths_;
    size_t pos_ = 0;

  public:
    explicit ListPathSource(std::vector<std::string> paths) : paths_(std::move(paths)) {}
    std::optional<std::string> next() override;
};

/**
 * @brief Version-control queries the resolver depends on.
 *
 * Each call returns the paths involved, or `std::nullopt` when that source is
 * unavailable (no repository, no patch stack, no upstream, bad revision).
 */
class VcsClient {
  public:
    virtual ~VcsClient() = default;
    /** Every tracked file. */
    virtual std::optional<std::vector<std::string>> tracked_files() = 0;
    /** Modified or added files not yet committed. */
    virtual std::optional<std::vector<std::string>> modified_files() = 0;
    /** Files touched by the applied patch stack; nullopt when nothing is applied. */
    virtual std::optional<std::vector<std::string>> patch_stack_files() = 0;
    /** Files touched by commits not yet pushed upstream. */
    virtual std::optional<std::vector<std::string>> outgoing_files() = 0;
    /** Files touched by a single revision or a revision range. */
    virtual std::optional<std::vector<std::string>> range_files(const std::string& spec) = 0;
};

/**
 * @brief Pick the candidate path source for a run.
 *
 * Order: stdin list (`--stdin`), manifest (`--all`), revision range
 * (`--rev`), then uncommitted changes when there are any, the applied patch
 * stack when there is one, and finally the outgoing commits. Unavailable
 * sources fall through; the result may be empty.
 *
 * @param opts Run configuration.
 * @param vcs  Collaborator for the VCS-backed modes; may be null for `--stdin`.
 * @param in   Stream read in `--stdin` mode.
 * @throws std::runtime_error if a VCS mode is requested without a client, or
 *         the revision spec cannot be resolved.
 */
std::unique_ptr<PathSource> resolve(const Options& opts, VcsClient* vcs, std::istream& in);

} // namespace source

#endif // FILE_SOURCE_HPP
