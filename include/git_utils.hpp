#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "file_source.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Message of the last libgit2 error, or a generic text.
 */
std::string last_error();

/**
 * @brief Name of the branch `HEAD` points to.
 *
 * @param repo  Open repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Short branch name or `std::nullopt` when detached or unborn.
 */
std::optional<std::string> current_branch(git_repository* repo, std::string* error = nullptr);

/**
 * @brief Add every path changed by @p commit relative to its first parent.
 *
 * Deleted paths are skipped. A root commit is compared to the empty tree.
 *
 * @return `false` on a libgit2 failure.
 */
bool collect_commit_files(git_repository* repo, const git_oid& commit, std::set<std::string>& out);

/**
 * @brief Read the applied patch names of a StGit-style stack.
 *
 * Names are listed one per line in `<gitdir>/patches/<branch>/applied`.
 */
std::vector<std::string> read_applied_patches(const fs::path& git_dir, const std::string& branch);

/**
 * @brief libgit2 implementation of source::VcsClient.
 *
 * Paths are reported relative to the current directory when the work tree
 * lies below it, so `wscheck -C sub` prints `sub/file.c`.
 */
class GitClient : public source::VcsClient {
    repo_ptr repo_;
    fs::path workdir_;

    explicit GitClient(git_repository* repo);
    std::vector<std::string> to_display(const std::set<std::string>& rel) const;
    std::optional<std::vector<std::string>> walk(const git_oid* push, const git_oid* push2,
                                                 const git_oid* hide);

  public:
    /**
     * @brief Open the repository containing @p path, searching upward.
     *
     * @param path  Directory inside the work tree.
     * @param error Optional output string receiving a libgit2 error message.
     * @return The client, or `nullptr` if no repository was found.
     */
    static std::unique_ptr<GitClient> open(const fs::path& path, std::string* error = nullptr);

    /** @return Absolute work tree path. */
    const fs::path& workdir() const { return workdir_; }

    std::optional<std::vector<std::string>> tracked_files() override;
    std::optional<std::vector<std::string>> modified_files() override;
    std::optional<std::vector<std::string>> patch_stack_files() override;
    std::optional<std::vector<std::string>> outgoing_files() override;
    std::optional<std::vector<std::string>> range_files(const std::string& spec) override;
};

} // namespace git

#endif // GIT_UTILS_HPP
