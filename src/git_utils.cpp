#include "git_utils.hpp"
#include <fstream>
#include "logger.hpp"

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

string last_error() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(string* error) {
    if (error)
        *error = last_error();
}

optional<string> current_branch(git_repository* repo, string* error) {
    git_reference* head = nullptr;
    if (git_repository_head(&head, repo) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    if (!git_reference_is_branch(ref.get())) {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    const char* name = git_reference_shorthand(ref.get());
    if (!name || !*name) {
        set_error(error);
        return nullopt;
    }
    return string(name);
}

bool collect_commit_files(git_repository* repo, const git_oid& oid, set<string>& out) {
    git_commit* raw_commit = nullptr;
    if (git_commit_lookup(&raw_commit, repo, &oid) != 0)
        return false;
    commit_ptr commit(raw_commit);
    git_tree* raw_tree = nullptr;
    if (git_commit_tree(&raw_tree, commit.get()) != 0)
        return false;
    tree_ptr tree(raw_tree);

    git_tree* raw_parent_tree = nullptr;
    if (git_commit_parentcount(commit.get()) > 0) {
        git_commit* raw_parent = nullptr;
        if (git_commit_parent(&raw_parent, commit.get(), 0) != 0)
            return false;
        commit_ptr parent(raw_parent);
        if (git_commit_tree(&raw_parent_tree, parent.get()) != 0)
            return false;
    }
    tree_ptr parent_tree(raw_parent_tree);

    git_diff* raw_diff = nullptr;
    if (git_diff_tree_to_tree(&raw_diff, repo, parent_tree.get(), tree.get(), nullptr) != 0)
        return false;
    diff_ptr diff(raw_diff);
    size_t n = git_diff_num_deltas(diff.get());
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
        if (!delta || delta->status == GIT_DELTA_DELETED || !delta->new_file.path)
            continue;
        out.insert(delta->new_file.path);
    }
    return true;
}

vector<string> read_applied_patches(const fs::path& git_dir, const string& branch) {
    vector<string> names;
    ifstream ifs(git_dir / "patches" / branch / "applied");
    string line;
    while (getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            names.push_back(line);
    }
    return names;
}

GitClient::GitClient(git_repository* repo) : repo_(repo) {
    const char* wd = git_repository_workdir(repo);
    if (wd)
        workdir_ = fs::path(wd).lexically_normal();
}

unique_ptr<GitClient> GitClient::open(const fs::path& path, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, path.string().c_str(), 0, nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    if (git_repository_is_bare(raw)) {
        git_repository_free(raw);
        if (error)
            *error = "Repository has no work tree";
        return nullptr;
    }
    log_debug("opened repository", {{"path", path.string()}});
    return unique_ptr<GitClient>(new GitClient(raw));
}

vector<string> GitClient::to_display(const set<string>& rel) const {
    error_code ec;
    fs::path cwd = fs::current_path(ec);
    vector<string> paths;
    paths.reserve(rel.size());
    for (const auto& r : rel) {
        fs::path abs = workdir_ / r;
        fs::path shown = ec ? fs::path() : abs.lexically_relative(cwd);
        if (shown.empty() || *shown.begin() == "..")
            shown = abs;
        paths.push_back(shown.generic_string());
    }
    return paths;
}

optional<vector<string>> GitClient::walk(const git_oid* push, const git_oid* push2,
                                         const git_oid* hide) {
    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, repo_.get()) != 0)
        return nullopt;
    revwalk_ptr walker(raw_walk);
    if (git_revwalk_push(walker.get(), push) != 0)
        return nullopt;
    if (push2 && git_revwalk_push(walker.get(), push2) != 0)
        return nullopt;
    if (hide && git_revwalk_hide(walker.get(), hide) != 0)
        return nullopt;
    set<string> files;
    git_oid oid;
    int rc = 0;
    while ((rc = git_revwalk_next(&oid, walker.get())) == 0) {
        if (!collect_commit_files(repo_.get(), oid, files)) {
            log_warning("commit diff failed", {{"error", last_error()}});
            return nullopt;
        }
    }
    if (rc != GIT_ITEROVER)
        return nullopt;
    return to_display(files);
}

optional<vector<string>> GitClient::tracked_files() {
    git_index* raw_index = nullptr;
    if (git_repository_index(&raw_index, repo_.get()) != 0) {
        log_warning("cannot read index", {{"error", last_error()}});
        return nullopt;
    }
    index_ptr index(raw_index);
    set<string> files;
    size_t n = git_index_entrycount(index.get());
    for (size_t i = 0; i < n; ++i) {
        const git_index_entry* entry = git_index_get_byindex(index.get(), i);
        if (entry && entry->path)
            files.insert(entry->path);
    }
    return to_display(files);
}

optional<vector<string>> GitClient::modified_files() {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, repo_.get(), &opts) != 0) {
        log_warning("status failed", {{"error", last_error()}});
        return nullopt;
    }
    status_list_ptr list(raw_list);
    const unsigned int wanted = GIT_STATUS_INDEX_NEW | GIT_STATUS_INDEX_MODIFIED |
                                GIT_STATUS_INDEX_RENAMED | GIT_STATUS_INDEX_TYPECHANGE |
                                GIT_STATUS_WT_MODIFIED | GIT_STATUS_WT_TYPECHANGE |
                                GIT_STATUS_WT_RENAMED;
    set<string> files;
    size_t n = git_status_list_entrycount(list.get());
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list.get(), i);
        if (!e || !(e->status & wanted) || (e->status & GIT_STATUS_WT_DELETED))
            continue;
        const git_diff_delta* d = e->index_to_workdir ? e->index_to_workdir : e->head_to_index;
        if (d && d->new_file.path)
            files.insert(d->new_file.path);
    }
    return to_display(files);
}

optional<vector<string>> GitClient::patch_stack_files() {
    auto branch = current_branch(repo_.get());
    if (!branch)
        return nullopt;
    auto names = read_applied_patches(git_repository_path(repo_.get()), *branch);
    if (names.empty())
        return nullopt;
    set<string> files;
    for (const auto& name : names) {
        git_oid oid;
        string ref = "refs/patches/" + *branch + "/" + name;
        if (git_reference_name_to_id(&oid, repo_.get(), ref.c_str()) != 0 ||
            !collect_commit_files(repo_.get(), oid, files)) {
            log_warning("patch stack unreadable", {{"patch", name}, {"error", last_error()}});
            return nullopt;
        }
    }
    return to_display(files);
}

optional<vector<string>> GitClient::outgoing_files() {
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, repo_.get()) != 0)
        return nullopt;
    reference_ptr head(raw_head);
    git_reference* raw_upstream = nullptr;
    if (git_branch_upstream(&raw_upstream, head.get()) != 0) {
        log_debug("no upstream", {{"error", last_error()}});
        return nullopt;
    }
    reference_ptr upstream(raw_upstream);
    const git_oid* local = git_reference_target(head.get());
    const git_oid* remote = git_reference_target(upstream.get());
    if (!local || !remote)
        return nullopt;
    return walk(local, nullptr, remote);
}

optional<vector<string>> GitClient::range_files(const string& spec) {
    git_revspec rs;
    if (git_revparse(&rs, repo_.get(), spec.c_str()) != 0) {
        log_error("bad revision", {{"rev", spec}, {"error", last_error()}});
        return nullopt;
    }
    object_ptr from(rs.from);
    object_ptr to(rs.to);

    auto peel = [](git_object* obj, git_oid& out) {
        git_object* raw = nullptr;
        if (!obj || git_object_peel(&raw, obj, GIT_OBJECT_COMMIT) != 0)
            return false;
        object_ptr commit(raw);
        git_oid_cpy(&out, git_object_id(commit.get()));
        return true;
    };

    git_oid from_oid;
    if (!peel(from.get(), from_oid))
        return nullopt;
    if (rs.flags & GIT_REVPARSE_SINGLE) {
        set<string> files;
        if (!collect_commit_files(repo_.get(), from_oid, files))
            return nullopt;
        return to_display(files);
    }
    git_oid to_oid;
    if (!peel(to.get(), to_oid))
        return nullopt;
    if (rs.flags & GIT_REVPARSE_MERGE_BASE) {
        git_oid base;
        if (git_merge_base(&base, repo_.get(), &from_oid, &to_oid) != 0)
            return nullopt;
        return walk(&from_oid, &to_oid, &base);
    }
    return walk(&to_oid, nullptr, &from_oid);
}

} // namespace git
