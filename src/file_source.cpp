#include "file_source.hpp"
#include <stdexcept>
#include <utility>
#include "logger.hpp"

namespace source {

std::optional<std::string> StreamPathSource::next() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            return line;
    }
    return std::nullopt;
}

std::optional<std::string> ListPathSource::next() {
    if (pos_ >= paths_.size())
        return std::nullopt;
    return paths_[pos_++];
}

static std::unique_ptr<PathSource> from_list(const char* name, std::vector<std::string> paths) {
    log_info("file source selected",
             {{"source", name}, {"files", std::to_string(paths.size())}});
    return std::make_unique<ListPathSource>(std::move(paths));
}

std::unique_ptr<PathSource> resolve(const Options& opts, VcsClient* vcs, std::istream& in) {
    SourceMode mode = opts.source_mode();
    if (mode == SourceMode::STDIN) {
        log_info("file source selected", {{"source", "stdin"}});
        return std::make_unique<StreamPathSource>(in);
    }
    if (!vcs)
        throw std::runtime_error("No version control repository found at " + opts.repo.string());

    if (mode == SourceMode::MANIFEST) {
        auto files = vcs->tracked_files();
        if (!files)
            log_warning("manifest unavailable");
        return from_list("manifest", files.value_or(std::vector<std::string>{}));
    }
    if (mode == SourceMode::RANGE) {
        auto files = vcs->range_files(opts.rev_spec);
        if (!files)
            throw std::runtime_error("Cannot resolve revision: " + opts.rev_spec);
        return from_list("revision", std::move(*files));
    }

    if (auto files = vcs->modified_files(); files && !files->empty())
        return from_list("uncommitted", std::move(*files));
    log_debug("no uncommitted changes");
    if (auto files = vcs->patch_stack_files(); files)
        return from_list("patch stack", std::move(*files));
    log_debug("no applied patch stack");
    if (auto files = vcs->outgoing_files(); files)
        return from_list("outgoing", std::move(*files));
    log_debug("no upstream to compare against");
    return from_list("none", {});
}

} // namespace source
