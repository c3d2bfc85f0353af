#include "extension_matcher.hpp"

namespace ws {

const std::vector<std::string>& base_extensions() {
    static const std::vector<std::string> exts{".java", ".c", ".h", ".cpp", ".hpp"};
    return exts;
}

const std::vector<std::string>& extra_extensions() {
    static const std::vector<std::string> exts{".cc",  ".jsl",  ".fxml",   ".css",
                                               ".m",   ".mm",   ".frag",   ".vert",
                                               ".hlsl", ".gradle", ".groovy"};
    return exts;
}

static bool has_suffix(const std::string& name, const std::vector<std::string>& suffixes) {
    for (const auto& suf : suffixes) {
        if (name.size() >= suf.size() &&
            name.compare(name.size() - suf.size(), suf.size(), suf) == 0)
            return true;
    }
    return false;
}

bool should_check_content(const std::string& path, bool extended) {
    size_t slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (has_suffix(name, base_extensions()))
        return true;
    return extended && has_suffix(name, extra_extensions());
}

} // namespace ws
