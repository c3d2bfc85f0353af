#ifndef EXTENSION_MATCHER_HPP
#define EXTENSION_MATCHER_HPP
#include <string>
#include <vector>

namespace ws {

/** Suffixes whose content is always checked. */
const std::vector<std::string>& base_extensions();

/** Suffixes added by `--extended`. Does not repeat the base set. */
const std::vector<std::string>& extra_extensions();

/**
 * @brief Decide whether the content of @p path should be checked.
 *
 * The final path component must end in one of the configured suffixes,
 * matching the glob `*<suffix>`; a name equal to the suffix (`.h`) matches.
 * The comparison is case-sensitive and the path is not normalized.
 *
 * @param path     Candidate path as produced by the file source.
 * @param extended Also accept the extended suffix list.
 */
bool should_check_content(const std::string& path, bool extended);

} // namespace ws

#endif // EXTENSION_MATCHER_HPP
