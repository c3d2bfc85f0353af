#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string format_flag(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--fix", "-F", "", "Repair the files instead of reporting them", "Basics"},
        {"--exec", "-x", "", "Also flag (or clear) the executable bit", "Basics"},
        {"--extended", "-E", "", "Check the extended extension list", "Basics"},
        {"--verbose", "-v", "", "Report clean and unchanged files too", "Basics"},
        {"--debug", "-V", "", "Very verbose; trace to stderr", "Basics"},
        {"--repo", "-C", "<dir>", "Repository root (default .)", "Basics"},
        {"--stdin", "-S", "", "Read the file list from stdin", "Files"},
        {"--all", "-a", "", "Check every tracked file", "Files"},
        {"--rev", "-r", "<rev>", "Check files touched by a revision or range", "Files"},
        {"--ignore", "-I", "<glob>", "Skip matching paths (repeatable)", "Files"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .wscheck.yaml or .wscheck.json", "Config"},
        {"--log-file", "", "<path>", "Write a log file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, format_flag(o).size());
    }

    os << "wscheck - whitespace checker for source files\n";
    os << "Reports tabs, trailing blanks and carriage returns, optionally fixing them.\n";
    os << "Without a file option the uncommitted changes are checked, then an applied\n";
    os << "patch stack, then the commits not yet pushed upstream.\n\n";
    os << "Usage: " << prog << " [options]\n";
    os << "       " << prog << " -S [options] < file-list\n\n";
    const std::vector<std::string> order{"Basics", "Files", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << format_flag(*o) << o->desc
               << "\n";
        os << "\n";
    }
    os << "Exit status: 0 clean, 1 issues found or fixed (or bad usage), 2 fix aborted.\n";
}
