#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Command line parser for wscheck style flags.
 *
 * Long options (`--flag`, `--opt value`, `--opt=value`) and short options
 * (`-x`, clustered `-vF`, `-r value`, `-rvalue`) are recognized. Only options
 * listed in @a value_flags consume an argument; every other flag is a plain
 * switch, so `-x file` never swallows `file`. Flags outside @a known_flags are
 * collected and reported through unknown_flags().
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value seen for each option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                        ///< Every value for repeatable options
    std::vector<std::string> positional_;      ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;   ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;  ///< Value options given without a value
    std::set<std::string> known_flags_;        ///< List of accepted flags
    std::set<std::string> value_flags_;        ///< Flags that take an argument
    std::map<char, std::string> short_map_;    ///< Mapping of short to long flags

    bool accept(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key, const std::string& val) {
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are known.
     * @param short_map   Mapping from single characters to long flags.
     * @param value_flags Long flags that require a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                std::string key = arg.substr(0, eq);
                if (!accept(key)) {
                    unknown_flags_.push_back(key);
                    continue;
                }
                if (eq != std::string::npos) {
                    store(key, arg.substr(eq + 1));
                } else if (value_flags_.count(key)) {
                    if (i + 1 < argc)
                        store(key, argv[++i]);
                    else
                        missing_values_.push_back(key);
                } else {
                    flags_.insert(key);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                for (size_t j = 1; j < arg.size(); ++j) {
                    char c = arg[j];
                    auto it = short_map_.find(c);
                    if (it == short_map_.end() || !accept(it->second)) {
                        unknown_flags_.push_back(std::string("-") + c);
                        break;
                    }
                    const std::string& key = it->second;
                    if (!value_flags_.count(key)) {
                        flags_.insert(key);
                        continue;
                    }
                    // The rest of the cluster, or the next argument, is the value.
                    if (j + 1 < arg.size())
                        store(key, arg.substr(j + 1));
                    else if (i + 1 < argc)
                        store(key, argv[++i]);
                    else
                        missing_values_.push_back(key);
                    break;
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Last stored value or an empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @brief Retrieve all values given for a repeatable option. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value flags that appeared without their argument. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
