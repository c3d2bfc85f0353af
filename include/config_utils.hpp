#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

using ConfigValues = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Load options from a YAML file.
 *
 * Top-level scalar keys become long flags (`fix: true` is stored as
 * `--fix` = `true`). A sequence stores one value per element, which is how
 * repeatable options such as `ignore` are written. A nested map is treated as
 * a section and its keys are flattened the same way, so
 * `logging: {log-file: run.log}` yields `--log-file`.
 *
 * @param path  Filesystem path to the YAML file.
 * @param opts  Map receiving the option values.
 * @param error Output string with a human-readable message on failure.
 * @return `true` if the file was loaded successfully.
 */
bool load_yaml_config(const std::string& path, ConfigValues& opts, std::string& error);

/**
 * @brief Load options from a JSON file.
 *
 * Same mapping as load_yaml_config(); the root value must be an object.
 *
 * @param path  Filesystem path to the JSON file.
 * @param opts  Map receiving the option values.
 * @param error Output string with a human-readable message on failure.
 * @return `true` if the file was loaded successfully.
 */
bool load_json_config(const std::string& path, ConfigValues& opts, std::string& error);

#endif // CONFIG_UTILS_HPP
