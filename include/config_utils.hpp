#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * Every scalar entry `key: value` is stored as `--key`. Entries of a nested
 * map (a category such as `logging:`) are flattened into the same namespace.
 * A sequence of scalars is stored with its items joined by newlines.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as load_yaml_config(): the root must be an object whose
 * members are scalars, arrays of scalars or category objects.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
