#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`)
 * and short options mapped to their long form (e.g. `-d 7`, `-d7`, `-fj`).
 * Only flags listed in @a value_flags consume a value; every other flag is a
 * switch, so `-f scan` keeps `scan` as a positional argument. The form
 * `--opt=value` is accepted for any known flag. A lone `--` ends option
 * parsing and everything after it is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Store all values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value flags given without a value
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags
    std::set<std::string> value_flags_;      ///< Flags that take a value

    bool known(const std::string& key) const {
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
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param value_flags Long flags that take a value from the next argument.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                std::string key = arg.substr(0, eq);
                if (!known(key)) {
                    unknown_flags_.push_back(key);
                    // Skip the value of an unknown value flag so it does not
                    // turn into a positional argument.
                    if (eq == std::string::npos && value_flags_.count(key) && i + 1 < argc)
                        ++i;
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
                continue;
            }

            // Cluster of short options such as -fj or -d7.
            for (size_t j = 1; j < arg.size(); ++j) {
                char c = arg[j];
                auto it = short_map_.find(c);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(std::string("-") + c);
                    break;
                }
                const std::string& key = it->second;
                if (!value_flags_.count(key)) {
                    if (known(key))
                        flags_.insert(key);
                    else
                        unknown_flags_.push_back(key);
                    continue;
                }
                std::string val;
                bool have_val = false;
                if (j + 1 < arg.size()) {
                    val = arg.substr(j + 1);
                    if (!val.empty() && val[0] == '=')
                        val.erase(0, 1);
                    have_val = true;
                } else if (i + 1 < argc) {
                    val = argv[++i];
                    have_val = true;
                }
                if (!known(key))
                    unknown_flags_.push_back(key);
                else if (have_val)
                    store(key, val);
                else
                    missing_values_.push_back(key);
                break;
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned. For a
     * repeated option the last value wins.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /**
     * @brief Retrieve all values associated with an option.
     *
     * If the option was not provided, an empty vector is returned.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value-taking flags that appeared last with nothing after them. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
