#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for subcommand style tools.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Only
 * options listed in @a value_flags consume the following argument, so a
 * switch such as `--json` never swallows a positional. Short options (`-m`)
 * map onto their long form through @a short_map. Anything that does not
 * start with a dash is positional; `--` ends option parsing.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value seen per option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Every value of repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value options given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    void store(const std::string& key, const std::string& val) {
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void take(const std::string& key, int argc, char* argv[], int& i) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        if (!value_flags_.count(key)) {
            flags_.insert(key);
            return;
        }
        if (i + 1 < argc)
            store(key, argv[++i]);
        else
            missing_values_.push_back(key);
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags considered valid; empty accepts everything.
     * @param value_flags Flags that take a value.
     * @param short_map Mapping from single character options to long ones.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
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
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    if (known(key))
                        store(key, arg.substr(eq + 1));
                    else
                        unknown_flags_.push_back(key);
                } else {
                    take(arg, argc, argv, i);
                }
            } else if (arg.size() == 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                take(short_map_.at(arg[1]), argc, argv, i);
            } else if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-' &&
                       short_map_.count(arg[1])) {
                // -mvalue or -m=value
                std::string key = short_map_.at(arg[1]);
                std::string val = arg.substr(arg[2] == '=' ? 3 : 2);
                if (!known(key))
                    unknown_flags_.push_back(key);
                else if (value_flags_.count(key))
                    store(key, val);
                else
                    unknown_flags_.push_back(arg);
            } else if (arg.size() > 1 && arg[0] == '-') {
                unknown_flags_.push_back(arg);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /** @brief Whether @p flag was given (with or without a value). */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @brief Last value of @p opt, or an empty string. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @brief Every value given for @p opt in order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared last on the line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
