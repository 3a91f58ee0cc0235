#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line parser for wrapper options followed by forwarded arguments.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` or
 * `--opt=value`) and single character aliases such as `-h`. Flags listed as
 * switches never consume the following argument as their value.
 *
 * When @a max_positional is non-zero, parsing stops once that many positional
 * arguments were collected and every later argument is stored verbatim in
 * remainder(). A literal `--` ends option parsing early.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> remainder_;         ///< Arguments after the last positional
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags
    std::set<std::string> switches_;             ///< Flags that never take a value
    std::size_t max_positional_ = 0;             ///< Positional cap, 0 for none

    bool accepts(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key) {
        if (accepts(key))
            flags_.insert(key);
        else
            unknown_flags_.push_back(key);
    }

    void store(const std::string& key, const std::string& val) {
        if (accepts(key)) {
            flags_.insert(key);
            options_[key] = val;
        } else {
            unknown_flags_.push_back(key);
        }
    }

    void parse_short(const std::string& arg, int& i, int argc, char* argv[]) {
        for (std::size_t j = 1; j < arg.size(); ++j) {
            auto it = short_map_.find(arg[j]);
            if (it == short_map_.end()) {
                unknown_flags_.push_back("-" + std::string(1, arg[j]));
                return;
            }
            const std::string& key = it->second;
            if (switches_.count(key)) {
                store(key);
                continue;
            }
            std::string val = arg.substr(j + 1);
            if (!val.empty() && val[0] == '=')
                val.erase(0, 1);
            if (val.empty() && i + 1 < argc && argv[i + 1][0] != '-')
                val = argv[++i];
            store(key, val);
            return;
        }
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
     * @param switches Flags that are boolean and never take a value.
     * @param max_positional Stop option parsing after this many positional
     *        arguments. Zero disables the cap.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {}, std::size_t max_positional = 0)
        : known_flags_(known_flags), short_map_(short_map), switches_(switches),
          max_positional_(max_positional) {
        bool literal = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (max_positional_ > 0 && positional_.size() >= max_positional_) {
                remainder_.push_back(arg);
                continue;
            }
            if (literal) {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                literal = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    store(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (switches_.count(arg)) {
                    store(arg);
                } else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    store(arg, argv[++i]);
                } else {
                    store(arg);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                parse_short(arg, i, argc, argv);
            } else {
                positional_.push_back(arg);
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
     * If the option was not provided, an empty string is returned.
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

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Arguments following the capped positionals, untouched. */
    const std::vector<std::string>& remainder() const { return remainder_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
