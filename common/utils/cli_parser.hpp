#ifndef CHATLIVE_CLI_PARSER_HPP
#define CHATLIVE_CLI_PARSER_HPP

/******************************************************************************
 *
 * @file       cli_parser.hpp
 * @brief      getopt_long based command line parser with per-option callbacks
 *
 *****************************************************************************/

#include <getopt.h>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatlive {
namespace utils {

enum class ArgumentType {
    FLAG,     // no value, callback receives "true"
    STRING,
    INTEGER
};

// Returns false to reject the value
using ArgumentCallback = std::function<bool(const std::string& value)>;

struct ArgumentDefinition {
    std::string long_name;
    char short_name = 0;  // 0: long form only
    ArgumentType type = ArgumentType::FLAG;
    std::string description;
    std::string default_value;
    ArgumentCallback callback;
};

struct ParseResult {
    bool success = true;
    bool help_requested = false;
    std::string error_message;
    std::vector<std::string> remaining_args;
};

class CLIParser {
public:
    explicit CLIParser(std::string program_name, std::string program_description = "")
            : program_name_(std::move(program_name)),
              program_description_(std::move(program_description)) {}

    bool addArgument(const std::string& long_name, char short_name, ArgumentType type,
                     const std::string& description, const std::string& default_value = "",
                     ArgumentCallback callback = nullptr) {
        if (long_name.empty() || long_name == "help" || short_name == 'h') {
            return false;
        }
        for (const auto& def : arguments_) {
            if (def.long_name == long_name || (short_name != 0 && def.short_name == short_name)) {
                return false;
            }
        }

        ArgumentDefinition def;
        def.long_name = long_name;
        def.short_name = short_name;
        def.type = type;
        def.description = description;
        def.default_value = default_value;
        def.callback = std::move(callback);
        arguments_.push_back(std::move(def));
        return true;
    }

    /**
     * @brief Parse argv, running callbacks for given options and then for
     *        defaults of options that were not given
     */
    ParseResult parse(int argc, char* argv[]) {
        ParseResult result;
        parsed_.clear();

        std::vector<struct option> long_options;
        std::string short_options = ":h";
        long_options.push_back({"help", no_argument, nullptr, 'h'});
        for (size_t i = 0; i < arguments_.size(); ++i) {
            const auto& def = arguments_[i];
            int has_arg = def.type == ArgumentType::FLAG ? no_argument : required_argument;
            int val = def.short_name != 0 ? def.short_name : kLongOnlyBase + static_cast<int>(i);
            long_options.push_back({def.long_name.c_str(), has_arg, nullptr, val});
            if (def.short_name != 0) {
                short_options += def.short_name;
                if (def.type != ArgumentType::FLAG) {
                    short_options += ':';
                }
            }
        }
        long_options.push_back({nullptr, 0, nullptr, 0});

        optind = 0;  // 0 makes glibc reset its scanner between parses
        opterr = 0;
        int c;
        while ((c = getopt_long(argc, argv, short_options.c_str(), long_options.data(),
                                nullptr)) != -1) {
            if (c == 'h') {
                result.help_requested = true;
                continue;
            }
            if (c == '?' || c == ':') {
                result.success = false;
                result.error_message = c == ':' ? "Missing value for an option"
                                                : "Unknown option";
                return result;
            }
            const ArgumentDefinition* def = findByOption(c);
            if (!def) {
                result.success = false;
                result.error_message = "Unknown option";
                return result;
            }
            std::string value = def->type == ArgumentType::FLAG ? "true" : std::string(optarg);
            if (!apply(*def, value, result)) {
                return result;
            }
        }

        for (int i = optind; i < argc; ++i) {
            result.remaining_args.emplace_back(argv[i]);
        }

        for (const auto& def : arguments_) {
            if (parsed_.count(def.long_name) == 0 && !def.default_value.empty()) {
                if (!apply(def, def.default_value, result)) {
                    return result;
                }
            }
        }
        return result;
    }

    void printHelp(std::ostream& out = std::cout) const {
        out << program_name_;
        if (!program_description_.empty()) {
            out << " - " << program_description_;
        }
        out << "\n\nUSAGE:\n    " << program_name_ << " [OPTIONS]\n\nOPTIONS:\n";
        out << "    -h, --help" << std::string(20, ' ') << "Show this help message\n";
        for (const auto& def : arguments_) {
            std::string name = def.long_name;
            if (def.type == ArgumentType::STRING) name += " <STRING>";
            if (def.type == ArgumentType::INTEGER) name += " <INT>";
            out << "    " << (def.short_name ? std::string("-") + def.short_name + ", " : "    ")
                << "--" << name << std::string(std::max(1, 24 - static_cast<int>(name.size())), ' ')
                << def.description;
            if (!def.default_value.empty()) {
                out << " (default: " << def.default_value << ")";
            }
            out << "\n";
        }
    }

private:
    static constexpr int kLongOnlyBase = 1000;

    const ArgumentDefinition* findByOption(int c) const {
        if (c >= kLongOnlyBase) {
            size_t index = static_cast<size_t>(c - kLongOnlyBase);
            return index < arguments_.size() ? &arguments_[index] : nullptr;
        }
        auto it = std::find_if(arguments_.begin(), arguments_.end(),
                               [c](const ArgumentDefinition& def) { return def.short_name == c; });
        return it == arguments_.end() ? nullptr : &*it;
    }

    bool apply(const ArgumentDefinition& def, const std::string& value, ParseResult& result) {
        if (def.type == ArgumentType::INTEGER) {
            try {
                size_t pos = 0;
                std::stoll(value, &pos);
                if (pos != value.size()) {
                    throw std::invalid_argument("trailing characters");
                }
            } catch (const std::exception&) {
                result.success = false;
                result.error_message = "Invalid integer '" + value + "' for --" + def.long_name;
                return false;
            }
        }
        if (def.callback && !def.callback(value)) {
            result.success = false;
            result.error_message = "Invalid value '" + value + "' for --" + def.long_name;
            return false;
        }
        parsed_[def.long_name] = value;
        return true;
    }

    std::string program_name_;
    std::string program_description_;
    std::vector<ArgumentDefinition> arguments_;
    std::map<std::string, std::string> parsed_;
};

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_CLI_PARSER_HPP
