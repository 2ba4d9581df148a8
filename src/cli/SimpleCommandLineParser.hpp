/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser shared by the planet tools
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <sstream>
#include <iostream>
#include <cstdlib>

namespace planet {

/**
 * @brief Minimal GNU-style option parser
 *
 * Supports --long VALUE, --long=VALUE, -s VALUE, boolean flags and
 * positional arguments. Values may be negative numbers.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void set_usage(const std::string& usage) { usage_ = usage; }
    void add_example(const std::string& example) { examples_.push_back(example); }

    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false));
    }

    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    /**
     * @brief Parse arguments (without the program name)
     * @return false on error or when help was requested (see help_requested())
     */
    bool parse(const std::vector<std::string>& args) {
        parsed_values_.clear();
        positional_args_.clear();
        given_.clear();
        help_requested_ = false;

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                size_t eq_pos = option_name.find('=');
                std::optional<std::string> value;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!value) {
                        if (!value_follows(args, i)) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args[++i];
                    }
                    parsed_values_[option_name] = *value;
                } else {
                    parsed_values_[option_name] = "true";
                }
                given_.insert(option_name);

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_number(arg)) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = it->second;
                if (options_[option_name].has_value) {
                    if (!value_follows(args, i)) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
                given_.insert(option_name);
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    /**
     * @brief True when the user gave the option explicitly (defaults do not count)
     */
    bool was_given(const std::string& option_name) const {
        return given_.count(option_name) > 0;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " " << (usage_.empty() ? "[OPTIONS]" : usage_) << "\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : option_order_) {
            const auto& option = options_.at(name);
            std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
            flags += "--" + option.long_name + (option.has_value ? " VALUE" : "");
            std::cout << "    " << flags;
            if (flags.size() < 28) {
                std::cout << std::string(28 - flags.size(), ' ');
            } else {
                std::cout << "\n" << std::string(32, ' ');
            }
            std::cout << option.description;
            if (!option.default_value.empty()) {
                std::cout << " (default: " << option.default_value << ")";
            }
            std::cout << "\n";
        }
        std::cout << "    -h, --help                  Show this help\n";

        if (!examples_.empty()) {
            std::cout << "\nEXAMPLES:\n";
            for (const auto& example : examples_) {
                std::cout << "    " << program_name_ << " " << example << "\n";
            }
        }
    }

private:
    std::string program_name_;
    std::string description_;
    std::string usage_;
    std::vector<std::string> examples_;
    std::map<std::string, Option> options_;
    std::vector<std::string> option_order_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_values_;
    std::set<std::string> given_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;

    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            option_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    static bool is_number(const std::string& text) {
        char* end = nullptr;
        std::strtod(text.c_str(), &end);
        return end != text.c_str() && *end == '\0';
    }

    static bool value_follows(const std::vector<std::string>& args, size_t i) {
        return i + 1 < args.size() && (!args[i + 1].starts_with("-") || is_number(args[i + 1]));
    }
};

} // namespace planet
