#pragma once

#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace tfa {

// ============================================================================
// Argument definitions
// ============================================================================

enum class ArgKind {
    Text,       ///< Free text, or one of `choices` when given
    Integer,    ///< Whole number >= min_value
    Flag        ///< No value; presence means set
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    ArgKind kind = ArgKind::Text;
    bool required = false;
    std::vector<std::string> choices;   ///< Allowed values, matched case-insensitively
    int min_value = 0;                  ///< Integer arguments only
};

inline ArgDef text_arg(const std::string& name, const std::string& short_name,
                       const std::string& description, bool required = false) {
    ArgDef def{name, short_name, description};
    def.required = required;
    return def;
}

inline ArgDef choice_arg(const std::string& name, const std::string& short_name,
                         const std::string& description, std::vector<std::string> choices) {
    ArgDef def{name, short_name, description};
    def.choices = std::move(choices);
    return def;
}

inline ArgDef int_arg(const std::string& name, const std::string& short_name,
                      const std::string& description, int min_value) {
    ArgDef def{name, short_name, description, ArgKind::Integer};
    def.min_value = min_value;
    return def;
}

inline ArgDef flag_arg(const std::string& name, const std::string& short_name,
                       const std::string& description) {
    return ArgDef{name, short_name, description, ArgKind::Flag};
}

// ============================================================================
// Parsed arguments
// ============================================================================

/**
 * @brief Validated command-line values
 *
 * Integers have been range-checked and choices canonicalized during parsing,
 * so handlers read them without further checks.
 */
class Args {
public:
    void set(const std::string& name, const std::string& value) { values_[name] = value; }

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = values_.find(name);
        return it != values_.end() ? it->second : fallback;
    }

    int get_int(const std::string& name, int fallback) const {
        auto it = values_.find(name);
        return it != values_.end() ? std::stoi(it->second) : fallback;
    }

    std::string require(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> values_;
};

// ============================================================================
// Commands
// ============================================================================

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n";
        std::cout << description << "\n\n";
        std::cout << "Options:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) {
                std::cout << ", -" << arg.short_name;
            }
            if (!arg.choices.empty()) {
                std::cout << " {";
                for (size_t i = 0; i < arg.choices.size(); ++i) {
                    std::cout << (i ? "|" : "") << arg.choices[i];
                }
                std::cout << "}";
            } else if (arg.kind == ArgKind::Integer) {
                std::cout << " <n>=" << arg.min_value;
            } else if (arg.kind == ArgKind::Text) {
                std::cout << " <value>";
            }
            std::cout << "\n      " << arg.description;
            if (arg.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

// ============================================================================
// CLI
// ============================================================================

class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }

        if (cmd_name == "--version" || cmd_name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }

        const Command& cmd = it->second;
        std::vector<std::string> tokens(argv + 2, argv + argc);

        if (std::find(tokens.begin(), tokens.end(), "--help") != tokens.end() ||
            std::find(tokens.begin(), tokens.end(), "-h") != tokens.end()) {
            cmd.print_help(program_name_);
            return 0;
        }

        Args args;
        try {
            args = parse_args(cmd, tokens);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return 1;
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - Training Feedback Analysis CLI\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

    /**
     * @brief Parse and validate the arguments following the command name
     *
     * Accepts `--name value`, `--name=value` and `-s value`.
     *
     * @throws std::runtime_error on unknown, missing or invalid arguments
     */
    static Args parse_args(const Command& cmd, const std::vector<std::string>& tokens) {
        std::map<std::string, const ArgDef*> lookup;
        for (const auto& arg : cmd.args) {
            lookup["--" + arg.name] = &arg;
            if (!arg.short_name.empty()) {
                lookup["-" + arg.short_name] = &arg;
            }
        }

        Args result;
        for (size_t i = 0; i < tokens.size(); ++i) {
            std::string token = tokens[i];
            std::string inline_value;
            bool has_inline_value = false;

            auto eq_pos = token.find('=');
            if (token.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
                inline_value = token.substr(eq_pos + 1);
                token = token.substr(0, eq_pos);
                has_inline_value = true;
            }

            auto it = lookup.find(token);
            if (it == lookup.end()) {
                throw std::runtime_error(token.rfind("-", 0) == 0
                                             ? "Unknown argument: " + token
                                             : "Unexpected argument: " + token);
            }
            const ArgDef& def = *it->second;

            if (def.kind == ArgKind::Flag) {
                if (has_inline_value) {
                    throw std::runtime_error("--" + def.name + " takes no value");
                }
                result.set(def.name, "true");
                continue;
            }

            std::string value;
            if (has_inline_value) {
                value = inline_value;
            } else if (i + 1 < tokens.size()) {
                value = tokens[++i];
            } else {
                throw std::runtime_error("--" + def.name + " requires a value");
            }
            result.set(def.name, validate(def, value));
        }

        for (const auto& arg : cmd.args) {
            if (arg.required && !result.has(arg.name)) {
                throw std::runtime_error("Missing required argument: --" + arg.name);
            }
        }
        return result;
    }

private:
    static std::string lowered(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Canonical form of value; throws when it does not fit the definition
    static std::string validate(const ArgDef& def, const std::string& value) {
        if (!def.choices.empty()) {
            for (const auto& choice : def.choices) {
                if (lowered(choice) == lowered(value)) {
                    return choice;
                }
            }
            std::string allowed;
            for (const auto& choice : def.choices) {
                allowed += (allowed.empty() ? "" : ", ") + choice;
            }
            throw std::runtime_error("--" + def.name + " must be one of " + allowed +
                                     ", got '" + value + "'");
        }

        if (def.kind == ArgKind::Integer) {
            size_t consumed = 0;
            int number = 0;
            try {
                number = std::stoi(value, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value.size()) {
                throw std::runtime_error("--" + def.name + " expects an integer, got '" +
                                         value + "'");
            }
            if (number < def.min_value) {
                throw std::runtime_error("--" + def.name + " must be at least " +
                                         std::to_string(def.min_value));
            }
            return std::to_string(number);
        }

        return value;
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace tfa
