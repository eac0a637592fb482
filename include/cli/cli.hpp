#pragma once

#include "core/errors.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gv {
namespace cli {

// Process exit codes
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FAILURE_GENERIC = 1,
    EXIT_USAGE = 2,             ///< Bad command line
    EXIT_NETWORK = 3            ///< Data source unreachable or answered with an error
};

/**
 * @brief Thrown for command-line mistakes; run() prints the command help
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Argument Values
// ============================================================================

struct ArgValue {
    std::string name;
    std::string value;
    bool is_set = false;

    explicit operator bool() const { return is_set; }

    // Malformed numbers are usage errors, never silently replaced
    int64_t as_int(int64_t default_val = 0) const {
        if (!is_set) return default_val;
        try {
            size_t consumed = 0;
            int64_t parsed = std::stoll(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw UsageError("--" + name + " expects an integer, got '" + value + "'");
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw UsageError("--" + name + " expects a number, got '" + value + "'");
    }

    // Counts, sizes and seeds
    uint64_t as_count(uint64_t default_val = 0) const {
        if (!is_set) return default_val;
        int64_t parsed = as_int();
        if (parsed < 0) {
            throw UsageError("--" + name + " must not be negative");
        }
        return static_cast<uint64_t>(parsed);
    }

    std::chrono::milliseconds as_millis(std::chrono::milliseconds default_val = {}) const {
        if (!is_set) return default_val;
        return std::chrono::milliseconds(static_cast<int64_t>(as_count()));
    }

    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> result;
        if (!is_set) return result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }
};

// ============================================================================
// Parsed Arguments
// ============================================================================

class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{name, "", false};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    // Value of --name, or fallback when the option was not given
    std::string value_or(const std::string& name, const std::string& fallback) const {
        return has(name) ? named.at(name).value : fallback;
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw UsageError("Missing required argument: --" + name);
        }
        return named.at(name).value;
    }
};

// ============================================================================
// Command Definitions
// ============================================================================

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means true, no value follows
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    std::vector<std::string> examples;  // Full invocations shown under --help

    void print_help(const std::string& program) const {
        std::cout << "\nUsage: " << program << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) std::cout << ", -" << arg.short_name;
            if (!arg.is_flag) std::cout << " <value>";
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }

        if (!examples.empty()) {
            std::cout << "\nExamples:\n";
            for (const auto& example : examples) {
                std::cout << "  " << example << "\n";
            }
        }
        std::cout << "\n";
    }
};

// ============================================================================
// CLI
// ============================================================================

/**
 * @brief Subcommand dispatcher for the gv tool
 *
 * Shared options are appended to every command registered after them. A
 * handler's exceptions become exit codes: UsageError -> EXIT_USAGE,
 * NetworkError -> EXIT_NETWORK, anything else derived from std::exception ->
 * EXIT_FAILURE_GENERIC.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void add_shared_option(ArgDef def) {
        shared_.push_back(std::move(def));
    }

    void register_command(Command cmd) {
        for (const auto& def : shared_) {
            cmd.args.push_back(def);
        }
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return EXIT_USAGE;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return EXIT_OK;
        }
        if (cmd_name == "--version" || cmd_name == "-V") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return EXIT_OK;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::string guess = closest_command(cmd_name);
            if (!guess.empty()) {
                std::cerr << "Did you mean '" << guess << "'?\n";
            }
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return EXIT_USAGE;
        }

        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return EXIT_OK;
            }
        }

        try {
            Args args = parse_args(argc - 2, argv + 2, cmd);
            return cmd.handler(args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return EXIT_USAGE;
        } catch (const NetworkError& e) {
            std::cerr << "Network error: " << e.what() << "\n";
            return EXIT_NETWORK;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return EXIT_FAILURE_GENERIC;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - viewport streaming and virtualization for large graphs\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name << std::string(name.length() < 16 ? 16 - name.length() : 1, ' ')
                      << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

private:
    // A registered command that starts with, or is a prefix of, what was typed
    std::string closest_command(const std::string& typed) const {
        for (const auto& [name, cmd] : commands_) {
            if (name.rfind(typed, 0) == 0 || typed.rfind(name, 0) == 0) {
                return name;
            }
        }
        return "";
    }

    Args parse_args(int argc, char** argv, const Command& cmd) const {
        Args result;

        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto& arg : cmd.args) {
            by_name["--" + arg.name] = &arg;
            if (!arg.short_name.empty()) {
                by_short["-" + arg.short_name] = &arg;
            }
        }

        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            const ArgDef* def = nullptr;

            if (arg.rfind("--", 0) == 0) {
                auto eq_pos = arg.find('=');
                if (eq_pos != std::string::npos) {
                    auto it = by_name.find(arg.substr(0, eq_pos));
                    if (it != by_name.end() && !it->second->is_flag) {
                        def = it->second;
                        result.named[def->name] = ArgValue{def->name, arg.substr(eq_pos + 1), true};
                        continue;
                    }
                }
                auto it = by_name.find(arg);
                if (it != by_name.end()) def = it->second;
            } else if (arg.size() == 2 && arg[0] == '-') {
                auto it = by_short.find(arg);
                if (it != by_short.end()) def = it->second;
            } else {
                result.positional.push_back(arg);
                continue;
            }

            if (!def) {
                throw UsageError("Unknown argument: " + arg);
            }

            if (def->is_flag) {
                result.named[def->name] = ArgValue{def->name, "true", true};
            } else {
                // Values may start with '-' (negative pan steps, chunk_-1_0)
                if (i + 1 >= argc) {
                    throw UsageError("Argument " + arg + " requires a value");
                }
                result.named[def->name] = ArgValue{def->name, argv[++i], true};
            }
        }

        for (const auto& arg : cmd.args) {
            if (result.named.count(arg.name)) continue;
            if (arg.required) {
                throw UsageError("Missing required argument: --" + arg.name);
            }
            if (!arg.default_value.empty()) {
                result.named[arg.name] = ArgValue{arg.name, arg.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::vector<ArgDef> shared_;
    std::map<std::string, Command> commands_;
};

} // namespace cli
} // namespace gv
