#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <stdexcept>

#include "graph/errors.hpp"

namespace lgraph {

// Process exit codes
enum ExitCode {
    kExitOk = 0,
    kExitFailure = 1,         // I/O and malformed records
    kExitUsage = 2,           // Bad arguments or configuration
    kExitReference = 3        // Test label on a missing vertex
};

// Argument value holder
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    size_t as_size(size_t default_val = 0) const {
        if (!is_set) return default_val;
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw ConfigurationError("Expected a non-negative integer, got '" + value + "'");
        }
        try {
            return static_cast<size_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            throw ConfigurationError("Integer out of range: '" + value + "'");
        }
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &consumed);
        } catch (const std::exception&) {
            throw ConfigurationError("Expected a number, got '" + value + "'");
        }
        if (consumed != value.size()) {
            throw ConfigurationError("Expected a number, got '" + value + "'");
        }
        return parsed;
    }

    bool as_bool() const {
        return is_set && (value == "true" || value == "1");
    }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw ConfigurationError("Missing required argument: --" + name);
        }
        return named.at(name).value;
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string description;
    bool required = false;
    bool is_flag = false;  // Presence means "true"
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name << " [options]\n\n";
        std::cout << description << "\n\nOptions:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name << (arg.is_flag ? "" : " <value>") << "\n";
            std::cout << "      " << arg.description;
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

// Subcommand dispatcher
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
            return kExitUsage;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return kExitOk;
        }

        if (cmd_name == "--version") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return kExitOk;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return kExitUsage;
        }

        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return kExitOk;
            }
        }

        try {
            Args args = parse_args(argc - 2, argv + 2, cmd);
            return cmd.handler(args);
        } catch (const ConfigurationError& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return kExitUsage;
        } catch (const ReferenceError& e) {
            std::cerr << "Reference error: " << e.what() << "\n";
            return kExitReference;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitFailure;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - label propagation graph builder\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name << std::string(name.length() < 12 ? 12 - name.length() : 1, ' ')
                      << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
    }

private:
    // Accepts --name value, --name=value and bare --flag
    Args parse_args(int argc, char** argv, const Command& cmd) const {
        Args result;

        std::map<std::string, const ArgDef*> by_name;
        for (const auto& arg : cmd.args) {
            by_name[arg.name] = &arg;
        }

        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) {
                throw ConfigurationError("Unexpected argument: " + arg);
            }

            std::string name = arg.substr(2);
            std::string inline_value;
            bool has_inline_value = false;
            auto eq_pos = name.find('=');
            if (eq_pos != std::string::npos) {
                inline_value = name.substr(eq_pos + 1);
                name = name.substr(0, eq_pos);
                has_inline_value = true;
            }

            auto it = by_name.find(name);
            if (it == by_name.end()) {
                throw ConfigurationError("Unknown argument: --" + name);
            }
            const ArgDef* def = it->second;

            if (has_inline_value) {
                result.named[name] = ArgValue{inline_value, true};
            } else if (def->is_flag) {
                result.named[name] = ArgValue{"true", true};
            } else {
                if (i + 1 >= argc) {
                    throw ConfigurationError("Argument --" + name + " requires a value");
                }
                result.named[name] = ArgValue{argv[++i], true};
            }
        }

        for (const auto& arg : cmd.args) {
            if (arg.required && !result.has(arg.name)) {
                throw ConfigurationError("Missing required argument: --" + arg.name);
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace lgraph
