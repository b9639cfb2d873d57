#pragma once

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace rd {

/**
 * @brief Process exit codes shared by every command
 */
enum class ExitCode {
    OK = 0,
    FAILED = 1,
    WARNINGS = 2
};

/**
 * @brief Bad command line: unknown option, missing value or required option
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// Option value holder
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }
};

// Parsed command line of one command
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> extra;     ///< Bare words beyond the positional slot

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() ? it->second : ArgValue{};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw UsageError("Missing required argument: --" + name);
        }
        return it->second.value;
    }
};

/**
 * @brief One --option of a command
 *
 * Unset options fall back to env_var, then default_value.
 */
struct OptionSpec {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    std::string env_var;
    bool required = false;
    bool is_flag = false;
};

/**
 * @brief A subcommand: options, an optional positional slot and its handler
 *
 * When positional is set, the first bare word fills the option of that
 * name, so "convert book.epub" and "convert --input book.epub" agree.
 */
struct CommandSpec {
    std::string name;
    std::string summary;
    std::string positional;
    std::vector<OptionSpec> options;
    std::function<ExitCode(const Args&)> handler;

    void print_usage(const std::string& program) const {
        std::cout << "\nUsage: " << program << " " << name;
        if (!positional.empty()) {
            std::cout << " <" << positional << ">";
        }
        std::cout << " [options]\n\n" << summary << "\n\nOptions:\n";

        for (const auto& opt : options) {
            std::string flag = "  --" + opt.name;
            if (!opt.short_name.empty()) flag += ", -" + opt.short_name;
            if (!opt.is_flag) flag += " <value>";
            std::cout << flag << "\n      " << opt.description;
            if (!opt.env_var.empty()) std::cout << " [env: " << opt.env_var << "]";
            if (!opt.default_value.empty()) std::cout << " (default: " << opt.default_value << ")";
            if (opt.required && opt.name != positional) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Subcommand dispatcher for the rittdoc executable
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version)
        : program_(std::move(program)), version_(std::move(version)) {}

    void add(CommandSpec command) {
        std::string key = command.name;
        commands_[key] = std::move(command);
    }

    /**
     * @brief Parse argv and run the selected command
     *
     * Usage errors and exceptions escaping a handler give ExitCode::FAILED.
     */
    int run(int argc, char** argv) const {
        if (argc < 2) {
            print_overview();
            return static_cast<int>(ExitCode::FAILED);
        }

        std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            print_overview();
            return static_cast<int>(ExitCode::OK);
        }
        if (first == "--version" || first == "-v") {
            std::cout << program_ << " " << version_ << "\n";
            return static_cast<int>(ExitCode::OK);
        }

        auto it = commands_.find(first);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << first << "\n"
                      << "Run '" << program_ << " --help' for the command list.\n";
            return static_cast<int>(ExitCode::FAILED);
        }
        const CommandSpec& command = it->second;

        std::vector<std::string> words(argv + 2, argv + argc);
        for (const auto& word : words) {
            if (word == "--help" || word == "-h") {
                command.print_usage(program_);
                return static_cast<int>(ExitCode::OK);
            }
        }

        Args args;
        try {
            args = parse(command, words);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            command.print_usage(program_);
            return static_cast<int>(ExitCode::FAILED);
        }

        try {
            return static_cast<int>(command.handler(args));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return static_cast<int>(ExitCode::FAILED);
        }
    }

    void print_overview() const {
        std::cout << program_ << " " << version_ << " - PDF/EPUB to RittDoc conversion\n\n"
                  << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, command] : commands_) {
            std::string padded = name;
            padded.resize(std::max<size_t>(name.size(), 14), ' ');
            std::cout << "  " << padded << command.summary << "\n";
        }
        std::cout << "\nExit codes: 0 success, 2 success with warnings, 1 failure\n"
                  << "Run '" << program_ << " <command> --help' for its options.\n";
    }

private:
    static Args parse(const CommandSpec& command, const std::vector<std::string>& words) {
        std::map<std::string, const OptionSpec*> lookup;
        for (const auto& opt : command.options) {
            lookup["--" + opt.name] = &opt;
            if (!opt.short_name.empty()) lookup["-" + opt.short_name] = &opt;
        }

        Args args;
        for (size_t i = 0; i < words.size(); ++i) {
            const std::string& word = words[i];

            if (word.empty() || word[0] != '-') {
                if (!command.positional.empty() && !args.has(command.positional)) {
                    args.named[command.positional] = ArgValue{word, true};
                } else {
                    args.extra.push_back(word);
                }
                continue;
            }

            // --name=value
            std::string key = word;
            std::string inline_value;
            bool has_inline = false;
            size_t eq = word.find('=');
            if (word.rfind("--", 0) == 0 && eq != std::string::npos) {
                key = word.substr(0, eq);
                inline_value = word.substr(eq + 1);
                has_inline = true;
            }

            auto found = lookup.find(key);
            if (found == lookup.end()) {
                throw UsageError("Unknown option: " + key);
            }
            const OptionSpec& opt = *found->second;

            if (opt.is_flag) {
                if (has_inline) {
                    throw UsageError("Option " + key + " takes no value");
                }
                args.named[opt.name] = ArgValue{"true", true};
            } else if (has_inline) {
                args.named[opt.name] = ArgValue{inline_value, true};
            } else {
                if (i + 1 >= words.size()) {
                    throw UsageError("Option " + key + " requires a value");
                }
                args.named[opt.name] = ArgValue{words[++i], true};
            }
        }

        for (const auto& opt : command.options) {
            if (args.has(opt.name)) continue;
            const char* env = opt.env_var.empty() ? nullptr : std::getenv(opt.env_var.c_str());
            if (env && *env) {
                args.named[opt.name] = ArgValue{env, true};
            } else if (!opt.default_value.empty()) {
                args.named[opt.name] = ArgValue{opt.default_value, true};
            } else if (opt.required) {
                throw UsageError("Missing required argument: --" + opt.name);
            }
        }
        return args;
    }

    std::string program_;
    std::string version_;
    std::map<std::string, CommandSpec> commands_;
};

} // namespace rd
