#include "ed2kwire/core/cli.hpp"
#include <array>
#include <iomanip>
#include <string_view>
#include <utility>

namespace ed2kwire::core {

namespace {
    enum class OptionId { HELP, VERSION, CONFIG, HEX, RAW, VERBOSE, LOG_FILE };

    struct OptionSpec {
        OptionId id;
        char short_name;            // '\0' when there is none
        std::string_view long_name;
        std::string_view value_name;  // Empty for flags
        std::string_view description;
    };

    constexpr std::array<OptionSpec, 7> OPTIONS{{
        {OptionId::HELP,     'h',  "help",     "",     "Show this help message"},
        {OptionId::VERSION,  'v',  "version",  "",     "Show version information"},
        {OptionId::CONFIG,   'c',  "config",   "FILE", "Read settings from FILE"},
        {OptionId::HEX,      'x',  "hex",      "",     "Captures are hex text (dump.hex_input)"},
        {OptionId::RAW,      '\0', "raw",      "",     "Captures are raw bytes"},
        {OptionId::VERBOSE,  '\0', "verbose",  "",     "Log at debug level"},
        {OptionId::LOG_FILE, '\0', "log-file", "FILE", "Write the log to FILE (log.file)"}
    }};

    const OptionSpec* find_long(std::string_view name) {
        for (const auto& option : OPTIONS) {
            if (option.long_name == name) return &option;
        }
        return nullptr;
    }

    const OptionSpec* find_short(char name) {
        for (const auto& option : OPTIONS) {
            if (option.short_name != '\0' && option.short_name == name) return &option;
        }
        return nullptr;
    }

    std::string display_name(const OptionSpec& option) {
        return "--" + std::string(option.long_name);
    }
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    options_ = DumpOptions{};
    error_.clear();

    bool options_done = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            options_.captures.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const OptionSpec* option = nullptr;
        std::optional<std::string> inline_value;

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            option = find_long(std::string_view(arg).substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2));
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
            }
        } else if (arg.size() == 2) {
            option = find_short(arg[1]);
        }

        if (option == nullptr) {
            return fail("Unknown option: " + arg);
        }

        std::string value;
        if (option->value_name.empty()) {
            if (inline_value) {
                return fail("Option " + display_name(*option) + " does not take a value");
            }
        } else if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return fail("Option " + display_name(*option) + " requires a value");
        }

        if (!option->value_name.empty() && value.empty()) {
            return fail("Option " + display_name(*option) + " has an empty value");
        }

        switch (option->id) {
            case OptionId::HELP:
                options_.show_help = true;
                break;
            case OptionId::VERSION:
                options_.show_version = true;
                break;
            case OptionId::VERBOSE:
                options_.verbose = true;
                break;
            case OptionId::HEX:
            case OptionId::RAW: {
                bool hex = option->id == OptionId::HEX;
                if (options_.hex_input && *options_.hex_input != hex) {
                    return fail("Options --hex and --raw are mutually exclusive");
                }
                options_.hex_input = hex;
                break;
            }
            case OptionId::CONFIG:
                if (options_.config_file) {
                    return fail("Option --config given more than once");
                }
                options_.config_file = value;
                break;
            case OptionId::LOG_FILE:
                if (options_.log_file) {
                    return fail("Option --log-file given more than once");
                }
                options_.log_file = value;
                break;
        }
    }

    if (!options_.show_help && !options_.show_version && options_.captures.empty()) {
        return fail("No capture files given");
    }
    return true;
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] [--] CAPTURE...\n\n"
        << "Prints every ed2k message found in each capture file.\n\n"
        << "Options:\n";

    for (const auto& option : OPTIONS) {
        std::string names = option.short_name != '\0'
            ? std::string("-") + option.short_name + ", "
            : std::string("    ");
        names += "--" + std::string(option.long_name);
        if (!option.value_name.empty()) {
            names += " " + std::string(option.value_name);
        }
        out << "  " << std::left << std::setw(24) << names << option.description << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version 1.0.0\n";
}

}
