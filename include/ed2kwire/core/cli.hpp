#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ed2kwire::core {

struct DumpOptions {
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
    std::optional<bool> hex_input;            // Unset: fall back to configuration
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    std::vector<std::string> captures;
};

// Command line of ed2kwire-dump:
//
//   ed2kwire-dump [-h] [-v] [-c FILE] [-x | --raw] [--verbose]
//                 [--log-file FILE] [--] CAPTURE...
//
// Value options take their value as the next argument or after '=' on the
// long form. Short options do not cluster. Everything after "--" is a
// capture path.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    const DumpOptions& options() const { return options_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out) const;
    void print_version(std::ostream& out) const;

private:
    bool fail(std::string message);

    std::string program_name_;
    DumpOptions options_;
    std::string error_;
};

}
