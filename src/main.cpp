#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "ed2kwire/core/logger.hpp"
#include "ed2kwire/core/config.hpp"
#include "ed2kwire/core/cli.hpp"
#include "ed2kwire/core/utils.hpp"
#include "ed2kwire/inspect/capture_dumper.hpp"
#include "ed2kwire/inspect/settings.hpp"

using ed2kwire::core::Config;
using ed2kwire::core::utils::FileUtils;
using ed2kwire::core::utils::StringUtils;
namespace settings = ed2kwire::inspect::settings;

namespace {

std::optional<std::vector<std::uint8_t>> load_capture(const std::string& path, bool hex_input) {
    auto bytes = FileUtils::read_binary_file(path);
    if (!bytes) {
        LOG_ERROR("Cannot read capture file {}", path);
        return std::nullopt;
    }
    if (!hex_input) {
        return bytes;
    }

    auto decoded = StringUtils::from_hex(std::string(bytes->begin(), bytes->end()));
    if (!decoded) {
        LOG_ERROR("Capture file {} is not valid hex text", path);
    }
    return decoded;
}

}

int main(int argc, char* argv[]) {
    ed2kwire::core::CommandLineParser parser("ed2kwire-dump");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    const auto& options = parser.options();
    if (options.show_help) {
        parser.print_help(std::cout);
        return 0;
    }
    if (options.show_version) {
        parser.print_version(std::cout);
        return 0;
    }

    auto& config = Config::instance();
    if (options.config_file && !config.load_from_file(*options.config_file)) {
        std::cerr << "Error: cannot read configuration file " << *options.config_file << "\n";
        return 1;
    }
    config.set_defaults(ed2kwire::inspect::default_settings());

    auto log_level = ed2kwire::core::parse_log_level(config.get_string(settings::LOG_LEVEL));
    if (!log_level) {
        std::cerr << "Error: unknown " << settings::LOG_LEVEL << " '"
                  << config.get_string(settings::LOG_LEVEL) << "'\n";
        return 1;
    }
    if (options.verbose) {
        log_level = ed2kwire::core::LogLevel::Debug;
    }
    ed2kwire::core::Logger::initialize(
        options.log_file.value_or(config.get_string(settings::LOG_FILE)), *log_level);

    for (const auto& problem : config.problems()) {
        LOG_WARN("Ignored configuration line {}", problem);
    }

    bool hex_input = options.hex_input.value_or(config.get_bool(settings::HEX_INPUT));
    auto max_payload = config.get_uint32(settings::MAX_PAYLOAD_SIZE,
                                         ed2kwire::protocol::DEFAULT_MAX_PAYLOAD_SIZE);
    if (max_payload == 0) {
        LOG_WARN("{} is 0, using {}", settings::MAX_PAYLOAD_SIZE,
                 ed2kwire::protocol::DEFAULT_MAX_PAYLOAD_SIZE);
        max_payload = ed2kwire::protocol::DEFAULT_MAX_PAYLOAD_SIZE;
    }

    bool all_clean = true;
    for (const auto& path : options.captures) {
        LOG_INFO("Dumping {}", path);
        auto data = load_capture(path, hex_input);
        if (!data) {
            all_clean = false;
            continue;
        }

        auto stats = ed2kwire::inspect::dump_capture(*data, std::cout, max_payload);
        all_clean = all_clean && stats.clean();
    }

    ed2kwire::core::Logger::shutdown();
    return all_clean ? 0 : 1;
}
