#include "ed2kwire/core/logger.hpp"
#include "ed2kwire/core/utils.hpp"
#include <spdlog/pattern_formatter.h>

namespace ed2kwire::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

std::optional<LogLevel> parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(utils::StringUtils::to_lower(name));
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && utils::StringUtils::to_lower(name) != "off") {
        return std::nullopt;
    }
    return static_cast<LogLevel>(level);
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("ed2kwire", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_DEBUG("Shutting down logger");
        logger_->flush();
        // Hand the default slot to a console-only logger so the file sink closes.
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "ed2kwire", std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    return logger_ ? logger_ : spdlog::default_logger();
}

}
