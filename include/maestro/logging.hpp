#pragma once

#include "types.hpp"

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace maestro {

/**
 * @brief Create the process logger described by a LogConfig.
 *
 * The logger is not registered in spdlog's global registry; it is handed to
 * components through the RuntimeContext.
 */
inline Expected<std::shared_ptr<spdlog::logger>> make_logger(const LogConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level", config.level});
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (config.file_path.has_value()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file_path));
        } catch (const spdlog::spdlog_ex& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cannot open log file", e.what()});
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    if (config.pattern.has_value()) {
        logger->set_pattern(*config.pattern);
    } else {
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    }
    logger->flush_on(spdlog::level::warn);
    return logger;
}

/// Logger that discards everything. Used where no logger was supplied.
inline std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = "maestro") {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace maestro
