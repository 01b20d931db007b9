/// @file src/core/logging.cpp
/// @brief spdlog default-logger installation.

#include "matchcast/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace matchcast::core {

void init_logging(const std::string& level) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
        spdlog::register_logger(logger);
    }
    spdlog::set_default_logger(logger);

    // from_str maps unknown names to "off"; keep "info" instead.
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
    spdlog::flush_on(spdlog::level::warn);
}

}  // namespace matchcast::core
