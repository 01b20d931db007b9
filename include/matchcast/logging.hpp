#pragma once

/// @file include/matchcast/logging.hpp
/// @brief Process-wide logger setup.

#include <string>

namespace matchcast::core {

/// Name of the default logger installed by `init_logging`.
inline constexpr const char* LOGGER_NAME = "matchcast";

/// Install a colour stdout logger named "matchcast" as the spdlog default
/// and set its level ("trace", "debug", "info", "warn", "error", "critical",
/// "off"). Unknown level names fall back to "info". Safe to call again to
/// change the level.
void init_logging(const std::string& level = "info");

}  // namespace matchcast::core
