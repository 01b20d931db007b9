/// @file src/core/config.cpp
/// @brief EngineConfig environment overrides and validation.

#include "matchcast/engine.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>

namespace matchcast::core {

namespace {

std::string get_env(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? value : default_value;
}

std::size_t get_env_size(const char* name, std::size_t default_value) {
    const char* value = std::getenv(name);
    if (value) {
        try {
            const long long parsed = std::stoll(value);
            if (parsed >= 0) {
                return static_cast<std::size_t>(parsed);
            }
            spdlog::warn("Negative value for {}: {}", name, value);
        } catch (const std::exception&) {
            spdlog::warn("Invalid integer value for {}: {}", name, value);
        }
    }
    return default_value;
}

double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    if (value) {
        try {
            return std::stod(value);
        } catch (const std::exception&) {
            spdlog::warn("Invalid double value for {}: {}", name, value);
        }
    }
    return default_value;
}

std::chrono::milliseconds get_env_ms(const char* name, std::chrono::milliseconds default_value) {
    const auto count = get_env_size(name, static_cast<std::size_t>(default_value.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(count)};
}

}  // anonymous namespace

void EngineConfig::load_from_env() {
    // Ensemble
    weights.rule_cascade    = get_env_double("MATCHCAST_WEIGHT_RULE_CASCADE", weights.rule_cascade);
    weights.majority_vote   = get_env_double("MATCHCAST_WEIGHT_MAJORITY_VOTE", weights.majority_vote);
    weights.layered_weights = get_env_double("MATCHCAST_WEIGHT_LAYERED_WEIGHTS", weights.layered_weights);
    home_advantage_scale    = get_env_double("MATCHCAST_HOME_ADVANTAGE_SCALE", home_advantage_scale);
    high_confidence_threshold =
        get_env_double("MATCHCAST_HIGH_CONFIDENCE_THRESHOLD", high_confidence_threshold);

    // Feature windows
    h2h_window  = get_env_size("MATCHCAST_H2H_WINDOW", h2h_window);
    form_window = get_env_size("MATCHCAST_FORM_WINDOW", form_window);

    // League defaults
    league_defaults.avg_goals_per_game =
        get_env_double("MATCHCAST_LEAGUE_AVG_GOALS", league_defaults.avg_goals_per_game);
    league_defaults.avg_home_advantage =
        get_env_double("MATCHCAST_LEAGUE_HOME_ADVANTAGE", league_defaults.avg_home_advantage);

    // Orchestration
    lookup_timeout    = get_env_ms("MATCHCAST_LOOKUP_TIMEOUT_MS", lookup_timeout);
    batch_limit       = get_env_size("MATCHCAST_BATCH_LIMIT", batch_limit);
    batch_concurrency = get_env_size("MATCHCAST_BATCH_CONCURRENCY", batch_concurrency);
    batch_pause       = get_env_ms("MATCHCAST_BATCH_PAUSE_MS", batch_pause);
    max_importance    = get_env_size("MATCHCAST_MAX_IMPORTANCE", max_importance);

    log_level = get_env("MATCHCAST_LOG_LEVEL", log_level);
}

bool EngineConfig::is_valid() const noexcept {
    if (!weights.is_valid()) return false;
    if (!std::isfinite(home_advantage_scale) || home_advantage_scale < 0.0) return false;
    if (!std::isfinite(high_confidence_threshold)
        || high_confidence_threshold < 0.0 || high_confidence_threshold > 1.0) return false;

    if (h2h_window == 0) return false;
    if (form_window == 0 || form_window > constants::FORM_WINDOW) return false;

    if (!std::isfinite(league_defaults.avg_goals_per_game)
        || league_defaults.avg_goals_per_game <= 0.0) return false;
    if (!std::isfinite(league_defaults.avg_home_advantage)) return false;

    if (lookup_timeout.count() <= 0) return false;
    if (batch_limit == 0 || batch_limit > constants::MAX_BATCH_SIZE) return false;
    if (batch_concurrency == 0) return false;
    if (batch_pause.count() < 0) return false;

    return true;
}

}  // namespace matchcast::core
