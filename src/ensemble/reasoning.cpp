/// @file src/ensemble/reasoning.cpp
/// @brief Ordered explanation rules and key-factor labels.

#include "matchcast/ensemble.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace matchcast::ensemble {

namespace {

constexpr double FORM_GAP_THRESHOLD        = 3.0;
constexpr double POSITION_GAP_THRESHOLD    = 5.0;
constexpr double HOME_ADVANTAGE_THRESHOLD  = 0.1;
constexpr double GD_GAP_THRESHOLD          = 0.5;
constexpr double H2H_DOMINANT_RATIO        = 0.6;
constexpr double H2H_WEAK_RATIO            = 0.4;
constexpr double HIGH_CONFIDENCE_REASON    = 0.7;
constexpr double LOW_CONFIDENCE_REASON     = 0.4;
constexpr double HIGH_CONFIDENCE_FACTOR    = 0.8;
constexpr double CLOSE_MATCH_FACTOR        = 0.5;

std::optional<std::string> form_rule(const ReasoningInput& in) {
    const double home = in.features.home.form_points_last_5;
    const double away = in.features.away.form_points_last_5;
    if (std::abs(home - away) <= FORM_GAP_THRESHOLD) {
        return std::nullopt;
    }
    if (home > away) {
        return fmt::format("Home team is in much better form ({:g} vs {:g} points in last 5 games)",
                           home, away);
    }
    return fmt::format("Away team is in much better form ({:g} vs {:g} points in last 5 games)",
                       away, home);
}

std::optional<std::string> position_rule(const ReasoningInput& in) {
    const double gap = in.features.away.league_position - in.features.home.league_position;
    if (gap > POSITION_GAP_THRESHOLD) {
        return fmt::format("Significant league position advantage for home team (+{:g} positions)",
                           gap);
    }
    if (gap < -POSITION_GAP_THRESHOLD) {
        return fmt::format("Significant league position advantage for away team (+{:g} positions)",
                           -gap);
    }
    return std::nullopt;
}

std::optional<std::string> home_advantage_rule(const ReasoningInput& in) {
    const double adv = in.features.match.league_avg_home_advantage;
    if (adv <= HOME_ADVANTAGE_THRESHOLD) {
        return std::nullopt;
    }
    return fmt::format("Strong home advantage in this league ({:.1f}% win rate boost)", adv * 100.0);
}

std::optional<std::string> goal_difference_rule(const ReasoningInput& in) {
    const double home = in.features.home.goal_difference_per_game;
    const double away = in.features.away.goal_difference_per_game;
    if (std::abs(home - away) <= GD_GAP_THRESHOLD) {
        return std::nullopt;
    }
    if (home > away) {
        return fmt::format("Home team has superior goal difference ({:+.2f} vs {:+.2f} per game)",
                           home, away);
    }
    return fmt::format("Away team has superior goal difference ({:+.2f} vs {:+.2f} per game)",
                       away, home);
}

std::optional<std::string> head_to_head_rule(const ReasoningInput& in) {
    const auto& h2h = in.features.h2h;
    if (h2h.h2h_matches_played <= 0.0) {
        return std::nullopt;
    }
    const double ratio = h2h.home_win_ratio();
    if (ratio > H2H_DOMINANT_RATIO) {
        return fmt::format("Home team historically dominant in head-to-head meetings ({:.0f}% wins)",
                           ratio * 100.0);
    }
    if (ratio < H2H_WEAK_RATIO) {
        return std::string("Away team has good head-to-head record against home team");
    }
    return std::nullopt;
}

std::optional<std::string> confidence_rule(const ReasoningInput& in) {
    if (in.confidence > HIGH_CONFIDENCE_REASON) {
        return std::string("High confidence prediction based on multiple strong indicators");
    }
    if (in.confidence < LOW_CONFIDENCE_REASON) {
        return std::string("Low confidence prediction - teams are closely matched");
    }
    return std::nullopt;
}

std::optional<std::string> degraded_rule(const ReasoningInput& in) {
    if (in.degraded_strategies == 0) {
        return std::nullopt;
    }
    return fmt::format("{} of {} scoring strategies fell back to a neutral estimate",
                       in.degraded_strategies, constants::STRATEGY_COUNT);
}

std::optional<std::string> league_defaults_rule(const ReasoningInput& in) {
    if (!in.features.match.league_defaults_used) {
        return std::nullopt;
    }
    return std::string("League averages unavailable; configured defaults were used");
}

}  // anonymous namespace

const std::vector<ReasoningRule>& default_reasoning_rules() {
    static const std::vector<ReasoningRule> rules{
        form_rule,
        position_rule,
        home_advantage_rule,
        goal_difference_rule,
        head_to_head_rule,
        confidence_rule,
        degraded_rule,
        league_defaults_rule,
    };
    return rules;
}

std::vector<std::string>
explain(const std::vector<ReasoningRule>& rules, const ReasoningInput& input) {
    std::vector<std::string> out;
    for (const auto& rule : rules) {
        if (auto sentence = rule(input)) {
            out.push_back(std::move(*sentence));
        }
    }
    return out;
}

std::vector<std::string> key_factors(const features::FeatureVector& fv, double confidence) {
    std::vector<std::string> out;

    if (std::abs(fv.home.form_points_last_5 - fv.away.form_points_last_5) > FORM_GAP_THRESHOLD) {
        out.emplace_back("Significant form difference between teams");
    }
    if (std::abs(fv.home.league_position - fv.away.league_position) > POSITION_GAP_THRESHOLD) {
        out.emplace_back("Large league position gap");
    }
    if (std::abs(fv.home.goal_difference_per_game - fv.away.goal_difference_per_game)
        > GD_GAP_THRESHOLD) {
        out.emplace_back("Divergent goal-scoring records");
    }

    if (confidence > HIGH_CONFIDENCE_FACTOR) {
        out.emplace_back("High prediction confidence");
    } else if (confidence < CLOSE_MATCH_FACTOR) {
        out.emplace_back("Close match - difficult to predict");
    }

    return out;
}

}  // namespace matchcast::ensemble
