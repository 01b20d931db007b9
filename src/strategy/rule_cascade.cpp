/// @file src/strategy/rule_cascade.cpp
/// @brief RuleCascadeStrategy — additive decision rules.

#include "matchcast/strategy.hpp"

#include <algorithm>

namespace matchcast::strategy {

OutcomeProbabilities
RuleCascadeStrategy::evaluate(const features::FeatureVector& fv) const {
    const auto& home = fv.home;
    const auto& away = fv.away;

    double home_score = 0.0;
    double draw_score = 0.0;
    double away_score = 0.0;

    // Recent form.
    const double form_gap = home.form_points_last_5 - away.form_points_last_5;
    if (form_gap > FORM_GAP) {
        home_score += FORM_WEIGHT;
    } else if (form_gap < -FORM_GAP) {
        away_score += FORM_WEIGHT;
    } else {
        draw_score += FORM_DRAW_WEIGHT;
    }

    // Goal difference per game.
    const double gd_gap = home.goal_difference_per_game - away.goal_difference_per_game;
    if (gd_gap > GD_GAP) {
        home_score += GD_WEIGHT;
    } else if (gd_gap < -GD_GAP) {
        away_score += GD_WEIGHT;
    }

    // Table position: a lower number is better.
    const double rank_gap = away.league_position - home.league_position;
    if (rank_gap > RANK_GAP) {
        home_score += RANK_WEIGHT;
    } else if (rank_gap < -RANK_GAP) {
        away_score += RANK_WEIGHT;
    }

    home_score += HOME_ADV_WEIGHT * fv.match.league_avg_home_advantage;

    // Short-term trend.
    const double trend_gap = home.performance_trend_5 - away.performance_trend_5;
    if (trend_gap > TREND_GAP) {
        home_score += TREND_WEIGHT;
    } else if (trend_gap < -TREND_GAP) {
        away_score += TREND_WEIGHT;
    }

    draw_score += BASE_DRAW_MASS;

    const double total = home_score + draw_score + away_score;
    const OutcomeProbabilities clamped{
        .home_win = std::clamp(home_score / total, MIN_BUCKET, MAX_BUCKET),
        .draw     = std::clamp(draw_score / total, MIN_BUCKET, MAX_BUCKET),
        .away_win = std::clamp(away_score / total, MIN_BUCKET, MAX_BUCKET),
    };

    const double sum = clamped.sum();
    return OutcomeProbabilities{
        .home_win = clamped.home_win / sum,
        .draw     = clamped.draw / sum,
        .away_win = clamped.away_win / sum,
    };
}

}  // namespace matchcast::strategy
