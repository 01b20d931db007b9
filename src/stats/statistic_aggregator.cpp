/// @file src/stats/statistic_aggregator.cpp
/// @brief StatisticAggregator — season rates, form, streaks and trend.

#include "matchcast/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace matchcast::stats {

using namespace matchcast::constants;

// ─── rate ─────────────────────────────────────────────────────────────────────

double StatisticAggregator::rate(double value, int games) noexcept {
    if (games <= 0) {
        return 0.0;
    }
    return value / static_cast<double>(std::max(games, 1));
}

// ─── summarize_form ───────────────────────────────────────────────────────────

FormSummary
StatisticAggregator::summarize_form(std::span<const FormResult> recent,
                                    std::size_t window) noexcept {
    FormSummary s;
    const std::size_t n = std::min(recent.size(), window);

    for (std::size_t i = 0; i < n; ++i) {
        switch (recent[i]) {
            case FormResult::Win:
                ++s.wins;
                s.goals_for     += PROXY_GOALS_FOR_WIN;
                s.goals_against += PROXY_GOALS_AGAINST_WIN;
                break;
            case FormResult::Draw:
                ++s.draws;
                s.goals_for     += PROXY_GOALS_DRAW;
                s.goals_against += PROXY_GOALS_DRAW;
                break;
            case FormResult::Loss:
                ++s.losses;
                s.goals_for     += PROXY_GOALS_FOR_LOSS;
                s.goals_against += PROXY_GOALS_AGAINST_LOSS;
                break;
        }
    }

    s.points = s.wins * POINTS_FOR_WIN + s.draws * POINTS_FOR_DRAW;
    return s;
}

// ─── detect_streaks ───────────────────────────────────────────────────────────

StreakSummary
StatisticAggregator::detect_streaks(std::span<const FormResult> recent) noexcept {
    StreakSummary s;
    if (recent.empty()) {
        return s;
    }

    // Current run: maximal prefix equal to the most recent symbol.
    const FormResult head = recent.front();
    std::size_t run = 0;
    while (run < recent.size() && recent[run] == head) {
        ++run;
    }
    switch (head) {
        case FormResult::Win:  s.type = StreakType::Win;  break;
        case FormResult::Draw: s.type = StreakType::Draw; break;
        case FormResult::Loss: s.type = StreakType::Loss; break;
    }
    s.length = static_cast<int>(run);

    // Longest win / loss runs anywhere in the window.
    int win_run = 0;
    int loss_run = 0;
    for (auto r : recent) {
        win_run  = (r == FormResult::Win)  ? win_run + 1  : 0;
        loss_run = (r == FormResult::Loss) ? loss_run + 1 : 0;
        s.longest_win  = std::max(s.longest_win,  win_run);
        s.longest_loss = std::max(s.longest_loss, loss_run);
    }

    return s;
}

// ─── performance_trend ────────────────────────────────────────────────────────

double
StatisticAggregator::performance_trend(std::span<const FormResult> recent) noexcept {
    if (recent.size() < 2) {
        return 0.0;
    }

    double trend = 0.0;
    for (std::size_t i = 0; i + 1 < recent.size(); ++i) {
        const FormResult cur  = recent[i];
        const FormResult next = recent[i + 1];

        if (cur == FormResult::Win && next != FormResult::Loss) {
            trend += 1.0;
        } else if (cur == FormResult::Loss && next == FormResult::Win) {
            trend += 1.0;
        } else if (cur == next) {
            trend += 0.5;
        } else {
            trend -= 1.0;
        }
    }

    return trend / static_cast<double>(recent.size() - 1);
}

// ─── aggregate ────────────────────────────────────────────────────────────────

EntityFeatures
StatisticAggregator::aggregate(const EntitySnapshot& snapshot,
                               std::span<const FormResult> recent,
                               double league_avg_goals) noexcept {
    const auto window = recent.first(std::min(recent.size(), FORM_WINDOW));
    const auto short_window = window.first(std::min(window.size(), SHORT_FORM_WINDOW));
    const int games = snapshot.games_played;

    EntityFeatures f;

    // ── Season rates ──────────────────────────────────────────────────────────
    f.league_position          = static_cast<double>(snapshot.rank);
    f.points_per_game          = rate(snapshot.points, games);
    f.wins_percentage          = rate(snapshot.wins, games) * 100.0;
    f.draws_percentage         = rate(snapshot.draws, games) * 100.0;
    f.losses_percentage        = rate(snapshot.losses, games) * 100.0;
    f.goals_per_game           = rate(snapshot.goals_for, games);
    f.goals_conceded_per_game  = rate(snapshot.goals_against, games);
    f.goal_difference_per_game = f.goals_per_game - f.goals_conceded_per_game;

    // ── Form windows ──────────────────────────────────────────────────────────
    const auto last5  = summarize_form(window, SHORT_FORM_WINDOW);
    const auto last10 = summarize_form(window, FORM_WINDOW);

    f.form_wins_last_5          = last5.wins;
    f.form_draws_last_5         = last5.draws;
    f.form_losses_last_5        = last5.losses;
    f.form_points_last_5        = last5.points;
    f.form_goals_for_last_5     = last5.goals_for;
    f.form_goals_against_last_5 = last5.goals_against;

    f.form_wins_last_10   = last10.wins;
    f.form_draws_last_10  = last10.draws;
    f.form_losses_last_10 = last10.losses;
    f.form_points_last_10 = last10.points;

    // ── Streaks and trend ─────────────────────────────────────────────────────
    const auto streaks = detect_streaks(window);
    f.current_streak_type   = streaks.type;
    f.current_streak_length = streaks.length;
    f.longest_win_streak    = streaks.longest_win;
    f.longest_loss_streak   = streaks.longest_loss;

    f.performance_trend_5  = performance_trend(short_window);
    f.performance_trend_10 = performance_trend(window);

    // ── League strength ───────────────────────────────────────────────────────
    if (games > 0) {
        f.league_strength_rating =
            std::clamp(1.0 + 9.0 * f.points_per_game / 3.0, 1.0, 10.0);
        if (std::isfinite(league_avg_goals) && league_avg_goals > 0.0) {
            f.relative_strength_vs_league =
                f.goals_per_game / (league_avg_goals / 2.0);
        }
    }

    return f;
}

}  // namespace matchcast::stats
