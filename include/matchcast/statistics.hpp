#pragma once

/// @file include/matchcast/statistics.hpp
/// @brief Statistic Aggregator — per-entity derived statistics.
///
/// # Module: Statistic Aggregator
///
/// ## Responsibility
/// Turn one entity's snapshot and its recent-results window into the
/// `EntityFeatures` record consumed by every downstream stage: season rates,
/// short/long form, streaks, performance trend and a league-relative
/// strength rating.
///
/// ## Formulae
///   rate            = value / max(games_played, 1)      (0 with no games)
///   percentage      = 100 · rate
///   form points     = 3·W + 1·D over the window
///   form goals      = proxy Win 2–1, Draw 1–1, Loss 1–2
///   strength rating = 1 + 9 · ppg / 3, clamped to [1, 10]
///   relative        = goals_per_game / (league_avg_goals / 2)
///
/// ## Trend
/// For consecutive pairs (cur = w[i], next = w[i+1]), most recent first:
///   cur = W and next ≠ L      → +1
///   cur = L and next = W      → +1
///   cur = next                → +0.5
///   otherwise                 → −1
/// The sum is divided by (len − 1). A window shorter than 2 has trend 0.
///
/// ## Guarantees
/// - Never divides by zero; every output field is finite
/// - Stateless: all methods are static and noexcept

#include "matchcast/types.hpp"
#include "matchcast/constants.hpp"

#include <span>
#include <vector>

namespace matchcast::stats {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Win/draw/loss counts, points and proxy goals over a form window.
struct FormSummary {
    int wins          = 0;
    int draws         = 0;
    int losses        = 0;
    int points        = 0;
    int goals_for     = 0;
    int goals_against = 0;
};

/// Current run and longest runs over a form window.
struct StreakSummary {
    StreakType type         = StreakType::None;
    int        length       = 0;
    int        longest_win  = 0;
    int        longest_loss = 0;
};

/// Derived per-entity features (one record per side).
struct EntityFeatures {
    // Season statistics
    double league_position          = 0.0;
    double points_per_game          = 0.0;
    double wins_percentage          = 0.0;  ///< [0, 100]
    double draws_percentage         = 0.0;  ///< [0, 100]
    double losses_percentage        = 0.0;  ///< [0, 100]
    double goals_per_game           = 0.0;
    double goals_conceded_per_game  = 0.0;
    double goal_difference_per_game = 0.0;

    // Form, last 5
    double form_wins_last_5          = 0.0;
    double form_draws_last_5         = 0.0;
    double form_losses_last_5        = 0.0;
    double form_points_last_5        = 0.0;
    double form_goals_for_last_5     = 0.0;
    double form_goals_against_last_5 = 0.0;

    // Form, last 10
    double form_wins_last_10   = 0.0;
    double form_draws_last_10  = 0.0;
    double form_losses_last_10 = 0.0;
    double form_points_last_10 = 0.0;

    // Streaks
    StreakType current_streak_type   = StreakType::None;
    double     current_streak_length = 0.0;
    double     longest_win_streak    = 0.0;
    double     longest_loss_streak   = 0.0;

    // Trends, each in [-1, 1]
    double performance_trend_5  = 0.0;
    double performance_trend_10 = 0.0;

    // League strength
    double league_strength_rating      = 0.0;  ///< [1, 10], 0 when unrated
    double relative_strength_vs_league = 0.0;

    friend bool operator==(const EntityFeatures&, const EntityFeatures&) = default;
};

// ─── StatisticAggregator ──────────────────────────────────────────────────────

class StatisticAggregator {
public:
    /// Build the full feature record for one entity.
    ///
    /// # Arguments
    /// * `snapshot`         — Season totals of the entity
    /// * `recent`           — Recent results, most recent first (≤ FORM_WINDOW used)
    /// * `league_avg_goals` — League goals per game, for the relative rating
    [[nodiscard]] static EntityFeatures
    aggregate(const EntitySnapshot& snapshot,
              std::span<const FormResult> recent,
              double league_avg_goals = constants::DEFAULT_LEAGUE_AVG_GOALS) noexcept;

    /// Counts, points and proxy goals over the first `window` results.
    [[nodiscard]] static FormSummary
    summarize_form(std::span<const FormResult> recent, std::size_t window) noexcept;

    /// Current and longest streaks over the whole window.
    [[nodiscard]] static StreakSummary
    detect_streaks(std::span<const FormResult> recent) noexcept;

    /// Pairwise performance trend; 0 for windows shorter than 2.
    [[nodiscard]] static double
    performance_trend(std::span<const FormResult> recent) noexcept;

    /// value / max(games, 1), or 0 when games ≤ 0.
    [[nodiscard]] static double rate(double value, int games) noexcept;
};

}  // namespace matchcast::stats
