#pragma once

/// @file include/matchcast/context.hpp
/// @brief Contextual Feature Builder — fixture-level features.
///
/// # Module: Contextual Feature Builder
///
/// ## Responsibility
/// Derive everything about a fixture that is not a property of a single
/// entity: rest days and congestion, calendar position within the season,
/// league scoring baselines, the head-to-head record between the two sides,
/// and the external (weather / officiating / motivation) factors.
///
/// ## Season calendar
/// A season starts on 1 August. Fixtures dated before 1 August belong to the
/// season that started the previous year.
///   progress = min(100, elapsed_days / 365 · 100)
///   week     = ceil(progress / 2.6)
///   played   = 2 · week
///
/// ## Failure model
/// - Entity lookups: NotFound and Transient propagate
/// - History lookups: Transient propagates; no meetings is not an error
/// - League / external lookups: Transient degrades to defaults and sets the
///   corresponding flag (`league_defaults_used`, `placeholder`)
///
/// ## NOT Responsible For
/// - Per-entity statistics (see statistics.hpp)
/// - Validating finiteness (see features.hpp)

#include "matchcast/types.hpp"
#include "matchcast/constants.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace matchcast {

class EntitySource;
class HistorySource;
class LeagueSource;
class ExternalFactorSource;
class DeadlineRunner;

}  // namespace matchcast

namespace matchcast::context {

// ─── Feature Families ─────────────────────────────────────────────────────────

/// League scoring baselines.
struct LeagueAverages {
    double avg_goals_per_game = constants::DEFAULT_LEAGUE_AVG_GOALS;
    double avg_home_advantage = constants::DEFAULT_LEAGUE_AVG_HOME_ADVANTAGE;
};

/// Fixture timing, calendar and league context.
struct MatchFeatures {
    double days_since_last_match      = constants::DEFAULT_REST_DAYS;  ///< min of both sides
    double days_since_last_match_home = constants::DEFAULT_REST_DAYS;
    double days_since_last_match_away = constants::DEFAULT_REST_DAYS;
    double matches_in_last_14_days    = 0.0;
    bool   is_weekend_match           = false;
    bool   is_even_week               = false;
    double match_importance           = 3.0;  ///< [1, 5]
    double league_avg_goals_per_game  = constants::DEFAULT_LEAGUE_AVG_GOALS;
    double league_avg_home_advantage  = constants::DEFAULT_LEAGUE_AVG_HOME_ADVANTAGE;
    double season_week                = 0.0;
    double season_matches_played      = 0.0;
    double season_progress_percentage = 0.0;  ///< [0, 100]

    /// League lookup failed; the averages above are the configured defaults.
    bool league_defaults_used = false;

    friend bool operator==(const MatchFeatures&, const MatchFeatures&) = default;
};

/// Head-to-head record from the home entity's perspective, regardless of
/// where past meetings were played.
struct HeadToHeadFeatures {
    double h2h_matches_played    = 0.0;
    double h2h_home_wins         = 0.0;
    double h2h_draws             = 0.0;
    double h2h_away_wins         = 0.0;
    double h2h_home_goals_avg    = 0.0;
    double h2h_away_goals_avg    = 0.0;
    double h2h_total_goals_avg   = 0.0;
    double recent_h2h_home_wins  = 0.0;  ///< last 5 meetings
    double recent_h2h_draws      = 0.0;
    double recent_h2h_away_wins  = 0.0;
    double h2h_trend             = 0.0;  ///< [-1, 1]
    double venue_h2h_matches     = 0.0;  ///< meetings at the fixture's venue
    double venue_h2h_home_wins   = 0.0;

    /// Date of the most recent counted meeting.
    std::optional<Timestamp> last_meeting;

    /// Share of meetings won by the home entity; 0 with no meetings.
    [[nodiscard]] double home_win_ratio() const noexcept;

    friend bool operator==(const HeadToHeadFeatures&, const HeadToHeadFeatures&) = default;
};

/// Weather, officiating and squad factors.
struct ExternalFactors {
    double weather_condition          = 7.0;      ///< 1 (severe) – 10 (ideal)
    double temperature                = 20.0;     ///< °C
    double expected_attendance        = 50000.0;
    double attendance_percentage      = 85.0;     ///< [0, 100]
    double referee_home_bias          = 0.1;
    double referee_cards_per_game     = 3.5;
    double referee_penalties_per_game = 0.8;
    double home_motivation            = 7.0;      ///< 1 – 10
    double away_motivation            = 7.0;      ///< 1 – 10
    double home_key_players_missing   = 0.0;      ///< % of first-choice squad
    double away_key_players_missing   = 0.0;

    /// Neutral placeholder values, not sourced data.
    bool placeholder = true;

    friend bool operator==(const ExternalFactors&, const ExternalFactors&) = default;
};

/// Everything the builder produces for one fixture.
struct ContextFeatures {
    MatchFeatures      match;
    HeadToHeadFeatures h2h;
    ExternalFactors    external;
};

// ─── Builder ──────────────────────────────────────────────────────────────────

/// Tunables forwarded from the engine configuration.
struct BuilderConfig {
    std::size_t               h2h_window     = constants::H2H_WINDOW;
    std::size_t               recent_matches = constants::FORM_WINDOW;
    std::chrono::milliseconds lookup_timeout = constants::DEFAULT_LOOKUP_TIMEOUT;
    LeagueAverages            league_defaults{};
};

class ContextualFeatureBuilder {
public:
    /// Collaborators are borrowed and must outlive the builder.
    /// `external` may be null; placeholders are used in that case.
    ContextualFeatureBuilder(const EntitySource& entities,
                             const HistorySource& history,
                             const LeagueSource& leagues,
                             const ExternalFactorSource* external,
                             BuilderConfig config = BuilderConfig{});

    /// Resolve both entities, then build the fixture features.
    ///
    /// # Throws
    /// `NotFoundError` for an unknown entity, `TransientError` when an entity
    /// or history lookup times out.
    [[nodiscard]] ContextFeatures build(const MatchContext& context) const;

    /// Build with snapshots the caller has already resolved.
    [[nodiscard]] ContextFeatures build(const MatchContext& context,
                                        const EntitySnapshot& home,
                                        const EntitySnapshot& away) const;

    // ── Pure calendar helpers ────────────────────────────────────────────────

    /// 1 August of the season containing `ts`.
    [[nodiscard]] static Timestamp season_start(Timestamp ts) noexcept;

    /// Percentage of the season elapsed at `ts`, in [0, 100].
    [[nodiscard]] static double season_progress(Timestamp ts) noexcept;

    /// ceil(progress / 2.6).
    [[nodiscard]] static int season_week(double progress) noexcept;

    /// Saturday or Sunday (UTC).
    [[nodiscard]] static bool is_weekend(Timestamp ts) noexcept;

    /// Whole days between `earlier` and `later` (floored, ≥ 0).
    [[nodiscard]] static int days_between(Timestamp earlier, Timestamp later) noexcept;

    /// 1–5 importance from ranks and season progress.
    [[nodiscard]] static double match_importance(int home_rank, int away_rank,
                                                 double progress) noexcept;

    /// Head-to-head summary over `meetings` (most recent first) from
    /// `home_id`'s perspective.
    [[nodiscard]] static HeadToHeadFeatures
    summarize_head_to_head(const std::vector<MatchRecord>& meetings,
                           EntityId home_id,
                           EntityId away_id,
                           const std::optional<std::string>& venue) noexcept;

private:
    [[nodiscard]] MatchFeatures build_match_features(const MatchContext& context,
                                                     const EntitySnapshot& home,
                                                     const EntitySnapshot& away) const;

    [[nodiscard]] HeadToHeadFeatures build_head_to_head(const MatchContext& context) const;

    [[nodiscard]] ExternalFactors build_external(const MatchContext& context) const;

    [[nodiscard]] LeagueAverages resolve_league(const std::string& league,
                                                bool& defaults_used) const;

    [[nodiscard]] std::vector<MatchRecord>
    completed_before(EntityId id, Timestamp before) const;

    const EntitySource*         entities_;
    const HistorySource*        history_;
    const LeagueSource*         leagues_;
    const ExternalFactorSource* external_;
    BuilderConfig               config_;
    std::shared_ptr<DeadlineRunner> lookups_;
};

}  // namespace matchcast::context
