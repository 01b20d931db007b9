/// @file src/features/feature_vector.cpp
/// @brief FeatureVector flattening, naming and assembly.

#include "matchcast/features.hpp"
#include "matchcast/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace matchcast::features {

namespace {

/// Sequential writer over a FlatFeatures buffer.
class Cursor {
public:
    explicit Cursor(FlatFeatures& out) noexcept : out_(out) {}

    void put(double v) noexcept { out_(static_cast<Eigen::Index>(pos_++)) = v; }
    void put(bool v) noexcept { put(v ? 1.0 : 0.0); }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    FlatFeatures& out_;
    std::size_t   pos_ = 0;
};

void put_entity(Cursor& c, const stats::EntityFeatures& e) noexcept {
    c.put(e.league_position);
    c.put(e.points_per_game);
    c.put(e.wins_percentage);
    c.put(e.draws_percentage);
    c.put(e.losses_percentage);
    c.put(e.goals_per_game);
    c.put(e.goals_conceded_per_game);
    c.put(e.goal_difference_per_game);
    c.put(e.form_wins_last_5);
    c.put(e.form_draws_last_5);
    c.put(e.form_losses_last_5);
    c.put(e.form_points_last_5);
    c.put(e.form_goals_for_last_5);
    c.put(e.form_goals_against_last_5);
    c.put(e.form_wins_last_10);
    c.put(e.form_draws_last_10);
    c.put(e.form_losses_last_10);
    c.put(e.form_points_last_10);
    c.put(encode_streak(e.current_streak_type));
    c.put(e.current_streak_length);
    c.put(e.longest_win_streak);
    c.put(e.longest_loss_streak);
    c.put(e.performance_trend_5);
    c.put(e.performance_trend_10);
    c.put(e.league_strength_rating);
    c.put(e.relative_strength_vs_league);
}

constexpr std::array<std::string_view, ENTITY_FEATURE_COUNT> ENTITY_NAMES{
    "league_position", "points_per_game", "wins_percentage",
    "draws_percentage", "losses_percentage", "goals_per_game",
    "goals_conceded_per_game", "goal_difference_per_game",
    "form_wins_last_5", "form_draws_last_5", "form_losses_last_5",
    "form_points_last_5", "form_goals_for_last_5", "form_goals_against_last_5",
    "form_wins_last_10", "form_draws_last_10", "form_losses_last_10",
    "form_points_last_10", "current_streak_type", "current_streak_length",
    "longest_win_streak", "longest_loss_streak", "performance_trend_5",
    "performance_trend_10", "league_strength_rating",
    "relative_strength_vs_league",
};

constexpr std::array<std::string_view, MATCH_FEATURE_COUNT> MATCH_NAMES{
    "match.days_since_last_match", "match.days_since_last_match_home",
    "match.days_since_last_match_away", "match.matches_in_last_14_days",
    "match.is_weekend_match", "match.is_even_week", "match.match_importance",
    "match.league_avg_goals_per_game", "match.league_avg_home_advantage",
    "match.season_week", "match.season_matches_played",
    "match.season_progress_percentage",
};

constexpr std::array<std::string_view, H2H_FEATURE_COUNT> H2H_NAMES{
    "h2h.h2h_matches_played", "h2h.h2h_home_wins", "h2h.h2h_draws",
    "h2h.h2h_away_wins", "h2h.h2h_home_goals_avg", "h2h.h2h_away_goals_avg",
    "h2h.h2h_total_goals_avg", "h2h.recent_h2h_home_wins",
    "h2h.recent_h2h_draws", "h2h.recent_h2h_away_wins", "h2h.h2h_trend",
    "h2h.venue_h2h_matches", "h2h.venue_h2h_home_wins",
};

constexpr std::array<std::string_view, EXTERNAL_FEATURE_COUNT> EXTERNAL_NAMES{
    "external.weather_condition", "external.temperature",
    "external.expected_attendance", "external.attendance_percentage",
    "external.referee_home_bias", "external.referee_cards_per_game",
    "external.referee_penalties_per_game", "external.home_motivation",
    "external.away_motivation", "external.home_key_players_missing",
    "external.away_key_players_missing",
};

/// Entity names need a side prefix; they are built once into static storage.
struct NameTable {
    std::array<std::string, 2 * ENTITY_FEATURE_COUNT> entity_storage;
    std::array<std::string_view, FEATURE_COUNT>       names;

    NameTable() {
        std::size_t i = 0;
        for (const auto* side : {"home.", "away."}) {
            for (auto n : ENTITY_NAMES) {
                entity_storage[i] = fmt::format("{}{}", side, n);
                names[i] = entity_storage[i];
                ++i;
            }
        }
        for (auto n : MATCH_NAMES)    names[i++] = n;
        for (auto n : H2H_NAMES)      names[i++] = n;
        for (auto n : EXTERNAL_NAMES) names[i++] = n;
    }
};

}  // anonymous namespace

// ─── encode_streak ────────────────────────────────────────────────────────────

double encode_streak(StreakType type) noexcept {
    switch (type) {
        case StreakType::None: return 0.0;
        case StreakType::Win:  return 1.0;
        case StreakType::Draw: return 2.0;
        case StreakType::Loss: return 3.0;
    }
    return 0.0;
}

// ─── flatten ──────────────────────────────────────────────────────────────────

FlatFeatures flatten(const FeatureVector& fv) noexcept {
    FlatFeatures out;
    Cursor c(out);

    put_entity(c, fv.home);
    put_entity(c, fv.away);

    const auto& m = fv.match;
    c.put(m.days_since_last_match);
    c.put(m.days_since_last_match_home);
    c.put(m.days_since_last_match_away);
    c.put(m.matches_in_last_14_days);
    c.put(m.is_weekend_match);
    c.put(m.is_even_week);
    c.put(m.match_importance);
    c.put(m.league_avg_goals_per_game);
    c.put(m.league_avg_home_advantage);
    c.put(m.season_week);
    c.put(m.season_matches_played);
    c.put(m.season_progress_percentage);

    const auto& h = fv.h2h;
    c.put(h.h2h_matches_played);
    c.put(h.h2h_home_wins);
    c.put(h.h2h_draws);
    c.put(h.h2h_away_wins);
    c.put(h.h2h_home_goals_avg);
    c.put(h.h2h_away_goals_avg);
    c.put(h.h2h_total_goals_avg);
    c.put(h.recent_h2h_home_wins);
    c.put(h.recent_h2h_draws);
    c.put(h.recent_h2h_away_wins);
    c.put(h.h2h_trend);
    c.put(h.venue_h2h_matches);
    c.put(h.venue_h2h_home_wins);

    const auto& x = fv.external;
    c.put(x.weather_condition);
    c.put(x.temperature);
    c.put(x.expected_attendance);
    c.put(x.attendance_percentage);
    c.put(x.referee_home_bias);
    c.put(x.referee_cards_per_game);
    c.put(x.referee_penalties_per_game);
    c.put(x.home_motivation);
    c.put(x.away_motivation);
    c.put(x.home_key_players_missing);
    c.put(x.away_key_players_missing);

    return out;
}

const std::array<std::string_view, FEATURE_COUNT>& feature_names() noexcept {
    static const NameTable table;
    return table.names;
}

std::optional<std::size_t> first_non_finite(const FeatureVector& fv) noexcept {
    const FlatFeatures flat = flatten(fv);
    for (Eigen::Index i = 0; i < flat.size(); ++i) {
        if (!std::isfinite(flat(i))) {
            return static_cast<std::size_t>(i);
        }
    }
    return std::nullopt;
}

// ─── FeatureVectorAssembler ───────────────────────────────────────────────────

FeatureVector
FeatureVectorAssembler::assemble(const stats::EntityFeatures& home,
                                 const stats::EntityFeatures& away,
                                 const context::MatchFeatures& match,
                                 const context::HeadToHeadFeatures& h2h,
                                 const context::ExternalFactors& external) {
    FeatureVector fv{
        .home     = home,
        .away     = away,
        .match    = match,
        .h2h      = h2h,
        .external = external,
    };

    if (const auto bad = first_non_finite(fv)) {
        throw ValidationError(
            fmt::format("feature '{}' is not finite", feature_names()[*bad]));
    }
    return fv;
}

}  // namespace matchcast::features
