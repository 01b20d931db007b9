/// @file src/context/contextual_feature_builder.cpp
/// @brief ContextualFeatureBuilder — rest, calendar, league, H2H and externals.

#include "matchcast/context.hpp"
#include "matchcast/collaborators.hpp"
#include "matchcast/deadline.hpp"
#include "matchcast/errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <utility>

namespace matchcast::context {

using namespace matchcast::constants;

// ─── HeadToHeadFeatures ───────────────────────────────────────────────────────

double HeadToHeadFeatures::home_win_ratio() const noexcept {
    if (h2h_matches_played <= 0.0) {
        return 0.0;
    }
    return h2h_home_wins / h2h_matches_played;
}

// ─── Construction ─────────────────────────────────────────────────────────────

ContextualFeatureBuilder::ContextualFeatureBuilder(const EntitySource& entities,
                                                   const HistorySource& history,
                                                   const LeagueSource& leagues,
                                                   const ExternalFactorSource* external,
                                                   BuilderConfig config)
    : entities_(&entities),
      history_(&history),
      leagues_(&leagues),
      external_(external),
      config_(config),
      lookups_(std::make_shared<DeadlineRunner>()) {}

// ─── Calendar helpers ─────────────────────────────────────────────────────────

Timestamp ContextualFeatureBuilder::season_start(Timestamp ts) noexcept {
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(ts)};
    const month_day start{month{SEASON_START_MONTH}, day{SEASON_START_DAY}};

    year y = ymd.year();
    if (month_day{ymd.month(), ymd.day()} < start) {
        --y;
    }
    return time_point_cast<seconds>(sys_days{y / start.month() / start.day()});
}

double ContextualFeatureBuilder::season_progress(Timestamp ts) noexcept {
    using namespace std::chrono;
    const auto elapsed = duration<double, days::period>(ts - season_start(ts)).count();
    return std::clamp(elapsed / SEASON_LENGTH_DAYS * 100.0, 0.0, 100.0);
}

int ContextualFeatureBuilder::season_week(double progress) noexcept {
    return static_cast<int>(std::ceil(progress / PROGRESS_PER_SEASON_WEEK));
}

bool ContextualFeatureBuilder::is_weekend(Timestamp ts) noexcept {
    using namespace std::chrono;
    const weekday wd{floor<days>(ts)};
    return wd == Saturday || wd == Sunday;
}

int ContextualFeatureBuilder::days_between(Timestamp earlier, Timestamp later) noexcept {
    using namespace std::chrono;
    if (later <= earlier) {
        return 0;
    }
    return static_cast<int>(floor<days>(later - earlier).count());
}

double ContextualFeatureBuilder::match_importance(int home_rank, int away_rank,
                                                  double progress) noexcept {
    double importance = 3.0;
    if (home_rank <= 4 && away_rank <= 4) {
        importance += 1.0;
    }
    if (progress > 75.0) {
        importance += 1.0;
    }
    return std::clamp(importance, 1.0, 5.0);
}

// ─── Head-to-head ─────────────────────────────────────────────────────────────

HeadToHeadFeatures
ContextualFeatureBuilder::summarize_head_to_head(const std::vector<MatchRecord>& meetings,
                                                 EntityId home_id,
                                                 EntityId away_id,
                                                 const std::optional<std::string>& venue) noexcept {
    HeadToHeadFeatures h;

    double home_goals = 0.0;
    double away_goals = 0.0;
    double all_points = 0.0;
    double recent_points = 0.0;
    std::size_t recent_n = 0;
    std::size_t n = 0;

    for (const auto& m : meetings) {
        if (m.status != MatchStatus::Completed
            || !m.involves(home_id) || !m.involves(away_id)) {
            continue;
        }

        const FormResult r = m.result_for(home_id);
        const double pts = (r == FormResult::Win)  ? POINTS_FOR_WIN
                         : (r == FormResult::Draw) ? POINTS_FOR_DRAW
                         : 0.0;
        const bool recent = n < RECENT_H2H_WINDOW;
        if (n == 0) {
            h.last_meeting = m.date;
        }

        switch (r) {
            case FormResult::Win:
                h.h2h_home_wins += 1.0;
                if (recent) h.recent_h2h_home_wins += 1.0;
                break;
            case FormResult::Draw:
                h.h2h_draws += 1.0;
                if (recent) h.recent_h2h_draws += 1.0;
                break;
            case FormResult::Loss:
                h.h2h_away_wins += 1.0;
                if (recent) h.recent_h2h_away_wins += 1.0;
                break;
        }

        home_goals += m.goals_for(home_id);
        away_goals += m.goals_for(away_id);
        all_points += pts;
        if (recent) {
            recent_points += pts;
            ++recent_n;
        }

        if (venue && m.venue && *m.venue == *venue) {
            h.venue_h2h_matches += 1.0;
            if (r == FormResult::Win) {
                h.venue_h2h_home_wins += 1.0;
            }
        }
        ++n;
    }

    if (n == 0) {
        return h;
    }

    const double count = static_cast<double>(n);
    h.h2h_matches_played  = count;
    h.h2h_home_goals_avg  = home_goals / count;
    h.h2h_away_goals_avg  = away_goals / count;
    h.h2h_total_goals_avg = (home_goals + away_goals) / count;

    const double recent_ppm = recent_points / static_cast<double>(recent_n);
    const double all_ppm    = all_points / count;
    h.h2h_trend = std::clamp((recent_ppm - all_ppm) / POINTS_FOR_WIN, -1.0, 1.0);

    return h;
}

// ─── Collaborator access ──────────────────────────────────────────────────────

std::vector<MatchRecord>
ContextualFeatureBuilder::completed_before(EntityId id, Timestamp before) const {
    const HistorySource* history = history_;
    const std::size_t count = config_.recent_matches;
    auto matches = lookups_->call(
        [history, id, before, count] {
            return history->get_recent_matches(id, before, count);
        },
        config_.lookup_timeout, fmt::format("recent matches of entity {}", id));

    std::erase_if(matches, [&](const MatchRecord& m) {
        return m.status != MatchStatus::Completed || m.date >= before || !m.involves(id);
    });
    std::sort(matches.begin(), matches.end(),
              [](const MatchRecord& a, const MatchRecord& b) { return a.date > b.date; });
    return matches;
}

LeagueAverages ContextualFeatureBuilder::resolve_league(const std::string& league,
                                                        bool& defaults_used) const {
    defaults_used = false;
    const LeagueSource* leagues = leagues_;
    try {
        auto avg = lookups_->call(
            [leagues, league] { return leagues->get_league_averages(league); },
            config_.lookup_timeout, fmt::format("league averages of '{}'", league));
        if (std::isfinite(avg.avg_goals_per_game) && std::isfinite(avg.avg_home_advantage)) {
            return avg;
        }
        spdlog::warn("league '{}' returned non-finite averages; using defaults", league);
    } catch (const TransientError& e) {
        spdlog::warn("league lookup degraded to defaults: {}", e.what());
    }
    defaults_used = true;
    return config_.league_defaults;
}

// ─── Feature families ─────────────────────────────────────────────────────────

MatchFeatures
ContextualFeatureBuilder::build_match_features(const MatchContext& context,
                                               const EntitySnapshot& home,
                                               const EntitySnapshot& away) const {
    MatchFeatures f;

    const auto home_matches = completed_before(context.home_id, context.scheduled);
    const auto away_matches = completed_before(context.away_id, context.scheduled);

    if (!home_matches.empty()) {
        f.days_since_last_match_home =
            days_between(home_matches.front().date, context.scheduled);
    }
    if (!away_matches.empty()) {
        f.days_since_last_match_away =
            days_between(away_matches.front().date, context.scheduled);
    }
    f.days_since_last_match =
        std::min(f.days_since_last_match_home, f.days_since_last_match_away);

    // Distinct fixtures of either side in [scheduled − 14d, scheduled).
    using FixtureKey = std::tuple<EntityId, EntityId, Timestamp>;
    std::set<FixtureKey> recent;
    const Timestamp window_start = context.scheduled - CONGESTION_WINDOW;
    for (const auto* list : {&home_matches, &away_matches}) {
        for (const auto& m : *list) {
            if (m.date >= window_start) {
                recent.emplace(m.home_id, m.away_id, m.date);
            }
        }
    }
    f.matches_in_last_14_days = static_cast<double>(recent.size());

    const double progress = season_progress(context.scheduled);
    const int week = season_week(progress);
    f.is_weekend_match           = is_weekend(context.scheduled);
    f.is_even_week               = week % 2 == 0;
    f.season_progress_percentage = progress;
    f.season_week                = week;
    f.season_matches_played      = 2.0 * week;
    f.match_importance           = match_importance(home.rank, away.rank, progress);

    const auto league = resolve_league(context.league, f.league_defaults_used);
    f.league_avg_goals_per_game = league.avg_goals_per_game;
    f.league_avg_home_advantage = league.avg_home_advantage;

    return f;
}

HeadToHeadFeatures
ContextualFeatureBuilder::build_head_to_head(const MatchContext& context) const {
    const HistorySource* history = history_;
    const EntityId home = context.home_id;
    const EntityId away = context.away_id;
    const std::size_t window = config_.h2h_window;

    auto meetings = lookups_->call(
        [history, home, away, window] { return history->get_head_to_head(home, away, window); },
        config_.lookup_timeout, fmt::format("head-to-head of {} and {}", home, away));

    std::erase_if(meetings, [&](const MatchRecord& m) {
        return m.status != MatchStatus::Completed || m.date >= context.scheduled;
    });
    std::sort(meetings.begin(), meetings.end(),
              [](const MatchRecord& a, const MatchRecord& b) { return a.date > b.date; });
    if (meetings.size() > window) {
        meetings.resize(window);
    }

    return summarize_head_to_head(meetings, home, away, context.venue);
}

ExternalFactors ContextualFeatureBuilder::build_external(const MatchContext& context) const {
    if (external_ == nullptr) {
        return ExternalFactors{};
    }

    const ExternalFactorSource* source = external_;
    try {
        auto factors = lookups_->call(
            [source, context] { return source->get_external_factors(context); },
            config_.lookup_timeout, "external factors");
        factors.placeholder = false;
        return factors;
    } catch (const TransientError& e) {
        spdlog::warn("external factors degraded to placeholders: {}", e.what());
    }
    return ExternalFactors{};
}

// ─── build ────────────────────────────────────────────────────────────────────

ContextFeatures ContextualFeatureBuilder::build(const MatchContext& context,
                                                const EntitySnapshot& home,
                                                const EntitySnapshot& away) const {
    return ContextFeatures{
        .match    = build_match_features(context, home, away),
        .h2h      = build_head_to_head(context),
        .external = build_external(context),
    };
}

ContextFeatures ContextualFeatureBuilder::build(const MatchContext& context) const {
    const EntitySource* entities = entities_;
    auto resolve = [&](EntityId id) {
        auto snapshot = lookups_->call(
            [entities, id] { return entities->get_entity(id); },
            config_.lookup_timeout, fmt::format("entity {}", id));
        if (!snapshot) {
            throw NotFoundError(fmt::format("entity {} not found", id));
        }
        return std::move(*snapshot);
    };

    const EntitySnapshot home = resolve(context.home_id);
    const EntitySnapshot away = resolve(context.away_id);
    return build(context, home, away);
}

}  // namespace matchcast::context
