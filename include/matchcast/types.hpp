#pragma once

/// @file include/matchcast/types.hpp
/// @brief Shared value types for the matchcast forecasting engine.
///
/// All modules include this file. It defines the identity, snapshot and
/// match-record shapes the engine reads from its collaborators, plus the
/// outcome vocabulary every stage speaks.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matchcast {

/// Identity of a competing entity (team).
using EntityId = std::int64_t;

/// UTC instant with one-second resolution.
using Timestamp = std::chrono::sys_seconds;

// ─── Outcome Vocabulary ───────────────────────────────────────────────────────

/// Outcome of a fixture from the perspective of the home entity.
enum class Outcome {
    HomeWin,
    Draw,
    AwayWin,
};

/// One entry of an entity's recent-results sequence.
enum class FormResult {
    Win,
    Draw,
    Loss,
};

/// Symbol of the entity's current (most recent) run of results.
enum class StreakType {
    None,
    Win,
    Draw,
    Loss,
};

/// Canonical label: "home_win", "draw", "away_win".
[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

/// Canonical label: "win", "draw", "loss", "none".
[[nodiscard]] std::string_view to_string(StreakType streak) noexcept;

/// Single-letter symbol: 'W', 'D' or 'L'.
[[nodiscard]] char to_symbol(FormResult result) noexcept;

/// Parse a form string such as "WWDLW" (most recent first).
///
/// # Returns
/// `nullopt` if any character is not one of W/D/L (case-insensitive).
[[nodiscard]] std::optional<std::vector<FormResult>>
parse_form(std::string_view form) noexcept;

/// Render a results sequence back to its "WDL" string form.
[[nodiscard]] std::string format_form(const std::vector<FormResult>& form);

// ─── Probability Triple ───────────────────────────────────────────────────────

/// Probability mass over the three outcomes.
struct OutcomeProbabilities {
    double home_win = 0.0;
    double draw     = 0.0;
    double away_win = 0.0;

    [[nodiscard]] double of(Outcome outcome) const noexcept;
    [[nodiscard]] double sum() const noexcept;
    [[nodiscard]] double max() const noexcept;

    /// Strictly largest bucket; any exact tie resolves to Draw.
    [[nodiscard]] Outcome argmax() const noexcept;

    friend bool operator==(const OutcomeProbabilities&,
                           const OutcomeProbabilities&) = default;
};

// ─── Entity Snapshot ──────────────────────────────────────────────────────────

/// Read-only statistical snapshot of an entity, as held by the data store.
///
/// Invariant: wins + draws + losses == games_played.
struct EntitySnapshot {
    EntityId    id = 0;
    std::string name;
    std::string league;
    int rank          = 1;  ///< Current table position (≥ 1)
    int points        = 0;
    int games_played  = 0;
    int wins          = 0;
    int draws         = 0;
    int losses        = 0;
    int goals_for     = 0;
    int goals_against = 0;
    std::vector<FormResult> form;  ///< Most recent first, length 0–10

    /// True when the record counts are internally consistent.
    [[nodiscard]] bool is_consistent() const noexcept;
};

// ─── Match Records ────────────────────────────────────────────────────────────

enum class MatchStatus {
    Scheduled,
    Completed,
};

/// A fixture as stored by the history collaborator.
struct MatchRecord {
    EntityId    home_id = 0;
    EntityId    away_id = 0;
    std::string league;
    Timestamp   date{};
    int         home_score = 0;
    int         away_score = 0;
    MatchStatus status = MatchStatus::Completed;
    std::optional<std::string> venue;

    /// True when `id` took part in this fixture.
    [[nodiscard]] bool involves(EntityId id) const noexcept;

    /// Goals scored by `id` in this fixture (0 if it did not take part).
    [[nodiscard]] int goals_for(EntityId id) const noexcept;

    /// Goals conceded by `id` in this fixture (0 if it did not take part).
    [[nodiscard]] int goals_against(EntityId id) const noexcept;

    /// Result for `id`. Precondition: `involves(id)` and status Completed.
    [[nodiscard]] FormResult result_for(EntityId id) const noexcept;

    /// Outcome relative to the recorded home side.
    [[nodiscard]] Outcome outcome() const noexcept;
};

/// The fixture a prediction is requested for.
///
/// Invariant: home_id != away_id.
struct MatchContext {
    EntityId    home_id = 0;
    EntityId    away_id = 0;
    std::string league;
    Timestamp   scheduled{};
    std::optional<std::string> venue;
};

// ─── Calendar helpers ─────────────────────────────────────────────────────────

/// Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[Z]" as a UTC instant.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

/// Render as "YYYY-MM-DD".
[[nodiscard]] std::string format_date(Timestamp ts);

/// Render as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace matchcast
