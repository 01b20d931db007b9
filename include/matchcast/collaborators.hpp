#pragma once

/// @file include/matchcast/collaborators.hpp
/// @brief Abstract collaborators the engine reads from and writes to.
///
/// The engine owns none of these. Implementations must be safe to call from
/// several threads at once, and must outlive every engine that borrows them.
/// A temporary outage is reported by throwing `TransientError`; an unknown
/// entity is an empty optional, not an exception.

#include "matchcast/types.hpp"
#include "matchcast/context.hpp"
#include "matchcast/ensemble.hpp"
#include "matchcast/constants.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matchcast {

// ─── Read side ────────────────────────────────────────────────────────────────

class EntitySource {
public:
    virtual ~EntitySource() = default;

    [[nodiscard]] virtual std::optional<EntitySnapshot> get_entity(EntityId id) const = 0;
};

class HistorySource {
public:
    virtual ~HistorySource() = default;

    /// Up to `count` most recent results of `id`, most recent first.
    [[nodiscard]] virtual std::vector<FormResult>
    get_recent_outcomes(EntityId id, std::size_t count) const = 0;

    /// Up to `count` completed matches of `id` dated strictly before
    /// `before`, most recent first.
    [[nodiscard]] virtual std::vector<MatchRecord>
    get_recent_matches(EntityId id, Timestamp before, std::size_t count) const = 0;

    /// Up to `max_count` completed meetings between `a` and `b` at either
    /// venue, most recent first.
    [[nodiscard]] virtual std::vector<MatchRecord>
    get_head_to_head(EntityId a, EntityId b,
                     std::size_t max_count = constants::H2H_WINDOW) const = 0;
};

class LeagueSource {
public:
    virtual ~LeagueSource() = default;

    [[nodiscard]] virtual context::LeagueAverages
    get_league_averages(const std::string& league) const = 0;
};

class ExternalFactorSource {
public:
    virtual ~ExternalFactorSource() = default;

    [[nodiscard]] virtual context::ExternalFactors
    get_external_factors(const MatchContext& context) const = 0;
};

// ─── Write side ───────────────────────────────────────────────────────────────

class PredictionSink {
public:
    virtual ~PredictionSink() = default;

    virtual void store_prediction(const MatchContext& context,
                                  const ensemble::EnsembleResult& result) = 0;
};

// ─── Ledger ───────────────────────────────────────────────────────────────────

/// A persisted prediction and, once the fixture is played, its result.
struct StoredPrediction {
    MatchContext           context;
    Outcome                predicted  = Outcome::Draw;
    double                 confidence = 0.0;
    Timestamp              stored_at{};
    std::optional<Outcome> actual;

    [[nodiscard]] std::optional<bool> was_correct() const noexcept;
};

/// Hit rate of the predictions that named one particular outcome.
struct OutcomeAccuracy {
    std::size_t predictions = 0;
    std::size_t correct     = 0;

    /// correct / predictions, 0 when nothing was predicted.
    [[nodiscard]] double accuracy() const noexcept;
};

/// Accuracy over predictions whose fixture has a completed result.
struct AccuracyStats {
    std::size_t     total_predictions        = 0;
    std::size_t     correct_predictions      = 0;
    double          overall_accuracy         = 0.0;
    double          avg_confidence_correct   = 0.0;
    double          avg_confidence_incorrect = 0.0;
    OutcomeAccuracy home_win;
    OutcomeAccuracy draw;
    OutcomeAccuracy away_win;
};

class PredictionLedger {
public:
    virtual ~PredictionLedger() = default;

    /// Most recent first, at most `limit` entries.
    [[nodiscard]] virtual std::vector<StoredPrediction>
    prediction_history(std::size_t limit) const = 0;

    [[nodiscard]] virtual AccuracyStats accuracy_stats() const = 0;
};

}  // namespace matchcast
