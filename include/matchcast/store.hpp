#pragma once

/// @file include/matchcast/store.hpp
/// @brief In-memory collaborator store.
///
/// # Module: InMemoryStore
///
/// ## Responsibility
/// Serve every collaborator role of the engine from process memory: entity
/// snapshots, match history, league averages, and the prediction ledger.
/// Entities live in an arena with an id index; matches and predictions are
/// append-only arenas.
///
/// ## League averages
/// An explicit `set_league_averages` wins. Otherwise, once a league has
/// `min_league_sample` completed matches, averages are derived from them:
///   avg_goals_per_game = total goals / matches
///   avg_home_advantage = (home wins − away wins) / matches
/// Below the sample size the configured defaults are returned.
///
/// ## Guarantees
/// - Concurrent reads; writes take an exclusive lock (`std::shared_mutex`)
/// - Query results are copies and stay valid after later writes

#include "matchcast/collaborators.hpp"
#include "matchcast/context.hpp"
#include "matchcast/types.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace matchcast::core {

class InMemoryStore final : public EntitySource,
                            public HistorySource,
                            public LeagueSource,
                            public PredictionSink,
                            public PredictionLedger {
public:
    static constexpr std::size_t DEFAULT_MIN_LEAGUE_SAMPLE = 10;

    explicit InMemoryStore(context::LeagueAverages defaults = context::LeagueAverages{},
                           std::size_t min_league_sample = DEFAULT_MIN_LEAGUE_SAMPLE);

    // ── Writes ───────────────────────────────────────────────────────────────

    /// Insert or replace an entity by id.
    ///
    /// # Throws
    /// `ValidationError` if the snapshot is internally inconsistent or its
    /// form is longer than the form window.
    void upsert_entity(EntitySnapshot snapshot);

    /// Append a match record.
    ///
    /// # Throws
    /// `ValidationError` if both sides are the same entity or a score is
    /// negative.
    void add_match(MatchRecord match);

    void set_league_averages(const std::string& league, context::LeagueAverages averages);

    // ── Inspection ───────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t entity_count() const;
    [[nodiscard]] std::size_t match_count() const;
    [[nodiscard]] std::size_t prediction_count() const;

    /// All entities in insertion order.
    [[nodiscard]] std::vector<EntitySnapshot> entities() const;

    // ── EntitySource ─────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<EntitySnapshot> get_entity(EntityId id) const override;

    // ── HistorySource ────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<FormResult>
    get_recent_outcomes(EntityId id, std::size_t count) const override;

    [[nodiscard]] std::vector<MatchRecord>
    get_recent_matches(EntityId id, Timestamp before, std::size_t count) const override;

    [[nodiscard]] std::vector<MatchRecord>
    get_head_to_head(EntityId a, EntityId b, std::size_t max_count) const override;

    // ── LeagueSource ─────────────────────────────────────────────────────────

    [[nodiscard]] context::LeagueAverages
    get_league_averages(const std::string& league) const override;

    // ── PredictionSink / PredictionLedger ────────────────────────────────────

    void store_prediction(const MatchContext& context,
                          const ensemble::EnsembleResult& result) override;

    [[nodiscard]] std::vector<StoredPrediction>
    prediction_history(std::size_t limit) const override;

    [[nodiscard]] AccuracyStats accuracy_stats() const override;

private:
    /// Completed result of the fixture a prediction was made for. Caller
    /// holds the lock.
    [[nodiscard]] std::optional<Outcome> result_of(const MatchContext& context) const;

    /// Completed matches satisfying `pred`, most recent first, at most
    /// `count`. Caller holds the lock.
    template <typename Pred>
    [[nodiscard]] std::vector<MatchRecord> select_matches(Pred pred, std::size_t count) const;

    mutable std::shared_mutex                               mutex_;
    std::vector<EntitySnapshot>                             entities_;
    std::unordered_map<EntityId, std::size_t>               entity_index_;
    std::vector<MatchRecord>                                matches_;
    std::unordered_map<std::string, context::LeagueAverages> league_overrides_;
    std::vector<StoredPrediction>                           predictions_;
    context::LeagueAverages                                 defaults_;
    std::size_t                                             min_league_sample_;
};

}  // namespace matchcast::core
