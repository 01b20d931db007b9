#pragma once

/// @file include/matchcast/engine.hpp
/// @brief Prediction Orchestrator — public API.
///
/// # Module: Prediction Orchestrator
///
/// ## Responsibility
/// Run the full forecasting pipeline for one fixture or a bounded batch:
///   request → entity lookup → ContextualFeatureBuilder →
///   StatisticAggregator (home ∥ away) → FeatureVectorAssembler →
///   strategies (rule cascade ∥ majority vote ∥ layered weights) →
///   EnsembleCombiner → PredictionSink
///
/// ## Usage
/// ```cpp
/// core::InMemoryStore store;
/// core::DataLoader::load_into(store, "teams.csv", "matches.csv");
/// core::PredictionEngine engine(core::EngineConfig{},
///                               core::Collaborators::from_store(store));
/// auto response = engine.predict({.home_id = 1, .away_id = 2});
/// fmt::print("{}\n", to_string(response.result.outcome));
/// ```
///
/// ## Guarantees
/// - `predict` is const and safe to call concurrently
/// - Identical inputs give identical `EnsembleResult`s
/// - Persistence failures never fail a prediction
///
/// ## NOT Responsible For
/// - Transport, authentication, storage schema

#include "matchcast/collaborators.hpp"
#include "matchcast/context.hpp"
#include "matchcast/ensemble.hpp"
#include "matchcast/errors.hpp"
#include "matchcast/features.hpp"
#include "matchcast/strategy.hpp"
#include "matchcast/types.hpp"
#include "matchcast/constants.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace matchcast::core {

class InMemoryStore;

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the prediction engine.
struct EngineConfig {
    /// Ensemble weights (rule cascade, majority vote, layered weights).
    ensemble::StrategyWeights weights{};

    /// Home bucket bonus per unit of league home advantage.
    double home_advantage_scale = constants::DEFAULT_HOME_ADVANTAGE_SCALE;

    /// Confidence above which a response is flagged high-confidence.
    double high_confidence_threshold = constants::HIGH_CONFIDENCE_THRESHOLD;

    /// Maximum head-to-head meetings considered.
    std::size_t h2h_window = constants::H2H_WINDOW;

    /// Recent results requested per entity.
    std::size_t form_window = constants::FORM_WINDOW;

    /// Deadline for each collaborator lookup.
    std::chrono::milliseconds lookup_timeout = constants::DEFAULT_LOOKUP_TIMEOUT;

    /// Maximum number of requests in one batch; may only be lowered.
    std::size_t batch_limit = constants::MAX_BATCH_SIZE;

    /// Predictions run concurrently within a batch.
    std::size_t batch_concurrency = constants::DEFAULT_BATCH_CONCURRENCY;

    /// Pause between consecutive sub-batches.
    std::chrono::milliseconds batch_pause = constants::DEFAULT_BATCH_PAUSE;

    /// League averages used when the league collaborator is unavailable.
    context::LeagueAverages league_defaults{};

    /// Feature-importance table reported with every prediction.
    std::vector<ensemble::ImportanceSpec> importance_table = ensemble::default_importance_table();

    /// Maximum feature-importance entries per response.
    std::size_t max_importance = constants::MAX_IMPORTANCE_ENTRIES;

    /// spdlog level name.
    std::string log_level = "info";

    /// Override fields from MATCHCAST_* environment variables. Unparseable
    /// values are logged and ignored.
    void load_from_env();

    /// Weights sum to 1, limits are positive, thresholds are in range.
    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── Collaborators ────────────────────────────────────────────────────────────

/// Borrowed collaborator set. Required: entities, history, leagues.
struct Collaborators {
    const EntitySource*         entities = nullptr;
    const HistorySource*        history  = nullptr;
    const LeagueSource*         leagues  = nullptr;
    const ExternalFactorSource* external = nullptr;
    PredictionSink*             sink     = nullptr;
    const PredictionLedger*     ledger   = nullptr;

    /// Every role served by one in-memory store.
    [[nodiscard]] static Collaborators from_store(InMemoryStore& store) noexcept;
};

// ─── Request / Response ───────────────────────────────────────────────────────

struct PredictionRequest {
    EntityId                   home_id = 0;
    EntityId                   away_id = 0;
    std::optional<Timestamp>   match_date;  ///< now when absent
    std::optional<std::string> league;      ///< home entity's league when absent
    std::optional<std::string> venue;
};

struct TeamInfo {
    EntityId    id = 0;
    std::string name;
    int         league_position = 0;
    std::string form;
};

struct MatchInfo {
    TeamInfo    home;
    TeamInfo    away;
    std::string league;
    Timestamp   match_date{};
};

/// Last-five summary of one side, with proxy goals.
struct FormComparison {
    std::string last_5_games;
    int         points        = 0;
    int         goals_for     = 0;
    int         goals_against = 0;
};

struct HeadToHeadRecord {
    std::size_t              total_matches  = 0;
    std::size_t              home_team_wins = 0;
    std::size_t              draws          = 0;
    std::size_t              away_team_wins = 0;
    std::optional<Timestamp> last_meeting;
};

struct HistoricalContext {
    HeadToHeadRecord head_to_head;
    FormComparison   home_form;
    FormComparison   away_form;
};

struct PredictionResponse {
    MatchInfo                match_info;
    ensemble::EnsembleResult result;
    bool                     is_high_confidence = false;
    std::vector<std::string> key_factors;
    HistoricalContext        historical_context;
    std::chrono::microseconds processing_time{0};
};

/// A categorised failure of one batch entry.
struct BatchError {
    ErrorKind   kind = ErrorKind::Transient;
    std::string message;
};

/// One batch entry: either a response or an error, never both.
struct BatchItem {
    PredictionRequest                 request;
    std::optional<PredictionResponse> response;
    std::optional<BatchError>         error;

    [[nodiscard]] bool ok() const noexcept { return response.has_value(); }
};

// ─── PredictionEngine ─────────────────────────────────────────────────────────

class PredictionEngine {
public:
    /// # Throws
    /// `ValidationError` if `config` is invalid or a required collaborator
    /// is missing.
    PredictionEngine(EngineConfig config, Collaborators collaborators);

    /// Predict one fixture.
    ///
    /// # Throws
    /// - `ValidationError` for identical or non-positive ids, or non-finite
    ///   features
    /// - `NotFoundError` for an unknown entity
    /// - `TransientError` when an entity or history lookup times out
    [[nodiscard]] PredictionResponse predict(const PredictionRequest& request) const;

    /// Predict up to `batch_limit` fixtures, `batch_concurrency` at a time.
    ///
    /// Results are in input order; a failing entry carries its error and
    /// does not affect the others.
    ///
    /// # Throws
    /// `ValidationError` when the batch exceeds `batch_limit`.
    [[nodiscard]] std::vector<BatchItem>
    predict_batch(std::span<const PredictionRequest> requests) const;

    /// Accuracy of stored predictions; `nullopt` without a ledger.
    [[nodiscard]] std::optional<AccuracyStats> accuracy_stats() const;

    /// Most recent stored predictions; empty without a ledger.
    [[nodiscard]] std::vector<StoredPrediction> prediction_history(std::size_t limit = 50) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Resolve one entity under the lookup deadline.
    [[nodiscard]] EntitySnapshot resolve_entity(EntityId id) const;

    /// Recent results under the lookup deadline, aggregated into features.
    [[nodiscard]] stats::EntityFeatures
    aggregate_side(const EntitySnapshot& snapshot, double league_avg_goals) const;

    /// Build the response's historical context block.
    [[nodiscard]] static HistoricalContext
    historical_context(const context::HeadToHeadFeatures& h2h,
                       const EntitySnapshot& home,
                       const EntitySnapshot& away);

    /// Persist, logging and discarding any failure.
    void persist(const MatchContext& context, const ensemble::EnsembleResult& result) const;

    EngineConfig                                     config_;
    Collaborators                                    collaborators_;
    context::ContextualFeatureBuilder                builder_;
    std::vector<std::unique_ptr<strategy::Strategy>> strategies_;
    ensemble::EnsembleCombiner                       combiner_;
    std::shared_ptr<DeadlineRunner>                  lookups_;
};

}  // namespace matchcast::core
