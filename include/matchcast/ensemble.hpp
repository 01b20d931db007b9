#pragma once

/// @file include/matchcast/ensemble.hpp
/// @brief Ensemble Combiner — weighted vote of the three strategies.
///
/// # Module: Ensemble Combiner
///
/// ## Responsibility
/// Fuse three `StrategyEstimate`s into one calibrated distribution, attach a
/// ranked feature-importance list and an ordered explanation trail.
///
/// ## Combination
///   bucket[e.outcome] += weight_e · e.probability      for each estimate e
///   bucket[home]      += home_advantage_scale · league_avg_home_advantage
///   normalise (uniform when the total is not positive)
///   outcome    = strictly largest bucket, any tie → Draw
///   confidence = max bucket
///
/// ## Guarantees
/// - Probabilities sum to 1 within 1e-9, each in [0, 1]
/// - Deterministic: identical inputs give identical results
/// - `degraded` whenever fewer than three strategies contributed

#include "matchcast/features.hpp"
#include "matchcast/strategy.hpp"
#include "matchcast/constants.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace matchcast::ensemble {

// ─── Weights ──────────────────────────────────────────────────────────────────

/// Per-strategy weights, in ensemble order.
struct StrategyWeights {
    double rule_cascade    = constants::DEFAULT_RULE_CASCADE_WEIGHT;
    double majority_vote   = constants::DEFAULT_MAJORITY_VOTE_WEIGHT;
    double layered_weights = constants::DEFAULT_LAYERED_WEIGHTS_WEIGHT;

    [[nodiscard]] double sum() const noexcept;

    /// Non-negative, finite, and summing to 1 within 1e-9.
    [[nodiscard]] bool is_valid() const noexcept;

    [[nodiscard]] std::array<double, constants::STRATEGY_COUNT> as_array() const noexcept;

    friend bool operator==(const StrategyWeights&, const StrategyWeights&) = default;
};

// ─── Feature importance ───────────────────────────────────────────────────────

/// One entry of the static importance table.
struct ImportanceSpec {
    std::string feature_name;
    double      base_weight = 0.0;
    std::string description;
};

/// Per-strategy attribution multipliers applied to the base weight.
static constexpr double RULE_CASCADE_IMPORTANCE_MULTIPLIER    = 1.2;
static constexpr double MAJORITY_VOTE_IMPORTANCE_MULTIPLIER   = 1.0;
static constexpr double LAYERED_WEIGHTS_IMPORTANCE_MULTIPLIER = 0.8;

struct FeatureImportance {
    std::string feature_name;
    double      importance_score = 0.0;
    double      rule_cascade     = 0.0;
    double      majority_vote    = 0.0;
    double      layered_weights  = 0.0;
    std::string impact_description;

    friend bool operator==(const FeatureImportance&, const FeatureImportance&) = default;
};

/// The eight features reported by default, with base weights.
[[nodiscard]] const std::vector<ImportanceSpec>& default_importance_table();

/// Expand `table` into ranked entries: base weight descending, stable,
/// truncated to `limit`.
[[nodiscard]] std::vector<FeatureImportance>
rank_feature_importance(const std::vector<ImportanceSpec>& table, std::size_t limit);

// ─── Reasoning ────────────────────────────────────────────────────────────────

/// Inputs visible to a reasoning rule.
struct ReasoningInput {
    const features::FeatureVector& features;
    double                         confidence;
    std::size_t                    degraded_strategies;
};

/// A rule yields one sentence when its predicate holds.
using ReasoningRule = std::function<std::optional<std::string>(const ReasoningInput&)>;

/// Default rules in emission order: form gap, position gap, home advantage,
/// goal-difference gap, head-to-head record, confidence level, degraded
/// strategies, defaulted league averages.
[[nodiscard]] const std::vector<ReasoningRule>& default_reasoning_rules();

/// Apply `rules` in order, collecting every sentence produced.
[[nodiscard]] std::vector<std::string>
explain(const std::vector<ReasoningRule>& rules, const ReasoningInput& input);

/// Short labels for the dominant factors of a fixture (form gap, position
/// gap, goal-difference gap, confidence band).
[[nodiscard]] std::vector<std::string>
key_factors(const features::FeatureVector& fv, double confidence);

// ─── EnsembleResult ───────────────────────────────────────────────────────────

struct EnsembleResult {
    Outcome              outcome     = Outcome::Draw;
    OutcomeProbabilities probabilities{};
    double               confidence  = 0.0;
    std::array<strategy::StrategyEstimate, constants::STRATEGY_COUNT> estimates{};
    StrategyWeights      weights{};
    std::vector<FeatureImportance> feature_importance;
    std::vector<std::string>       reasoning;
    std::size_t          contributing_strategies = 0;
    /// League averages are the configured defaults, not sourced data.
    bool                 league_defaults_used = false;
    /// External factors are neutral placeholders.
    bool                 placeholder_external_factors = false;
    /// A strategy fell back to its neutral estimate or the league lookup
    /// degraded to defaults.
    bool                 degraded    = false;

    friend bool operator==(const EnsembleResult&, const EnsembleResult&) = default;
};

// ─── EnsembleCombiner ─────────────────────────────────────────────────────────

struct CombinerConfig {
    StrategyWeights             weights{};
    double                      home_advantage_scale = constants::DEFAULT_HOME_ADVANTAGE_SCALE;
    std::vector<ImportanceSpec> importance_table     = default_importance_table();
    std::size_t                 max_importance       = constants::MAX_IMPORTANCE_ENTRIES;
};

class EnsembleCombiner {
public:
    /// # Throws
    /// `ValidationError` if the weights are invalid or the home-advantage
    /// scale is negative or non-finite.
    explicit EnsembleCombiner(CombinerConfig config = CombinerConfig{});

    /// Combine the rule-cascade, majority-vote and layered-weights estimates
    /// (in that order) for the fixture described by `fv`.
    [[nodiscard]] EnsembleResult combine(const strategy::StrategyEstimate& rule_cascade,
                                         const strategy::StrategyEstimate& majority_vote,
                                         const strategy::StrategyEstimate& layered_weights,
                                         const features::FeatureVector& fv) const;

    /// Weighted per-outcome sums, normalised; uniform when the total is not
    /// positive.
    [[nodiscard]] OutcomeProbabilities
    weighted_distribution(const std::array<strategy::StrategyEstimate,
                                           constants::STRATEGY_COUNT>& estimates,
                          double league_avg_home_advantage) const noexcept;

    [[nodiscard]] const CombinerConfig& config() const noexcept { return config_; }

private:
    CombinerConfig                 config_;
    std::vector<FeatureImportance> ranked_importance_;
};

}  // namespace matchcast::ensemble
