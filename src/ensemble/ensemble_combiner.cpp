/// @file src/ensemble/ensemble_combiner.cpp
/// @brief EnsembleCombiner — weighted vote, normalisation and explanation.

#include "matchcast/ensemble.hpp"
#include "matchcast/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace matchcast::ensemble {

using namespace matchcast::constants;

// ─── StrategyWeights ──────────────────────────────────────────────────────────

double StrategyWeights::sum() const noexcept {
    return rule_cascade + majority_vote + layered_weights;
}

bool StrategyWeights::is_valid() const noexcept {
    for (double w : as_array()) {
        if (!std::isfinite(w) || w < 0.0) {
            return false;
        }
    }
    return std::abs(sum() - 1.0) <= PROBABILITY_SUM_TOLERANCE;
}

std::array<double, STRATEGY_COUNT> StrategyWeights::as_array() const noexcept {
    return {rule_cascade, majority_vote, layered_weights};
}

// ─── EnsembleCombiner ─────────────────────────────────────────────────────────

EnsembleCombiner::EnsembleCombiner(CombinerConfig config)
    : config_(std::move(config)) {
    if (!config_.weights.is_valid()) {
        throw ValidationError(fmt::format(
            "strategy weights must be non-negative and sum to 1 (got {} + {} + {} = {})",
            config_.weights.rule_cascade, config_.weights.majority_vote,
            config_.weights.layered_weights, config_.weights.sum()));
    }
    if (!std::isfinite(config_.home_advantage_scale) || config_.home_advantage_scale < 0.0) {
        throw ValidationError(fmt::format("home advantage scale must be finite and >= 0 (got {})",
                                          config_.home_advantage_scale));
    }
    ranked_importance_ = rank_feature_importance(config_.importance_table,
                                                 config_.max_importance);
}

OutcomeProbabilities EnsembleCombiner::weighted_distribution(
    const std::array<strategy::StrategyEstimate, STRATEGY_COUNT>& estimates,
    double league_avg_home_advantage) const noexcept {
    const auto weights = config_.weights.as_array();

    OutcomeProbabilities p;
    for (std::size_t i = 0; i < STRATEGY_COUNT; ++i) {
        const double mass = weights[i] * estimates[i].probability;
        switch (estimates[i].outcome) {
            case Outcome::HomeWin: p.home_win += mass; break;
            case Outcome::Draw:    p.draw     += mass; break;
            case Outcome::AwayWin: p.away_win += mass; break;
        }
    }

    p.home_win += config_.home_advantage_scale * league_avg_home_advantage;

    const double total = p.sum();
    if (!std::isfinite(total) || total <= 0.0
        || p.home_win < 0.0 || p.draw < 0.0 || p.away_win < 0.0) {
        return {NEUTRAL_PROBABILITY, NEUTRAL_PROBABILITY, NEUTRAL_PROBABILITY};
    }

    return OutcomeProbabilities{
        .home_win = p.home_win / total,
        .draw     = p.draw / total,
        .away_win = p.away_win / total,
    };
}

EnsembleResult
EnsembleCombiner::combine(const strategy::StrategyEstimate& rule_cascade,
                          const strategy::StrategyEstimate& majority_vote,
                          const strategy::StrategyEstimate& layered_weights,
                          const features::FeatureVector& fv) const {
    EnsembleResult r;
    r.estimates = {rule_cascade, majority_vote, layered_weights};
    r.weights   = config_.weights;

    r.probabilities = weighted_distribution(r.estimates, fv.match.league_avg_home_advantage);
    r.outcome       = r.probabilities.argmax();
    r.confidence    = r.probabilities.max();

    r.contributing_strategies = static_cast<std::size_t>(
        std::count_if(r.estimates.begin(), r.estimates.end(),
                      [](const auto& e) { return !e.degraded; }));
    r.league_defaults_used         = fv.match.league_defaults_used;
    r.placeholder_external_factors = fv.external.placeholder;
    r.degraded = r.contributing_strategies < STRATEGY_COUNT || r.league_defaults_used;

    r.feature_importance = ranked_importance_;

    const ReasoningInput input{
        .features            = fv,
        .confidence          = r.confidence,
        .degraded_strategies = STRATEGY_COUNT - r.contributing_strategies,
    };
    r.reasoning = explain(default_reasoning_rules(), input);

    return r;
}

}  // namespace matchcast::ensemble
