/// @file src/strategy/strategy.cpp
/// @brief Strategy::score fallback wrapper and StrategyEstimate helpers.

#include "matchcast/strategy.hpp"
#include "matchcast/constants.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>

namespace matchcast::strategy {

using namespace matchcast::constants;

StrategyEstimate StrategyEstimate::neutral(std::string_view name) {
    return StrategyEstimate{
        .name          = std::string(name),
        .outcome       = Outcome::Draw,
        .probability   = NEUTRAL_PROBABILITY,
        .probabilities = {NEUTRAL_PROBABILITY, NEUTRAL_PROBABILITY, NEUTRAL_PROBABILITY},
        .degraded      = true,
    };
}

StrategyEstimate StrategyEstimate::from(std::string_view name,
                                        const OutcomeProbabilities& p) {
    const Outcome outcome = p.argmax();
    return StrategyEstimate{
        .name          = std::string(name),
        .outcome       = outcome,
        .probability   = p.of(outcome),
        .probabilities = p,
        .degraded      = false,
    };
}

bool is_valid_distribution(const OutcomeProbabilities& p, double tolerance) noexcept {
    for (double v : {p.home_win, p.draw, p.away_win}) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            return false;
        }
    }
    return std::abs(p.sum() - 1.0) <= tolerance;
}

// ─── Strategy::score ──────────────────────────────────────────────────────────

StrategyEstimate Strategy::score(const features::FeatureVector& fv) const noexcept {
    OutcomeProbabilities p;
    try {
        p = evaluate(fv);
    } catch (const std::exception& e) {
        spdlog::warn("strategy {} failed: {}; using neutral estimate", name(), e.what());
        return StrategyEstimate::neutral(name());
    } catch (...) {
        spdlog::warn("strategy {} failed with a non-standard exception; using neutral estimate",
                     name());
        return StrategyEstimate::neutral(name());
    }

    if (!is_valid_distribution(p)) {
        spdlog::warn("strategy {} produced an invalid distribution ({}, {}, {}); "
                     "using neutral estimate",
                     name(), p.home_win, p.draw, p.away_win);
        return StrategyEstimate::neutral(name());
    }

    return StrategyEstimate::from(name(), p);
}

// ─── make_default_strategies ──────────────────────────────────────────────────

std::vector<std::unique_ptr<Strategy>> make_default_strategies() {
    std::vector<std::unique_ptr<Strategy>> out;
    out.reserve(STRATEGY_COUNT);
    out.push_back(std::make_unique<RuleCascadeStrategy>());
    out.push_back(std::make_unique<MajorityVoteStrategy>());
    out.push_back(std::make_unique<LayeredWeightsStrategy>());
    return out;
}

}  // namespace matchcast::strategy
