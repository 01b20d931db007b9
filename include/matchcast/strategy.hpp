#pragma once

/// @file include/matchcast/strategy.hpp
/// @brief Scoring Strategies — three independent heuristic scorers.
///
/// # Module: Scoring Strategies
///
/// ## Responsibility
/// Map a `FeatureVector` to an outcome distribution. Every variant exposes
/// the same `score` entry point; `score` never throws and never returns an
/// invalid triple. A variant whose `evaluate` throws, or yields a non-finite
/// or out-of-range triple, is replaced by the neutral estimate
/// (1/3 each, Draw, `degraded = true`).
///
/// ## Variants
/// - `RuleCascadeStrategy`   — additive decision rules, clamped and renormalised
/// - `MajorityVoteStrategy`  — five single-feature voters, votes / 5
/// - `LayeredWeightsStrategy` — fixed 12 → 8 → 4 → 3 sigmoid/softmax network
///
/// ## Guarantees
/// - Stateless after construction; safe to call concurrently
/// - Deterministic: identical input gives bit-identical output
/// - Outcome is the strictly largest bucket, ties resolve to Draw

#include "matchcast/features.hpp"
#include "matchcast/types.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace matchcast::strategy {

// ─── StrategyEstimate ─────────────────────────────────────────────────────────

struct StrategyEstimate {
    std::string          name;
    Outcome              outcome     = Outcome::Draw;
    double               probability = 0.0;  ///< probabilities.of(outcome)
    OutcomeProbabilities probabilities{};
    bool                 degraded    = false;

    /// Uniform fallback estimate for a failed strategy.
    [[nodiscard]] static StrategyEstimate neutral(std::string_view name);

    /// Estimate reporting the strictly largest bucket of `p`.
    [[nodiscard]] static StrategyEstimate from(std::string_view name,
                                               const OutcomeProbabilities& p);

    friend bool operator==(const StrategyEstimate&, const StrategyEstimate&) = default;
};

/// True when every bucket is finite, in [0, 1], and the sum is 1 within
/// `tolerance`.
[[nodiscard]] bool is_valid_distribution(const OutcomeProbabilities& p,
                                         double tolerance = 1e-9) noexcept;

// ─── Strategy ─────────────────────────────────────────────────────────────────

class Strategy {
public:
    virtual ~Strategy() = default;

    /// Stable identifier ("rule_cascade", "majority_vote", "layered_weights").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Score a feature vector, falling back to the neutral estimate on fault.
    [[nodiscard]] StrategyEstimate score(const features::FeatureVector& fv) const noexcept;

protected:
    /// Variant-specific scoring. May throw; must be free of side effects.
    [[nodiscard]] virtual OutcomeProbabilities
    evaluate(const features::FeatureVector& fv) const = 0;
};

// ─── RuleCascadeStrategy ──────────────────────────────────────────────────────

/// Additive decision rules over the home/away feature gaps.
///
///   form-points gap (last 5)  > 3  → home +0.30,  < −3 → away +0.30, else draw +0.10
///   goal-difference gap       > 0.5 → home +0.25, < −0.5 → away +0.25
///   rank gap (away − home)    > 3  → home +0.20,  < −3 → away +0.20
///   home advantage                 → home +0.15 · league_avg_home_advantage
///   trend-5 gap               > 1  → home +0.15,  < −1 → away +0.15
///   base draw mass                 → draw +0.20
///
/// Each bucket is divided by the total, clamped to [0.05, 0.9] and the
/// triple is renormalised.
class RuleCascadeStrategy final : public Strategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "rule_cascade"; }

    static constexpr double FORM_GAP          = 3.0;
    static constexpr double FORM_WEIGHT       = 0.30;
    static constexpr double FORM_DRAW_WEIGHT  = 0.10;
    static constexpr double GD_GAP            = 0.5;
    static constexpr double GD_WEIGHT         = 0.25;
    static constexpr double RANK_GAP          = 3.0;
    static constexpr double RANK_WEIGHT       = 0.20;
    static constexpr double HOME_ADV_WEIGHT   = 0.15;
    static constexpr double TREND_GAP         = 1.0;
    static constexpr double TREND_WEIGHT      = 0.15;
    static constexpr double BASE_DRAW_MASS    = 0.20;
    static constexpr double MIN_BUCKET        = 0.05;
    static constexpr double MAX_BUCKET        = 0.90;

protected:
    [[nodiscard]] OutcomeProbabilities
    evaluate(const features::FeatureVector& fv) const override;
};

// ─── MajorityVoteStrategy ─────────────────────────────────────────────────────

/// Five single-feature voters; probabilities are vote shares.
class MajorityVoteStrategy final : public Strategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "majority_vote"; }

    static constexpr int    VOTER_COUNT        = 5;
    static constexpr double FORM_MARGIN        = 2.0;
    static constexpr double RANK_MARGIN        = 3.0;
    static constexpr double GOALS_MARGIN       = 0.5;
    static constexpr double HOME_ADV_HIGH      = 0.15;
    static constexpr double HOME_ADV_LOW       = 0.05;
    static constexpr double STREAK_THRESHOLD   = 3.0;

    /// Individual votes in voter order (form, rank, goals, home advantage,
    /// streak).
    [[nodiscard]] static std::array<Outcome, VOTER_COUNT>
    votes(const features::FeatureVector& fv) noexcept;

protected:
    [[nodiscard]] OutcomeProbabilities
    evaluate(const features::FeatureVector& fv) const override;
};

// ─── LayeredWeightsStrategy ───────────────────────────────────────────────────

/// Number of scaled inputs fed to the network.
static constexpr int NETWORK_INPUT_DIM = 12;
static constexpr int HIDDEN_1_DIM      = 8;
static constexpr int HIDDEN_2_DIM      = 4;
static constexpr int OUTPUT_DIM        = 3;

using NetworkInput = Eigen::Vector<double, NETWORK_INPUT_DIM>;

/// Fixed three-layer network.
///
/// # Input projection (each scaled into [0, 1])
///   x0, x1   home / away form points last 5 ÷ 15
///   x2, x3   home / away points per game ÷ 3
///   x4, x5   home / away (goal difference per game + 3) ÷ 6
///   x6, x7   home / away rank score 1 − (position − 1) ÷ 19
///   x8, x9   home / away (trend-5 + 1) ÷ 2
///   x10      league average home advantage ÷ 0.5
///   x11      (h2h home wins − h2h away wins) ÷ meetings, mapped to [0, 1]
///
/// # Layers
///   hidden-1: 8 sigmoid units, five home-minus-away contrasts, an H2H unit,
///             a home-advantage unit and a combined form/points contrast
///   hidden-2: 4 sigmoid units, home edge, away edge, momentum and home
///             advantage pass-through
///   output:   softmax over (home, draw, away); the draw logit is a constant
///
/// Equal sides drive every contrast unit to 0.5, which leaves the draw logit
/// the largest.
class LayeredWeightsStrategy final : public Strategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "layered_weights"; }

    /// Build the scaled input vector.
    [[nodiscard]] static NetworkInput project(const features::FeatureVector& fv) noexcept;

    /// Run the network on an already projected input.
    [[nodiscard]] static OutcomeProbabilities forward(const NetworkInput& x) noexcept;

protected:
    [[nodiscard]] OutcomeProbabilities
    evaluate(const features::FeatureVector& fv) const override;
};

// ─── Factory ──────────────────────────────────────────────────────────────────

/// The three strategies in ensemble order.
[[nodiscard]] std::vector<std::unique_ptr<Strategy>> make_default_strategies();

}  // namespace matchcast::strategy
