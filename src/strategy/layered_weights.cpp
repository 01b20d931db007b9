/// @file src/strategy/layered_weights.cpp
/// @brief LayeredWeightsStrategy — fixed 12 → 8 → 4 → 3 network.

#include "matchcast/strategy.hpp"

#include <algorithm>
#include <cmath>

namespace matchcast::strategy {

namespace {

using Hidden1Weights = Eigen::Matrix<double, HIDDEN_1_DIM, NETWORK_INPUT_DIM>;
using Hidden2Weights = Eigen::Matrix<double, HIDDEN_2_DIM, HIDDEN_1_DIM>;
using OutputWeights  = Eigen::Matrix<double, OUTPUT_DIM, HIDDEN_2_DIM>;
using Hidden1        = Eigen::Vector<double, HIDDEN_1_DIM>;
using Hidden2        = Eigen::Vector<double, HIDDEN_2_DIM>;
using Output         = Eigen::Vector<double, OUTPUT_DIM>;

struct NetworkWeights {
    Hidden1Weights w1;
    Hidden1        b1;
    Hidden2Weights w2;
    Hidden2        b2;
    OutputWeights  w3;
    Output         b3;
};

NetworkWeights make_weights() {
    NetworkWeights n;

    // x:     f_h   f_a   p_h   p_a   gd_h  gd_a  r_h   r_a   t_h   t_a   adv   h2h
    n.w1 <<   2.0, -2.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,
              0.0,  0.0,  2.0, -2.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,
              0.0,  0.0,  0.0,  0.0,  2.0, -2.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,
              0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  2.0, -2.0,  0.0,  0.0,  0.0,  0.0,
              0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  2.0, -2.0,  0.0,  0.0,
              0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  2.0,
              0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  4.0,  0.0,
              0.5, -0.5,  0.5, -0.5,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  0.0;
    n.b1 << 0.0, 0.0, 0.0, 0.0, 0.0, -1.0, -1.0, 0.0;

    // Home edge weighs every contrast unit; away edge mirrors it.
    // h:     form  ppg   gd    rank  trend h2h   adv   mix
    n.w2 <<   3.0,  3.0,  3.0,  3.0,  2.0,  2.0,  0.0,  3.0,
             -3.0, -3.0, -3.0, -3.0, -2.0, -2.0,  0.0, -3.0,
              0.0,  0.0,  0.0,  0.0,  4.0,  4.0,  0.0,  0.0,
              0.0,  0.0,  0.0,  0.0,  0.0,  0.0,  4.0,  0.0;
    n.b2 << -9.5, 9.5, -4.0, -2.0;

    // g:     home  away  mom   adv
    n.w3 <<   6.0,  0.0,  0.5,  1.0,
              0.0,  0.0,  0.0,  0.0,
              0.0,  6.0, -0.5,  0.0;
    n.b3 << -3.75, 0.6, -2.75;

    return n;
}

const NetworkWeights& weights() {
    static const NetworkWeights n = make_weights();
    return n;
}

template <typename V>
V sigmoid(const V& z) {
    return (1.0 + (-z.array()).exp()).inverse().matrix();
}

double unit(double v) noexcept {
    return std::clamp(v, 0.0, 1.0);
}

}  // anonymous namespace

// ─── project ──────────────────────────────────────────────────────────────────

NetworkInput LayeredWeightsStrategy::project(const features::FeatureVector& fv) noexcept {
    const auto& home = fv.home;
    const auto& away = fv.away;
    const auto& h2h  = fv.h2h;

    auto rank_score = [](double position) noexcept {
        return unit(1.0 - (position - 1.0) / 19.0);
    };

    double h2h_balance = 0.0;
    if (h2h.h2h_matches_played > 0.0) {
        h2h_balance = (h2h.h2h_home_wins - h2h.h2h_away_wins) / h2h.h2h_matches_played;
    }

    NetworkInput x;
    x << unit(home.form_points_last_5 / 15.0),
         unit(away.form_points_last_5 / 15.0),
         unit(home.points_per_game / 3.0),
         unit(away.points_per_game / 3.0),
         unit((home.goal_difference_per_game + 3.0) / 6.0),
         unit((away.goal_difference_per_game + 3.0) / 6.0),
         rank_score(home.league_position),
         rank_score(away.league_position),
         unit((home.performance_trend_5 + 1.0) / 2.0),
         unit((away.performance_trend_5 + 1.0) / 2.0),
         unit(fv.match.league_avg_home_advantage / 0.5),
         unit((h2h_balance + 1.0) / 2.0);
    return x;
}

// ─── forward ──────────────────────────────────────────────────────────────────

OutcomeProbabilities LayeredWeightsStrategy::forward(const NetworkInput& x) noexcept {
    const auto& n = weights();

    const Hidden1 h1 = sigmoid<Hidden1>(n.w1 * x + n.b1);
    const Hidden2 h2 = sigmoid<Hidden2>(n.w2 * h1 + n.b2);
    const Output  z  = n.w3 * h2 + n.b3;

    // Softmax with max subtraction.
    const Output e = (z.array() - z.maxCoeff()).exp().matrix();
    const Output p = e / e.sum();

    return OutcomeProbabilities{
        .home_win = p(0),
        .draw     = p(1),
        .away_win = p(2),
    };
}

OutcomeProbabilities
LayeredWeightsStrategy::evaluate(const features::FeatureVector& fv) const {
    return forward(project(fv));
}

}  // namespace matchcast::strategy
