/// @file src/strategy/majority_vote.cpp
/// @brief MajorityVoteStrategy — five single-feature voters.

#include "matchcast/strategy.hpp"

namespace matchcast::strategy {

namespace {

/// Home if `home` beats `away` by more than `margin`, away for the mirror
/// case, draw otherwise.
Outcome compare(double home, double away, double margin) noexcept {
    if (home > away + margin) return Outcome::HomeWin;
    if (away > home + margin) return Outcome::AwayWin;
    return Outcome::Draw;
}

}  // anonymous namespace

std::array<Outcome, MajorityVoteStrategy::VOTER_COUNT>
MajorityVoteStrategy::votes(const features::FeatureVector& fv) noexcept {
    const auto& home = fv.home;
    const auto& away = fv.away;

    std::array<Outcome, VOTER_COUNT> out{};

    out[0] = compare(home.form_points_last_5, away.form_points_last_5, FORM_MARGIN);

    // Position is inverted: the smaller rank is the stronger side.
    out[1] = compare(away.league_position, home.league_position, RANK_MARGIN);

    out[2] = compare(home.goals_per_game, away.goals_per_game, GOALS_MARGIN);

    const double adv = fv.match.league_avg_home_advantage;
    if (adv > HOME_ADV_HIGH) {
        out[3] = Outcome::HomeWin;
    } else if (adv < HOME_ADV_LOW) {
        out[3] = Outcome::AwayWin;
    } else {
        out[3] = Outcome::Draw;
    }

    // Streak length only; the streak type is not consulted.
    if (home.current_streak_length > STREAK_THRESHOLD) {
        out[4] = Outcome::HomeWin;
    } else if (away.current_streak_length > STREAK_THRESHOLD) {
        out[4] = Outcome::AwayWin;
    } else {
        out[4] = Outcome::Draw;
    }

    return out;
}

OutcomeProbabilities
MajorityVoteStrategy::evaluate(const features::FeatureVector& fv) const {
    int home_votes = 0;
    int draw_votes = 0;
    int away_votes = 0;

    for (auto v : votes(fv)) {
        switch (v) {
            case Outcome::HomeWin: ++home_votes; break;
            case Outcome::Draw:    ++draw_votes; break;
            case Outcome::AwayWin: ++away_votes; break;
        }
    }

    constexpr double n = VOTER_COUNT;
    return OutcomeProbabilities{
        .home_win = home_votes / n,
        .draw     = draw_votes / n,
        .away_win = away_votes / n,
    };
}

}  // namespace matchcast::strategy
