/// @file tests/strategy/test_strategies.cpp
/// @brief Tests for the three scoring strategies and the neutral fallback.

#include "matchcast/strategy.hpp"
#include "matchcast/statistics.hpp"
#include "matchcast/constants.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace matchcast;
using namespace matchcast::strategy;

namespace {

/// A mid-table side whose only distinguishing input is its recent form.
stats::EntityFeatures side(std::string_view form, int rank = 5) {
    const EntitySnapshot snap{
        .id = 1, .name = "Side", .league = "Premier", .rank = rank,
        .points = 30, .games_played = 20, .wins = 8, .draws = 6, .losses = 6,
        .goals_for = 28, .goals_against = 25, .form = parse_form(form).value(),
    };
    return stats::StatisticAggregator::aggregate(snap, snap.form);
}

features::FeatureVector fixture(std::string_view home_form, std::string_view away_form,
                                double home_advantage = 0.15) {
    features::FeatureVector fv;
    fv.home = side(home_form);
    fv.away = side(away_form);
    fv.match.league_avg_home_advantage = home_advantage;
    return fv;
}

class ThrowingStrategy final : public Strategy {
public:
    std::string_view name() const noexcept override { return "throwing"; }

protected:
    OutcomeProbabilities evaluate(const features::FeatureVector&) const override {
        throw std::runtime_error("model exploded");
    }
};

class IntThrowingStrategy final : public Strategy {
public:
    std::string_view name() const noexcept override { return "int_throwing"; }

protected:
    OutcomeProbabilities evaluate(const features::FeatureVector&) const override {
        throw 42;
    }
};

class NanStrategy final : public Strategy {
public:
    std::string_view name() const noexcept override { return "nan"; }

protected:
    OutcomeProbabilities evaluate(const features::FeatureVector&) const override {
        return {std::numeric_limits<double>::quiet_NaN(), 0.5, 0.5};
    }
};

class UnnormalisedStrategy final : public Strategy {
public:
    std::string_view name() const noexcept override { return "unnormalised"; }

protected:
    OutcomeProbabilities evaluate(const features::FeatureVector&) const override {
        return {0.6, 0.6, 0.6};
    }
};

}  // anonymous namespace

// ─── Distribution helpers ─────────────────────────────────────────────────────

TEST(StrategyDistribution, ValidTriple) {
    EXPECT_TRUE(is_valid_distribution({0.5, 0.3, 0.2}));
    EXPECT_TRUE(is_valid_distribution({1.0, 0.0, 0.0}));
    EXPECT_FALSE(is_valid_distribution({0.5, 0.5, 0.5}));
    EXPECT_FALSE(is_valid_distribution({1.2, -0.1, -0.1}));
    EXPECT_FALSE(is_valid_distribution({std::numeric_limits<double>::infinity(), 0.0, 0.0}));
}

TEST(StrategyDistribution, ArgmaxTiesResolveToDraw) {
    EXPECT_EQ((OutcomeProbabilities{0.4, 0.2, 0.4}).argmax(), Outcome::Draw);
    EXPECT_EQ((OutcomeProbabilities{0.4, 0.4, 0.2}).argmax(), Outcome::Draw);
    EXPECT_EQ((OutcomeProbabilities{0.5, 0.3, 0.2}).argmax(), Outcome::HomeWin);
    EXPECT_EQ((OutcomeProbabilities{0.2, 0.3, 0.5}).argmax(), Outcome::AwayWin);
}

TEST(StrategyEstimateFrom, FromReportsLargestBucket) {
    const auto e = StrategyEstimate::from("x", {0.2, 0.3, 0.5});
    EXPECT_EQ(e.outcome, Outcome::AwayWin);
    EXPECT_DOUBLE_EQ(e.probability, 0.5);
    EXPECT_FALSE(e.degraded);
}

// ─── Neutral fallback ─────────────────────────────────────────────────────────

TEST(StrategyFallback, ThrowingStrategyIsNeutral) {
    ThrowingStrategy s;
    const auto e = s.score(fixture("WWWWW", "LLLLL"));
    EXPECT_TRUE(e.degraded);
    EXPECT_EQ(e.name, "throwing");
    EXPECT_EQ(e.outcome, Outcome::Draw);
    EXPECT_DOUBLE_EQ(e.probability, constants::NEUTRAL_PROBABILITY);
    EXPECT_DOUBLE_EQ(e.probabilities.home_win, constants::NEUTRAL_PROBABILITY);
    EXPECT_DOUBLE_EQ(e.probabilities.away_win, constants::NEUTRAL_PROBABILITY);
}

TEST(StrategyFallback, NonStandardExceptionIsNeutral) {
    IntThrowingStrategy s;
    const auto e = s.score(fixture("WWWWW", "LLLLL"));
    EXPECT_TRUE(e.degraded);
    EXPECT_EQ(e.name, "int_throwing");
    EXPECT_EQ(e.outcome, Outcome::Draw);
}

TEST(StrategyFallback, NonFiniteOutputIsNeutral) {
    NanStrategy s;
    EXPECT_TRUE(s.score(fixture("WWWWW", "LLLLL")).degraded);
}

TEST(StrategyFallback, UnnormalisedOutputIsNeutral) {
    UnnormalisedStrategy s;
    EXPECT_TRUE(s.score(fixture("WWWWW", "LLLLL")).degraded);
}

TEST(StrategyFactory, DefaultOrderAndNames) {
    const auto all = make_default_strategies();
    ASSERT_EQ(all.size(), constants::STRATEGY_COUNT);
    EXPECT_EQ(all[0]->name(), "rule_cascade");
    EXPECT_EQ(all[1]->name(), "majority_vote");
    EXPECT_EQ(all[2]->name(), "layered_weights");
}

TEST(StrategyFactory, EveryStrategyIsDeterministicAndValid) {
    const auto fv = fixture("WDWLW", "DLLWD", 0.22);
    for (const auto& s : make_default_strategies()) {
        const auto a = s->score(fv);
        const auto b = s->score(fv);
        EXPECT_EQ(a, b) << s->name();
        EXPECT_FALSE(a.degraded) << s->name();
        EXPECT_TRUE(is_valid_distribution(a.probabilities)) << s->name();
    }
}

// ─── RuleCascadeStrategy ──────────────────────────────────────────────────────

TEST(RuleCascade, StrongHomeForm) {
    RuleCascadeStrategy s;
    const auto e = s.score(fixture("WWWWW", "LLLLL"));

    // home 0.30 + 0.15 × 0.15, draw 0.20, away 0 → clamp away to 0.05
    const double total = 0.3225 + 0.2;
    const double sum   = 0.3225 / total + 0.2 / total + 0.05;
    EXPECT_EQ(e.outcome, Outcome::HomeWin);
    EXPECT_NEAR(e.probabilities.home_win, (0.3225 / total) / sum, 1e-12);
    EXPECT_NEAR(e.probabilities.draw, (0.2 / total) / sum, 1e-12);
    EXPECT_NEAR(e.probabilities.away_win, 0.05 / sum, 1e-12);
    EXPECT_NEAR(e.probabilities.home_win, 0.5878, 1e-4);
}

TEST(RuleCascade, StrongAwayForm) {
    RuleCascadeStrategy s;
    const auto e = s.score(fixture("LLLLL", "WWWWW"));
    EXPECT_EQ(e.outcome, Outcome::AwayWin);
    EXPECT_GT(e.probabilities.away_win, e.probabilities.draw);
}

TEST(RuleCascade, EvenSidesFavourDraw) {
    RuleCascadeStrategy s;
    const auto e = s.score(fixture("WDLWD", "WDLWD"));
    EXPECT_EQ(e.outcome, Outcome::Draw);
    EXPECT_NEAR(e.probabilities.draw, 0.9 / (0.0225 / 0.3225 + 0.9 + 0.05), 1e-12);
}

TEST(RuleCascade, BucketsStayWithinClampAfterRenormalisation) {
    RuleCascadeStrategy s;
    for (auto [h, a] : {std::pair{"WWWWW", "LLLLL"}, std::pair{"DDDDD", "DDDDD"},
                        std::pair{"LLLLL", "WWWWW"}}) {
        const auto e = s.score(fixture(h, a));
        for (double p : {e.probabilities.home_win, e.probabilities.draw,
                         e.probabilities.away_win}) {
            EXPECT_GT(p, 0.0);
            EXPECT_LT(p, 0.9 + 1e-12);
        }
    }
}

// ─── MajorityVoteStrategy ─────────────────────────────────────────────────────

TEST(MajorityVote, IndividualVotes) {
    const auto votes = MajorityVoteStrategy::votes(fixture("WWWWW", "LLLLL"));
    EXPECT_EQ(votes[0], Outcome::HomeWin);  // form
    EXPECT_EQ(votes[1], Outcome::Draw);     // rank
    EXPECT_EQ(votes[2], Outcome::Draw);     // goals
    EXPECT_EQ(votes[3], Outcome::Draw);     // home advantage 0.15 is not > 0.15
    EXPECT_EQ(votes[4], Outcome::HomeWin);  // streak length 5
}

TEST(MajorityVote, VoteSharesAreProbabilities) {
    MajorityVoteStrategy s;
    const auto e = s.score(fixture("WWWWW", "LLLLL"));
    EXPECT_DOUBLE_EQ(e.probabilities.home_win, 0.4);
    EXPECT_DOUBLE_EQ(e.probabilities.draw, 0.6);
    EXPECT_DOUBLE_EQ(e.probabilities.away_win, 0.0);
    EXPECT_EQ(e.outcome, Outcome::Draw);
}

TEST(MajorityVote, HomeAdvantageVoter) {
    EXPECT_EQ(MajorityVoteStrategy::votes(fixture("D", "D", 0.2))[3], Outcome::HomeWin);
    EXPECT_EQ(MajorityVoteStrategy::votes(fixture("D", "D", 0.01))[3], Outcome::AwayWin);
}

TEST(MajorityVote, StreakVoterIgnoresStreakType) {
    // A four-match losing run still votes for its side.
    const auto votes = MajorityVoteStrategy::votes(fixture("LLLLW", "WDWDW"));
    EXPECT_EQ(votes[4], Outcome::HomeWin);
}

TEST(MajorityVote, EvenSidesAreUnanimousDraw) {
    MajorityVoteStrategy s;
    const auto e = s.score(fixture("WDLWD", "WDLWD"));
    EXPECT_DOUBLE_EQ(e.probabilities.draw, 1.0);
}

// ─── LayeredWeightsStrategy ───────────────────────────────────────────────────

TEST(LayeredWeights, ProjectionIsUnitScaled) {
    const auto x = LayeredWeightsStrategy::project(fixture("WWWWW", "LLLLL"));
    EXPECT_DOUBLE_EQ(x(0), 1.0);
    EXPECT_DOUBLE_EQ(x(1), 0.0);
    EXPECT_DOUBLE_EQ(x(8), 1.0);    // trend +1
    EXPECT_DOUBLE_EQ(x(9), 0.75);   // trend +0.5
    EXPECT_DOUBLE_EQ(x(10), 0.3);   // 0.15 / 0.5
    EXPECT_DOUBLE_EQ(x(11), 0.5);   // no meetings
    EXPECT_TRUE(((x.array() >= 0.0) && (x.array() <= 1.0)).all());
}

TEST(LayeredWeights, EqualSidesPredictDraw) {
    LayeredWeightsStrategy s;
    const auto e = s.score(fixture("WDLWD", "WDLWD"));
    EXPECT_EQ(e.outcome, Outcome::Draw);
    EXPECT_NEAR(e.probabilities.draw, 0.4705, 1e-3);
}

TEST(LayeredWeights, FormGapDecidesTheFavourite) {
    LayeredWeightsStrategy s;
    const auto home = s.score(fixture("WWWWW", "LLLLL"));
    EXPECT_EQ(home.outcome, Outcome::HomeWin);
    EXPECT_NEAR(home.probabilities.home_win, 0.827, 2e-3);

    const auto away = s.score(fixture("LLLLL", "WWWWW"));
    EXPECT_EQ(away.outcome, Outcome::AwayWin);
    EXPECT_GT(away.probabilities.away_win, 0.75);
}

TEST(LayeredWeights, ForwardIsASoftmax) {
    NetworkInput x;
    x.setConstant(0.5);
    const auto p = LayeredWeightsStrategy::forward(x);
    EXPECT_TRUE(is_valid_distribution(p));
}
