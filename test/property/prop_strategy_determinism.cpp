/**
 * @file  prop_strategy_determinism.cpp
 * @brief Property: scoring and combining are pure functions of the feature
 *        vector: identical inputs give bit-identical results.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_strategy_determinism
 *
 * Also checks the rule cascade's clamp: after renormalisation no bucket is
 * zero and none exceeds 0.9.
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "matchcast/ensemble.hpp"
#include "matchcast/statistics.hpp"
#include "matchcast/strategy.hpp"

using namespace matchcast;

namespace {

stats::EntityFeatures gen_side() {
    EntitySnapshot s;
    s.id            = 1;
    s.name          = "Side";
    s.rank          = *rc::gen::inRange(1, 21);
    s.wins          = *rc::gen::inRange(0, 20);
    s.draws         = *rc::gen::inRange(0, 20);
    s.losses        = *rc::gen::inRange(0, 20);
    s.games_played  = s.wins + s.draws + s.losses;
    s.points        = 3 * s.wins + s.draws;
    s.goals_for     = *rc::gen::inRange(0, 80);
    s.goals_against = *rc::gen::inRange(0, 80);
    auto form = *rc::gen::container<std::vector<FormResult>>(
        rc::gen::element(FormResult::Win, FormResult::Draw, FormResult::Loss));
    if (form.size() > constants::FORM_WINDOW) form.resize(constants::FORM_WINDOW);
    return stats::StatisticAggregator::aggregate(s, form);
}

}  // anonymous namespace

int main() {
    const auto strategies = strategy::make_default_strategies();
    const ensemble::EnsembleCombiner combiner;

    // ── Property 1: repeat scoring is identical ────────────────────────────
    rc::check(
        "strategy_determinism: scoring twice gives identical estimates",
        [&strategies, &combiner]() {
            features::FeatureVector fv;
            fv.home = gen_side();
            fv.away = gen_side();
            fv.match.league_avg_home_advantage = *rc::gen::inRange(0, 40) / 100.0;

            for (const auto& s : strategies) {
                RC_ASSERT(s->score(fv) == s->score(fv));
            }
            const auto a = combiner.combine(strategies[0]->score(fv), strategies[1]->score(fv),
                                            strategies[2]->score(fv), fv);
            const auto b = combiner.combine(strategies[0]->score(fv), strategies[1]->score(fv),
                                            strategies[2]->score(fv), fv);
            RC_ASSERT(a == b);
        }
    );

    // ── Property 2: rule cascade buckets stay inside the clamp ─────────────
    rc::check(
        "strategy_determinism: rule cascade buckets are in (0, 0.9]",
        [&strategies]() {
            features::FeatureVector fv;
            fv.home = gen_side();
            fv.away = gen_side();
            fv.match.league_avg_home_advantage = *rc::gen::inRange(0, 40) / 100.0;

            const auto p = strategies[0]->score(fv).probabilities;
            for (double x : {p.home_win, p.draw, p.away_win}) {
                RC_ASSERT(x > 0.0);
                RC_ASSERT(x <= 0.9 + 1e-12);
            }
        }
    );

    return 0;
}
