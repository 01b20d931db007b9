/**
 * @file  prop_probability_simplex.cpp
 * @brief Property: every strategy and the ensemble emit a probability triple
 *        on the simplex, for any consistent pair of entity records.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_probability_simplex
 *
 * Checked on every input:
 *   - each strategy: components in [0, 1], sum within 1e-9 of 1, not degraded
 *   - ensemble: sum within 1e-9 of 1, confidence == max bucket,
 *     outcome == argmax with ties resolved to Draw
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

#include "matchcast/ensemble.hpp"
#include "matchcast/statistics.hpp"
#include "matchcast/strategy.hpp"

using namespace matchcast;

namespace {

rc::Gen<std::vector<FormResult>> gen_form() {
    return rc::gen::map(
        rc::gen::container<std::vector<FormResult>>(
            rc::gen::element(FormResult::Win, FormResult::Draw, FormResult::Loss)),
        [](std::vector<FormResult> f) {
            if (f.size() > constants::FORM_WINDOW) f.resize(constants::FORM_WINDOW);
            return f;
        });
}

EntitySnapshot gen_snapshot() {
    EntitySnapshot s;
    s.id            = 1;
    s.name          = "Side";
    s.league        = "Premier";
    s.rank          = *rc::gen::inRange(1, 21);
    s.wins          = *rc::gen::inRange(0, 20);
    s.draws         = *rc::gen::inRange(0, 20);
    s.losses        = *rc::gen::inRange(0, 20);
    s.games_played  = s.wins + s.draws + s.losses;
    s.points        = 3 * s.wins + s.draws;
    s.goals_for     = *rc::gen::inRange(0, 100);
    s.goals_against = *rc::gen::inRange(0, 100);
    s.form          = *gen_form();
    return s;
}

features::FeatureVector gen_fixture() {
    const auto home = gen_snapshot();
    const auto away = gen_snapshot();
    const double league_goals = *rc::gen::inRange(0, 50) / 10.0;

    features::FeatureVector fv;
    fv.home = stats::StatisticAggregator::aggregate(home, home.form, league_goals);
    fv.away = stats::StatisticAggregator::aggregate(away, away.form, league_goals);
    fv.match.league_avg_home_advantage = *rc::gen::inRange(-20, 51) / 100.0;

    const int played = *rc::gen::inRange(0, 21);
    const int home_wins = played > 0 ? *rc::gen::inRange(0, played + 1) : 0;
    fv.h2h.h2h_matches_played = played;
    fv.h2h.h2h_home_wins      = home_wins;
    fv.h2h.h2h_away_wins      = played - home_wins;
    return fv;
}

bool on_simplex(const OutcomeProbabilities& p) {
    for (double x : {p.home_win, p.draw, p.away_win}) {
        if (!std::isfinite(x) || x < 0.0 || x > 1.0) return false;
    }
    return std::abs(p.sum() - 1.0) <= 1e-9;
}

}  // anonymous namespace

int main() {
    const auto strategies = strategy::make_default_strategies();
    const ensemble::EnsembleCombiner combiner;

    // ── Property 1: each strategy lands on the simplex ──────────────────────
    rc::check(
        "probability_simplex: every strategy emits a valid distribution",
        [&strategies]() {
            const auto fv = gen_fixture();
            for (const auto& s : strategies) {
                const auto e = s->score(fv);
                RC_ASSERT(on_simplex(e.probabilities));
                RC_ASSERT(!e.degraded);
                RC_ASSERT(e.probability == e.probabilities.of(e.outcome));
            }
        }
    );

    // ── Property 2: the ensemble lands on the simplex ───────────────────────
    rc::check(
        "probability_simplex: ensemble sums to one and reports its argmax",
        [&strategies, &combiner]() {
            const auto fv = gen_fixture();
            const auto r = combiner.combine(strategies[0]->score(fv),
                                            strategies[1]->score(fv),
                                            strategies[2]->score(fv), fv);
            RC_ASSERT(on_simplex(r.probabilities));
            RC_ASSERT(r.confidence == r.probabilities.max());
            RC_ASSERT(r.outcome == r.probabilities.argmax());
            RC_ASSERT(r.contributing_strategies == constants::STRATEGY_COUNT);
        }
    );

    // ── Property 3: exact ties never favour a side ─────────────────────────
    rc::check(
        "probability_simplex: a home/away tie resolves to draw",
        [](int raw) {
            const double p = std::abs(raw % 1000) / 2000.0;
            const OutcomeProbabilities t{p, 1.0 - 2.0 * p, p};
            if (t.home_win >= t.draw) {
                RC_ASSERT(t.argmax() == Outcome::Draw);
            }
        }
    );

    return 0;
}
