/**
 * @file  bench/bench_predict.cpp
 * @brief Google Benchmark suite for the matchcast prediction pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Aggregate            — StatisticAggregator over a 10-result window
 *   BM_Strategy/<i>         — one scoring strategy (0 rule cascade,
 *                             1 majority vote, 2 layered weights)
 *   BM_Combine              — EnsembleCombiner with reasoning
 *   BM_Predict              — full PredictionEngine::predict over a store
 *   BM_PredictBatch         — a full 20-entry batch, no inter-chunk pause
 *
 * Build (CMake):
 *   cmake -DMATCHCAST_BENCH=ON ..
 *   cmake --build build --target bench_predict
 *   ./build/bench_predict --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "matchcast/engine.hpp"
#include "matchcast/ensemble.hpp"
#include "matchcast/statistics.hpp"
#include "matchcast/store.hpp"
#include "matchcast/strategy.hpp"
#include "matchcast/logging.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace matchcast;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static EntitySnapshot make_entity(EntityId id, const char* form) {
    return EntitySnapshot{
        .id = id, .name = "Team " + std::to_string(id), .league = "Premier",
        .rank = static_cast<int>(id), .points = 60 - 3 * static_cast<int>(id),
        .games_played = 30, .wins = 18 - static_cast<int>(id), .draws = 6,
        .losses = 6 + static_cast<int>(id), .goals_for = 50 - static_cast<int>(id),
        .goals_against = 30 + static_cast<int>(id), .form = parse_form(form).value(),
    };
}

static features::FeatureVector make_fixture() {
    const auto home = make_entity(2, "WWDWLWWDWW");
    const auto away = make_entity(9, "LDLWLLDWLD");
    features::FeatureVector fv;
    fv.home = stats::StatisticAggregator::aggregate(home, home.form);
    fv.away = stats::StatisticAggregator::aggregate(away, away.form);
    fv.match.league_avg_home_advantage = 0.15;
    fv.h2h.h2h_matches_played = 6;
    fv.h2h.h2h_home_wins = 4;
    fv.h2h.h2h_away_wins = 1;
    fv.h2h.h2h_draws = 1;
    return fv;
}

static void fill_store(core::InMemoryStore& store) {
    const char* forms[] = {"WWDWLWWDWW", "LDLWLLDWLD", "DDWLWDLWWD", "WLWLWLWLWL"};
    for (EntityId id = 1; id <= 12; ++id) {
        store.upsert_entity(make_entity(id, forms[id % 4]));
    }
    const auto start = parse_timestamp("2023-08-05").value();
    for (int week = 0; week < 30; ++week) {
        for (EntityId id = 1; id <= 12; id += 2) {
            store.add_match(MatchRecord{
                .home_id = (week % 2 == 0) ? id : id + 1,
                .away_id = (week % 2 == 0) ? id + 1 : id,
                .league = "Premier", .date = start + std::chrono::days{7 * week},
                .home_score = (week + static_cast<int>(id)) % 4, .away_score = week % 3,
            });
        }
    }
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_Aggregate(benchmark::State& state) {
    const auto e = make_entity(3, "WWDWLWWDWW");
    for (auto _ : state) {
        benchmark::DoNotOptimize(stats::StatisticAggregator::aggregate(e, e.form));
    }
}
BENCHMARK(BM_Aggregate);

static void BM_Strategy(benchmark::State& state) {
    const auto strategies = strategy::make_default_strategies();
    const auto& s = strategies[static_cast<std::size_t>(state.range(0))];
    const auto fv = make_fixture();
    for (auto _ : state) {
        benchmark::DoNotOptimize(s->score(fv));
    }
    state.SetLabel(std::string(s->name()));
}
BENCHMARK(BM_Strategy)->DenseRange(0, 2);

static void BM_Combine(benchmark::State& state) {
    const auto strategies = strategy::make_default_strategies();
    const auto fv = make_fixture();
    const auto a = strategies[0]->score(fv);
    const auto b = strategies[1]->score(fv);
    const auto c = strategies[2]->score(fv);
    const ensemble::EnsembleCombiner combiner;
    for (auto _ : state) {
        benchmark::DoNotOptimize(combiner.combine(a, b, c, fv));
    }
}
BENCHMARK(BM_Combine);

static void BM_Predict(benchmark::State& state) {
    core::init_logging("off");
    core::InMemoryStore store;
    fill_store(store);
    const core::PredictionEngine engine(core::EngineConfig{},
                                        core::Collaborators::from_store(store));
    const core::PredictionRequest request{
        .home_id = 2, .away_id = 9, .match_date = parse_timestamp("2024-03-02")};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.predict(request));
    }
}
BENCHMARK(BM_Predict)->Unit(benchmark::kMicrosecond);

static void BM_PredictBatch(benchmark::State& state) {
    core::init_logging("off");
    core::InMemoryStore store;
    fill_store(store);
    core::EngineConfig config;
    config.batch_pause = std::chrono::milliseconds{0};
    const core::PredictionEngine engine(config, core::Collaborators::from_store(store));

    std::vector<core::PredictionRequest> requests;
    for (EntityId id = 1; id <= 10; ++id) {
        requests.push_back({.home_id = id, .away_id = id + 1,
                            .match_date = parse_timestamp("2024-03-02")});
        requests.push_back({.home_id = id + 2, .away_id = id,
                            .match_date = parse_timestamp("2024-03-09")});
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.predict_batch(requests));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(requests.size()));
}
BENCHMARK(BM_PredictBatch)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
