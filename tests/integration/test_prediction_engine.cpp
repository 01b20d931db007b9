/// @file tests/integration/test_prediction_engine.cpp
/// @brief End-to-end tests of PredictionEngine over an InMemoryStore.

#include "matchcast/engine.hpp"
#include "matchcast/store.hpp"
#include "matchcast/errors.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace matchcast;
using namespace matchcast::core;
using namespace std::chrono_literals;

namespace {

Timestamp day(const char* text) {
    return parse_timestamp(text).value();
}

EntitySnapshot team(EntityId id, std::string_view form) {
    return EntitySnapshot{
        .id = id, .name = "Team " + std::to_string(id), .league = "Premier", .rank = 5,
        .points = 30, .games_played = 20, .wins = 8, .draws = 6, .losses = 6,
        .goals_for = 28, .goals_against = 25, .form = parse_form(form).value(),
    };
}

class ThrowingSink final : public PredictionSink {
public:
    void store_prediction(const MatchContext&, const ensemble::EnsembleResult&) override {
        throw std::runtime_error("disk full");
    }
};

class IntThrowingSink final : public PredictionSink {
public:
    void store_prediction(const MatchContext&, const ensemble::EnsembleResult&) override {
        throw 7;
    }
};

class SlowEntities final : public EntitySource {
public:
    std::optional<EntitySnapshot> get_entity(EntityId) const override {
        std::this_thread::sleep_for(300ms);
        return std::nullopt;
    }
};

class UnavailableLeagues final : public LeagueSource {
public:
    context::LeagueAverages get_league_averages(const std::string& league) const override {
        throw TransientError("league service unavailable for " + league);
    }
};

bool contains(const std::vector<std::string>& lines, std::string_view needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& l) {
        return l.find(needle) != std::string::npos;
    });
}

class PredictionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.upsert_entity(team(1, "WWWWW"));
        store.upsert_entity(team(2, "LLLLL"));
        store.upsert_entity(team(3, "WDLWD"));
        store.upsert_entity(team(4, "WDLWD"));
        config.batch_pause = 1ms;
    }

    PredictionEngine make_engine() {
        return PredictionEngine(config, Collaborators::from_store(store));
    }

    static PredictionRequest request(EntityId home, EntityId away) {
        return PredictionRequest{.home_id = home, .away_id = away,
                                 .match_date = day("2024-05-04")};
    }

    InMemoryStore store;
    EngineConfig  config;
};

}  // anonymous namespace

// ─── Single predictions ───────────────────────────────────────────────────────

TEST_F(PredictionEngineTest, StrongFormFavoursHome) {
    const auto engine = make_engine();
    const auto r = engine.predict(request(1, 2));

    EXPECT_EQ(r.result.outcome, Outcome::HomeWin);
    EXPECT_NEAR(r.result.confidence, 0.7346, 1e-3);
    EXPECT_NEAR(r.result.probabilities.sum(), 1.0, 1e-9);
    EXPECT_FALSE(r.result.degraded);
    EXPECT_FALSE(r.result.league_defaults_used);
    EXPECT_TRUE(r.result.placeholder_external_factors);
    EXPECT_FALSE(r.is_high_confidence);  // 0.73 is below the 0.75 threshold
    EXPECT_EQ(r.result.feature_importance.size(), 8u);
    EXPECT_TRUE(contains(r.key_factors, "Significant form difference between teams"));
    EXPECT_TRUE(contains(r.result.reasoning, "Home team is in much better form"));

    EXPECT_EQ(r.match_info.home.name, "Team 1");
    EXPECT_EQ(r.match_info.away.form, "LLLLL");
    EXPECT_EQ(r.match_info.league, "Premier");
    EXPECT_EQ(format_date(r.match_info.match_date), "2024-05-04");

    EXPECT_EQ(r.historical_context.home_form.last_5_games, "WWWWW");
    EXPECT_EQ(r.historical_context.home_form.points, 15);
    EXPECT_EQ(r.historical_context.home_form.goals_for, 10);
    EXPECT_EQ(r.historical_context.away_form.goals_against, 10);
    EXPECT_EQ(r.historical_context.head_to_head.total_matches, 0u);
    EXPECT_FALSE(r.historical_context.head_to_head.last_meeting.has_value());
}

TEST_F(PredictionEngineTest, EvenSidesPredictDraw) {
    const auto engine = make_engine();
    const auto r = engine.predict(request(3, 4));
    EXPECT_EQ(r.result.outcome, Outcome::Draw);
    EXPECT_GT(r.result.probabilities.draw, 0.9);
    EXPECT_TRUE(r.is_high_confidence);
}

TEST_F(PredictionEngineTest, IdenticalRequestsGiveIdenticalResults) {
    const auto engine = make_engine();
    const auto a = engine.predict(request(1, 2));
    const auto b = engine.predict(request(1, 2));
    EXPECT_EQ(a.result, b.result);
    EXPECT_EQ(a.key_factors, b.key_factors);
}

TEST_F(PredictionEngineTest, LeagueOverrideFromRequest) {
    store.set_league_averages("Cup", {.avg_goals_per_game = 2.0, .avg_home_advantage = 0.0});
    const auto engine = make_engine();
    auto req = request(3, 4);
    req.league = "Cup";
    const auto r = engine.predict(req);
    EXPECT_EQ(r.match_info.league, "Cup");
    EXPECT_FALSE(contains(r.result.reasoning, "Strong home advantage"));
}

TEST_F(PredictionEngineTest, HeadToHeadDominanceIsExplained) {
    for (const char* date : {"2023-01-07", "2023-03-04", "2023-05-06", "2023-09-02", "2023-11-04"}) {
        store.add_match(MatchRecord{.home_id = 1, .away_id = 2, .league = "Premier",
                                    .date = day(date), .home_score = 2, .away_score = 0});
    }
    const auto engine = make_engine();
    const auto r = engine.predict(request(1, 2));

    EXPECT_TRUE(contains(r.result.reasoning,
        "Home team historically dominant in head-to-head meetings (100% wins)"));
    EXPECT_EQ(r.historical_context.head_to_head.total_matches, 5u);
    EXPECT_EQ(r.historical_context.head_to_head.home_team_wins, 5u);
    ASSERT_TRUE(r.historical_context.head_to_head.last_meeting.has_value());
    EXPECT_EQ(format_date(*r.historical_context.head_to_head.last_meeting), "2023-11-04");
}

TEST_F(PredictionEngineTest, LeagueLookupFailureIsMarkedDegraded) {
    static const UnavailableLeagues leagues;
    auto collaborators = Collaborators::from_store(store);
    collaborators.leagues = &leagues;
    const PredictionEngine engine(config, collaborators);

    const auto r = engine.predict(request(1, 2));
    EXPECT_EQ(r.result.outcome, Outcome::HomeWin);
    EXPECT_EQ(r.result.contributing_strategies, 3u);
    EXPECT_TRUE(r.result.league_defaults_used);
    EXPECT_TRUE(r.result.degraded);
    EXPECT_TRUE(contains(r.result.reasoning,
        "League averages unavailable; configured defaults were used"));
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST_F(PredictionEngineTest, SelfMatchIsRejected) {
    const auto engine = make_engine();
    EXPECT_THROW((void)engine.predict(request(1, 1)), ValidationError);
}

TEST_F(PredictionEngineTest, NonPositiveIdsAreRejected) {
    const auto engine = make_engine();
    EXPECT_THROW((void)engine.predict(request(0, 2)), ValidationError);
    EXPECT_THROW((void)engine.predict(request(1, -4)), ValidationError);
}

TEST_F(PredictionEngineTest, UnknownEntityIsNotFound) {
    const auto engine = make_engine();
    EXPECT_THROW((void)engine.predict(request(1, 99)), NotFoundError);
}

TEST_F(PredictionEngineTest, EntityLookupTimeoutIsTransient) {
    static const SlowEntities slow;
    config.lookup_timeout = 50ms;
    auto collaborators = Collaborators::from_store(store);
    collaborators.entities = &slow;
    const PredictionEngine engine(config, collaborators);
    EXPECT_THROW((void)engine.predict(request(1, 2)), TransientError);
}

TEST_F(PredictionEngineTest, ConstructorValidatesConfigAndCollaborators) {
    config.weights.rule_cascade = 0.9;
    EXPECT_THROW(make_engine(), ValidationError);

    auto missing = Collaborators::from_store(store);
    missing.history = nullptr;
    EXPECT_THROW(PredictionEngine(EngineConfig{}, missing), ValidationError);
}

// ─── Persistence ──────────────────────────────────────────────────────────────

TEST_F(PredictionEngineTest, PredictionsAreStoredAndScored) {
    const auto engine = make_engine();
    (void)engine.predict(request(1, 2));
    (void)engine.predict(request(3, 4));

    const auto history = engine.prediction_history(10);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].context.home_id, 3);
    EXPECT_EQ(history[1].predicted, Outcome::HomeWin);

    store.add_match(MatchRecord{.home_id = 1, .away_id = 2, .league = "Premier",
                                .date = day("2024-05-04"), .home_score = 3, .away_score = 1});
    const auto stats = engine.accuracy_stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_predictions, 1u);
    EXPECT_EQ(stats->correct_predictions, 1u);
    EXPECT_DOUBLE_EQ(stats->home_win.accuracy(), 1.0);
}

TEST_F(PredictionEngineTest, SinkFailureDoesNotFailPrediction) {
    ThrowingSink sink;
    auto collaborators = Collaborators::from_store(store);
    collaborators.sink = &sink;
    const PredictionEngine engine(config, collaborators);

    const auto r = engine.predict(request(1, 2));
    EXPECT_EQ(r.result.outcome, Outcome::HomeWin);
    EXPECT_EQ(store.prediction_count(), 0u);
}

TEST_F(PredictionEngineTest, NonStandardSinkFailureDoesNotFailPrediction) {
    IntThrowingSink sink;
    auto collaborators = Collaborators::from_store(store);
    collaborators.sink = &sink;
    const PredictionEngine engine(config, collaborators);

    EXPECT_NO_THROW((void)engine.predict(request(1, 2)));
    const std::vector<PredictionRequest> requests(3, request(3, 4));
    for (const auto& item : engine.predict_batch(requests)) {
        EXPECT_TRUE(item.ok());
    }
}

TEST_F(PredictionEngineTest, NoLedgerMeansNoStats) {
    auto collaborators = Collaborators::from_store(store);
    collaborators.ledger = nullptr;
    const PredictionEngine engine(config, collaborators);
    EXPECT_FALSE(engine.accuracy_stats().has_value());
    EXPECT_TRUE(engine.prediction_history().empty());
}

// ─── Batches ──────────────────────────────────────────────────────────────────

TEST_F(PredictionEngineTest, BatchOverLimitIsRejected) {
    const auto engine = make_engine();
    const std::vector<PredictionRequest> requests(21, request(1, 2));
    EXPECT_THROW((void)engine.predict_batch(requests), ValidationError);
}

TEST_F(PredictionEngineTest, FullBatchSucceeds) {
    const auto engine = make_engine();
    const std::vector<PredictionRequest> requests(20, request(1, 2));
    const auto items = engine.predict_batch(requests);
    ASSERT_EQ(items.size(), 20u);
    for (const auto& item : items) {
        ASSERT_TRUE(item.ok());
        EXPECT_FALSE(item.error.has_value());
        EXPECT_EQ(item.response->result.outcome, Outcome::HomeWin);
    }
    EXPECT_EQ(store.prediction_count(), 20u);
}

TEST_F(PredictionEngineTest, BatchReportsPerItemErrorsInOrder) {
    const auto engine = make_engine();
    const std::vector<PredictionRequest> requests{
        request(1, 2), request(1, 1), request(1, 99), request(3, 4),
        request(2, 1), request(4, 3), request(2, 3),
    };
    const auto items = engine.predict_batch(requests);
    ASSERT_EQ(items.size(), requests.size());

    EXPECT_TRUE(items[0].ok());
    ASSERT_TRUE(items[1].error.has_value());
    EXPECT_EQ(items[1].error->kind, ErrorKind::Validation);
    ASSERT_TRUE(items[2].error.has_value());
    EXPECT_EQ(items[2].error->kind, ErrorKind::NotFound);
    EXPECT_FALSE(items[2].response.has_value());
    EXPECT_TRUE(items[3].ok());
    EXPECT_EQ(items[3].request.home_id, 3);
    EXPECT_TRUE(items[6].ok());
}

TEST_F(PredictionEngineTest, EmptyBatch) {
    const auto engine = make_engine();
    EXPECT_TRUE(engine.predict_batch({}).empty());
}
