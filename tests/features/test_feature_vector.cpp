/// @file tests/features/test_feature_vector.cpp
/// @brief Tests for FeatureVector flattening and FeatureVectorAssembler.

#include "matchcast/features.hpp"
#include "matchcast/errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <set>
#include <string>

using namespace matchcast;
using namespace matchcast::features;

namespace {

FeatureVector make_vector() {
    FeatureVector fv;
    fv.home.league_position     = 3.0;
    fv.home.points_per_game     = 2.1;
    fv.home.current_streak_type = StreakType::Loss;
    fv.away.league_position     = 11.0;
    fv.away.relative_strength_vs_league = 0.8;
    fv.match.is_weekend_match   = true;
    fv.match.league_avg_home_advantage = 0.15;
    fv.h2h.h2h_trend            = -0.25;
    fv.external.away_key_players_missing = 12.5;
    return fv;
}

Eigen::Index index_of(std::string_view name) {
    const auto& names = feature_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return static_cast<Eigen::Index>(i);
    }
    ADD_FAILURE() << "unknown feature " << name;
    return 0;
}

}  // anonymous namespace

// ─── Layout ───────────────────────────────────────────────────────────────────

TEST(FeatureLayout, CountsAddUp) {
    EXPECT_EQ(FEATURE_COUNT, 88u);
    EXPECT_EQ(feature_names().size(), FEATURE_COUNT);
}

TEST(FeatureLayout, NamesAreUniqueAndPrefixed) {
    std::set<std::string_view> seen;
    for (auto n : feature_names()) {
        EXPECT_TRUE(seen.insert(n).second) << "duplicate name " << n;
        EXPECT_NE(n.find('.'), std::string_view::npos) << n;
    }
}

TEST(FeatureLayout, FamilyBoundaries) {
    const auto& names = feature_names();
    EXPECT_EQ(names[0], "home.league_position");
    EXPECT_EQ(names[ENTITY_FEATURE_COUNT], "away.league_position");
    EXPECT_EQ(names[2 * ENTITY_FEATURE_COUNT], "match.days_since_last_match");
    EXPECT_EQ(names[2 * ENTITY_FEATURE_COUNT + MATCH_FEATURE_COUNT], "h2h.h2h_matches_played");
    EXPECT_EQ(names[FEATURE_COUNT - 1], "external.away_key_players_missing");
}

TEST(FeatureLayout, StreakEncoding) {
    EXPECT_DOUBLE_EQ(encode_streak(StreakType::None), 0.0);
    EXPECT_DOUBLE_EQ(encode_streak(StreakType::Win), 1.0);
    EXPECT_DOUBLE_EQ(encode_streak(StreakType::Draw), 2.0);
    EXPECT_DOUBLE_EQ(encode_streak(StreakType::Loss), 3.0);
}

// ─── flatten ──────────────────────────────────────────────────────────────────

TEST(FeatureFlatten, ValuesLandAtTheirNamedIndex) {
    const auto flat = flatten(make_vector());

    EXPECT_DOUBLE_EQ(flat(index_of("home.league_position")), 3.0);
    EXPECT_DOUBLE_EQ(flat(index_of("home.points_per_game")), 2.1);
    EXPECT_DOUBLE_EQ(flat(index_of("home.current_streak_type")), 3.0);
    EXPECT_DOUBLE_EQ(flat(index_of("away.league_position")), 11.0);
    EXPECT_DOUBLE_EQ(flat(index_of("away.relative_strength_vs_league")), 0.8);
    EXPECT_DOUBLE_EQ(flat(index_of("match.is_weekend_match")), 1.0);
    EXPECT_DOUBLE_EQ(flat(index_of("match.is_even_week")), 0.0);
    EXPECT_DOUBLE_EQ(flat(index_of("match.league_avg_home_advantage")), 0.15);
    EXPECT_DOUBLE_EQ(flat(index_of("h2h.h2h_trend")), -0.25);
    EXPECT_DOUBLE_EQ(flat(index_of("external.away_key_players_missing")), 12.5);
}

TEST(FeatureFlatten, DefaultVectorIsFinite) {
    const auto flat = flatten(FeatureVector{});
    EXPECT_TRUE(flat.allFinite());
    EXPECT_FALSE(first_non_finite(FeatureVector{}).has_value());
}

TEST(FeatureFlatten, FirstNonFiniteReportsIndex) {
    auto fv = make_vector();
    fv.h2h.h2h_home_goals_avg = std::numeric_limits<double>::quiet_NaN();
    fv.external.temperature   = std::numeric_limits<double>::infinity();

    const auto idx = first_non_finite(fv);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(feature_names()[*idx], "h2h.h2h_home_goals_avg");
}

// ─── assemble ─────────────────────────────────────────────────────────────────

TEST(FeatureAssemble, MergesFamilies) {
    const auto src = make_vector();
    const auto fv = FeatureVectorAssembler::assemble(src.home, src.away, src.match,
                                                     src.h2h, src.external);
    EXPECT_EQ(fv.home, src.home);
    EXPECT_EQ(fv.away, src.away);
    EXPECT_EQ(fv.match, src.match);
    EXPECT_EQ(fv.h2h, src.h2h);
    EXPECT_EQ(fv.external, src.external);
}

TEST(FeatureAssemble, RejectsNonFiniteField) {
    auto src = make_vector();
    src.away.goals_per_game = std::numeric_limits<double>::infinity();

    try {
        (void)FeatureVectorAssembler::assemble(src.home, src.away, src.match,
                                               src.h2h, src.external);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("away.goals_per_game"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}
