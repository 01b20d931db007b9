#pragma once

#include <chrono>
#include <cstddef>

/// @file include/matchcast/constants.hpp
/// @brief Fixed constants of the matchcast engine.
///
/// Tunable values live in core::EngineConfig; the constants here are the
/// defaults it starts from and the thresholds baked into the heuristics.

namespace matchcast::constants {

// ─── Windows ──────────────────────────────────────────────────────────────────

/// Maximum length of an entity's recent-form sequence.
static constexpr std::size_t FORM_WINDOW = 10;

/// Short form window used for "last 5" features.
static constexpr std::size_t SHORT_FORM_WINDOW = 5;

/// Maximum number of head-to-head meetings considered.
static constexpr std::size_t H2H_WINDOW = 20;

/// Most recent meetings used for the "recent H2H" counts.
static constexpr std::size_t RECENT_H2H_WINDOW = 5;

/// Rest days reported when a side has no prior completed match.
static constexpr int DEFAULT_REST_DAYS = 14;

/// Trailing window for the congestion count.
static constexpr std::chrono::days CONGESTION_WINDOW{14};

// ─── Form proxies ─────────────────────────────────────────────────────────────

static constexpr int POINTS_FOR_WIN  = 3;
static constexpr int POINTS_FOR_DRAW = 1;

/// Goals attributed to a result when only its symbol is known.
/// Win = 2–1, Draw = 1–1, Loss = 1–2.
static constexpr int PROXY_GOALS_FOR_WIN      = 2;
static constexpr int PROXY_GOALS_AGAINST_WIN  = 1;
static constexpr int PROXY_GOALS_DRAW         = 1;
static constexpr int PROXY_GOALS_FOR_LOSS     = 1;
static constexpr int PROXY_GOALS_AGAINST_LOSS = 2;

// ─── Season calendar ──────────────────────────────────────────────────────────

/// Season start month/day (1 August).
static constexpr unsigned SEASON_START_MONTH = 8;
static constexpr unsigned SEASON_START_DAY   = 1;

/// Season length used for the progress fraction.
static constexpr double SEASON_LENGTH_DAYS = 365.0;

/// Progress percentage per season week (~38 weeks per season).
static constexpr double PROGRESS_PER_SEASON_WEEK = 2.6;

// ─── League defaults ──────────────────────────────────────────────────────────

static constexpr double DEFAULT_LEAGUE_AVG_GOALS          = 2.5;
static constexpr double DEFAULT_LEAGUE_AVG_HOME_ADVANTAGE = 0.15;

// ─── Ensemble ─────────────────────────────────────────────────────────────────

static constexpr double DEFAULT_RULE_CASCADE_WEIGHT   = 0.4;
static constexpr double DEFAULT_MAJORITY_VOTE_WEIGHT  = 0.3;
static constexpr double DEFAULT_LAYERED_WEIGHTS_WEIGHT = 0.3;

/// Home bucket bonus = scale × league_avg_home_advantage.
static constexpr double DEFAULT_HOME_ADVANTAGE_SCALE = 0.1;

/// Predictions above this confidence are flagged high-confidence.
static constexpr double HIGH_CONFIDENCE_THRESHOLD = 0.75;

/// Tolerance on the probability-triple sum and the weight sum.
static constexpr double PROBABILITY_SUM_TOLERANCE = 1e-9;

/// Neutral probability used by the strategy fallback.
static constexpr double NEUTRAL_PROBABILITY = 1.0 / 3.0;

static constexpr std::size_t STRATEGY_COUNT = 3;

// ─── Orchestrator ─────────────────────────────────────────────────────────────

static constexpr std::size_t MAX_BATCH_SIZE          = 20;
static constexpr std::size_t DEFAULT_BATCH_CONCURRENCY = 5;
static constexpr std::chrono::milliseconds DEFAULT_BATCH_PAUSE{100};
static constexpr std::chrono::milliseconds DEFAULT_LOOKUP_TIMEOUT{2000};

/// Feature-importance entries reported in a response.
static constexpr std::size_t MAX_IMPORTANCE_ENTRIES = 10;

}  // namespace matchcast::constants
