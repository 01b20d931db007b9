/// @file src/core/engine.cpp
/// @brief Prediction Orchestrator — pipeline wiring, batching and ledger access.

#include "matchcast/engine.hpp"
#include "matchcast/deadline.hpp"
#include "matchcast/statistics.hpp"
#include "matchcast/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <future>
#include <thread>
#include <utility>

namespace matchcast::core {

namespace {

context::BuilderConfig builder_config(const EngineConfig& config) {
    return context::BuilderConfig{
        .h2h_window      = config.h2h_window,
        .recent_matches  = config.form_window,
        .lookup_timeout  = config.lookup_timeout,
        .league_defaults = config.league_defaults,
    };
}

ensemble::CombinerConfig combiner_config(const EngineConfig& config) {
    return ensemble::CombinerConfig{
        .weights              = config.weights,
        .home_advantage_scale = config.home_advantage_scale,
        .importance_table     = config.importance_table,
        .max_importance       = config.max_importance,
    };
}

/// Reject a malformed config before any member is built from it.
const EngineConfig& checked(const EngineConfig& config) {
    if (!config.is_valid()) {
        throw ValidationError("engine configuration is invalid");
    }
    return config;
}

/// Reject a collaborator set missing a required role.
const Collaborators& checked(const Collaborators& c) {
    if (c.entities == nullptr || c.history == nullptr || c.leagues == nullptr) {
        throw ValidationError("entity, history and league collaborators are required");
    }
    return c;
}

FormComparison compare_form(const EntitySnapshot& snapshot) {
    const auto s = stats::StatisticAggregator::summarize_form(snapshot.form,
                                                              constants::SHORT_FORM_WINDOW);
    const auto n = std::min(snapshot.form.size(), constants::SHORT_FORM_WINDOW);
    return FormComparison{
        .last_5_games  = format_form(std::vector<FormResult>(
            snapshot.form.begin(), snapshot.form.begin() + static_cast<std::ptrdiff_t>(n))),
        .points        = s.points,
        .goals_for     = s.goals_for,
        .goals_against = s.goals_against,
    };
}

TeamInfo team_info(const EntitySnapshot& snapshot) {
    return TeamInfo{
        .id              = snapshot.id,
        .name            = snapshot.name,
        .league_position = snapshot.rank,
        .form            = format_form(snapshot.form),
    };
}

}  // anonymous namespace

// ─── Collaborators ────────────────────────────────────────────────────────────

Collaborators Collaborators::from_store(InMemoryStore& store) noexcept {
    return Collaborators{
        .entities = &store,
        .history  = &store,
        .leagues  = &store,
        .external = nullptr,
        .sink     = &store,
        .ledger   = &store,
    };
}

// ─── PredictionEngine constructor ─────────────────────────────────────────────

PredictionEngine::PredictionEngine(EngineConfig config, Collaborators collaborators)
    : config_(checked(config))
    , collaborators_(checked(collaborators))
    , builder_(*collaborators_.entities, *collaborators_.history, *collaborators_.leagues,
               collaborators_.external, builder_config(config_))
    , strategies_(strategy::make_default_strategies())
    , combiner_(combiner_config(config_))
    , lookups_(std::make_shared<DeadlineRunner>())
{}

// ─── PredictionEngine::predict ────────────────────────────────────────────────

PredictionResponse PredictionEngine::predict(const PredictionRequest& request) const {
    const auto started = std::chrono::steady_clock::now();

    if (request.home_id <= 0 || request.away_id <= 0) {
        throw ValidationError(fmt::format("entity ids must be positive (got {} and {})",
                                          request.home_id, request.away_id));
    }
    if (request.home_id == request.away_id) {
        throw ValidationError(fmt::format("entity {} cannot play itself", request.home_id));
    }

    // ── Step 1: Resolve both entities ─────────────────────────────────────────
    const EntitySnapshot home = resolve_entity(request.home_id);
    const EntitySnapshot away = resolve_entity(request.away_id);

    MatchContext match_context{
        .home_id   = home.id,
        .away_id   = away.id,
        .league    = request.league.value_or(home.league),
        .scheduled = request.match_date.value_or(
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())),
        .venue     = request.venue,
    };

    // ── Step 2: Fixture-level features ────────────────────────────────────────
    const auto ctx = builder_.build(match_context, home, away);
    const double league_goals = ctx.match.league_avg_goals_per_game;

    // ── Step 3: Per-entity statistics, both sides concurrently ───────────────
    auto home_stats = std::async(std::launch::async,
                                 [&] { return aggregate_side(home, league_goals); });
    auto away_stats = std::async(std::launch::async,
                                 [&] { return aggregate_side(away, league_goals); });
    const auto home_features = home_stats.get();
    const auto away_features = away_stats.get();

    // ── Step 4: Assemble and validate ─────────────────────────────────────────
    const auto fv = features::FeatureVectorAssembler::assemble(
        home_features, away_features, ctx.match, ctx.h2h, ctx.external);

    // ── Step 5: Score with every strategy concurrently ────────────────────────
    std::array<std::future<strategy::StrategyEstimate>, constants::STRATEGY_COUNT> pending;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const strategy::Strategy* s = strategies_[i].get();
        pending[i] = std::async(std::launch::async, [s, &fv] { return s->score(fv); });
    }
    const auto rule_cascade    = pending[0].get();
    const auto majority_vote   = pending[1].get();
    const auto layered_weights = pending[2].get();

    // ── Step 6: Combine ───────────────────────────────────────────────────────
    auto result = combiner_.combine(rule_cascade, majority_vote, layered_weights, fv);

    spdlog::debug("{} v {}: rule_cascade={} majority_vote={} layered_weights={}",
                  home.id, away.id,
                  to_string(rule_cascade.outcome), to_string(majority_vote.outcome),
                  to_string(layered_weights.outcome));

    // ── Step 7: Persist; a failure here never fails the prediction ───────────
    persist(match_context, result);

    PredictionResponse response{
        .match_info = MatchInfo{
            .home       = team_info(home),
            .away       = team_info(away),
            .league     = match_context.league,
            .match_date = match_context.scheduled,
        },
        .result             = std::move(result),
        .is_high_confidence = false,
        .key_factors        = {},
        .historical_context = historical_context(ctx.h2h, home, away),
        .processing_time    = {},
    };
    response.is_high_confidence =
        response.result.confidence > config_.high_confidence_threshold;
    response.key_factors = ensemble::key_factors(fv, response.result.confidence);
    response.processing_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("predicted {} v {} on {}: {} ({:.3f}){}",
                 home.name, away.name, format_date(match_context.scheduled),
                 to_string(response.result.outcome), response.result.confidence,
                 response.result.degraded ? " [degraded]" : "");
    return response;
}

// ─── PredictionEngine::predict_batch ──────────────────────────────────────────

std::vector<BatchItem>
PredictionEngine::predict_batch(std::span<const PredictionRequest> requests) const {
    if (requests.size() > config_.batch_limit) {
        throw ValidationError(fmt::format("batch of {} exceeds the limit of {}",
                                          requests.size(), config_.batch_limit));
    }

    std::vector<BatchItem> items;
    items.reserve(requests.size());
    for (const auto& r : requests) {
        items.push_back(BatchItem{.request = r, .response = std::nullopt, .error = std::nullopt});
    }

    const std::size_t chunk = config_.batch_concurrency;
    for (std::size_t start = 0; start < items.size(); start += chunk) {
        if (start > 0) {
            std::this_thread::sleep_for(config_.batch_pause);
        }

        const std::size_t end = std::min(start + chunk, items.size());
        std::vector<std::future<void>> running;
        running.reserve(end - start);

        for (std::size_t i = start; i < end; ++i) {
            BatchItem& item = items[i];
            running.push_back(std::async(std::launch::async, [this, &item] {
                try {
                    item.response = predict(item.request);
                } catch (const Error& e) {
                    item.error = BatchError{.kind = e.kind(), .message = e.what()};
                } catch (const std::exception& e) {
                    item.error = BatchError{.kind = ErrorKind::Transient, .message = e.what()};
                } catch (...) {
                    item.error = BatchError{.kind    = ErrorKind::Transient,
                                            .message = "non-standard exception"};
                }
                if (item.error) {
                    spdlog::warn("batch entry {} v {} failed ({}): {}",
                                 item.request.home_id, item.request.away_id,
                                 to_string(item.error->kind), item.error->message);
                }
            }));
        }
        for (auto& f : running) {
            f.get();
        }
    }

    const auto failed = static_cast<std::size_t>(
        std::count_if(items.begin(), items.end(), [](const BatchItem& b) { return !b.ok(); }));
    spdlog::info("batch of {} finished, {} failed", items.size(), failed);
    return items;
}

// ─── Ledger access ────────────────────────────────────────────────────────────

std::optional<AccuracyStats> PredictionEngine::accuracy_stats() const {
    if (collaborators_.ledger == nullptr) {
        return std::nullopt;
    }
    return collaborators_.ledger->accuracy_stats();
}

std::vector<StoredPrediction> PredictionEngine::prediction_history(std::size_t limit) const {
    if (collaborators_.ledger == nullptr) {
        return {};
    }
    return collaborators_.ledger->prediction_history(limit);
}

// ─── Private helpers ──────────────────────────────────────────────────────────

EntitySnapshot PredictionEngine::resolve_entity(EntityId id) const {
    const EntitySource* source = collaborators_.entities;
    auto snapshot = lookups_->call([source, id] { return source->get_entity(id); },
                                   config_.lookup_timeout,
                                   fmt::format("entity lookup for {}", id));
    if (!snapshot) {
        throw NotFoundError(fmt::format("entity {} not found", id));
    }
    return std::move(*snapshot);
}

stats::EntityFeatures
PredictionEngine::aggregate_side(const EntitySnapshot& snapshot, double league_avg_goals) const {
    const HistorySource* source = collaborators_.history;
    const EntityId id = snapshot.id;
    const std::size_t count = config_.form_window;
    const auto recent = lookups_->call(
        [source, id, count] { return source->get_recent_outcomes(id, count); },
        config_.lookup_timeout, fmt::format("recent outcomes for {}", id));
    return stats::StatisticAggregator::aggregate(snapshot, recent, league_avg_goals);
}

HistoricalContext
PredictionEngine::historical_context(const context::HeadToHeadFeatures& h2h,
                                     const EntitySnapshot& home,
                                     const EntitySnapshot& away) {
    return HistoricalContext{
        .head_to_head = HeadToHeadRecord{
            .total_matches  = static_cast<std::size_t>(h2h.h2h_matches_played),
            .home_team_wins = static_cast<std::size_t>(h2h.h2h_home_wins),
            .draws          = static_cast<std::size_t>(h2h.h2h_draws),
            .away_team_wins = static_cast<std::size_t>(h2h.h2h_away_wins),
            .last_meeting   = h2h.last_meeting,
        },
        .home_form = compare_form(home),
        .away_form = compare_form(away),
    };
}

void PredictionEngine::persist(const MatchContext& context,
                               const ensemble::EnsembleResult& result) const {
    if (collaborators_.sink == nullptr) {
        return;
    }
    try {
        collaborators_.sink->store_prediction(context, result);
    } catch (const std::exception& e) {
        spdlog::warn("failed to store prediction {} v {}: {}",
                     context.home_id, context.away_id, e.what());
    } catch (...) {
        spdlog::warn("failed to store prediction {} v {}: non-standard exception",
                     context.home_id, context.away_id);
    }
}

}  // namespace matchcast::core
