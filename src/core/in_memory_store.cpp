/// @file src/core/in_memory_store.cpp
/// @brief InMemoryStore — arenas, id index, league averages and ledger.

#include "matchcast/store.hpp"
#include "matchcast/errors.hpp"
#include "matchcast/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <utility>

namespace matchcast::core {

InMemoryStore::InMemoryStore(context::LeagueAverages defaults, std::size_t min_league_sample)
    : defaults_(defaults), min_league_sample_(min_league_sample) {}

// ─── Writes ───────────────────────────────────────────────────────────────────

void InMemoryStore::upsert_entity(EntitySnapshot snapshot) {
    if (!snapshot.is_consistent()) {
        throw ValidationError(fmt::format(
            "entity {} is inconsistent: {}W + {}D + {}L != {} played (rank {})",
            snapshot.id, snapshot.wins, snapshot.draws, snapshot.losses,
            snapshot.games_played, snapshot.rank));
    }
    if (snapshot.form.size() > constants::FORM_WINDOW) {
        throw ValidationError(fmt::format("entity {} form has {} results (max {})",
                                          snapshot.id, snapshot.form.size(),
                                          constants::FORM_WINDOW));
    }

    std::unique_lock lock(mutex_);
    if (auto it = entity_index_.find(snapshot.id); it != entity_index_.end()) {
        entities_[it->second] = std::move(snapshot);
        return;
    }
    entity_index_.emplace(snapshot.id, entities_.size());
    entities_.push_back(std::move(snapshot));
}

void InMemoryStore::add_match(MatchRecord match) {
    if (match.home_id == match.away_id) {
        throw ValidationError(fmt::format("match has entity {} on both sides", match.home_id));
    }
    if (match.home_score < 0 || match.away_score < 0) {
        throw ValidationError(fmt::format("match {} v {} has a negative score",
                                          match.home_id, match.away_id));
    }

    std::unique_lock lock(mutex_);
    matches_.push_back(std::move(match));
}

void InMemoryStore::set_league_averages(const std::string& league,
                                        context::LeagueAverages averages) {
    std::unique_lock lock(mutex_);
    league_overrides_[league] = averages;
}

// ─── Inspection ───────────────────────────────────────────────────────────────

std::size_t InMemoryStore::entity_count() const {
    std::shared_lock lock(mutex_);
    return entities_.size();
}

std::size_t InMemoryStore::match_count() const {
    std::shared_lock lock(mutex_);
    return matches_.size();
}

std::size_t InMemoryStore::prediction_count() const {
    std::shared_lock lock(mutex_);
    return predictions_.size();
}

std::vector<EntitySnapshot> InMemoryStore::entities() const {
    std::shared_lock lock(mutex_);
    return entities_;
}

// ─── EntitySource ─────────────────────────────────────────────────────────────

std::optional<EntitySnapshot> InMemoryStore::get_entity(EntityId id) const {
    std::shared_lock lock(mutex_);
    const auto it = entity_index_.find(id);
    if (it == entity_index_.end()) {
        return std::nullopt;
    }
    return entities_[it->second];
}

// ─── HistorySource ────────────────────────────────────────────────────────────

template <typename Pred>
std::vector<MatchRecord> InMemoryStore::select_matches(Pred pred, std::size_t count) const {
    std::vector<MatchRecord> out;
    for (const auto& m : matches_) {
        if (m.status == MatchStatus::Completed && pred(m)) {
            out.push_back(m);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const MatchRecord& a, const MatchRecord& b) { return a.date > b.date; });
    if (out.size() > count) {
        out.resize(count);
    }
    return out;
}

std::vector<FormResult> InMemoryStore::get_recent_outcomes(EntityId id, std::size_t count) const {
    std::shared_lock lock(mutex_);
    const auto it = entity_index_.find(id);
    if (it == entity_index_.end()) {
        return {};
    }
    const auto& form = entities_[it->second].form;
    const auto n = std::min(count, form.size());
    return {form.begin(), form.begin() + static_cast<std::ptrdiff_t>(n)};
}

std::vector<MatchRecord>
InMemoryStore::get_recent_matches(EntityId id, Timestamp before, std::size_t count) const {
    std::shared_lock lock(mutex_);
    return select_matches(
        [&](const MatchRecord& m) { return m.involves(id) && m.date < before; }, count);
}

std::vector<MatchRecord>
InMemoryStore::get_head_to_head(EntityId a, EntityId b, std::size_t max_count) const {
    std::shared_lock lock(mutex_);
    return select_matches(
        [&](const MatchRecord& m) { return m.involves(a) && m.involves(b); }, max_count);
}

// ─── LeagueSource ─────────────────────────────────────────────────────────────

context::LeagueAverages InMemoryStore::get_league_averages(const std::string& league) const {
    std::shared_lock lock(mutex_);
    if (auto it = league_overrides_.find(league); it != league_overrides_.end()) {
        return it->second;
    }

    std::size_t n = 0;
    long long goals = 0;
    long long home_wins = 0;
    long long away_wins = 0;
    for (const auto& m : matches_) {
        if (m.status != MatchStatus::Completed || m.league != league) {
            continue;
        }
        ++n;
        goals += m.home_score + m.away_score;
        if (m.home_score > m.away_score) ++home_wins;
        if (m.home_score < m.away_score) ++away_wins;
    }

    if (n == 0 || n < min_league_sample_) {
        return defaults_;
    }
    const double count = static_cast<double>(n);
    return context::LeagueAverages{
        .avg_goals_per_game = static_cast<double>(goals) / count,
        .avg_home_advantage = static_cast<double>(home_wins - away_wins) / count,
    };
}

// ─── PredictionSink / PredictionLedger ────────────────────────────────────────

void InMemoryStore::store_prediction(const MatchContext& context,
                                     const ensemble::EnsembleResult& result) {
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());

    std::unique_lock lock(mutex_);
    predictions_.push_back(StoredPrediction{
        .context    = context,
        .predicted  = result.outcome,
        .confidence = result.confidence,
        .stored_at  = now,
        .actual     = std::nullopt,
    });
}

std::optional<Outcome> InMemoryStore::result_of(const MatchContext& context) const {
    using namespace std::chrono;
    const auto day = floor<days>(context.scheduled);
    for (const auto& m : matches_) {
        if (m.status == MatchStatus::Completed
            && m.home_id == context.home_id
            && m.away_id == context.away_id
            && floor<days>(m.date) == day) {
            return m.outcome();
        }
    }
    return std::nullopt;
}

std::vector<StoredPrediction> InMemoryStore::prediction_history(std::size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<StoredPrediction> out;
    const std::size_t n = std::min(limit, predictions_.size());
    out.reserve(n);
    for (auto it = predictions_.rbegin(); it != predictions_.rend() && out.size() < n; ++it) {
        StoredPrediction p = *it;
        p.actual = result_of(p.context);
        out.push_back(std::move(p));
    }
    return out;
}

AccuracyStats InMemoryStore::accuracy_stats() const {
    std::shared_lock lock(mutex_);
    AccuracyStats s;
    double confidence_correct = 0.0;
    double confidence_incorrect = 0.0;

    for (const auto& p : predictions_) {
        const auto actual = result_of(p.context);
        if (!actual) {
            continue;
        }
        const bool correct = *actual == p.predicted;

        ++s.total_predictions;
        OutcomeAccuracy& bucket = p.predicted == Outcome::HomeWin ? s.home_win
                                : p.predicted == Outcome::AwayWin ? s.away_win
                                : s.draw;
        ++bucket.predictions;
        if (correct) {
            ++s.correct_predictions;
            ++bucket.correct;
            confidence_correct += p.confidence;
        } else {
            confidence_incorrect += p.confidence;
        }
    }

    if (s.total_predictions > 0) {
        s.overall_accuracy = static_cast<double>(s.correct_predictions)
                           / static_cast<double>(s.total_predictions);
    }
    const std::size_t incorrect = s.total_predictions - s.correct_predictions;
    if (s.correct_predictions > 0) {
        s.avg_confidence_correct = confidence_correct / static_cast<double>(s.correct_predictions);
    }
    if (incorrect > 0) {
        s.avg_confidence_incorrect = confidence_incorrect / static_cast<double>(incorrect);
    }
    return s;
}

}  // namespace matchcast::core
