/// @file src/ensemble/feature_importance.cpp
/// @brief Static feature-importance table and its ranking.

#include "matchcast/ensemble.hpp"

#include <algorithm>

namespace matchcast::ensemble {

const std::vector<ImportanceSpec>& default_importance_table() {
    static const std::vector<ImportanceSpec> table{
        {"home.form_points_last_5",          0.15, "Home team recent form (last 5 games)"},
        {"away.form_points_last_5",          0.12, "Away team recent form (last 5 games)"},
        {"home.goals_per_game",              0.12, "Home team scoring rate"},
        {"away.goals_per_game",              0.10, "Away team scoring rate"},
        {"home.league_position",             0.08, "Home team current league position"},
        {"away.league_position",             0.08, "Away team current league position"},
        {"h2h.h2h_home_wins",                0.04, "Historical head-to-head record"},
        {"match.league_avg_home_advantage",  0.06, "League-specific home advantage factor"},
    };
    return table;
}

std::vector<FeatureImportance>
rank_feature_importance(const std::vector<ImportanceSpec>& table, std::size_t limit) {
    std::vector<FeatureImportance> out;
    out.reserve(table.size());

    for (const auto& entry : table) {
        out.push_back(FeatureImportance{
            .feature_name       = entry.feature_name,
            .importance_score   = entry.base_weight,
            .rule_cascade       = entry.base_weight * RULE_CASCADE_IMPORTANCE_MULTIPLIER,
            .majority_vote      = entry.base_weight * MAJORITY_VOTE_IMPORTANCE_MULTIPLIER,
            .layered_weights    = entry.base_weight * LAYERED_WEIGHTS_IMPORTANCE_MULTIPLIER,
            .impact_description = entry.description,
        });
    }

    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.importance_score > b.importance_score;
    });

    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

}  // namespace matchcast::ensemble
