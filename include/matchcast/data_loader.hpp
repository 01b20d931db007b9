#pragma once

/// @file include/matchcast/data_loader.hpp
/// @brief CSV fixture loader for entities, matches and batch requests.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files into entity snapshots, match records and prediction
/// requests. Malformed rows are skipped; the loader never crashes on bad
/// input.
///
/// ## Expected CSV Formats
/// ```
/// id,name,league,rank,points,played,wins,draws,losses,goals_for,goals_against,form
/// 1,Rovers,Premier,2,40,20,12,4,4,35,18,WWDLW
///
/// home_id,away_id,league,date,home_score,away_score,status[,venue]
/// 1,2,Premier,2024-03-09,2,1,completed,Rovers Park
///
/// home_id,away_id[,date[,league[,venue]]]
/// 1,2,2024-05-04
/// ```
/// The first non-empty, non-comment line of each file is treated as a
/// header and skipped. Lines starting with '#' are comments.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when a file cannot be opened
/// - Every returned entity satisfies `validate_entity`, every returned match
///   satisfies `validate_match`
/// - Does not modify any file or external state

#include "matchcast/engine.hpp"
#include "matchcast/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace matchcast::core {

class InMemoryStore;

/// Loads engine fixtures from CSV files and strings.
class DataLoader {
public:
    // ── Entities ─────────────────────────────────────────────────────────────

    [[nodiscard]] static std::optional<std::vector<EntitySnapshot>>
    load_teams_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<EntitySnapshot>
    parse_teams_string(const std::string& csv_content) noexcept;

    /// An entity is valid if:
    /// - id > 0 and the name is non-empty
    /// - rank ≥ 1, counts and goals are non-negative
    /// - wins + draws + losses == played
    /// - form holds at most 10 results
    [[nodiscard]] static bool validate_entity(const EntitySnapshot& entity) noexcept;

    // ── Matches ──────────────────────────────────────────────────────────────

    [[nodiscard]] static std::optional<std::vector<MatchRecord>>
    load_matches_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<MatchRecord>
    parse_matches_string(const std::string& csv_content) noexcept;

    /// A match is valid if both ids are positive and distinct and both
    /// scores are non-negative.
    [[nodiscard]] static bool validate_match(const MatchRecord& match) noexcept;

    // ── Batch requests ───────────────────────────────────────────────────────

    [[nodiscard]] static std::optional<std::vector<PredictionRequest>>
    load_pairs_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<PredictionRequest>
    parse_pairs_string(const std::string& csv_content) noexcept;

    // ── Store population ─────────────────────────────────────────────────────

    /// Load both fixture files into `store`.
    ///
    /// # Returns
    /// `false` if either file cannot be opened.
    [[nodiscard]] static bool load_into(InMemoryStore& store,
                                        const std::string& teams_path,
                                        const std::string& matches_path);

private:
    [[nodiscard]] static std::optional<EntitySnapshot>
    parse_team_row(const std::string& line) noexcept;

    [[nodiscard]] static std::optional<MatchRecord>
    parse_match_row(const std::string& line) noexcept;

    [[nodiscard]] static std::optional<PredictionRequest>
    parse_pair_row(const std::string& line) noexcept;
};

}  // namespace matchcast::core
