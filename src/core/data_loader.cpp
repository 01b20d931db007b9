/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for entity, match and request fixtures.

#include "matchcast/data_loader.hpp"
#include "matchcast/store.hpp"
#include "matchcast/constants.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace matchcast::core {

namespace {

/// Split on ',' and trim surrounding whitespace from each field.
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        auto token = line.substr(start, comma == std::string_view::npos
                                            ? std::string_view::npos
                                            : comma - start);
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        token = (first == std::string_view::npos)
              ? std::string_view{}
              : token.substr(first, last - first + 1);
        fields.push_back(token);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return fields;
}

/// Whole-field integer parse; rejects empty input and trailing garbage.
template <typename Int>
std::optional<Int> parse_int(std::string_view token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    Int value{};
    const char* first = token.data();
    const char* last  = first + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<MatchStatus> parse_status(std::string_view token) noexcept {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "completed" || lower == "finished") return MatchStatus::Completed;
    if (lower == "scheduled") return MatchStatus::Scheduled;
    return std::nullopt;
}

/// Read a whole file; `nullopt` if it cannot be opened.
std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

/// Apply `parse` to every data line after the header.
template <typename T, typename Parse>
std::vector<T> parse_lines(const std::string& csv_content, Parse parse) {
    std::vector<T> rows;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        // Skip blank lines and comment lines.
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto row = parse(line);
        if (row) {
            rows.push_back(std::move(*row));
        } else {
            spdlog::debug("skipping malformed row: {}", line);
        }
    }

    return rows;
}

}  // anonymous namespace

// ─── Entities ─────────────────────────────────────────────────────────────────

bool DataLoader::validate_entity(const EntitySnapshot& e) noexcept {
    if (e.id <= 0 || e.name.empty()) return false;
    if (e.points < 0) return false;
    if (e.form.size() > constants::FORM_WINDOW) return false;
    return e.is_consistent();
}

std::optional<EntitySnapshot>
DataLoader::parse_team_row(const std::string& line) noexcept {
    const auto f = split_fields(line);
    if (f.size() != 12) {
        return std::nullopt;
    }

    const auto id            = parse_int<EntityId>(f[0]);
    const auto rank          = parse_int<int>(f[3]);
    const auto points        = parse_int<int>(f[4]);
    const auto played        = parse_int<int>(f[5]);
    const auto wins          = parse_int<int>(f[6]);
    const auto draws         = parse_int<int>(f[7]);
    const auto losses        = parse_int<int>(f[8]);
    const auto goals_for     = parse_int<int>(f[9]);
    const auto goals_against = parse_int<int>(f[10]);
    const auto form          = parse_form(f[11]);
    if (!id || !rank || !points || !played || !wins || !draws || !losses
        || !goals_for || !goals_against || !form) {
        return std::nullopt;
    }

    EntitySnapshot e{
        .id            = *id,
        .name          = std::string(f[1]),
        .league        = std::string(f[2]),
        .rank          = *rank,
        .points        = *points,
        .games_played  = *played,
        .wins          = *wins,
        .draws         = *draws,
        .losses        = *losses,
        .goals_for     = *goals_for,
        .goals_against = *goals_against,
        .form          = *form,
    };

    if (!validate_entity(e)) {
        return std::nullopt;
    }
    return e;
}

std::vector<EntitySnapshot>
DataLoader::parse_teams_string(const std::string& csv_content) noexcept {
    return parse_lines<EntitySnapshot>(csv_content, parse_team_row);
}

std::optional<std::vector<EntitySnapshot>>
DataLoader::load_teams_csv(const std::string& filepath) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_teams_string(*contents);
}

// ─── Matches ──────────────────────────────────────────────────────────────────

bool DataLoader::validate_match(const MatchRecord& m) noexcept {
    if (m.home_id <= 0 || m.away_id <= 0) return false;
    if (m.home_id == m.away_id) return false;
    return m.home_score >= 0 && m.away_score >= 0;
}

std::optional<MatchRecord>
DataLoader::parse_match_row(const std::string& line) noexcept {
    const auto f = split_fields(line);
    if (f.size() != 7 && f.size() != 8) {
        return std::nullopt;
    }

    const auto home_id = parse_int<EntityId>(f[0]);
    const auto away_id = parse_int<EntityId>(f[1]);
    const auto date    = parse_timestamp(f[3]);
    const auto status  = parse_status(f[6]);
    if (!home_id || !away_id || !date || !status) {
        return std::nullopt;
    }

    // A scheduled fixture may leave its scores empty.
    auto home_score = parse_int<int>(f[4]);
    auto away_score = parse_int<int>(f[5]);
    if (*status == MatchStatus::Scheduled) {
        home_score = home_score.value_or(0);
        away_score = away_score.value_or(0);
    }
    if (!home_score || !away_score) {
        return std::nullopt;
    }

    MatchRecord m{
        .home_id    = *home_id,
        .away_id    = *away_id,
        .league     = std::string(f[2]),
        .date       = *date,
        .home_score = *home_score,
        .away_score = *away_score,
        .status     = *status,
        .venue      = std::nullopt,
    };
    if (f.size() == 8 && !f[7].empty()) {
        m.venue = std::string(f[7]);
    }

    if (!validate_match(m)) {
        return std::nullopt;
    }
    return m;
}

std::vector<MatchRecord>
DataLoader::parse_matches_string(const std::string& csv_content) noexcept {
    return parse_lines<MatchRecord>(csv_content, parse_match_row);
}

std::optional<std::vector<MatchRecord>>
DataLoader::load_matches_csv(const std::string& filepath) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_matches_string(*contents);
}

// ─── Batch requests ───────────────────────────────────────────────────────────

std::optional<PredictionRequest>
DataLoader::parse_pair_row(const std::string& line) noexcept {
    const auto f = split_fields(line);
    if (f.size() < 2 || f.size() > 5) {
        return std::nullopt;
    }

    const auto home_id = parse_int<EntityId>(f[0]);
    const auto away_id = parse_int<EntityId>(f[1]);
    if (!home_id || !away_id) {
        return std::nullopt;
    }

    PredictionRequest r{.home_id = *home_id, .away_id = *away_id};
    if (f.size() > 2 && !f[2].empty()) {
        r.match_date = parse_timestamp(f[2]);
        if (!r.match_date) {
            return std::nullopt;
        }
    }
    if (f.size() > 3 && !f[3].empty()) {
        r.league = std::string(f[3]);
    }
    if (f.size() > 4 && !f[4].empty()) {
        r.venue = std::string(f[4]);
    }
    return r;
}

std::vector<PredictionRequest>
DataLoader::parse_pairs_string(const std::string& csv_content) noexcept {
    return parse_lines<PredictionRequest>(csv_content, parse_pair_row);
}

std::optional<std::vector<PredictionRequest>>
DataLoader::load_pairs_csv(const std::string& filepath) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_pairs_string(*contents);
}

// ─── Store population ─────────────────────────────────────────────────────────

bool DataLoader::load_into(InMemoryStore& store,
                           const std::string& teams_path,
                           const std::string& matches_path) {
    const auto teams = load_teams_csv(teams_path);
    if (!teams) {
        spdlog::error("cannot open teams file {}", teams_path);
        return false;
    }
    const auto matches = load_matches_csv(matches_path);
    if (!matches) {
        spdlog::error("cannot open matches file {}", matches_path);
        return false;
    }

    for (const auto& t : *teams) {
        store.upsert_entity(t);
    }
    for (const auto& m : *matches) {
        store.add_match(m);
    }
    spdlog::info("loaded {} entities and {} matches", teams->size(), matches->size());
    return true;
}

}  // namespace matchcast::core
