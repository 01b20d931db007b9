/// @file src/core/types.cpp
/// @brief Outcome vocabulary, match-record helpers and UTC calendar parsing.

#include "matchcast/types.hpp"
#include "matchcast/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace matchcast {

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::HomeWin: return "home_win";
        case Outcome::Draw:    return "draw";
        case Outcome::AwayWin: return "away_win";
    }
    return "draw";
}

std::string_view to_string(StreakType streak) noexcept {
    switch (streak) {
        case StreakType::Win:  return "win";
        case StreakType::Draw: return "draw";
        case StreakType::Loss: return "loss";
        case StreakType::None: return "none";
    }
    return "none";
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:   return "not_found";
        case ErrorKind::Validation: return "validation_error";
        case ErrorKind::Transient:  return "transient_failure";
    }
    return "transient_failure";
}

char to_symbol(FormResult result) noexcept {
    switch (result) {
        case FormResult::Win:  return 'W';
        case FormResult::Draw: return 'D';
        case FormResult::Loss: return 'L';
    }
    return 'D';
}

std::optional<std::vector<FormResult>> parse_form(std::string_view form) noexcept {
    std::vector<FormResult> out;
    out.reserve(form.size());
    for (char c : form) {
        switch (std::toupper(static_cast<unsigned char>(c))) {
            case 'W': out.push_back(FormResult::Win);  break;
            case 'D': out.push_back(FormResult::Draw); break;
            case 'L': out.push_back(FormResult::Loss); break;
            default:  return std::nullopt;
        }
    }
    return out;
}

std::string format_form(const std::vector<FormResult>& form) {
    std::string out;
    out.reserve(form.size());
    for (auto r : form) {
        out.push_back(to_symbol(r));
    }
    return out;
}

// ─── OutcomeProbabilities ─────────────────────────────────────────────────────

double OutcomeProbabilities::of(Outcome outcome) const noexcept {
    switch (outcome) {
        case Outcome::HomeWin: return home_win;
        case Outcome::Draw:    return draw;
        case Outcome::AwayWin: return away_win;
    }
    return draw;
}

double OutcomeProbabilities::sum() const noexcept {
    return home_win + draw + away_win;
}

double OutcomeProbabilities::max() const noexcept {
    return std::max({home_win, draw, away_win});
}

Outcome OutcomeProbabilities::argmax() const noexcept {
    // Strict comparisons only: equal buckets never beat Draw.
    if (home_win > draw && home_win > away_win) return Outcome::HomeWin;
    if (away_win > draw && away_win > home_win) return Outcome::AwayWin;
    return Outcome::Draw;
}

// ─── EntitySnapshot ───────────────────────────────────────────────────────────

bool EntitySnapshot::is_consistent() const noexcept {
    return rank >= 1
        && games_played >= 0
        && wins >= 0 && draws >= 0 && losses >= 0
        && wins + draws + losses == games_played
        && goals_for >= 0 && goals_against >= 0;
}

// ─── MatchRecord ──────────────────────────────────────────────────────────────

bool MatchRecord::involves(EntityId id) const noexcept {
    return home_id == id || away_id == id;
}

int MatchRecord::goals_for(EntityId id) const noexcept {
    if (id == home_id) return home_score;
    if (id == away_id) return away_score;
    return 0;
}

int MatchRecord::goals_against(EntityId id) const noexcept {
    if (id == home_id) return away_score;
    if (id == away_id) return home_score;
    return 0;
}

FormResult MatchRecord::result_for(EntityId id) const noexcept {
    const int gf = goals_for(id);
    const int ga = goals_against(id);
    if (gf > ga) return FormResult::Win;
    if (gf < ga) return FormResult::Loss;
    return FormResult::Draw;
}

Outcome MatchRecord::outcome() const noexcept {
    if (home_score > away_score) return Outcome::HomeWin;
    if (home_score < away_score) return Outcome::AwayWin;
    return Outcome::Draw;
}

// ─── Calendar ─────────────────────────────────────────────────────────────────

namespace {

/// Parse exactly `width` decimal digits at `text[pos]`.
std::optional<int> parse_fixed(std::string_view text, std::size_t pos,
                               std::size_t width) noexcept {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept {
    using namespace std::chrono;

    // Trim surrounding whitespace.
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    const auto y = parse_fixed(text, 0, 4);
    const auto m = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }

    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*m)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    Timestamp ts = time_point_cast<seconds>(sys_days{ymd});
    if (text.size() == 10) {
        return ts;
    }

    // Optional time-of-day: "THH:MM:SS" with an optional trailing 'Z'.
    if (text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    std::string_view rest = text.substr(11);
    if (!rest.empty() && (rest.back() == 'Z' || rest.back() == 'z')) {
        rest.remove_suffix(1);
    }
    if (rest.size() != 8 || rest[2] != ':' || rest[5] != ':') {
        return std::nullopt;
    }
    const auto hh = parse_fixed(rest, 0, 2);
    const auto mm = parse_fixed(rest, 3, 2);
    const auto ss = parse_fixed(rest, 6, 2);
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 60) {
        return std::nullopt;
    }
    return ts + hours{*hh} + minutes{*mm} + seconds{*ss};
}

std::string format_date(Timestamp ts) {
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(ts)};
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;
    const auto day_start = floor<days>(ts);
    const hh_mm_ss tod{ts - day_start};
    return fmt::format("{}T{:02}:{:02}:{:02}Z",
                       format_date(ts),
                       tod.hours().count(),
                       tod.minutes().count(),
                       tod.seconds().count());
}

}  // namespace matchcast
