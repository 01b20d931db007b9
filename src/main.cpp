/// @file src/main.cpp
/// @brief matchcast CLI entry point.
///
/// Usage:
///   matchcast --predict <teams.csv> <matches.csv> <home_id> <away_id> [date]
///   matchcast --batch   <teams.csv> <matches.csv> <pairs.csv>
///   matchcast --history <teams.csv> <matches.csv> <pairs.csv>
///   matchcast --help

#include "matchcast/data_loader.hpp"
#include "matchcast/engine.hpp"
#include "matchcast/logging.hpp"
#include "matchcast/store.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace {

using namespace matchcast;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  matchcast --predict <teams.csv> <matches.csv> <home_id> <away_id> [YYYY-MM-DD]\n"
        "  matchcast --batch   <teams.csv> <matches.csv> <pairs.csv>\n"
        "  matchcast --history <teams.csv> <matches.csv> <pairs.csv>\n"
        "  matchcast --help\n"
        "\n"
        "CSV formats (header required):\n"
        "  teams:   id,name,league,rank,points,played,wins,draws,losses,goals_for,goals_against,form\n"
        "  matches: home_id,away_id,league,date,home_score,away_score,status[,venue]\n"
        "  pairs:   home_id,away_id[,date[,league[,venue]]]\n"
        "\n"
        "Environment: MATCHCAST_* variables override engine defaults.\n"
    );
}

std::optional<EntityId> parse_id(std::string_view text) {
    EntityId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return id;
}

void print_response(const core::PredictionResponse& r) {
    const auto& res = r.result;
    fmt::print("{} (#{}, {}) vs {} (#{}, {})  {}  {}\n",
               r.match_info.home.name, r.match_info.home.league_position, r.match_info.home.form,
               r.match_info.away.name, r.match_info.away.league_position, r.match_info.away.form,
               r.match_info.league, format_date(r.match_info.match_date));
    fmt::print("  prediction: {}  confidence={:.3f}{}{}\n",
               to_string(res.outcome), res.confidence,
               r.is_high_confidence ? "  [high confidence]" : "",
               res.degraded ? "  [degraded]" : "");
    fmt::print("  probabilities: home={:.3f}  draw={:.3f}  away={:.3f}\n",
               res.probabilities.home_win, res.probabilities.draw, res.probabilities.away_win);
    for (const auto& e : res.estimates) {
        fmt::print("  {:<16} {:<9} p={:.3f}{}\n", e.name, to_string(e.outcome), e.probability,
                   e.degraded ? " (neutral fallback)" : "");
    }

    const auto& h2h = r.historical_context.head_to_head;
    fmt::print("  head-to-head: {} played, {}W {}D {}L{}\n",
               h2h.total_matches, h2h.home_team_wins, h2h.draws, h2h.away_team_wins,
               h2h.last_meeting ? fmt::format(", last {}", format_date(*h2h.last_meeting)) : "");

    for (const auto& line : res.reasoning) {
        fmt::print("  - {}\n", line);
    }
    if (!r.key_factors.empty()) {
        fmt::print("  key factors:");
        for (const auto& k : r.key_factors) {
            fmt::print(" [{}]", k);
        }
        fmt::print("\n");
    }
    fmt::print("  processed in {} us\n", r.processing_time.count());
}

/// Returns 0 on success, 1 on error.
int run_predict(core::PredictionEngine& engine, std::string_view home_arg,
                std::string_view away_arg, std::optional<std::string_view> date_arg) {
    const auto home = parse_id(home_arg);
    const auto away = parse_id(away_arg);
    if (!home || !away) {
        fmt::print(stderr, "Error: entity ids must be integers\n");
        return 1;
    }

    core::PredictionRequest request{.home_id = *home, .away_id = *away};
    if (date_arg) {
        request.match_date = parse_timestamp(*date_arg);
        if (!request.match_date) {
            fmt::print(stderr, "Error: invalid date '{}'\n", *date_arg);
            return 1;
        }
    }

    try {
        print_response(engine.predict(request));
    } catch (const Error& e) {
        fmt::print(stderr, "Error ({}): {}\n", to_string(e.kind()), e.what());
        return 1;
    }
    return 0;
}

std::optional<std::vector<core::PredictionRequest>> load_pairs(const std::string& path) {
    auto pairs = core::DataLoader::load_pairs_csv(path);
    if (!pairs) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return std::nullopt;
    }
    return pairs;
}

int run_batch(core::PredictionEngine& engine, const std::string& pairs_path) {
    const auto pairs = load_pairs(pairs_path);
    if (!pairs) {
        return 1;
    }

    std::vector<core::BatchItem> items;
    try {
        items = engine.predict_batch(*pairs);
    } catch (const Error& e) {
        fmt::print(stderr, "Error ({}): {}\n", to_string(e.kind()), e.what());
        return 1;
    }

    for (const auto& item : items) {
        if (item.ok()) {
            print_response(*item.response);
        } else {
            fmt::print("{} vs {}: {} ({})\n", item.request.home_id, item.request.away_id,
                       item.error->message, to_string(item.error->kind));
        }
    }
    return 0;
}

/// Predict every pair, then report the ledger against the loaded results.
int run_history(core::PredictionEngine& engine, const std::string& pairs_path) {
    if (run_batch(engine, pairs_path) != 0) {
        return 1;
    }

    fmt::print("\nRecent predictions:\n");
    for (const auto& p : engine.prediction_history()) {
        const auto correct = p.was_correct();
        fmt::print("  {} v {} on {}: {} ({:.3f}) actual={} {}\n",
                   p.context.home_id, p.context.away_id, format_date(p.context.scheduled),
                   to_string(p.predicted), p.confidence,
                   p.actual ? to_string(*p.actual) : "pending",
                   correct ? (*correct ? "correct" : "wrong") : "");
    }

    const auto stats = engine.accuracy_stats();
    if (stats) {
        fmt::print("\nAccuracy: {}/{} ({:.1f}%)\n", stats->correct_predictions,
                   stats->total_predictions, 100.0 * stats->overall_accuracy);
        fmt::print("  avg confidence correct={:.3f} incorrect={:.3f}\n",
                   stats->avg_confidence_correct, stats->avg_confidence_incorrect);
        fmt::print("  home_win {:.1f}%  draw {:.1f}%  away_win {:.1f}%\n",
                   100.0 * stats->home_win.accuracy(), 100.0 * stats->draw.accuracy(),
                   100.0 * stats->away_win.accuracy());
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--predict" && mode != "--batch" && mode != "--history") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    const int required = mode == "--predict" ? 6 : 5;
    if (argc < required) {
        fmt::print(stderr, "Error: {} is missing arguments\n", mode);
        print_usage();
        return 1;
    }

    core::EngineConfig config;
    config.load_from_env();
    core::init_logging(config.log_level);

    core::InMemoryStore store(config.league_defaults);
    try {
        if (!core::DataLoader::load_into(store, argv[2], argv[3])) {
            return 1;
        }
    } catch (const Error& e) {
        fmt::print(stderr, "Error ({}): {}\n", to_string(e.kind()), e.what());
        return 1;
    }

    std::optional<core::PredictionEngine> engine;
    try {
        engine.emplace(config, core::Collaborators::from_store(store));
    } catch (const Error& e) {
        fmt::print(stderr, "Error ({}): {}\n", to_string(e.kind()), e.what());
        return 1;
    }

    if (mode == "--predict") {
        std::optional<std::string_view> date;
        if (argc > 6) {
            date = argv[6];
        }
        return run_predict(*engine, argv[4], argv[5], date);
    }
    if (mode == "--batch") {
        return run_batch(*engine, argv[4]);
    }
    return run_history(*engine, argv[4]);
}
