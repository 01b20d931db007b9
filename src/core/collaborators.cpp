/// @file src/core/collaborators.cpp
/// @brief Ledger value helpers.

#include "matchcast/collaborators.hpp"

namespace matchcast {

std::optional<bool> StoredPrediction::was_correct() const noexcept {
    if (!actual) {
        return std::nullopt;
    }
    return *actual == predicted;
}

double OutcomeAccuracy::accuracy() const noexcept {
    if (predictions == 0) {
        return 0.0;
    }
    return static_cast<double>(correct) / static_cast<double>(predictions);
}

}  // namespace matchcast
