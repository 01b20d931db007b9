#pragma once

/// @file include/matchcast/features.hpp
/// @brief Feature Vector Assembler — the scored input of every strategy.
///
/// # Module: Feature Vector Assembler
///
/// ## Responsibility
/// Merge the per-entity and fixture-level feature families into one
/// immutable `FeatureVector`, and expose its fixed, named flattened form.
///
/// ## Flattened layout (FEATURE_COUNT = 88)
///   [ 0, 26)  home EntityFeatures
///   [26, 52)  away EntityFeatures
///   [52, 64)  MatchFeatures
///   [64, 77)  HeadToHeadFeatures
///   [77, 88)  ExternalFactors
/// Streak type is encoded None=0, Win=1, Draw=2, Loss=3; booleans as 0/1.
///
/// ## Guarantees
/// - An assembled vector has every flattened field finite
/// - `flatten` and `feature_names` agree index for index

#include "matchcast/statistics.hpp"
#include "matchcast/context.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace matchcast::features {

static constexpr std::size_t ENTITY_FEATURE_COUNT   = 26;
static constexpr std::size_t MATCH_FEATURE_COUNT    = 12;
static constexpr std::size_t H2H_FEATURE_COUNT      = 13;
static constexpr std::size_t EXTERNAL_FEATURE_COUNT = 11;

static constexpr std::size_t FEATURE_COUNT =
    2 * ENTITY_FEATURE_COUNT + MATCH_FEATURE_COUNT
    + H2H_FEATURE_COUNT + EXTERNAL_FEATURE_COUNT;

static_assert(FEATURE_COUNT == 88);

/// Flattened numeric view of a FeatureVector.
using FlatFeatures = Eigen::Vector<double, static_cast<int>(FEATURE_COUNT)>;

// ─── FeatureVector ────────────────────────────────────────────────────────────

struct FeatureVector {
    stats::EntityFeatures       home;
    stats::EntityFeatures       away;
    context::MatchFeatures      match;
    context::HeadToHeadFeatures h2h;
    context::ExternalFactors    external;
};

/// Numeric code of a streak type inside the flattened layout.
[[nodiscard]] double encode_streak(StreakType type) noexcept;

/// Flatten in the documented order.
[[nodiscard]] FlatFeatures flatten(const FeatureVector& fv) noexcept;

/// Names of the flattened fields, index for index ("home.points_per_game",
/// "h2h.h2h_trend", ...).
[[nodiscard]] const std::array<std::string_view, FEATURE_COUNT>& feature_names() noexcept;

/// Index of the first non-finite flattened field, if any.
[[nodiscard]] std::optional<std::size_t> first_non_finite(const FeatureVector& fv) noexcept;

// ─── FeatureVectorAssembler ───────────────────────────────────────────────────

class FeatureVectorAssembler {
public:
    /// Structural merge followed by a finiteness check.
    ///
    /// # Throws
    /// `ValidationError` naming the first non-finite field.
    [[nodiscard]] static FeatureVector
    assemble(const stats::EntityFeatures& home,
             const stats::EntityFeatures& away,
             const context::MatchFeatures& match,
             const context::HeadToHeadFeatures& h2h,
             const context::ExternalFactors& external);
};

}  // namespace matchcast::features
