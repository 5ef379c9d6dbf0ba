#pragma once

/// @file compatibility.hpp
/// @brief Compatibility report received from the remote service, and its shape check.

#include "core/error.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace natal::chart
{
    /// @brief Synastry result for two people. Scored remotely; only shape-checked here.
    struct CompatibilityReport
    {
        std::optional<i32>         overall_score;      ///< 0..100
        std::map<std::string, i32> per_system_scores;  ///< Each on its system's own scale, e.g. "vedic" -> 28 (of 36)
        std::vector<std::string>   synastry_aspects;   ///< Descriptions, in display order

        bool operator==(const CompatibilityReport&) const = default;
    };

    class CompatibilityValidator
    {
    public:
        CompatibilityValidator() = delete;

        static constexpr i32 kMinScore = 0;
        static constexpr i32 kMaxScore = 100;

        /// @brief Check the overall score range (0..100), system names, and that
        /// a scored report carries at least one aspect description.
        ///
        /// Per-system scores only need to be non-negative: each system keeps
        /// its own maximum (Vedic guna matching scores out of 36).
        /// @return MalformedCompatibility describing the first violation found.
        [[nodiscard]] static core::Result<void> validate(const CompatibilityReport& report);
    };

} // namespace natal::chart
