/// @file compatibility.cpp
/// @brief CompatibilityReport shape validation.

#include "chart/compatibility.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>
#include <utility>

namespace natal::chart
{

namespace
{

bool score_in_range(i32 score)
{
    return score >= CompatibilityValidator::kMinScore && score <= CompatibilityValidator::kMaxScore;
}

core::Error malformed(std::string message)
{
    NATAL_CORE_WARN("Compatibility: {}", message);
    return core::Error{.code = core::ErrorCode::MalformedCompatibility, .message = std::move(message)};
}

} // anonymous namespace

core::Result<void> CompatibilityValidator::validate(const CompatibilityReport& report)
{
    if (report.overall_score && !score_in_range(*report.overall_score))
    {
        return malformed(fmt::format("overall score {} is outside {}..{}",
                                     *report.overall_score, kMinScore, kMaxScore));
    }

    for (const auto& [system, score] : report.per_system_scores)
    {
        if (system.empty())
        {
            return malformed("per-system score has an empty system name");
        }
        if (score < kMinScore)
        {
            return malformed(fmt::format("{} score {} is negative", system, score));
        }
    }

    if (report.overall_score)
    {
        const bool has_aspect = std::any_of(report.synastry_aspects.begin(), report.synastry_aspects.end(),
                                            [](const std::string& aspect) { return !aspect.empty(); });
        if (!has_aspect)
        {
            return malformed("scored report has no synastry aspect descriptions");
        }
    }

    return {};
}

} // namespace natal::chart
