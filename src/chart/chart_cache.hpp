#pragma once

/// @file chart_cache.hpp
/// @brief Caller-owned memo of assembled charts.

#include "birth/birth_moment.hpp"
#include "chart/chart_assembler.hpp"
#include "chart/chart_bundle.hpp"
#include "chart/ephemeris_source.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <map>

namespace natal::chart
{
    /// @brief Charts keyed by the exact BirthMoment they were built from.
    ///
    /// Two moments share an entry only if every field matches, down to the
    /// birth minute and the place. Not synchronized.
    class ChartCache
    {
    public:
        /// @brief Cached chart, or nullptr.
        [[nodiscard]] const ChartBundle* find(const birth::BirthMoment& moment) const;

        /// @brief Store a chart under its own moment, replacing any previous entry.
        const ChartBundle& insert(ChartBundle bundle);

        /// @brief Return the cached chart or generate and store a new one.
        ///
        /// Failed generations are not cached, so the next call fetches again.
        [[nodiscard]] core::Result<ChartBundle> get_or_generate(const birth::BirthMoment& moment,
                                                                const ChartAssembler& assembler,
                                                                EphemerisSource& source);

        void clear() { m_entries.clear(); }

        [[nodiscard]] std::size_t size() const { return m_entries.size(); }

    private:
        std::map<birth::BirthMoment, ChartBundle> m_entries;
    };

} // namespace natal::chart
