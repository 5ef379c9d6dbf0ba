/// @file chart_cache.cpp
/// @brief ChartCache lookup and fill.

#include "chart/chart_cache.hpp"

#include "core/logger.hpp"

#include <utility>

namespace natal::chart
{

const ChartBundle* ChartCache::find(const birth::BirthMoment& moment) const
{
    const auto it = m_entries.find(moment);
    return it != m_entries.end() ? &it->second : nullptr;
}

const ChartBundle& ChartCache::insert(ChartBundle bundle)
{
    auto key = bundle.moment;
    const auto it = m_entries.insert_or_assign(std::move(key), std::move(bundle)).first;
    return it->second;
}

core::Result<ChartBundle> ChartCache::get_or_generate(const birth::BirthMoment& moment,
                                                      const ChartAssembler& assembler,
                                                      EphemerisSource& source)
{
    if (const ChartBundle* cached = find(moment))
    {
        NATAL_CORE_DEBUG("ChartCache: Hit for '{}'", moment.full_name);
        return *cached;
    }

    auto bundle = assembler.generate(moment, source);
    if (!bundle)
    {
        return bundle.error();
    }

    NATAL_CORE_DEBUG("ChartCache: Stored chart for '{}' ({} entries)", moment.full_name, m_entries.size() + 1);
    return insert(std::move(bundle).value());
}

} // namespace natal::chart
