/// @file ayanamsa.cpp
/// @brief Linear ayanamsa model.

#include "astro/ayanamsa.hpp"

namespace natal::astro
{

f64 Ayanamsa::for_year(f64 year, const AyanamsaModel& model)
{
    return model.base_value_deg + (year - model.base_year) * model.rate_deg_per_year;
}

f64 Ayanamsa::for_date(const CalendarDate& date, const AyanamsaModel& model)
{
    return for_year(static_cast<f64>(date.year), model);
}

} // namespace natal::astro
