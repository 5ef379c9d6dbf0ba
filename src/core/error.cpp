/// @file error.cpp
/// @brief Error code names and categories.

#include "core/error.hpp"

namespace natal::core
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::FutureBirthDate:         return "FutureBirthDate";
        case ErrorCode::BirthDateTooOld:         return "BirthDateTooOld";
        case ErrorCode::IncompleteBirthData:     return "IncompleteBirthData";
        case ErrorCode::MalformedPlaceName:      return "MalformedPlaceName";
        case ErrorCode::InvalidCalendarDate:     return "InvalidCalendarDate";
        case ErrorCode::InvalidLocalTime:        return "InvalidLocalTime";
        case ErrorCode::InvalidCoordinates:      return "InvalidCoordinates";
        case ErrorCode::UnknownTimezone:         return "UnknownTimezone";
        case ErrorCode::IncompleteEphemerisData: return "IncompleteEphemerisData";
        case ErrorCode::DuplicateEphemerisEntry: return "DuplicateEphemerisEntry";
        case ErrorCode::MalformedCompatibility:  return "MalformedCompatibility";
    }
    return "Unknown";
}

ErrorCategory category_of(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::IncompleteEphemerisData:
        case ErrorCode::DuplicateEphemerisEntry:
        case ErrorCode::MalformedCompatibility:
            return ErrorCategory::MissingExternalData;
        default:
            return ErrorCategory::Validation;
    }
}

} // namespace natal::core
