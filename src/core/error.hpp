#pragma once

/// @file error.hpp
/// @brief Typed error values and the Result<T> return type used across the pipeline.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace natal::core
{
    /// @brief Every failure the conversion pipeline can report.
    enum class ErrorCode : u8
    {
        FutureBirthDate,          ///< Birth date later than today
        BirthDateTooOld,          ///< Birth date beyond the supported age window
        IncompleteBirthData,      ///< Required date, coordinate or timezone missing
        MalformedPlaceName,       ///< Place text present but has no usable segment
        InvalidCalendarDate,      ///< Month/day out of range, or year < 1
        InvalidLocalTime,         ///< Hour/minute out of range
        InvalidCoordinates,       ///< Latitude/longitude out of range or not finite
        UnknownTimezone,          ///< Timezone identifier or offset not usable
        IncompleteEphemerisData,  ///< Ephemeris returned fewer positions than requested
        DuplicateEphemerisEntry,  ///< Ephemeris returned the same planet twice
        MalformedCompatibility,   ///< Compatibility response violates its contract
    };

    /// @brief Coarse grouping that lets callers pick a fallback policy.
    ///
    /// Validation errors mean the user's input must be fixed.
    /// MissingExternalData means a collaborator failed to deliver.
    enum class ErrorCategory : u8
    {
        Validation,
        MissingExternalData,
    };

    /// @brief Stable identifier for an error code ("FutureBirthDate", ...).
    [[nodiscard]] const char* error_code_name(ErrorCode code);

    /// @brief Category an error code belongs to.
    [[nodiscard]] ErrorCategory category_of(ErrorCode code);

    /// @brief Error value carried by a failed Result.
    struct Error
    {
        ErrorCode   code;
        std::string message;

        [[nodiscard]] ErrorCategory category() const { return category_of(code); }

        bool operator==(const Error&) const = default;
    };

    /// @brief Either a value of type T or an Error.
    ///
    /// Implicitly constructible from both so functions can `return value;`
    /// or `return Error{...};`.
    template <typename T>
    class Result
    {
    public:
        Result(T value) : m_storage(std::move(value)) {}        // NOLINT(google-explicit-constructor)
        Result(Error error) : m_storage(std::move(error)) {}    // NOLINT(google-explicit-constructor)

        [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(m_storage); }
        explicit operator bool() const { return has_value(); }

        [[nodiscard]] const T& value() const& { return std::get<T>(m_storage); }
        [[nodiscard]] T& value() & { return std::get<T>(m_storage); }
        [[nodiscard]] T&& value() && { return std::get<T>(std::move(m_storage)); }

        [[nodiscard]] const T& operator*() const& { return value(); }
        [[nodiscard]] const T* operator->() const { return &value(); }

        /// @pre !has_value()
        [[nodiscard]] const Error& error() const { return std::get<Error>(m_storage); }

    private:
        std::variant<T, Error> m_storage;
    };

    /// @brief Success-or-error for operations with no value to return.
    template <>
    class Result<void>
    {
    public:
        Result() = default;
        Result(Error error) : m_error(std::move(error)) {}     // NOLINT(google-explicit-constructor)

        [[nodiscard]] bool has_value() const { return !m_error.has_value(); }
        explicit operator bool() const { return has_value(); }

        /// @pre !has_value()
        [[nodiscard]] const Error& error() const { return *m_error; }

    private:
        std::optional<Error> m_error;
    };

} // namespace natal::core
