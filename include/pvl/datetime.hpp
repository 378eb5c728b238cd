#pragma once


/*
    ---------------------------------------------------
    Pvl::date / Pvl::time / Pvl::datetime - Date values
    ---------------------------------------------------
    PVL date and time values are plain field aggregates rather than
    `std::chrono` time points so that a seconds field of 60 (a leap
    second) is carried exactly as written and is never normalized into
    the following minute.

    - `date`: proleptic Gregorian year, month, day. Day-of-year input
      (`2001-032`) is converted to month/day on decode
    - `time`: hour, minute, second (0-60), nanoseconds, and an optional
      UTC offset in minutes. Decoders always set the offset: PVL treats
      a time without a zone as UTC
    - `datetime`: a date and a time

    Equality is field-wise: `10:00Z` and `11:00+01:00` are distinct values
*/

#include <cstdint>
#include <optional>
#include <string>

#include "pvl/config.hpp"


/// @defgroup PvlDateTime Dates and Times
/// @ingroup Pvl
namespace Pvl {

    /// @ingroup PvlDateTime
    /// @brief Leap-second policy: a seconds value of 60 is stored as 60.
    ///
    /// @details
    /// Decoding never clamps or rolls a leap second over, and never
    /// degrades it to a string. Grammars without a leap-second form do
    /// not decode such text as a time at all, and encoders for those
    /// dialects reject a time whose second is 60.
    inline constexpr bool leap_seconds_preserved = true;

    /// @ingroup PvlDateTime
    struct date {
        int32_t year = 1;
        uint8_t month = 1;
        uint8_t day = 1;

        [[nodiscard]] PVL_API bool valid() const noexcept;

        bool operator==(const date&) const = default;
    };

    /// @ingroup PvlDateTime
    struct time {
        uint8_t hour = 0;
        uint8_t minute = 0;
        uint8_t second = 0;
        uint32_t nanosecond = 0;
        std::optional<int16_t> utc_offset_minutes{}; ///< nullopt for a naive time, which cannot be encoded

        [[nodiscard]] bool is_leap_second() const noexcept { return second == 60; }
        [[nodiscard]] bool is_utc() const noexcept { return utc_offset_minutes && *utc_offset_minutes == 0; }
        [[nodiscard]] PVL_API bool valid() const noexcept;

        bool operator==(const time&) const = default;
    };

    /// @ingroup PvlDateTime
    struct datetime {
        date date_part{};
        time time_part{};

        bool operator==(const datetime&) const = default;
    };

    /// @ingroup PvlDateTime
    [[nodiscard]] PVL_API bool is_leap_year(int32_t year) noexcept;

    /// @ingroup PvlDateTime
    /// @brief Number of days in @p month of @p year, or 0 for an invalid month.
    [[nodiscard]] PVL_API uint8_t days_in_month(int32_t year, uint8_t month) noexcept;

    /// @ingroup PvlDateTime
    /// @brief Converts a 1-based day of year to a calendar date.
    [[nodiscard]] PVL_API std::optional<date> date_from_ordinal(int32_t year, int day_of_year) noexcept;

    /// @ingroup PvlDateTime
    /// @brief `YYYY-MM-DD`
    [[nodiscard]] PVL_API std::string to_string(const date& d);

    /// @ingroup PvlDateTime
    /// @brief `HH:MM`, `HH:MM:SS` or `HH:MM:SS.f...` with trailing zeros of
    ///        the fraction removed. The UTC offset is not written.
    [[nodiscard]] PVL_API std::string to_string(const time& t);

    /// @ingroup PvlDateTime
    /// @brief Formats an offset as `Z` (zero), `+HH` or `+HH:MM`; empty for nullopt.
    [[nodiscard]] PVL_API std::string format_utc_offset(std::optional<int16_t> minutes);

} // namespace Pvl
