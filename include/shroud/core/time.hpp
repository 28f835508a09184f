#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace shroud {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Broken-down proleptic Gregorian date.
struct CivilDate {
    std::int32_t year = 1970;
    std::uint32_t month = 1;
    std::uint32_t day = 1;
};

/// Build a Date from year/month/day. Does not validate the day of month.
[[nodiscard]] auto make_date(std::int32_t year, std::uint32_t month, std::uint32_t day) noexcept
    -> Date;

[[nodiscard]] auto civil_from_date(Date date) noexcept -> CivilDate;

/// Number of days in `month` of `year`, 0 for an invalid month.
[[nodiscard]] auto days_in_month(std::int32_t year, std::uint32_t month) noexcept -> std::uint32_t;

/// ISO 8601 `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

}  // namespace shroud
