#include <shroud/core/time.hpp>

#include <fmt/core.h>

namespace shroud {

// Howard Hinnant's days_from_civil / civil_from_days.

auto make_date(std::int32_t year, std::uint32_t month, std::uint32_t day) noexcept -> Date {
    const std::int32_t y = static_cast<std::int32_t>(year) - (month <= 2 ? 1 : 0);
    const std::int32_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<std::uint32_t>(y - era * 400);
    const std::uint32_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const std::uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return Date{era * 146097 + static_cast<std::int32_t>(doe) - 719468};
}

auto civil_from_date(Date date) noexcept -> CivilDate {
    const std::int32_t z = date.days + 719468;
    const std::int32_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<std::uint32_t>(z - era * 146097);
    const std::uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int32_t y = static_cast<std::int32_t>(yoe) + era * 400;
    const std::uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::uint32_t mp = (5 * doy + 2) / 153;
    const std::uint32_t d = doy - (153 * mp + 2) / 5 + 1;
    const std::uint32_t m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{.year = y + (m <= 2 ? 1 : 0), .month = m, .day = d};
}

auto days_in_month(std::int32_t year, std::uint32_t month) noexcept -> std::uint32_t {
    switch (month) {
        case 1:
        case 3:
        case 5:
        case 7:
        case 8:
        case 10:
        case 12:
            return 31;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        case 2: {
            const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return leap ? 29 : 28;
        }
        default:
            return 0;
    }
}

auto format_date(Date date) -> std::string {
    const auto civil = civil_from_date(date);
    return fmt::format("{:04}-{:02}-{:02}", civil.year, civil.month, civil.day);
}

}  // namespace shroud
