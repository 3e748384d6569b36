/**
 * @file gc_time_utils.hpp
 * @brief Time and date utilities for training records
 * @author GymCoach Analytics Team
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - ISO 8601 parsing and formatting (UTC)
 * - Whole-day differences between record dates
 * - ISO week and weekday bucketing
 * - Elapsed-time measurement
 */

#ifndef GYMCOACH_GC_TIME_UTILS_HPP
#define GYMCOACH_GC_TIME_UTILS_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <ctime>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <optional>

namespace gymcoach {
namespace time_utils {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

constexpr int64_t SECONDS_PER_DAY = 86400;

[[nodiscard]] inline TimePoint now() noexcept {
    return Clock::now();
}

// ============================================================================
// Civil Calendar Arithmetic
// ============================================================================

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
[[nodiscard]] constexpr int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
    int64_t year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

[[nodiscard]] constexpr CivilDate civilFromDays(int64_t z) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

[[nodiscard]] constexpr bool isLeapYear(int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

[[nodiscard]] constexpr unsigned daysInMonth(int64_t y, unsigned m) noexcept {
    constexpr unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : table[m - 1];
}

/// Floor division by a positive divisor.
[[nodiscard]] constexpr int64_t floorDiv(int64_t a, int64_t b) noexcept {
    return a >= 0 ? a / b : -((-a + b - 1) / b);
}

// ============================================================================
// ISO 8601 Parsing
// ============================================================================

namespace detail {

inline bool readDigits(std::string_view s, std::size_t& pos, std::size_t count, int64_t& out) {
    if (pos + count > s.size()) return false;
    int64_t v = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

} // namespace detail

/**
 * @brief Parse an ISO 8601 date or date-time
 *
 * Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and
 * `HH:MM[:SS[.fff]]`, optionally followed by `Z` or `+HH:MM` / `-HH:MM`.
 * Values without an offset are taken as UTC.
 *
 * @return Time point, or nullopt when the text is not a valid date
 */
[[nodiscard]] inline std::optional<TimePoint> parseISO8601(std::string_view text) {
    std::size_t pos = 0;
    int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!detail::readDigits(text, pos, 4, year)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!detail::readDigits(text, pos, 2, month)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!detail::readDigits(text, pos, 2, day)) return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > static_cast<int64_t>(daysInMonth(year, static_cast<unsigned>(month)))) {
        return std::nullopt;
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!detail::readDigits(text, pos, 2, hour)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != ':') return std::nullopt;
        if (!detail::readDigits(text, pos, 2, minute)) return std::nullopt;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!detail::readDigits(text, pos, 2, second)) return std::nullopt;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                std::size_t start = pos;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
                if (pos == start) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        if (pos < text.size() && text[pos] == 'Z') {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            const int sign = text[pos++] == '-' ? -1 : 1;
            int64_t oh = 0, om = 0;
            if (!detail::readDigits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (!detail::readDigits(text, pos, 2, om)) return std::nullopt;
            offsetSeconds = sign * (oh * 3600 + om * 60);
        }
    }

    if (pos != text.size()) return std::nullopt;

    int64_t epoch = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day))
                    * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second - offsetSeconds;
    return TimePoint(Seconds(epoch));
}

[[nodiscard]] inline int64_t epochSeconds(TimePoint tp) noexcept {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

/**
 * @brief Whole days from @p from to @p to, floored like a calendar day count
 */
[[nodiscard]] inline int64_t wholeDaysBetween(TimePoint from, TimePoint to) noexcept {
    return floorDiv(epochSeconds(to) - epochSeconds(from), SECONDS_PER_DAY);
}

/**
 * @brief Whole days between two ISO 8601 strings
 * @return nullopt if either side fails to parse
 */
[[nodiscard]] inline std::optional<int64_t> daysBetween(std::string_view from, std::string_view to) {
    auto a = parseISO8601(from);
    auto b = parseISO8601(to);
    if (!a || !b) return std::nullopt;
    return wholeDaysBetween(*a, *b);
}

// ============================================================================
// Calendar Bucketing
// ============================================================================

/// 0 = Monday ... 6 = Sunday
[[nodiscard]] inline int weekdayIndex(TimePoint tp) noexcept {
    int64_t days = floorDiv(epochSeconds(tp), SECONDS_PER_DAY);
    // 1970-01-01 was a Thursday
    return static_cast<int>(((days % 7) + 7 + 3) % 7);
}

[[nodiscard]] inline const char* weekdayName(int index) noexcept {
    static const char* names[] = {"Monday", "Tuesday", "Wednesday", "Thursday",
                                  "Friday", "Saturday", "Sunday"};
    return (index >= 0 && index < 7) ? names[index] : "Unknown";
}

struct IsoWeek {
    int64_t year = 0;
    int week = 0;

    [[nodiscard]] bool operator<(const IsoWeek& o) const noexcept {
        return year != o.year ? year < o.year : week < o.week;
    }
    [[nodiscard]] bool operator==(const IsoWeek& o) const noexcept {
        return year == o.year && week == o.week;
    }
};

/**
 * @brief ISO 8601 week-numbering year and week of a time point
 */
[[nodiscard]] inline IsoWeek isoWeek(TimePoint tp) noexcept {
    const int64_t days = floorDiv(epochSeconds(tp), SECONDS_PER_DAY);
    // The Thursday of this week decides the ISO year
    const int64_t thursday = days - weekdayIndex(tp) + 3;
    const CivilDate civil = civilFromDays(thursday);
    const int64_t jan1 = daysFromCivil(civil.year, 1, 1);
    return IsoWeek{civil.year, static_cast<int>((thursday - jan1) / 7 + 1)};
}

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Format time point as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
 */
[[nodiscard]] inline std::string toISO8601(TimePoint tp = now()) {
    auto t = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

/**
 * @brief Format time point as a UTC date (YYYY-MM-DD)
 */
[[nodiscard]] inline std::string toDateString(TimePoint tp) {
    CivilDate c = civilFromDays(floorDiv(epochSeconds(tp), SECONDS_PER_DAY));
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << c.year << '-'
        << std::setw(2) << c.month << '-' << std::setw(2) << c.day;
    return oss.str();
}

/// Shifts a time point by whole days.
[[nodiscard]] inline TimePoint addDays(TimePoint tp, int64_t days) noexcept {
    return tp + Seconds(days * SECONDS_PER_DAY);
}

// ============================================================================
// Timer Utilities
// ============================================================================

/**
 * @brief Simple timer for measuring elapsed time
 */
class Timer {
public:
    Timer() noexcept : start_(std::chrono::steady_clock::now()) {}

    void reset() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsedMs() const noexcept {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace time_utils
} // namespace gymcoach

#endif // GYMCOACH_GC_TIME_UTILS_HPP
