/**
 * @file LocalDateTime.hpp
 * @brief Civil (wall clock) date-time used for reminder fire times.
 *
 * Reminders are expressed in the user's local wall clock, so all arithmetic is
 * done on the civil calendar and never depends on the process time zone.
 */

#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace ideasorter::domain {

struct LocalDateTime {
    int year = 1970;
    int month = 1;  ///< 1..12
    int day = 1;    ///< 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;

    /** @brief Current local wall-clock time. */
    static LocalDateTime Now();

    /** @brief Converts a system clock instant using the local time zone. */
    static LocalDateTime FromTimePoint(std::chrono::system_clock::time_point tp);

    /** @brief Parses "YYYY-MM-DDTHH:MM[:SS]" (a trailing zone suffix is ignored). */
    static std::optional<LocalDateTime> FromIsoString(const std::string& value);

    /** @brief Formats as "YYYY-MM-DDTHH:MM:SS". */
    std::string toIsoString() const;

    /** @brief Day of week, 0 = Sunday .. 6 = Saturday. */
    int weekday() const;

    LocalDateTime plusDays(int days) const;
    LocalDateTime plusMinutes(long long minutes) const;

    /** @brief Same date with the given time of day. */
    LocalDateTime atTime(int h, int m, int s = 0) const;

    /** @brief Seconds since 1970-01-01T00:00:00 on the civil calendar. */
    long long toCivilSeconds() const;
    static LocalDateTime FromCivilSeconds(long long seconds);
};

bool operator==(const LocalDateTime& a, const LocalDateTime& b);
bool operator!=(const LocalDateTime& a, const LocalDateTime& b);
bool operator<(const LocalDateTime& a, const LocalDateTime& b);
bool operator<=(const LocalDateTime& a, const LocalDateTime& b);

} // namespace ideasorter::domain
