/**
 * @file LocalDateTime.cpp
 * @brief Civil calendar arithmetic (days-from-civil algorithm).
 */

#include "domain/LocalDateTime.hpp"
#include <cstdio>
#include <ctime>

namespace ideasorter::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

long long DaysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void CivilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

long long FloorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

LocalDateTime LocalDateTime::Now() {
    return FromTimePoint(std::chrono::system_clock::now());
}

LocalDateTime LocalDateTime::FromTimePoint(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(tp));
    return LocalDateTime{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec};
}

std::optional<LocalDateTime> LocalDateTime::FromIsoString(const std::string& value) {
    LocalDateTime dt;
    int consumed = 0;
    char sep = 'T';
    int fields = std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d%n",
                             &dt.year, &dt.month, &dt.day, &sep, &dt.hour, &dt.minute, &consumed);
    if (fields < 6 || (sep != 'T' && sep != ' ')) return std::nullopt;

    if (static_cast<std::size_t>(consumed) < value.size() && value[consumed] == ':') {
        if (std::sscanf(value.c_str() + consumed, ":%2d", &dt.second) != 1) return std::nullopt;
    }

    if (dt.month < 1 || dt.month > 12 || dt.day < 1 || dt.day > 31 ||
        dt.hour < 0 || dt.hour > 23 || dt.minute < 0 || dt.minute > 59 ||
        dt.second < 0 || dt.second > 59) {
        return std::nullopt;
    }
    return dt;
}

std::string LocalDateTime::toIsoString() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", year, month, day, hour, minute, second);
    return buf;
}

int LocalDateTime::weekday() const {
    long long days = DaysFromCivil(year, month, day);
    // 1970-01-01 was a Thursday (4).
    long long wd = (days + 4) % 7;
    return static_cast<int>(wd < 0 ? wd + 7 : wd);
}

LocalDateTime LocalDateTime::plusDays(int days) const {
    LocalDateTime out = *this;
    CivilFromDays(DaysFromCivil(year, month, day) + days, out.year, out.month, out.day);
    return out;
}

LocalDateTime LocalDateTime::plusMinutes(long long minutes) const {
    return FromCivilSeconds(toCivilSeconds() + minutes * 60);
}

LocalDateTime LocalDateTime::atTime(int h, int m, int s) const {
    LocalDateTime out = *this;
    out.hour = h;
    out.minute = m;
    out.second = s;
    return out;
}

long long LocalDateTime::toCivilSeconds() const {
    return DaysFromCivil(year, month, day) * 86400LL + hour * 3600LL + minute * 60LL + second;
}

LocalDateTime LocalDateTime::FromCivilSeconds(long long seconds) {
    long long days = FloorDiv(seconds, 86400);
    long long rem = seconds - days * 86400;
    LocalDateTime out;
    CivilFromDays(days, out.year, out.month, out.day);
    out.hour = static_cast<int>(rem / 3600);
    out.minute = static_cast<int>((rem % 3600) / 60);
    out.second = static_cast<int>(rem % 60);
    return out;
}

bool operator==(const LocalDateTime& a, const LocalDateTime& b) {
    return a.toCivilSeconds() == b.toCivilSeconds();
}

bool operator!=(const LocalDateTime& a, const LocalDateTime& b) {
    return !(a == b);
}

bool operator<(const LocalDateTime& a, const LocalDateTime& b) {
    return a.toCivilSeconds() < b.toCivilSeconds();
}

bool operator<=(const LocalDateTime& a, const LocalDateTime& b) {
    return a.toCivilSeconds() <= b.toCivilSeconds();
}

} // namespace ideasorter::domain
