/**
 * @file date_dimension.cpp
 * @brief Date parsing and calendar arithmetic (proleptic Gregorian)
 */

#include <schema/date_dimension.hpp>
#include <utils/text.hpp>
#include <cstdio>
#include <regex>
#include <string>

namespace NewsCube {

namespace {

const char* const kMonthNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"};

const char* const kDayNames[] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};

// Days since 1970-01-01
long days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int weeks_in_year(int year) {
    int jan1 = weekday_index({year, 1, 1});
    if (jan1 == 3) return 53;                        // Thursday
    if (jan1 == 2 && is_leap_year(year)) return 53;  // Wednesday in a leap year
    return 52;
}

// 1..12 for a full or abbreviated English month name, 0 otherwise
int month_from_name(const std::string& word) {
    std::string w = to_lower(word);
    if (w.size() < 3) return 0;
    for (int i = 0; i < 12; ++i) {
        std::string full = to_lower(kMonthNames[i]);
        if (w == full || w == full.substr(0, 3) || (i == 8 && w == "sept")) return i + 1;
    }
    return 0;
}

std::optional<CivilDate> validated(int y, int m, int d) {
    if (y < 1 || y > 9999 || m < 1 || m > 12) return std::nullopt;
    if (d < 1 || d > days_in_month(y, m)) return std::nullopt;
    return CivilDate{y, m, d};
}

} // namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    return (month == 2 && is_leap_year(year)) ? 29 : days[month - 1];
}

std::optional<CivilDate> parse_date(std::string_view text) {
    static const std::regex iso(R"(^(\d{4})[-/](\d{1,2})[-/](\d{1,2})(?:[T ].*)?$)");
    static const std::regex compact(R"(^(\d{4})(\d{2})(\d{2})(?:[T ].*)?$)");
    static const std::regex us(R"(^(\d{1,2})/(\d{1,2})/(\d{4})(?:[T ].*)?$)");
    static const std::regex month_first(R"(^([A-Za-z]+)\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})(?:[T ].*)?$)");
    static const std::regex day_first(R"(^(\d{1,2})\s+([A-Za-z]+)\.?,?\s+(\d{4})(?:[T ].*)?$)");

    const std::string s = trim(text);
    if (s.empty() || s.size() > MAX_DATE_LENGTH) return std::nullopt;

    std::smatch m;
    if (std::regex_match(s, m, iso) || std::regex_match(s, m, compact)) {
        return validated(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
    }
    if (std::regex_match(s, m, us)) {
        return validated(std::stoi(m[3]), std::stoi(m[1]), std::stoi(m[2]));
    }
    if (std::regex_match(s, m, month_first)) {
        int month = month_from_name(m[1]);
        if (month == 0) return std::nullopt;
        return validated(std::stoi(m[3]), month, std::stoi(m[2]));
    }
    if (std::regex_match(s, m, day_first)) {
        int month = month_from_name(m[2]);
        if (month == 0) return std::nullopt;
        return validated(std::stoi(m[3]), month, std::stoi(m[1]));
    }
    return std::nullopt;
}

int date_key(const CivilDate& d) {
    return d.year * 10000 + d.month * 100 + d.day;
}

int date_key_of(std::string_view text) {
    auto parsed = parse_date(text);
    return parsed ? date_key(*parsed) : UNKNOWN_DATE_KEY;
}

int weekday_index(const CivilDate& d) {
    long days = days_from_civil(d.year, d.month, d.day);
    // 1970-01-01 was a Thursday
    return static_cast<int>(((days % 7) + 7 + 3) % 7);
}

int iso_week(const CivilDate& d) {
    const int ordinal = static_cast<int>(days_from_civil(d.year, d.month, d.day) -
                                         days_from_civil(d.year, 1, 1)) + 1;
    const int week = (ordinal - (weekday_index(d) + 1) + 10) / 7;

    if (week < 1) return weeks_in_year(d.year - 1);
    if (week > weeks_in_year(d.year)) return 1;
    return week;
}

TimeRow make_time_row(const CivilDate& d) {
    TimeRow row;
    row.date_key = date_key(d);
    row.year = d.year;
    row.quarter = "Q" + std::to_string((d.month - 1) / 3 + 1);
    row.month = kMonthNames[d.month - 1];
    row.month_number = d.month;
    row.day = d.day;
    row.day_of_week = kDayNames[weekday_index(d)];
    row.week_of_year = iso_week(d);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    row.date_string = buf;
    return row;
}

TimeRow unknown_time_row() {
    return make_time_row({1900, 1, 1});
}

} // namespace NewsCube
