/**
 * @file date_dimension.hpp
 * @brief Publication date parsing and Dim_Time row derivation
 */

#pragma once

#include <schema/star_schema.hpp>
#include <optional>
#include <string_view>

namespace NewsCube {

struct CivilDate {
    int year = 0;
    int month = 0;   // 1..12
    int day = 0;     // 1..31
};

// Key for documents whose date is absent or unparseable
constexpr int UNKNOWN_DATE_KEY = 19000101;

// Longer raw dates are rejected before any pattern is tried
constexpr size_t MAX_DATE_LENGTH = 64;

/**
 * @brief Parse the date formats seen in the article exports.
 *
 * Accepted: YYYY-MM-DD, YYYY/MM/DD, YYYYMMDD (each with an optional
 * "T..." or " ..." time suffix), MM/DD/YYYY, "Month DD, YYYY",
 * "DD Month YYYY" (full or three-letter month names).
 *
 * @return nullopt for anything else, an impossible calendar date or text
 *         longer than MAX_DATE_LENGTH
 */
std::optional<CivilDate> parse_date(std::string_view text);

int date_key(const CivilDate& d);

/**
 * @brief YYYYMMDD key of a raw date, UNKNOWN_DATE_KEY when unparseable.
 */
int date_key_of(std::string_view text);

bool is_leap_year(int year);
int days_in_month(int year, int month);

/**
 * @brief 0 = Monday .. 6 = Sunday
 */
int weekday_index(const CivilDate& d);

int iso_week(const CivilDate& d);

TimeRow make_time_row(const CivilDate& d);

/**
 * @brief Dim_Time row for UNKNOWN_DATE_KEY (1900-01-01).
 */
TimeRow unknown_time_row();

} // namespace NewsCube
