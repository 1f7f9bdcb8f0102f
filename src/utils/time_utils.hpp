#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_MINUTE * MINUTES_PER_HOUR * HOURS_PER_DAY;
constexpr int DAYS_PER_WEEK = 7;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* CALENDAR_DATE = "%Y-%m-%d";
constexpr const char* SCAN_ID = "%Y%m%dT%H%M%SZ";

// Current time
std::string get_current_iso_time_with_z();
std::string get_current_human_readable_time();
std::string get_current_scan_id();
std::string get_calendar_date_minus_days(int days);

// Calendar dates (YYYY-MM-DD, proleptic Gregorian)
bool is_valid_calendar_date(const std::string& calendar_date);
long long days_since_epoch(const std::string& calendar_date);
long long week_index_since_epoch(const std::string& calendar_date);
std::string calendar_date_from_days(long long days);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
