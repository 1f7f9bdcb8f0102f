#include "time_utils.hpp"
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

namespace {
    std::string format_current_time(const char* time_format, bool use_utc) {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;

        // Use thread-safe variants
        struct tm timeinfo;
        if (use_utc) {
            gmtime_r(&in_time_t, &timeinfo);
        } else {
            localtime_r(&in_time_t, &timeinfo);
        }
        ss << std::put_time(&timeinfo, time_format);
        return ss.str();
    }

    bool parse_calendar_fields(const std::string& calendar_date, int& year, unsigned& month, unsigned& day) {
        if (calendar_date.size() < 10 || calendar_date[4] != '-' || calendar_date[7] != '-') {
            return false;
        }
        for (size_t char_index : {0, 1, 2, 3, 5, 6, 8, 9}) {
            if (calendar_date[char_index] < '0' || calendar_date[char_index] > '9') {
                return false;
            }
        }
        year = std::stoi(calendar_date.substr(0, 4));
        month = static_cast<unsigned>(std::stoi(calendar_date.substr(5, 2)));
        day = static_cast<unsigned>(std::stoi(calendar_date.substr(8, 2)));
        if (month < 1 || month > 12 || day < 1) {
            return false;
        }
        static const unsigned days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool is_leap_year = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        unsigned month_length = days_in_month[month - 1] + ((month == 2 && is_leap_year) ? 1u : 0u);
        return day <= month_length;
    }

    // Days since 1970-01-01 for a civil date
    long long days_from_civil(int year, unsigned month, unsigned day) {
        year -= month <= 2 ? 1 : 0;
        const long long era = (year >= 0 ? year : year - 399) / 400;
        const unsigned year_of_era = static_cast<unsigned>(year - era * 400);
        const unsigned day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
        return era * 146097 + static_cast<long long>(day_of_era) - 719468;
    }
}

std::string get_current_iso_time_with_z() {
    return format_current_time(ISO_8601_WITH_Z, true);
}

std::string get_current_human_readable_time() {
    return format_current_time(HUMAN_READABLE, false);
}

std::string get_current_scan_id() {
    return format_current_time(SCAN_ID, true);
}

std::string get_calendar_date_minus_days(int days) {
    auto target_time = std::chrono::system_clock::now() - std::chrono::hours(24 * days);
    auto in_time_t = std::chrono::system_clock::to_time_t(target_time);
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, CALENDAR_DATE);
    return ss.str();
}

bool is_valid_calendar_date(const std::string& calendar_date) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    return parse_calendar_fields(calendar_date, year, month, day);
}

long long days_since_epoch(const std::string& calendar_date) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (!parse_calendar_fields(calendar_date, year, month, day)) {
        throw std::runtime_error("Invalid calendar date: '" + calendar_date + "'");
    }
    return days_from_civil(year, month, day);
}

long long week_index_since_epoch(const std::string& calendar_date) {
    // 1970-01-01 was a Thursday; shifting by 3 makes weeks run Monday to Sunday
    long long shifted_days = days_since_epoch(calendar_date) + 3;
    long long week_index = shifted_days / DAYS_PER_WEEK;
    if (shifted_days < 0 && shifted_days % DAYS_PER_WEEK != 0) {
        week_index -= 1;
    }
    return week_index;
}

std::string calendar_date_from_days(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned day_of_era = static_cast<unsigned>(days - era * 146097);
    const unsigned year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
    const long long year_value = static_cast<long long>(year_of_era) + era * 400;
    const unsigned day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
    const unsigned month_prime = (5 * day_of_year + 2) / 153;
    const unsigned day = day_of_year - (153 * month_prime + 2) / 5 + 1;
    const unsigned month = month_prime < 10 ? month_prime + 3 : month_prime - 9;
    const long long year = year_value + (month <= 2 ? 1 : 0);

    char formatted_date[16];
    std::snprintf(formatted_date, sizeof(formatted_date), "%04lld-%02u-%02u", year, month, day);
    return std::string(formatted_date);
}

} // namespace TimeUtils
