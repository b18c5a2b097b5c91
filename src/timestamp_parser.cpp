#include "timestamp_parser.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace chatmine {

namespace {
    const std::regex millis_regex{
        R"(^(\d{4})-(\d{2})-(\d{2}) (\d{2}):(\d{2}):(\d{2}),(\d{1,6})$)"};
    const std::regex seconds_regex{
        R"(^(\d{4})-(\d{2})-(\d{2}) (\d{2}):(\d{2}):(\d{2})$)"};

    bool is_leap_year(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int days_in_month(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return month == 2 && is_leap_year(year) ? 29 : days[month - 1];
    }

    // Days since 1970-01-01 in the proleptic Gregorian calendar
    long long days_from_civil(int year, int month, int day) {
        year -= month <= 2 ? 1 : 0;
        const long long era = (year >= 0 ? year : year - 399) / 400;
        const long long year_of_era = year - era * 400;
        const long long day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const long long day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
        return era * 146097 + day_of_era - 719468;
    }

    std::optional<TimePoint> to_time_point(const std::smatch& match) {
        const int year = std::stoi(match[1]);
        const int month = std::stoi(match[2]);
        const int day = std::stoi(match[3]);
        const int hour = std::stoi(match[4]);
        const int minute = std::stoi(match[5]);
        const int second = std::stoi(match[6]);

        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
            hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }

        // Log times carry no zone; they are kept as naive wall-clock values
        const long long seconds = days_from_civil(year, month, day) * 86400LL +
                                  hour * 3600LL + minute * 60LL + second;
        return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(seconds)));
    }

    std::tm to_naive_tm(const TimePoint& time_point) {
        std::time_t time_t = std::chrono::system_clock::to_time_t(time_point);
        std::tm tm = {};
#ifdef _WIN32
        gmtime_s(&tm, &time_t);
#else
        gmtime_r(&time_t, &tm);
#endif
        return tm;
    }

    std::string format_naive(const TimePoint& time_point, const char* format) {
        std::tm tm = to_naive_tm(time_point);
        std::stringstream ss;
        ss << std::put_time(&tm, format);
        return ss.str();
    }
}

std::optional<TimePoint> try_parse_log_timestamp(const std::string& timestamp) {
    std::smatch match;
    if (std::regex_match(timestamp, match, millis_regex)) {
        auto time_point = to_time_point(match);
        if (time_point) {
            // ",123" is 123 ms, ",5" is 500 ms
            std::string micros = match[7].str() + std::string(6 - match[7].length(), '0');
            *time_point += std::chrono::microseconds(std::stoi(micros));
            return time_point;
        }
    }

    if (timestamp.size() >= 19) {
        const std::string head = timestamp.substr(0, 19);
        if (std::regex_match(head, match, seconds_regex)) {
            return to_time_point(match);
        }
    }

    return std::nullopt;
}

TimePoint parse_log_timestamp(const std::string& timestamp) {
    auto parsed = try_parse_log_timestamp(timestamp);
    if (!parsed) {
        spdlog::debug("Unparseable timestamp '{}', using current time", timestamp);
        return std::chrono::system_clock::now();
    }
    return *parsed;
}

std::string format_log_timestamp(const TimePoint& time_point) {
    return format_naive(time_point, "%Y-%m-%d %H:%M:%S");
}

std::string format_clock_time(const TimePoint& time_point) {
    return format_naive(time_point, "%H:%M:%S");
}

std::string format_compact_timestamp(const TimePoint& time_point) {
    return format_naive(time_point, "%Y%m%d_%H%M%S");
}

} // namespace chatmine
