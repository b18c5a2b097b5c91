/**
 * @file timestamp_parser_test.cpp
 * @brief Unit tests for log timestamp parsing and formatting
 */

#include "timestamp_parser.h"
#include <iostream>
#include <chrono>
#include <cassert>

using namespace chatmine;

struct TimestampParserTest {
    void run_all_tests() {
        test_millisecond_format();
        test_fraction_scaling();
        test_seconds_prefix_fallback();
        test_rejects_garbage();
        test_rejects_out_of_range_fields();
        test_fallback_to_now();
        test_formatting();
        test_ordering();
        test_wall_clock_is_not_zone_shifted();
        test_calendar_validation();

        std::cout << "All TimestampParser tests passed." << std::endl;
    }

private:
    static long long millis_of(const TimePoint& tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    void test_millisecond_format() {
        std::cout << "Testing comma-millisecond format... ";

        auto parsed = try_parse_log_timestamp("2024-03-05 14:30:15,123");
        assert(parsed.has_value());
        assert(format_log_timestamp(*parsed) == "2024-03-05 14:30:15");
        assert(millis_of(*parsed) % 1000 == 123);

        std::cout << "PASSED" << std::endl;
    }

    void test_fraction_scaling() {
        std::cout << "Testing fraction scaling... ";

        auto base = try_parse_log_timestamp("2024-03-05 14:30:15,000");
        auto half = try_parse_log_timestamp("2024-03-05 14:30:15,5");
        auto micro = try_parse_log_timestamp("2024-03-05 14:30:15,250000");
        assert(base && half && micro);
        assert(millis_of(*half) - millis_of(*base) == 500);
        assert(millis_of(*micro) - millis_of(*base) == 250);

        std::cout << "PASSED" << std::endl;
    }

    void test_seconds_prefix_fallback() {
        std::cout << "Testing 19-character prefix fallback... ";

        auto with_tail = try_parse_log_timestamp("2024-03-05 14:30:15 INFO some message");
        assert(with_tail.has_value());
        assert(format_log_timestamp(*with_tail) == "2024-03-05 14:30:15");
        assert(millis_of(*with_tail) % 1000 == 0);

        // Broken fraction falls back to whole seconds
        auto broken_fraction = try_parse_log_timestamp("2024-03-05 14:30:15,12x");
        assert(broken_fraction.has_value());
        assert(format_log_timestamp(*broken_fraction) == "2024-03-05 14:30:15");

        auto bare = try_parse_log_timestamp("2024-03-05 14:30:15");
        assert(bare.has_value());

        std::cout << "PASSED" << std::endl;
    }

    void test_rejects_garbage() {
        std::cout << "Testing garbage rejection... ";

        assert(!try_parse_log_timestamp("").has_value());
        assert(!try_parse_log_timestamp("not a timestamp").has_value());
        assert(!try_parse_log_timestamp("2024-03-05T14:30:15,123").has_value());
        assert(!try_parse_log_timestamp("2024-03-05 14:30").has_value());
        assert(!try_parse_log_timestamp(" 2024-03-05 14:30:15,123").has_value());

        std::cout << "PASSED" << std::endl;
    }

    void test_rejects_out_of_range_fields() {
        std::cout << "Testing out-of-range fields... ";

        assert(!try_parse_log_timestamp("2024-13-05 14:30:15,123").has_value());
        assert(!try_parse_log_timestamp("2024-03-00 14:30:15,123").has_value());
        assert(!try_parse_log_timestamp("2024-03-05 24:30:15,123").has_value());
        assert(!try_parse_log_timestamp("2024-03-05 14:60:15").has_value());

        std::cout << "PASSED" << std::endl;
    }

    void test_fallback_to_now() {
        std::cout << "Testing fallback to current time... ";

        auto before = std::chrono::system_clock::now();
        auto parsed = parse_log_timestamp("definitely not a time");
        auto after = std::chrono::system_clock::now();
        assert(parsed >= before);
        assert(parsed <= after);

        std::cout << "PASSED" << std::endl;
    }

    void test_formatting() {
        std::cout << "Testing formatting helpers... ";

        auto parsed = parse_log_timestamp("2023-12-31 23:59:58,999");
        assert(format_log_timestamp(parsed) == "2023-12-31 23:59:58");
        assert(format_clock_time(parsed) == "23:59:58");
        assert(format_compact_timestamp(parsed) == "20231231_235958");

        std::cout << "PASSED" << std::endl;
    }

    void test_ordering() {
        std::cout << "Testing ordering of parsed values... ";

        auto earlier = parse_log_timestamp("2024-01-01 10:00:00,001");
        auto later = parse_log_timestamp("2024-01-01 10:00:00,002");
        auto next_day = parse_log_timestamp("2024-01-02 00:00:00,000");
        assert(earlier < later);
        assert(later < next_day);

        std::cout << "PASSED" << std::endl;
    }

    void test_wall_clock_is_not_zone_shifted() {
        std::cout << "Testing zone-free wall-clock values... ";

        auto epoch = try_parse_log_timestamp("1970-01-01 00:00:00,000");
        assert(epoch.has_value());
        assert(millis_of(*epoch) == 0);

        // 02:30 falls in a US daylight-saving gap; it must still sort before 03:10
        auto in_gap = try_parse_log_timestamp("2024-03-10 02:30:00,000");
        auto after_gap = try_parse_log_timestamp("2024-03-10 03:10:00,000");
        assert(in_gap && after_gap);
        assert(*in_gap < *after_gap);
        assert(millis_of(*after_gap) - millis_of(*in_gap) == 40 * 60 * 1000);
        assert(format_log_timestamp(*in_gap) == "2024-03-10 02:30:00");

        // 01:30 occurs twice when clocks go back; both parse to the same value
        auto repeated = try_parse_log_timestamp("2024-11-03 01:30:00,000");
        auto next = try_parse_log_timestamp("2024-11-03 01:31:00,000");
        assert(repeated && next);
        assert(millis_of(*next) - millis_of(*repeated) == 60 * 1000);

        std::cout << "PASSED" << std::endl;
    }

    void test_calendar_validation() {
        std::cout << "Testing day-of-month validation... ";

        assert(!try_parse_log_timestamp("2024-02-30 10:00:00,000").has_value());
        assert(!try_parse_log_timestamp("2023-02-29 10:00:00,000").has_value());
        assert(!try_parse_log_timestamp("2024-04-31 10:00:00").has_value());
        assert(!try_parse_log_timestamp("1900-02-29 10:00:00").has_value());

        auto leap_day = try_parse_log_timestamp("2024-02-29 10:00:00,000");
        assert(leap_day.has_value());
        assert(format_log_timestamp(*leap_day) == "2024-02-29 10:00:00");
        auto century_leap = try_parse_log_timestamp("2000-02-29 00:00:00");
        assert(century_leap.has_value());

        // An impossible date falls back to now instead of rolling into March
        auto before = std::chrono::system_clock::now();
        auto fallback = parse_log_timestamp("2024-02-30 10:00:00,000");
        assert(fallback >= before);

        std::cout << "PASSED" << std::endl;
    }
};

int main() {
    try {
        TimestampParserTest test;
        test.run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
