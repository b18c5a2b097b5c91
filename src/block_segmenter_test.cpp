/**
 * @file block_segmenter_test.cpp
 * @brief Unit tests for HISTORY block segmentation
 */

#include "block_segmenter.h"
#include "timestamp_parser.h"
#include <iostream>
#include <string>
#include <cassert>

using namespace chatmine;

struct BlockSegmenterTest {
    void run_all_tests() {
        test_basic_segmentation();
        test_untimed_marker_is_skipped();
        test_block_runs_to_end_of_file();
        test_adjacent_history_lines();
        test_timestamp_without_millis_ends_block();
        test_custom_marker();
        test_empty_input();
        test_starts_with_timestamp();

        std::cout << "All BlockSegmenter tests passed." << std::endl;
    }

private:
    AnalyzerConfig config_;

    void test_basic_segmentation() {
        std::cout << "Testing basic segmentation... ";

        const std::string log =
            "2024-01-01 10:00:00,000 INFO startup\n"
            "2024-01-01 10:00:01,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"hi\"}]\n"
            "continuation line\n"
            "2024-01-01 10:00:02,000 INFO other entry\n"
            "noise that belongs to the other entry";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment(log);

        assert(result.total_lines == 5);
        assert(result.blocks.size() == 1);
        const auto& block = result.blocks[0];
        assert(block.line_offset == 1);
        assert(block.raw_timestamp == "2024-01-01 10:00:01,000");
        assert(format_log_timestamp(block.timestamp) == "2024-01-01 10:00:01");
        assert(block.text ==
               "2024-01-01 10:00:01,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"hi\"}]\n"
               "continuation line");

        std::cout << "PASSED" << std::endl;
    }

    void test_untimed_marker_is_skipped() {
        std::cout << "Testing marker line without timestamp... ";

        const std::string log =
            "[HISTORY][{\"role\":\"user\",\"content\":\"orphan\"}]\n"
            "2024-01-01 10:00:05,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"timed\"}]\n";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment(log);

        assert(result.untimed_marker_lines == 1);
        assert(result.blocks.size() == 1);
        assert(result.blocks[0].line_offset == 1);
        assert(result.blocks[0].text.find("timed") != std::string::npos);
        assert(result.blocks[0].text.find("orphan") == std::string::npos);

        std::cout << "PASSED" << std::endl;
    }

    void test_block_runs_to_end_of_file() {
        std::cout << "Testing block extending to end of file... ";

        const std::string log =
            "2024-01-01 10:00:03,500 INFO [HISTORY][{\"role\":\"user\",\"content\":\"a\"},\n"
            "  {\"role\":\"assistant\",\"content\":\"b\"}]\n"
            "trailing garbage";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment(log);

        assert(result.blocks.size() == 1);
        assert(result.blocks[0].text ==
               "2024-01-01 10:00:03,500 INFO [HISTORY][{\"role\":\"user\",\"content\":\"a\"},\n"
               "  {\"role\":\"assistant\",\"content\":\"b\"}]\n"
               "trailing garbage");

        std::cout << "PASSED" << std::endl;
    }

    void test_adjacent_history_lines() {
        std::cout << "Testing adjacent history lines... ";

        const std::string log =
            "2024-01-01 10:00:01,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"one\"}]\n"
            "2024-01-01 10:00:02,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"two\"}]\n";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment(log);

        assert(result.blocks.size() == 2);
        assert(result.blocks[0].line_offset == 0);
        assert(result.blocks[1].line_offset == 1);
        assert(result.blocks[0].text.find("two") == std::string::npos);
        assert(result.blocks[1].raw_timestamp == "2024-01-01 10:00:02,000");

        std::cout << "PASSED" << std::endl;
    }

    void test_timestamp_without_millis_ends_block() {
        std::cout << "Testing entry start without milliseconds... ";

        const std::string log =
            "2024-01-01 10:00:01,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"one\"}]\n"
            "2024-01-01 10:00:02 plain entry\n"
            "2024-01-01 10:00:03 INFO [HISTORY][{\"role\":\"user\",\"content\":\"no millis\"}]\n";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment(log);

        assert(result.blocks.size() == 1);
        assert(result.blocks[0].text.find("plain entry") == std::string::npos);
        // A history line needs the millisecond timestamp to open a block
        assert(result.untimed_marker_lines == 1);

        std::cout << "PASSED" << std::endl;
    }

    void test_custom_marker() {
        std::cout << "Testing configurable marker... ";

        AnalyzerConfig config;
        config.history_marker = "<<HIST>>";
        const std::string log =
            "2024-01-01 10:00:01,000 INFO [HISTORY][{\"role\":\"user\",\"content\":\"default\"}]\n"
            "2024-01-01 10:00:02,000 INFO <<HIST>>[{\"role\":\"user\",\"content\":\"custom\"}]\n";

        BlockSegmenter segmenter(config);
        auto result = segmenter.segment(log);

        assert(result.blocks.size() == 1);
        assert(result.blocks[0].line_offset == 1);

        std::cout << "PASSED" << std::endl;
    }

    void test_empty_input() {
        std::cout << "Testing empty input... ";

        BlockSegmenter segmenter(config_);
        auto result = segmenter.segment("");
        assert(result.blocks.empty());
        assert(result.untimed_marker_lines == 0);

        std::cout << "PASSED" << std::endl;
    }

    void test_starts_with_timestamp() {
        std::cout << "Testing entry start detection... ";

        assert(BlockSegmenter::starts_with_timestamp("2024-01-01 10:00:00 x"));
        assert(BlockSegmenter::starts_with_timestamp("2024-01-01 10:00:00,123 x"));
        assert(!BlockSegmenter::starts_with_timestamp(" 2024-01-01 10:00:00"));
        assert(!BlockSegmenter::starts_with_timestamp("x 2024-01-01 10:00:00"));
        assert(!BlockSegmenter::starts_with_timestamp("2024-01-01"));
        assert(BlockSegmenter::leading_timestamp("2024-01-01 10:00:00,123 INFO") == "2024-01-01 10:00:00,123");
        assert(BlockSegmenter::leading_timestamp("2024-01-01 10:00:00 INFO").empty());

        std::cout << "PASSED" << std::endl;
    }
};

int main() {
    try {
        BlockSegmenterTest test;
        test.run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
