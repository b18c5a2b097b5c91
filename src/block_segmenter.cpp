#include "block_segmenter.h"
#include "timestamp_parser.h"
#include <regex>
#include <folly/String.h>
#include <spdlog/spdlog.h>

namespace chatmine {

namespace {
    const std::regex entry_start_regex{R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})"};
    const std::regex history_timestamp_regex{R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3})"};
}

BlockSegmenter::BlockSegmenter(const AnalyzerConfig& config)
    : marker_(config.history_marker) {}

bool BlockSegmenter::starts_with_timestamp(std::string_view line) {
    std::cmatch match;
    return std::regex_search(line.data(), line.data() + line.size(), match,
                             entry_start_regex, std::regex_constants::match_continuous);
}

std::string BlockSegmenter::leading_timestamp(std::string_view line) {
    std::cmatch match;
    if (std::regex_search(line.data(), line.data() + line.size(), match,
                          history_timestamp_regex, std::regex_constants::match_continuous)) {
        return match.str(0);
    }
    return std::string();
}

SegmentationResult BlockSegmenter::segment(std::string_view log_text) const {
    SegmentationResult result;

    std::vector<std::string_view> lines;
    folly::split('\n', log_text, lines);
    result.total_lines = lines.size();

    size_t i = 0;
    while (i < lines.size()) {
        const auto line = lines[i];
        if (line.find(marker_) == std::string_view::npos) {
            ++i;
            continue;
        }

        std::string raw_timestamp = leading_timestamp(line);
        if (raw_timestamp.empty()) {
            spdlog::debug("Line {}: history marker without timestamp, skipped", i);
            ++result.untimed_marker_lines;
            ++i;
            continue;
        }

        TimestampedBlock block;
        block.raw_timestamp = raw_timestamp;
        block.timestamp = parse_log_timestamp(raw_timestamp);
        block.line_offset = i;
        block.text.assign(line.data(), line.size());

        size_t j = i + 1;
        while (j < lines.size() && !starts_with_timestamp(lines[j])) {
            block.text.push_back('\n');
            block.text.append(lines[j].data(), lines[j].size());
            ++j;
        }

        result.blocks.push_back(std::move(block));
        // lines[j] opens the next entry and is examined on the next iteration
        i = j;
    }

    spdlog::debug("Segmented {} lines into {} history blocks", result.total_lines, result.blocks.size());
    return result;
}

} // namespace chatmine
