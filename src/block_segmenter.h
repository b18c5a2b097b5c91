#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "chat_record.h"
#include "analyzer_config.h"

namespace chatmine {

struct SegmentationResult {
    std::vector<TimestampedBlock> blocks;
    size_t total_lines = 0;
    // Marker lines without a leading "YYYY-MM-DD HH:MM:SS,fff"
    size_t untimed_marker_lines = 0;
};

/**
 * @brief Cuts HISTORY entries out of a raw log
 *
 * A block starts at a line containing the history marker and a leading
 * millisecond timestamp, and runs up to (not including) the next line that
 * starts with "YYYY-MM-DD HH:MM:SS", or to the end of the text. Every other
 * line is dropped.
 */
class BlockSegmenter {
public:
    explicit BlockSegmenter(const AnalyzerConfig& config);

    SegmentationResult segment(std::string_view log_text) const;

    // True if the line begins with "YYYY-MM-DD HH:MM:SS"
    static bool starts_with_timestamp(std::string_view line);

    // Leading "YYYY-MM-DD HH:MM:SS,fff" of the line, empty if absent
    static std::string leading_timestamp(std::string_view line);

private:
    std::string marker_;
};

} // namespace chatmine
