#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "chat_record.h"
#include "analyzer_config.h"

namespace chatmine {

enum class HistoryStatus {
    OK,
    NO_PAYLOAD,     // Marker missing, or text after it is neither '[' nor '{'
    UNBALANCED,     // No bracket closes the opening '['
    INVALID_JSON    // Balanced text that nlohmann::json rejects
};

const char* history_status_to_string(HistoryStatus status);

struct HistoryExtraction {
    HistoryStatus status = HistoryStatus::NO_PAYLOAD;
    std::vector<Turn> turns;
    std::string error;

    bool ok() const { return status == HistoryStatus::OK; }
};

/**
 * @brief Recovers the JSON array that follows the history marker in a block
 *
 * The log may wrap the array over several lines and append unrelated text
 * after it, so the array is cut out with a string-aware bracket scan before
 * it is decoded.
 */
class HistoryExtractor {
public:
    explicit HistoryExtractor(const AnalyzerConfig& config);

    /**
     * @brief Decode the turns of one HISTORY block
     *
     * Never throws; failures are reported through the status.
     *
     * @param block_text Raw block text as produced by the BlockSegmenter
     */
    HistoryExtraction extract(std::string_view block_text) const;

    /**
     * @brief Text after the marker, leading whitespace removed, with a '['
     *        prepended when it starts with '{'
     *
     * @return nullopt when there is no marker or no array/object start
     */
    std::optional<std::string> payload(std::string_view block_text) const;

    /**
     * @brief Length of the balanced array at the start of a payload
     *
     * Brackets inside string literals are ignored and a backslash escapes the
     * next character inside a string. Nothing after the closing bracket is
     * looked at.
     *
     * @param payload Text starting with '['
     * @return Index one past the closing ']', or nullopt if depth never
     *         returns to zero
     */
    static std::optional<size_t> balanced_array_length(std::string_view payload);

private:
    std::string marker_;
};

} // namespace chatmine
