#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "analyzer_config.h"
#include "block_segmenter.h"
#include "conversation_reconstructor.h"
#include "conversation_set.h"

namespace chatmine {

enum class AnalysisStatus {
    OK,
    NO_CONVERSATIONS,
    FILE_NOT_FOUND
};

const char* analysis_status_to_string(AnalysisStatus status);

/**
 * @brief Runs the full pipeline over one log snapshot
 *
 * segment -> decode -> reconstruct. Each call to analyze() or analyze_text()
 * discards the previous result; nothing is merged across passes.
 */
class ConversationAnalyzer {
public:
    explicit ConversationAnalyzer(AnalyzerConfig config = AnalyzerConfig());

    /**
     * @brief Analyze a log file
     *
     * @param log_path Path to the log file
     * @return FILE_NOT_FOUND if the file is missing or unreadable (the
     *         previous result is cleared), NO_CONVERSATIONS if nothing
     *         survived reconstruction, OK otherwise
     */
    AnalysisStatus analyze(const std::string& log_path);

    // Same as analyze() on text already in memory
    AnalysisStatus analyze_text(std::string_view log_text);

    const ConversationSet& conversations() const { return conversations_; }
    const AnalysisReport& report() const { return report_; }
    const AnalyzerConfig& config() const { return config_; }

private:
    void reset();

    AnalyzerConfig config_;
    BlockSegmenter segmenter_;
    ConversationReconstructor reconstructor_;

    ConversationSet conversations_;
    AnalysisReport report_;
};

} // namespace chatmine
