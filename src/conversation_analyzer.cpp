#include "conversation_analyzer.h"
#include "log_source.h"
#include <spdlog/spdlog.h>

namespace chatmine {

const char* analysis_status_to_string(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::OK: return "ok";
        case AnalysisStatus::NO_CONVERSATIONS: return "no conversations found";
        case AnalysisStatus::FILE_NOT_FOUND: return "file not found";
    }
    return "unknown";
}

ConversationAnalyzer::ConversationAnalyzer(AnalyzerConfig config)
    : config_(std::move(config)),
      segmenter_(config_),
      reconstructor_(config_) {}

void ConversationAnalyzer::reset() {
    conversations_ = ConversationSet();
    report_ = AnalysisReport();
}

AnalysisStatus ConversationAnalyzer::analyze(const std::string& log_path) {
    spdlog::info("Analyzing log file: {}", log_path);

    auto text = read_log_text(log_path, config_);
    if (!text) {
        reset();
        return AnalysisStatus::FILE_NOT_FOUND;
    }
    return analyze_text(*text);
}

AnalysisStatus ConversationAnalyzer::analyze_text(std::string_view log_text) {
    reset();

    auto segmentation = segmenter_.segment(log_text);
    report_.total_lines = segmentation.total_lines;
    report_.untimed_marker_lines = segmentation.untimed_marker_lines;
    spdlog::info("Log has {} lines, {} history blocks", report_.total_lines, segmentation.blocks.size());

    auto blocks = reconstructor_.decode(std::move(segmentation.blocks), report_);
    conversations_ = reconstructor_.reconstruct(blocks, report_);

    if (report_.skipped_blocks() > 0) {
        spdlog::info("Skipped {} undecodable history blocks", report_.skipped_blocks());
        for (const auto& [status, count] : report_.skipped_by_status) {
            spdlog::debug("  {}: {}", history_status_to_string(status), count);
        }
    }
    spdlog::info("Analysis finished: {} conversations ({} snapshots absorbed)",
                 report_.conversations, report_.absorbed_blocks);

    return conversations_.empty() ? AnalysisStatus::NO_CONVERSATIONS : AnalysisStatus::OK;
}

} // namespace chatmine
