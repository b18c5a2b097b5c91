#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include "chat_record.h"
#include "analyzer_config.h"
#include "conversation_set.h"
#include "history_extractor.h"
#include "context_document_extractor.h"

namespace chatmine {

/**
 * @brief A HISTORY block whose JSON array decoded successfully
 */
struct DecodedBlock {
    TimestampedBlock block;
    std::vector<Turn> turns;
    // Positions of the user turns inside `turns`
    std::vector<size_t> user_turns;

    size_t user_count() const { return user_turns.size(); }
    const std::string& user_message(size_t i) const { return turns[user_turns[i]].content; }
    const std::string& last_user_message() const { return user_message(user_turns.size() - 1); }
};

struct AnalysisReport {
    size_t total_lines = 0;
    size_t history_blocks = 0;
    size_t untimed_marker_lines = 0;
    size_t decoded_blocks = 0;
    std::map<HistoryStatus, size_t> skipped_by_status;
    size_t blocks_without_user_turns = 0;
    size_t absorbed_blocks = 0;
    size_t conversations = 0;

    size_t skipped_blocks() const {
        size_t total = 0;
        for (const auto& [status, count] : skipped_by_status) {
            total += count;
        }
        return total;
    }
};

/**
 * @brief Merges overlapping HISTORY snapshots into distinct conversations
 *
 * Every conversation shows up in the log as a growing series of snapshots,
 * each one extending the previous. Walking the snapshots newest first, a
 * snapshot whose user turns are a prefix of an already claimed conversation
 * is absorbed into it; any other snapshot claims a new conversation.
 *
 * Ordering: newest means later timestamp, and for equal timestamps the
 * later line offset.
 */
class ConversationReconstructor {
public:
    explicit ConversationReconstructor(const AnalyzerConfig& config);

    /**
     * @brief Decode every block, dropping those that fail or hold no user turn
     *
     * Failures are counted in the report and never abort the pass.
     */
    std::vector<DecodedBlock> decode(std::vector<TimestampedBlock> blocks, AnalysisReport& report) const;

    /**
     * @brief Build the conversation set from decoded blocks
     *
     * Conversations are numbered conversation_1..N by start time.
     */
    ConversationSet reconstruct(const std::vector<DecodedBlock>& blocks, AnalysisReport& report) const;

    /**
     * @brief Find a reply to a user message in blocks captured after a given time
     *
     * Blocks are searched in log order. Within a block, every user turn whose
     * text equals the message is tried, and the first non-empty assistant
     * turn after it is returned.
     *
     * @return The reply, or nullopt if no later block holds one
     */
    static std::optional<std::string> find_response_after(const std::vector<DecodedBlock>& blocks,
                                                          const TimePoint& after,
                                                          const std::string& user_message);

private:
    AnalyzerConfig config_;
    HistoryExtractor history_extractor_;
    ContextDocumentExtractor document_extractor_;
};

} // namespace chatmine
