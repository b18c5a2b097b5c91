#include "conversation_reconstructor.h"
#include "timestamp_parser.h"
#include <algorithm>
#include <numeric>
#include <boost/container_hash/hash.hpp>
#include <folly/container/F14Map.h>
#include <spdlog/spdlog.h>

namespace chatmine {

namespace {

using PrefixHash = size_t;

struct Claim {
    size_t block;
    TimePoint start_time;
    std::string synthetic_id;
};

bool is_prefix_of(const DecodedBlock& shorter, const DecodedBlock& longer) {
    if (shorter.user_count() > longer.user_count()) {
        return false;
    }
    for (size_t i = 0; i < shorter.user_count(); ++i) {
        if (shorter.user_message(i) != longer.user_message(i)) {
            return false;
        }
    }
    return true;
}

// Entry k hashes user turns [0, k]
std::vector<PrefixHash> prefix_hashes(const DecodedBlock& block) {
    std::vector<PrefixHash> hashes;
    hashes.reserve(block.user_count());
    PrefixHash seed = 0;
    for (size_t i = 0; i < block.user_count(); ++i) {
        boost::hash_combine(seed, block.user_message(i));
        hashes.push_back(seed);
    }
    return hashes;
}

std::string document_key(size_t user_count, const std::string& last_user_message) {
    return std::to_string(user_count) + '\x1f' + last_user_message;
}

/**
 * Claimed conversations of one reconstruct() call.
 *
 * Every prefix of a claimed user-turn list is hashed into prefix_index_, so
 * finding the claim that covers a snapshot is one lookup plus an exact
 * comparison against the few candidates sharing the hash.
 */
class ClaimLedger {
public:
    explicit ClaimLedger(const std::vector<DecodedBlock>& blocks) : blocks_(blocks) {}

    // First claim (in claim order) whose user turns start with the block's
    std::optional<size_t> covering_claim(size_t block_index) const {
        const auto& block = blocks_[block_index];
        auto hashes = prefix_hashes(block);
        auto it = prefix_index_.find(hashes.back());
        if (it == prefix_index_.end()) {
            return std::nullopt;
        }
        for (size_t claim : it->second) {
            if (is_prefix_of(block, blocks_[claims_[claim].block])) {
                return claim;
            }
        }
        return std::nullopt;
    }

    void absorb(size_t claim, size_t block_index) {
        auto& entry = claims_[claim];
        entry.start_time = std::min(entry.start_time, blocks_[block_index].block.timestamp);
    }

    const Claim& claim(size_t block_index) {
        const auto& block = blocks_[block_index];
        const size_t claim_index = claims_.size();

        Claim entry;
        entry.block = block_index;
        entry.start_time = block.block.timestamp;
        entry.synthetic_id = "conv_" + std::to_string(claim_index + 1) + "_" +
                             format_compact_timestamp(block.block.timestamp);
        claims_.push_back(std::move(entry));

        for (PrefixHash hash : prefix_hashes(block)) {
            auto& candidates = prefix_index_[hash];
            // A list can repeat a hash only through a collision
            if (candidates.empty() || candidates.back() != claim_index) {
                candidates.push_back(claim_index);
            }
        }
        return claims_.back();
    }

    std::vector<Claim>& claims() { return claims_; }

private:
    const std::vector<DecodedBlock>& blocks_;
    std::vector<Claim> claims_;
    folly::F14FastMap<PrefixHash, std::vector<size_t>> prefix_index_;
};

std::optional<std::string> response_after(const DecodedBlock& block, size_t user_turn) {
    for (size_t k = block.user_turns[user_turn] + 1; k < block.turns.size(); ++k) {
        if (block.turns[k].role == Role::ASSISTANT) {
            return block.turns[k].content;
        }
    }
    return std::nullopt;
}

} // namespace

ConversationReconstructor::ConversationReconstructor(const AnalyzerConfig& config)
    : config_(config),
      history_extractor_(config),
      document_extractor_(config) {}

std::vector<DecodedBlock> ConversationReconstructor::decode(std::vector<TimestampedBlock> blocks,
                                                            AnalysisReport& report) const {
    std::vector<DecodedBlock> decoded;
    decoded.reserve(blocks.size());
    report.history_blocks = blocks.size();

    for (auto& block : blocks) {
        auto extraction = history_extractor_.extract(block.text);
        if (!extraction.ok()) {
            ++report.skipped_by_status[extraction.status];
            if (extraction.error.empty()) {
                spdlog::debug("Skipping block at line {} ({}): {}", block.line_offset,
                              block.raw_timestamp, history_status_to_string(extraction.status));
            } else {
                spdlog::debug("Skipping block at line {} ({}): {}: {}", block.line_offset,
                              block.raw_timestamp, history_status_to_string(extraction.status),
                              extraction.error);
            }
            continue;
        }
        ++report.decoded_blocks;

        DecodedBlock entry;
        entry.turns = std::move(extraction.turns);
        for (size_t i = 0; i < entry.turns.size(); ++i) {
            if (entry.turns[i].role == Role::USER) {
                entry.user_turns.push_back(i);
            }
        }
        if (entry.user_turns.empty()) {
            ++report.blocks_without_user_turns;
            spdlog::debug("Block at line {} has no user turns", block.line_offset);
            continue;
        }

        entry.block = std::move(block);
        decoded.push_back(std::move(entry));
    }

    return decoded;
}

ConversationSet ConversationReconstructor::reconstruct(const std::vector<DecodedBlock>& blocks,
                                                       AnalysisReport& report) const {
    // Newest first; the later line wins a timestamp tie
    std::vector<size_t> order;
    order.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].user_count() > 0) {
            order.push_back(i);
        }
    }
    std::sort(order.begin(), order.end(), [&blocks](size_t a, size_t b) {
        const auto& lhs = blocks[a].block;
        const auto& rhs = blocks[b].block;
        if (lhs.timestamp != rhs.timestamp) {
            return lhs.timestamp > rhs.timestamp;
        }
        return lhs.line_offset > rhs.line_offset;
    });

    // (user turn count, last user turn) -> newest block with that shape
    folly::F14FastMap<std::string, size_t> document_sources;
    for (size_t index : order) {
        const auto& block = blocks[index];
        document_sources.try_emplace(document_key(block.user_count(), block.last_user_message()), index);
    }
    folly::F14FastMap<size_t, std::vector<ContextDocument>> document_cache;

    auto documents_for = [&](size_t position, const std::string& user_message) {
        auto source = document_sources.find(document_key(position, user_message));
        if (source == document_sources.end()) {
            return std::vector<ContextDocument>();
        }
        auto cached = document_cache.find(source->second);
        if (cached == document_cache.end()) {
            cached = document_cache.emplace(source->second,
                document_extractor_.extract(blocks[source->second].block.text)).first;
        }
        return cached->second;
    };

    ClaimLedger ledger(blocks);
    std::vector<Conversation> built;

    for (size_t index : order) {
        if (auto covering = ledger.covering_claim(index)) {
            ledger.absorb(*covering, index);
            ++report.absorbed_blocks;
            continue;
        }

        const auto& claim = ledger.claim(index);
        const auto& block = blocks[index];

        Conversation conversation;
        conversation.id = claim.synthetic_id;
        conversation.first_message = block.user_message(0);
        conversation.message_count = block.user_count();
        conversation.messages.reserve(block.user_count());

        for (size_t i = 0; i < block.user_count(); ++i) {
            Message message;
            message.timestamp = block.block.timestamp;
            message.user_message = block.user_message(i);
            message.claude_response = response_after(block, i);
            if (!message.claude_response && config_.resolve_late_responses) {
                message.claude_response = find_response_after(blocks, block.block.timestamp,
                                                               message.user_message);
            }
            message.context_documents = documents_for(i + 1, message.user_message);
            conversation.messages.push_back(std::move(message));
        }

        spdlog::debug("Claimed {}: {} user turns, captured {}", claim.synthetic_id,
                      block.user_count(), block.block.raw_timestamp);
        built.push_back(std::move(conversation));
    }

    // Renumber by start time
    auto& claims = ledger.claims();
    for (size_t i = 0; i < claims.size(); ++i) {
        built[i].start_time = claims[i].start_time;
    }
    std::vector<size_t> by_start(built.size());
    std::iota(by_start.begin(), by_start.end(), 0);
    std::sort(by_start.begin(), by_start.end(), [&](size_t a, size_t b) {
        if (claims[a].start_time != claims[b].start_time) {
            return claims[a].start_time < claims[b].start_time;
        }
        return blocks[claims[a].block].block.line_offset < blocks[claims[b].block].block.line_offset;
    });

    std::vector<Conversation> ordered;
    ordered.reserve(built.size());
    for (size_t position = 0; position < by_start.size(); ++position) {
        Conversation conversation = std::move(built[by_start[position]]);
        conversation.id = "conversation_" + std::to_string(position + 1);
        ordered.push_back(std::move(conversation));
    }

    report.conversations = ordered.size();
    return ConversationSet(std::move(ordered));
}

std::optional<std::string> ConversationReconstructor::find_response_after(const std::vector<DecodedBlock>& blocks,
                                                                          const TimePoint& after,
                                                                          const std::string& user_message) {
    std::vector<const DecodedBlock*> in_log_order;
    in_log_order.reserve(blocks.size());
    for (const auto& block : blocks) {
        if (block.block.timestamp > after) {
            in_log_order.push_back(&block);
        }
    }
    std::sort(in_log_order.begin(), in_log_order.end(), [](const DecodedBlock* a, const DecodedBlock* b) {
        return a->block.line_offset < b->block.line_offset;
    });

    for (const DecodedBlock* block : in_log_order) {
        for (size_t u = 0; u < block->user_count(); ++u) {
            if (block->user_message(u) != user_message) {
                continue;
            }
            for (size_t k = block->user_turns[u] + 1; k < block->turns.size(); ++k) {
                const auto& turn = block->turns[k];
                if (turn.role == Role::ASSISTANT && !turn.content.empty()) {
                    return turn.content;
                }
            }
        }
    }
    return std::nullopt;
}

} // namespace chatmine
