#pragma once

#include <string>
#include <vector>
#include <optional>
#include <folly/container/F14Map.h>
#include "chat_record.h"

namespace chatmine {

/**
 * @brief Read-only result of one analysis pass
 *
 * Conversations are kept in start-time order and indexed by id
 * ("conversation_1", "conversation_2", ...). Message and document indexes
 * are 0-based.
 */
class ConversationSet {
public:
    ConversationSet() = default;

    /**
     * @param conversations Conversations already ordered by start time
     */
    explicit ConversationSet(std::vector<Conversation> conversations);

    const std::vector<Conversation>& conversations() const { return conversations_; }
    size_t size() const { return conversations_.size(); }
    bool empty() const { return conversations_.empty(); }

    /**
     * @brief Look up a conversation by id
     * @return nullptr if no conversation has that id
     */
    const Conversation* find(const std::string& id) const;

    // nullptr if index is out of range
    const Conversation* at(size_t index) const;

    const std::vector<Message>* messages(const std::string& id) const;

    const Message* message(const std::string& id, size_t message_index) const;

    const std::vector<ContextDocument>* context_documents(const std::string& id, size_t message_index) const;

    /**
     * @brief Content of one context document
     * @return nullopt if the conversation, message or document does not exist
     */
    std::optional<std::string> document_content(const std::string& id,
                                                size_t message_index,
                                                size_t document_index) const;

private:
    std::vector<Conversation> conversations_;
    folly::F14FastMap<std::string, size_t> index_;
};

} // namespace chatmine
