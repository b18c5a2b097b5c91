#pragma once

#include <ostream>
#include <string>
#include "chat_record.h"
#include "conversation_set.h"

namespace chatmine {

/**
 * @brief Console rendering of a ConversationSet
 *
 * Pure formatting, no state besides the sentinel used for missing replies.
 */
class ConversationPrinter {
public:
    explicit ConversationPrinter(std::string missing_response_text);

    // Numbered list of all conversations, oldest first
    void print_overview(std::ostream& out, const ConversationSet& conversations) const;

    void print_conversation(std::ostream& out, const Conversation& conversation) const;

    void print_message(std::ostream& out, const Message& message) const;

    void print_document(std::ostream& out, const ContextDocument& document) const;

    /**
     * @brief Cut text to at most max_chars UTF-8 characters
     *
     * Appends "..." only when something was cut.
     */
    static std::string truncate(const std::string& text, size_t max_chars);

private:
    std::string missing_response_text_;
};

} // namespace chatmine
