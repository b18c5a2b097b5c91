#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include <optional>
#include "conversation_set.h"
#include "conversation_printer.h"

namespace chatmine {

/**
 * @brief Line-oriented interactive browser over a ConversationSet
 *
 * Navigation is an explicit stack of views (overview, conversation,
 * message, document). "n" on a message view replaces the current frame
 * rather than pushing a new one, so "b" always returns to the conversation.
 * End of input ends the session.
 */
class ConversationExplorer {
public:
    ConversationExplorer(const ConversationSet& conversations,
                         const ConversationPrinter& printer,
                         std::istream& in,
                         std::ostream& out);

    void run();

private:
    enum class View {
        OVERVIEW,
        CONVERSATION,
        MESSAGE,
        DOCUMENT
    };

    struct Frame {
        View view = View::OVERVIEW;
        size_t conversation = 0;
        size_t message = 0;
        size_t document = 0;
    };

    // Prompt and read one trimmed line; nullopt on end of input
    std::optional<std::string> ask(const std::string& prompt);

    // 1-based selection in [1, count] turned into a 0-based index
    static std::optional<size_t> parse_selection(const std::string& input, size_t count);

    bool show_overview(std::vector<Frame>& stack);
    bool show_conversation(std::vector<Frame>& stack);
    bool show_message(std::vector<Frame>& stack);
    bool show_document(std::vector<Frame>& stack);

    const ConversationSet& conversations_;
    const ConversationPrinter& printer_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace chatmine
