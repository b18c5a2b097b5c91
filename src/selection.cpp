#include "selection.h"
#include <vector>

namespace chatmine {

namespace {

// Resolve a 1-based number, filling `error` when it is out of range
template <typename T>
const T* pick(const std::vector<T>& items, size_t number, const char* what, std::string& error) {
    if (number < 1 || number > items.size()) {
        error = "No " + std::string(what) + " " + std::to_string(number) +
                " (1-" + std::to_string(items.size()) + ")";
        return nullptr;
    }
    return &items[number - 1];
}

} // namespace

std::optional<std::string> selection_error(const Selection& selection) {
    if (selection.message && !selection.conversation) {
        return std::string("--message requires --conversation");
    }
    if (selection.document && !selection.message) {
        return std::string("--document requires --message");
    }
    return std::nullopt;
}

ResolvedSelection resolve_selection(const ConversationSet& conversations, const Selection& selection) {
    ResolvedSelection resolved;
    if (auto error = selection_error(selection)) {
        resolved.error = *error;
        return resolved;
    }
    if (!selection.conversation) {
        return resolved;
    }

    const Conversation* conversation =
        pick(conversations.conversations(), *selection.conversation, "conversation", resolved.error);
    if (!conversation) {
        return resolved;
    }
    if (!selection.message) {
        resolved.conversation = conversation;
        return resolved;
    }

    const Message* message = pick(conversation->messages, *selection.message, "message", resolved.error);
    if (!message) {
        return resolved;
    }
    if (!selection.document) {
        resolved.conversation = conversation;
        resolved.message = message;
        return resolved;
    }

    const ContextDocument* document =
        pick(message->context_documents, *selection.document, "document", resolved.error);
    if (!document) {
        return resolved;
    }
    resolved.conversation = conversation;
    resolved.message = message;
    resolved.document = document;
    return resolved;
}

} // namespace chatmine
