#pragma once

#include <string>
#include <optional>
#include <cstddef>
#include "conversation_set.h"

namespace chatmine {

/**
 * @brief 1-based command line selection of a conversation, message and document
 */
struct Selection {
    std::optional<size_t> conversation;
    std::optional<size_t> message;
    std::optional<size_t> document;

    bool empty() const { return !conversation && !message && !document; }
};

/**
 * @brief Check that a selection does not skip a level
 *
 * @return Usage error text, or nullopt if the selection is consistent
 */
std::optional<std::string> selection_error(const Selection& selection);

/**
 * @brief Items a consistent selection points at
 *
 * Members past the deepest selected level stay null. `error` is set and
 * the remaining members are null when a number is out of range.
 */
struct ResolvedSelection {
    const Conversation* conversation = nullptr;
    const Message* message = nullptr;
    const ContextDocument* document = nullptr;
    std::string error;
};

ResolvedSelection resolve_selection(const ConversationSet& conversations, const Selection& selection);

} // namespace chatmine
