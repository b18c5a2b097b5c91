#include "conversation_set.h"

namespace chatmine {

ConversationSet::ConversationSet(std::vector<Conversation> conversations)
    : conversations_(std::move(conversations)) {
    index_.reserve(conversations_.size());
    for (size_t i = 0; i < conversations_.size(); ++i) {
        index_.emplace(conversations_[i].id, i);
    }
}

const Conversation* ConversationSet::find(const std::string& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &conversations_[it->second] : nullptr;
}

const Conversation* ConversationSet::at(size_t index) const {
    return index < conversations_.size() ? &conversations_[index] : nullptr;
}

const std::vector<Message>* ConversationSet::messages(const std::string& id) const {
    const Conversation* conversation = find(id);
    return conversation ? &conversation->messages : nullptr;
}

const Message* ConversationSet::message(const std::string& id, size_t message_index) const {
    const auto* list = messages(id);
    if (!list || message_index >= list->size()) {
        return nullptr;
    }
    return &(*list)[message_index];
}

const std::vector<ContextDocument>* ConversationSet::context_documents(const std::string& id,
                                                                       size_t message_index) const {
    const Message* msg = message(id, message_index);
    return msg ? &msg->context_documents : nullptr;
}

std::optional<std::string> ConversationSet::document_content(const std::string& id,
                                                             size_t message_index,
                                                             size_t document_index) const {
    const auto* documents = context_documents(id, message_index);
    if (!documents || document_index >= documents->size()) {
        return std::nullopt;
    }
    return (*documents)[document_index].content;
}

} // namespace chatmine
