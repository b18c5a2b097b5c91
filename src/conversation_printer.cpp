#include "conversation_printer.h"
#include "timestamp_parser.h"
#include <iomanip>

namespace chatmine {

namespace {

const std::string HEAVY_RULE(80, '=');
const std::string LIGHT_RULE(60, '-');

void print_banner(std::ostream& out, const std::string& title) {
    out << "\n" << HEAVY_RULE << "\n" << title << "\n" << HEAVY_RULE << "\n";
}

} // namespace

ConversationPrinter::ConversationPrinter(std::string missing_response_text)
    : missing_response_text_(std::move(missing_response_text)) {}

std::string ConversationPrinter::truncate(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        // Count lead bytes only
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return text.substr(0, i) + "...";
            }
            ++chars;
        }
    }
    return text;
}

void ConversationPrinter::print_overview(std::ostream& out, const ConversationSet& conversations) const {
    print_banner(out, "CONVERSATIONS OVERVIEW");

    if (conversations.empty()) {
        out << "No conversations found.\n";
        return;
    }

    size_t number = 1;
    for (const auto& conversation : conversations.conversations()) {
        out << std::setw(2) << number++ << ". [" << format_log_timestamp(conversation.start_time) << "] ("
            << conversation.message_count << (conversation.message_count == 1 ? " message" : " messages") << ")\n";
        out << "    First message: " << truncate(conversation.first_message, 80) << "\n";
        out << "    ID: " << conversation.id << "\n\n";
    }
}

void ConversationPrinter::print_conversation(std::ostream& out, const Conversation& conversation) const {
    print_banner(out, "CONVERSATION DETAILS - " + conversation.id);
    out << "Start: " << format_log_timestamp(conversation.start_time) << "\n";
    out << "Messages: " << conversation.message_count << "\n\n";

    size_t number = 1;
    for (const auto& message : conversation.messages) {
        out << std::setw(2) << number++ << ". [" << format_clock_time(message.timestamp) << "] USER:\n";
        out << "    " << message.user_message << "\n";
        if (!message.context_documents.empty()) {
            out << "    Context documents: " << message.context_documents.size() << "\n";
            for (const auto& document : message.context_documents) {
                out << "      - " << document.title << " (ID: " << document.id << ")\n";
            }
        }
        out << LIGHT_RULE << "\n";
    }
}

void ConversationPrinter::print_message(std::ostream& out, const Message& message) const {
    print_banner(out, "MESSAGE CONTEXT");
    out << "Time: " << format_log_timestamp(message.timestamp) << "\n";
    out << "User: " << message.user_message << "\n";
    out << "Assistant: " << message.response_or(missing_response_text_) << "\n\n";

    if (message.context_documents.empty()) {
        out << "No context documents found.\n";
        return;
    }

    out << "Context documents (" << message.context_documents.size() << "):\n";
    size_t number = 1;
    for (const auto& document : message.context_documents) {
        out << std::setw(2) << number++ << ". " << document.title << " (ID: " << document.id << ")\n";
    }
}

void ConversationPrinter::print_document(std::ostream& out, const ContextDocument& document) const {
    print_banner(out, "DOCUMENT: " + document.title);
    out << "ID: " << document.id << "\n\n";
    out << document.content << "\n";
}

} // namespace chatmine
