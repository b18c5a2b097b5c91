#include "conversation_explorer.h"
#include <algorithm>
#include <cctype>
#include <boost/algorithm/string.hpp>

namespace chatmine {

ConversationExplorer::ConversationExplorer(const ConversationSet& conversations,
                                           const ConversationPrinter& printer,
                                           std::istream& in,
                                           std::ostream& out)
    : conversations_(conversations), printer_(printer), in_(in), out_(out) {}

std::optional<std::string> ConversationExplorer::ask(const std::string& prompt) {
    out_ << "\n" << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return std::nullopt;
    }
    boost::algorithm::trim(line);
    return line;
}

std::optional<size_t> ConversationExplorer::parse_selection(const std::string& input, size_t count) {
    if (input.empty() || input.size() > 9 ||
        !std::all_of(input.begin(), input.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    size_t value = std::stoul(input);
    if (value < 1 || value > count) {
        return std::nullopt;
    }
    return value - 1;
}

void ConversationExplorer::run() {
    std::vector<Frame> stack{Frame{}};

    while (!stack.empty()) {
        bool keep_going = true;
        switch (stack.back().view) {
            case View::OVERVIEW:
                keep_going = show_overview(stack);
                break;
            case View::CONVERSATION:
                keep_going = show_conversation(stack);
                break;
            case View::MESSAGE:
                keep_going = show_message(stack);
                break;
            case View::DOCUMENT:
                keep_going = show_document(stack);
                break;
        }
        if (!keep_going) {
            return;
        }
    }
}

bool ConversationExplorer::show_overview(std::vector<Frame>& stack) {
    printer_.print_overview(out_, conversations_);
    if (conversations_.empty()) {
        return false;
    }

    auto choice = ask("Select conversation (number) or 'q' to quit: ");
    if (!choice || boost::algorithm::iequals(*choice, "q")) {
        return false;
    }

    auto index = parse_selection(*choice, conversations_.size());
    if (!index) {
        out_ << "Invalid selection.\n";
        return true;
    }

    Frame frame;
    frame.view = View::CONVERSATION;
    frame.conversation = *index;
    stack.push_back(frame);
    return true;
}

bool ConversationExplorer::show_conversation(std::vector<Frame>& stack) {
    const Frame frame = stack.back();
    const Conversation* conversation = conversations_.at(frame.conversation);
    printer_.print_conversation(out_, *conversation);

    auto choice = ask("Select message (number), 'b' to go back: ");
    if (!choice) {
        return false;
    }
    if (boost::algorithm::iequals(*choice, "b")) {
        stack.pop_back();
        return true;
    }

    auto index = parse_selection(*choice, conversation->messages.size());
    if (!index) {
        out_ << "Invalid selection.\n";
        return true;
    }

    Frame next = frame;
    next.view = View::MESSAGE;
    next.message = *index;
    stack.push_back(next);
    return true;
}

bool ConversationExplorer::show_message(std::vector<Frame>& stack) {
    Frame& frame = stack.back();
    const Conversation* conversation = conversations_.at(frame.conversation);
    const Message& message = conversation->messages[frame.message];
    printer_.print_message(out_, message);

    const bool has_documents = !message.context_documents.empty();
    const bool has_next = frame.message + 1 < conversation->messages.size();

    if (!has_documents && !has_next) {
        if (!ask("Press Enter to return...")) {
            return false;
        }
        stack.pop_back();
        return true;
    }

    std::vector<std::string> parts;
    if (has_documents) {
        parts.push_back("Select document (number)");
    }
    if (has_next) {
        parts.push_back("'n' for next message");
    }
    parts.push_back("'b' to go back");

    auto choice = ask(boost::algorithm::join(parts, ", ") + ": ");
    if (!choice) {
        return false;
    }

    if (boost::algorithm::iequals(*choice, "b")) {
        stack.pop_back();
    } else if (boost::algorithm::iequals(*choice, "n") && has_next) {
        ++frame.message;
    } else if (auto index = parse_selection(*choice, message.context_documents.size())) {
        Frame next = frame;
        next.view = View::DOCUMENT;
        next.document = *index;
        stack.push_back(next);
    } else {
        out_ << "Invalid input.\n";
    }
    return true;
}

bool ConversationExplorer::show_document(std::vector<Frame>& stack) {
    const Frame frame = stack.back();
    const Conversation* conversation = conversations_.at(frame.conversation);
    const auto& document = conversation->messages[frame.message].context_documents[frame.document];
    printer_.print_document(out_, document);

    if (!ask("Press Enter to return...")) {
        return false;
    }
    stack.pop_back();
    return true;
}

} // namespace chatmine
