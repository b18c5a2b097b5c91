#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstddef>

namespace chatmine {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Raw HISTORY entry cut out of the log by the BlockSegmenter
 */
struct TimestampedBlock {
    TimePoint timestamp;
    std::string raw_timestamp;
    std::string text;
    size_t line_offset = 0;
};

enum class Role {
    USER,
    ASSISTANT,
    SYSTEM,
    OTHER
};

Role role_from_string(const std::string& role);
const char* role_to_string(Role role);

/**
 * @brief One role-tagged element of a HISTORY array
 */
struct Turn {
    Role role = Role::OTHER;
    std::string content;
};

struct ContextDocument {
    std::string id;
    std::string title;
    std::string content;
};

class Message {
public:
    TimePoint timestamp;
    std::string user_message;
    std::optional<std::string> claude_response;
    std::vector<ContextDocument> context_documents;

    bool has_response() const {
        return claude_response.has_value();
    }

    // Reply text, or the given sentinel when the snapshot holds no reply
    std::string response_or(const std::string& sentinel) const {
        return claude_response ? *claude_response : sentinel;
    }
};

struct Conversation {
    std::string id;
    std::string first_message;
    TimePoint start_time;
    size_t message_count = 0;
    std::vector<Message> messages;
};

} // namespace chatmine
