#include "chat_record.h"

namespace chatmine {

Role role_from_string(const std::string& role) {
    // Case-sensitive on purpose, "User" is not a user turn
    if (role == "user") {
        return Role::USER;
    } else if (role == "assistant") {
        return Role::ASSISTANT;
    } else if (role == "system") {
        return Role::SYSTEM;
    }
    return Role::OTHER;
}

const char* role_to_string(Role role) {
    switch (role) {
        case Role::USER: return "user";
        case Role::ASSISTANT: return "assistant";
        case Role::SYSTEM: return "system";
        default: return "other";
    }
}

} // namespace chatmine
