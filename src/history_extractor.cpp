#include "history_extractor.h"
#include <nlohmann/json.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace chatmine {

namespace {

std::string content_of(const json& element) {
    auto it = element.find("content");
    if (it == element.end() || it->is_null()) {
        return std::string();
    }
    if (it->is_string()) {
        return boost::algorithm::trim_copy(it->get<std::string>());
    }
    return it->dump();
}

Role role_of(const json& element) {
    auto it = element.find("role");
    if (it == element.end() || !it->is_string()) {
        return Role::OTHER;
    }
    return role_from_string(it->get<std::string>());
}

} // namespace

const char* history_status_to_string(HistoryStatus status) {
    switch (status) {
        case HistoryStatus::OK: return "ok";
        case HistoryStatus::NO_PAYLOAD: return "no JSON payload";
        case HistoryStatus::UNBALANCED: return "unbalanced brackets";
        case HistoryStatus::INVALID_JSON: return "invalid JSON";
    }
    return "unknown";
}

HistoryExtractor::HistoryExtractor(const AnalyzerConfig& config)
    : marker_(config.history_marker) {}

std::optional<std::string> HistoryExtractor::payload(std::string_view block_text) const {
    auto marker_pos = block_text.find(marker_);
    if (marker_pos == std::string_view::npos) {
        return std::nullopt;
    }

    auto rest = block_text.substr(marker_pos + marker_.size());
    auto start = rest.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    rest = rest.substr(start);

    if (rest.front() == '[') {
        return std::string(rest);
    }
    if (rest.front() == '{') {
        // The marker swallowed the array's own '['
        std::string wrapped;
        wrapped.reserve(rest.size() + 1);
        wrapped.push_back('[');
        wrapped.append(rest.data(), rest.size());
        return wrapped;
    }
    return std::nullopt;
}

std::optional<size_t> HistoryExtractor::balanced_array_length(std::string_view payload) {
    int depth = 0;
    bool in_string = false;
    bool escape_next = false;

    for (size_t i = 0; i < payload.size(); ++i) {
        const char c = payload[i];
        if (escape_next) {
            escape_next = false;
            continue;
        }
        if (c == '\\' && in_string) {
            escape_next = true;
            continue;
        }
        if (c == '"') {
            in_string = !in_string;
            continue;
        }
        if (in_string) {
            continue;
        }
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return std::nullopt;
}

HistoryExtraction HistoryExtractor::extract(std::string_view block_text) const {
    HistoryExtraction result;

    auto text = payload(block_text);
    if (!text) {
        result.status = HistoryStatus::NO_PAYLOAD;
        return result;
    }

    auto length = balanced_array_length(*text);
    if (!length) {
        result.status = HistoryStatus::UNBALANCED;
        return result;
    }

    json history;
    try {
        history = json::parse(text->begin(), text->begin() + static_cast<std::ptrdiff_t>(*length));
    } catch (const json::exception& e) {
        result.status = HistoryStatus::INVALID_JSON;
        result.error = e.what();
        return result;
    }

    result.turns.reserve(history.size());
    for (const auto& element : history) {
        if (!element.is_object()) {
            spdlog::debug("Ignoring non-object history element: {}", element.dump());
            continue;
        }
        Turn turn;
        turn.role = role_of(element);
        turn.content = content_of(element);
        result.turns.push_back(std::move(turn));
    }

    result.status = HistoryStatus::OK;
    return result;
}

} // namespace chatmine
