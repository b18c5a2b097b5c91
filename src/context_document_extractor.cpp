#include "context_document_extractor.h"
#include <cctype>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <spdlog/spdlog.h>

namespace chatmine {

namespace {

constexpr std::string_view ID_LABEL = "ID:";
constexpr std::string_view BRANCH_GLYPH = "├──";
constexpr std::string_view LEAF_GLYPH = "└──";
constexpr std::string_view TITLE_LABEL = "Title:";
constexpr std::string_view CONTENT_LABEL = "Content:";
constexpr std::string_view SEPARATOR = "------";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

size_t skip_spaces(std::string_view text, size_t pos) {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

bool consume(std::string_view text, size_t& pos, std::string_view literal) {
    if (text.substr(pos, literal.size()) != literal) {
        return false;
    }
    pos += literal.size();
    return true;
}

// True if the line break at `pos` closes a content run
bool ends_content(std::string_view text, size_t pos) {
    if (text.substr(pos + 1, ID_LABEL.size()) == ID_LABEL) {
        return true;
    }

    size_t p = skip_spaces(text, pos + 1);
    if (text.substr(p, SEPARATOR.size()) == SEPARATOR) {
        return true;
    }
    if (p < text.size() && text[p] == '}') {
        p = skip_spaces(text, p + 1);
        return p < text.size() && text[p] == ',';
    }
    if (p < text.size() && text[p] == ']') {
        p = skip_spaces(text, p + 1);
        return p < text.size() && text[p] == '}';
    }
    return false;
}

size_t content_end(std::string_view text, size_t start) {
    for (size_t nl = text.find('\n', start); nl != std::string_view::npos; nl = text.find('\n', nl + 1)) {
        if (ends_content(text, nl)) {
            return nl;
        }
    }
    return text.size();
}

} // namespace

ContextDocumentExtractor::ContextDocumentExtractor(const AnalyzerConfig& config)
    : unescape_newlines_(config.unescape_newlines) {}

std::string ContextDocumentExtractor::clean_content(std::string_view content) {
    std::string cleaned = boost::algorithm::trim_copy(std::string(content));

    // Walk back over an optional '}', a ']', an optional ',' and a '}'
    auto skip_back = [&cleaned](size_t end) {
        while (end > 0 && is_space(cleaned[end - 1])) {
            --end;
        }
        return end;
    };

    size_t end = skip_back(cleaned.size());
    if (end > 0 && cleaned[end - 1] == '}') {
        end = skip_back(end - 1);
    }
    if (end == 0 || cleaned[end - 1] != ']') {
        return cleaned;
    }
    end = skip_back(end - 1);
    if (end > 0 && cleaned[end - 1] == ',') {
        end = skip_back(end - 1);
    }
    if (end == 0 || cleaned[end - 1] != '}') {
        return cleaned;
    }
    end = skip_back(end - 1);

    cleaned.resize(end);
    return cleaned;
}

std::vector<ContextDocument> ContextDocumentExtractor::extract(std::string_view block_text) const {
    std::vector<ContextDocument> documents;

    std::string text(block_text);
    if (unescape_newlines_ && text.find("\\n") != std::string::npos) {
        boost::algorithm::replace_all(text, "\\n", "\n");
    }
    const std::string_view view(text);

    size_t search_from = 0;
    while (true) {
        const size_t id_pos = view.find(ID_LABEL, search_from);
        if (id_pos == std::string_view::npos) {
            break;
        }
        // Resume right after this "ID:" unless a full record matches
        search_from = id_pos + 1;

        size_t pos = skip_spaces(view, id_pos + ID_LABEL.size());
        const size_t id_start = pos;
        while (pos < view.size() && std::isdigit(static_cast<unsigned char>(view[pos]))) {
            ++pos;
        }
        if (pos == id_start) {
            continue;
        }
        const auto id = view.substr(id_start, pos - id_start);

        pos = skip_spaces(view, pos);
        if (!consume(view, pos, BRANCH_GLYPH)) {
            continue;
        }
        pos = skip_spaces(view, pos);
        if (!consume(view, pos, TITLE_LABEL)) {
            continue;
        }
        pos = skip_spaces(view, pos);

        size_t title_end = view.find('\n', pos);
        if (title_end == std::string_view::npos) {
            title_end = view.size();
        }
        const size_t leaf_on_line = view.substr(pos, title_end - pos).find(LEAF_GLYPH);
        if (leaf_on_line != std::string_view::npos) {
            title_end = pos + leaf_on_line;
        }
        if (title_end == pos) {
            continue;
        }
        const auto title = view.substr(pos, title_end - pos);

        pos = skip_spaces(view, title_end);
        if (!consume(view, pos, LEAF_GLYPH)) {
            continue;
        }
        pos = skip_spaces(view, pos);
        if (!consume(view, pos, CONTENT_LABEL)) {
            continue;
        }
        pos = skip_spaces(view, pos);

        const size_t end = content_end(view, pos);

        ContextDocument document;
        document.id = boost::algorithm::trim_copy(std::string(id));
        document.title = boost::algorithm::trim_copy(std::string(title));
        document.content = clean_content(view.substr(pos, end - pos));
        documents.push_back(std::move(document));

        search_from = end;
    }

    if (!documents.empty()) {
        spdlog::debug("Extracted {} context documents", documents.size());
    }
    return documents;
}

} // namespace chatmine
