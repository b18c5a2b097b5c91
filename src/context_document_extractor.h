#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "chat_record.h"
#include "analyzer_config.h"

namespace chatmine {

/**
 * @brief Pulls retrieved reference documents out of a HISTORY block
 *
 * Documents are rendered by the server as a tree fragment:
 *
 *   ID: 12
 *   ├── Title: Some title
 *   └── Content: text, possibly over several lines
 *
 * The glyphs are matched literally. A content run ends at a "------"
 * separator line, the next "ID:" line, a JSON closing tail ("}," or "]}"
 * at the start of a line) or the end of the text. Works on the raw block,
 * independently of JSON decoding.
 */
class ContextDocumentExtractor {
public:
    explicit ContextDocumentExtractor(const AnalyzerConfig& config);

    /**
     * @brief Extract all documents in textual order
     * @return Empty vector when the block holds no documents
     */
    std::vector<ContextDocument> extract(std::string_view block_text) const;

    // Strip whitespace and a trailing "} , ] }"-style JSON tail
    static std::string clean_content(std::string_view content);

private:
    bool unescape_newlines_;
};

} // namespace chatmine
