#pragma once

#include <string>
#include <string_view>
#include <optional>
#include "analyzer_config.h"

namespace chatmine {

/**
 * @brief Read a whole log file into memory
 *
 * The file is opened for one read and closed before returning. Line endings
 * are normalised to '\n'. Bytes appended while the read is in progress are
 * not picked up; a file that shrinks meanwhile yields what could be read.
 *
 * @return The log text, or nullopt if the path is missing, not a regular
 *         file, unreadable or larger than config.max_file_bytes
 */
std::optional<std::string> read_log_text(const std::string& path, const AnalyzerConfig& config);

// Replace "\r\n" with "\n"
std::string normalize_line_endings(std::string_view text);

} // namespace chatmine
