#include "log_source.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace chatmine {

std::string normalize_line_endings(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        result.push_back(text[i]);
    }
    return result;
}

std::optional<std::string> read_log_text(const std::string& path, const AnalyzerConfig& config) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::error("Log file not found: {}", path);
        return std::nullopt;
    }
    if (!fs::is_regular_file(path, ec)) {
        spdlog::error("Not a regular file: {}", path);
        return std::nullopt;
    }

    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        spdlog::error("Could not stat log file {}: {}", path, ec.message());
        return std::nullopt;
    }
    if (config.max_file_bytes > 0 && file_size > config.max_file_bytes) {
        spdlog::error("Log file {} is {} bytes, limit is {}", path, file_size, config.max_file_bytes);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Could not open log file: {}", path);
        return std::nullopt;
    }

    std::string text(static_cast<size_t>(file_size), '\0');
    file.read(text.data(), static_cast<std::streamsize>(text.size()));
    if (file.bad()) {
        spdlog::error("Error while reading log file: {}", path);
        return std::nullopt;
    }
    // The file may have been truncated since it was sized
    text.resize(static_cast<size_t>(file.gcount()));

    spdlog::debug("Read {} ({} bytes)", path, text.size());
    return normalize_line_endings(text);
}

} // namespace chatmine
