#include "analyzer_config.h"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <boost/algorithm/string.hpp>

namespace chatmine {

namespace {

bool parse_flag(std::string value) {
    boost::algorithm::to_lower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void set_process_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

} // namespace

AnalyzerConfig AnalyzerConfig::from_env() {
    AnalyzerConfig config;

    auto marker = EnvFile::get("CHATMINE_HISTORY_MARKER");
    if (!marker.empty()) {
        config.history_marker = marker;
    }

    auto missing = EnvFile::get("CHATMINE_MISSING_RESPONSE");
    if (!missing.empty()) {
        config.missing_response_text = missing;
    }

    auto level = EnvFile::get("CHATMINE_LOG_LEVEL");
    if (!level.empty()) {
        config.log_level = level;
    }

    auto max_bytes = EnvFile::get("CHATMINE_MAX_FILE_BYTES");
    if (!max_bytes.empty()) {
        try {
            config.max_file_bytes = static_cast<size_t>(std::stoull(max_bytes));
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring CHATMINE_MAX_FILE_BYTES={}: {}", max_bytes, e.what());
        }
    }

    auto late = EnvFile::get("CHATMINE_RESOLVE_LATE_RESPONSES");
    if (!late.empty()) {
        config.resolve_late_responses = parse_flag(late);
    }

    return config;
}

bool EnvFile::load(const std::string& env_file) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        spdlog::error("Could not open .env file: {}", env_file);
        return false;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            spdlog::debug("{}:{}: no '=' found, line skipped", env_file, line_number);
            continue;
        }

        std::string key = boost::algorithm::trim_copy(line.substr(0, pos));
        std::string value = boost::algorithm::trim_copy(line.substr(pos + 1));
        if (key.empty()) {
            continue;
        }

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        set_process_env(key, value);
        loaded_[key] = value;
    }

    return true;
}

std::string EnvFile::get(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? value : "";
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lowered = boost::algorithm::to_lower_copy(name);
    if (lowered == "warning") {
        lowered = "warn";
    }
    auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && lowered != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

void apply_log_level(const AnalyzerConfig& config) {
    spdlog::set_level(parse_log_level(config.log_level));
}

} // namespace chatmine
