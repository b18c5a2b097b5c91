#pragma once

#include <string>
#include <cstddef>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace chatmine {

constexpr char HISTORY_MARKER[] = "[HISTORY][";
constexpr char NO_RESPONSE_FOUND[] = "[No response found]";
constexpr char DEFAULT_LOG_PATH[] = "ragflow-logs/ragflow_server.log";

struct AnalyzerConfig {
    std::string history_marker = HISTORY_MARKER;
    std::string missing_response_text = NO_RESPONSE_FOUND;
    bool unescape_newlines = true;
    std::string log_level = "info";

    // 0 disables the size check
    size_t max_file_bytes = 0;

    // Fill missing replies from HISTORY blocks captured later in the log
    bool resolve_late_responses = false;

    /**
     * @brief Build a configuration from CHATMINE_* environment variables
     *
     * Variables that are unset or empty keep their defaults.
     */
    static AnalyzerConfig from_env();
};

/**
 * Loads KEY=VALUE lines from a .env file into the process environment
 */
class EnvFile {
public:
    /**
     * Load a .env file
     *
     * @param env_file Path to the .env file
     * @return true if the file was read, false if it could not be opened
     */
    static bool load(const std::string& env_file = ".env");

    /**
     * @param key Name of the environment variable
     * @return Value of the variable, or empty string if unset
     */
    static std::string get(const std::string& key);

    static const std::unordered_map<std::string, std::string>& loaded() { return loaded_; }

private:
    static inline std::unordered_map<std::string, std::string> loaded_;
};

/**
 * @brief Map a level name ("trace" ... "off") to spdlog
 * @throws std::invalid_argument for an unknown name
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

void apply_log_level(const AnalyzerConfig& config);

} // namespace chatmine
