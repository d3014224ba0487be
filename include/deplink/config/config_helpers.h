#pragma once

#include <deplink/core/types.h>
#include <deplink/inference/inference_types.h>
#include <deplink/query/query_engine.h>
#include <deplink/realtime/realtime_query_system.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace deplink::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value
using ConfigMap = std::map<std::string, std::map<std::string, std::string>>;

// Reads every key of a TOML-style file. A missing file yields an empty map.
ConfigMap read_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns $XDG_CONFIG_HOME/deplink/config.toml or ~/.config/deplink/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Settings for every subsystem, loaded from [logging], [inference], [query]
 * and [realtime]. Keys absent from the file keep their defaults.
 */
struct SubsystemConfig {
    std::string logLevel = "info";

    inference::InferenceEngineConfig inference;
    int maxPathLength = 10;
    int maxInheritanceDepth = 5;

    query::QueryEngineConfig query;

    realtime::RealtimeQueryConfig realtime;
};

/// Loads the config file; DEPLINK_LOG_LEVEL overrides [logging] level.
/// A malformed number or boolean fails with InvalidArgument naming the key.
Result<SubsystemConfig> load_subsystem_config(const std::filesystem::path& config_path);

/// Maps trace|debug|info|warn|error|off onto spdlog. Returns false for an
/// unknown level, which leaves the current level untouched.
bool apply_log_level(std::string_view level);

} // namespace deplink::config
