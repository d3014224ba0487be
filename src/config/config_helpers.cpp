#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <deplink/config/config_helpers.h>

namespace deplink::config {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class SectionReader {
public:
    SectionReader(const ConfigMap& map, std::string section) : section_(std::move(section)) {
        if (auto it = map.find(section_); it != map.end())
            values_ = &it->second;
    }

    template <typename T> Result<void> integer(const std::string& key, T& out) const {
        auto raw = find(key);
        if (!raw)
            return Result<void>{};
        long long value = 0;
        auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
        if (ec != std::errc{} || ptr != raw->data() + raw->size() || value < 0)
            return invalid(key, *raw, "a non-negative integer");
        out = static_cast<T>(value);
        return Result<void>{};
    }

    Result<void> real(const std::string& key, double& out) const {
        auto raw = find(key);
        if (!raw)
            return Result<void>{};
        try {
            size_t used = 0;
            double value = std::stod(*raw, &used);
            if (used != raw->size())
                return invalid(key, *raw, "a number");
            out = value;
        } catch (const std::exception&) {
            return invalid(key, *raw, "a number");
        }
        return Result<void>{};
    }

    Result<void> boolean(const std::string& key, bool& out) const {
        auto raw = find(key);
        if (!raw)
            return Result<void>{};
        auto value = lower(*raw);
        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            out = true;
        } else if (value == "false" || value == "0" || value == "no" || value == "off") {
            out = false;
        } else {
            return invalid(key, *raw, "a boolean");
        }
        return Result<void>{};
    }

    Result<void> milliseconds(const std::string& key, std::chrono::milliseconds& out) const {
        long long ms = out.count();
        if (auto r = integer(key, ms); !r)
            return r;
        out = std::chrono::milliseconds(ms);
        return Result<void>{};
    }

    void string(const std::string& key, std::string& out) const {
        if (auto raw = find(key))
            out = *raw;
    }

private:
    const std::string* find(const std::string& key) const {
        if (!values_)
            return nullptr;
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &it->second;
    }

    Error invalid(const std::string& key, const std::string& raw, const char* expected) const {
        return Error{ErrorCode::InvalidArgument,
                     "Config [" + section_ + "] " + key + " = '" + raw + "' is not " + expected};
    }

    std::string section_;
    const std::map<std::string, std::string>* values_ = nullptr;
};

} // namespace

ConfigMap read_config_file(const std::filesystem::path& config_path) {
    ConfigMap map;
    std::ifstream file(config_path);
    if (!file) {
        return map;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "inference.max_depth" and "[inference] max_depth"
        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        map[section][k] = unquote(v);
    }
    return map;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto map = read_config_file(config_path);
    auto it = map.find(section);
    if (it == map.end()) {
        return "";
    }
    auto value = it->second.find(key);
    return value == it->second.end() ? "" : value->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "deplink" / "config.toml";
    }

    return configHome / "deplink" / "config.toml";
}

Result<SubsystemConfig> load_subsystem_config(const std::filesystem::path& config_path) {
    SubsystemConfig config;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::debug("[Config] {} not found, using defaults", config_path.string());
    }
    auto map = read_config_file(config_path);

    SectionReader logging(map, "logging");
    logging.string("level", config.logLevel);

    SectionReader inference(map, "inference");
    auto& ic = config.inference;
    for (auto r : {inference.integer("max_depth", ic.defaultMaxDepth),
                   inference.integer("max_path_length", config.maxPathLength),
                   inference.integer("max_inheritance_depth", config.maxInheritanceDepth),
                   inference.boolean("enable_cache", ic.enableCache),
                   inference.integer("cache_capacity", ic.cacheCapacity),
                   inference.boolean("enable_parallel", ic.enableParallel),
                   inference.integer("max_concurrency", ic.maxConcurrency),
                   inference.boolean("enable_cycle_detection", ic.enableCycleDetection)}) {
        if (!r)
            return r.error();
    }

    SectionReader query(map, "query");
    auto& cache = config.query.cache;
    long long ttlSeconds = std::chrono::duration_cast<std::chrono::seconds>(cache.defaultTTL).count();
    for (auto r : {query.integer("cache_max_entries", cache.maxEntries),
                   query.integer("cache_ttl_seconds", ttlSeconds),
                   query.real("optimize_target_ratio", cache.optimizeTargetRatio)}) {
        if (!r)
            return r.error();
    }
    cache.defaultTTL = std::chrono::seconds(ttlSeconds);

    SectionReader realtime(map, "realtime");
    auto& rc = config.realtime;
    for (auto r : {realtime.boolean("enable_polling", rc.enablePolling),
                   realtime.milliseconds("polling_interval_ms", rc.pollingInterval),
                   realtime.integer("max_connections", rc.maxConnections),
                   realtime.milliseconds("query_timeout_ms", rc.queryTimeout),
                   realtime.integer("max_concurrency", rc.maxConcurrency)}) {
        if (!r)
            return r.error();
    }

    if (const char* env = std::getenv("DEPLINK_LOG_LEVEL"); env && *env) {
        config.logLevel = env;
    }
    return config;
}

bool apply_log_level(std::string_view level) {
    auto value = lower(std::string(level));
    if (value == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (value == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (value == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (value == "warn" || value == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (value == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (value == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("[Config] unknown log level '{}', keeping current level", level);
        return false;
    }
    return true;
}

} // namespace deplink::config
