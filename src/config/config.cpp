#include "leastpriv/config.hpp"
#include "leastpriv/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

#include <nlohmann/json.hpp>

namespace leastpriv {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

// Integer value >= min_value; anything else leaves target unchanged and warns
template <typename T>
void read_positive(const nlohmann::json& section, const std::string& section_name,
                   const std::string& key, long long min_value, T& target,
                   std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (!v.is_number_integer() || v.get<long long>() < min_value) {
        warnings.push_back("invalid_configuration:" + section_name + "." + key);
        return;
    }
    target = static_cast<T>(v.get<long long>());
}

bool is_log_level(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::any_of(std::begin(kLevels), std::end(kLevels),
                       [&](const char* l) { return level == l; });
}

} // namespace

AnalyzerConfig get_default_config() {
    AnalyzerConfig config;
    config.schema = kConfigSchema;
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        // "collection" section
        if (j.contains("collection") && j["collection"].is_object()) {
            const auto& c = j["collection"];
            auto& cfg = result.config.collection;
            read_positive(c, "collection", "workers", 1, cfg.workers, result.warnings);
            read_positive(c, "collection", "stall_timeout_seconds", 1, cfg.stall_timeout_seconds,
                          result.warnings);
            read_positive(c, "collection", "lookback_days", 1, cfg.lookback_days, result.warnings);
            read_positive(c, "collection", "max_entries", 1, cfg.max_entries, result.warnings);
            read_positive(c, "collection", "min_window_hours", 1, cfg.min_window_hours,
                          result.warnings);
        }

        // "log_store" section
        if (j.contains("log_store") && j["log_store"].is_object()) {
            const auto& ls = j["log_store"];
            auto& cfg = result.config.log_store;

            if (auto endpoint = get_string(ls, "endpoint")) {
                std::string e = trim(*endpoint);
                while (!e.empty() && e.back() == '/') e.pop_back();
                if (e.rfind("https://", 0) == 0) {
                    cfg.endpoint = e;
                } else {
                    result.warnings.push_back("invalid_configuration:log_store.endpoint");
                }
            }
            if (auto ws = get_string(ls, "workspace_id")) {
                cfg.workspace_id = trim(*ws);
            }
            if (auto env = get_string(ls, "token_env")) {
                cfg.token_env = trim(*env);
            }
            read_positive(ls, "log_store", "timeout_seconds", 1, cfg.timeout_seconds,
                          result.warnings);
            if (ls.contains("size_exceeded_codes")) {
                auto codes = get_string_array(ls, "size_exceeded_codes");
                if (codes.empty()) {
                    result.warnings.push_back("invalid_configuration:log_store.size_exceeded_codes");
                } else {
                    cfg.size_exceeded_codes = codes;
                }
            }
        }

        // "permission_maps" section
        if (j.contains("permission_maps") && j["permission_maps"].is_object()) {
            const auto& pm = j["permission_maps"];
            if (auto v1 = get_string(pm, "v1.0")) result.config.permission_maps.v1 = *v1;
            if (auto beta = get_string(pm, "beta")) result.config.permission_maps.beta = *beta;
        }

        // "logging" section
        if (j.contains("logging") && j["logging"].is_object()) {
            if (auto level = get_string(j["logging"], "level")) {
                std::string l = trim(*level);
                std::transform(l.begin(), l.end(), l.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (is_log_level(l)) {
                    result.config.log_level = l;
                } else {
                    result.warnings.push_back("invalid_configuration:logging.level");
                }
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_config(const std::string& path) {
    auto content = fs::read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.config = get_default_config();
        result.error = "failed to read config: " + path;
        return result;
    }
    return parse_config(*content, path);
}

SchedulerOptions scheduler_options(const AnalyzerConfig& config) {
    SchedulerOptions options;
    options.workers = config.collection.workers;
    options.stall_timeout = std::chrono::seconds(config.collection.stall_timeout_seconds);
    return options;
}

CollectorOptions collector_options(const AnalyzerConfig& config) {
    CollectorOptions options;
    options.min_window = std::chrono::hours(config.collection.min_window_hours);
    return options;
}

LogAnalyticsOptions log_analytics_options(const AnalyzerConfig& config) {
    LogAnalyticsOptions options;
    options.endpoint = config.log_store.endpoint;
    options.workspace_id = config.log_store.workspace_id;
    options.timeout_seconds = config.log_store.timeout_seconds;
    options.size_exceeded_codes = config.log_store.size_exceeded_codes;

    if (!config.log_store.token_env.empty()) {
        const char* token = std::getenv(config.log_store.token_env.c_str());
        if (token) options.access_token = token;
    }
    return options;
}

spdlog::level::level_enum resolve_log_level(const AnalyzerConfig& config, bool verbose, bool quiet) {
    if (verbose) return spdlog::level::debug;
    if (quiet) return spdlog::level::warn;
    return spdlog::level::from_str(config.log_level);
}

} // namespace leastpriv
