#pragma once

#include "leastpriv/collector.hpp"
#include "leastpriv/log_analytics.hpp"
#include "leastpriv/scheduler.hpp"

#include <string>
#include <vector>

#include <spdlog/common.h>

namespace leastpriv {

// ============================================================================
// Analyzer Configuration
// ============================================================================

inline constexpr const char* kConfigSchema = "leastpriv.config.v1";

struct AnalyzerConfig {
    std::string schema;

    // [collection]
    struct {
        size_t workers = 10;
        long stall_timeout_seconds = 300;
        int lookback_days = 30;
        size_t max_entries = 100000;
        long min_window_hours = 24;
    } collection;

    // [log_store]
    struct {
        std::string endpoint = "https://api.loganalytics.io";
        std::string workspace_id;
        std::string token_env = "LEASTPRIV_ACCESS_TOKEN";
        long timeout_seconds = 300;
        std::vector<std::string> size_exceeded_codes = {"ResponseSizeError",
                                                        "E_QUERY_RESULT_SET_TOO_LARGE"};
    } log_store;

    // [permission_maps]
    struct {
        std::string v1;
        std::string beta;
    } permission_maps;

    // [logging]
    std::string log_level = "info";

    // Source path for diagnostics
    std::string source_path;
};

// Built-in defaults
AnalyzerConfig get_default_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    AnalyzerConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration document. Out-of-range or mistyped values produce a
// warning and keep their default.
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_config(const std::string& path);

// ============================================================================
// Derived Options
// ============================================================================

SchedulerOptions scheduler_options(const AnalyzerConfig& config);
CollectorOptions collector_options(const AnalyzerConfig& config);

// Log store options; the access token is read from the environment variable
// named by log_store.token_env
LogAnalyticsOptions log_analytics_options(const AnalyzerConfig& config);

// verbose forces debug, quiet forces warn; otherwise the configured level
spdlog::level::level_enum resolve_log_level(const AnalyzerConfig& config, bool verbose, bool quiet);

} // namespace leastpriv
