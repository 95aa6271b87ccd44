/**
 * leastpriv CLI - Common utilities and types
 */

#pragma once

#include <leastpriv/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace leastpriv::cli {

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.warnings;
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && j.is_object() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.warnings;
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Resolve the configuration file.
 * Priority: --config flag > LEASTPRIV_CONFIG env > built-in defaults
 */
inline ConfigParseResult resolve_config(const GlobalOptions& opts) {
    std::string path = opts.config;
    if (path.empty()) {
        path = safe_getenv("LEASTPRIV_CONFIG");
    }

    if (path.empty()) {
        ConfigParseResult result;
        result.ok = true;
        result.config = get_default_config();
        return result;
    }

    auto result = load_config(path);
    for (const auto& w : result.warnings) {
        print_warning(path + ": " + w);
    }
    return result;
}

/**
 * Set the log level. -v and -q override the configured level.
 */
inline void configure_logging(const AnalyzerConfig& config, const GlobalOptions& opts) {
    spdlog::set_level(resolve_log_level(config, opts.verbose, opts.quiet));
}

} // namespace leastpriv::cli
