/**
 * leastpriv CLI - analyze command
 *
 * Collect activity for each application, match it against the permission
 * maps and report the least-privileged permission set.
 */

#include "../common.hpp"
#include <leastpriv/analysis.hpp>
#include <leastpriv/fs.hpp>
#include <leastpriv/json.hpp>
#include <leastpriv/log_analytics.hpp>
#include <CLI/CLI.hpp>

#include <memory>

namespace leastpriv::cli::commands {

namespace {

struct AnalyzeOptions {
    std::string apps;
    std::string export_file;
    std::string out;
    size_t workers = 0;
    int lookback_days = 0;
    size_t max_entries = 0;
};

bool load_index(const AnalyzerConfig& config, PermissionMapIndex& index, bool json_mode) {
    std::vector<EndpointEntry> v1;
    std::vector<EndpointEntry> beta;

    if (config.permission_maps.v1.empty() && config.permission_maps.beta.empty()) {
        print_error("no permission maps configured (permission_maps.v1.0 / permission_maps.beta)",
                    json_mode);
        return false;
    }

    if (!config.permission_maps.v1.empty()) {
        auto loaded = json::load_permission_map(config.permission_maps.v1, ApiVersion::V1);
        if (!loaded.ok) {
            print_error(loaded.error, json_mode);
            return false;
        }
        v1 = std::move(loaded.value);
    }

    if (!config.permission_maps.beta.empty()) {
        auto loaded = json::load_permission_map(config.permission_maps.beta, ApiVersion::Beta);
        if (!loaded.ok) {
            print_error(loaded.error, json_mode);
            return false;
        }
        beta = std::move(loaded.value);
    }

    index = PermissionMapIndex(v1, beta);
    return true;
}

std::unique_ptr<ActivityLogSource> make_source(const AnalyzerConfig& config,
                                               const AnalyzeOptions& analyze_opts,
                                               bool json_mode) {
    if (!analyze_opts.export_file.empty()) {
        auto content = fs::read_file(analyze_opts.export_file);
        if (!content) {
            print_error("failed to read activity export: " + analyze_opts.export_file, json_mode);
            return nullptr;
        }
        auto parsed = json::parse_activity_export(*content);
        if (!parsed.ok) {
            print_error(analyze_opts.export_file + ": " + parsed.error, json_mode);
            return nullptr;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(analyze_opts.export_file + ": " + w);
        }
        spdlog::debug("Replaying {} activity rows from {}", parsed.value.size(),
                      analyze_opts.export_file);
        return std::make_unique<ActivityExportSource>(std::move(parsed.value));
    }

    auto options = log_analytics_options(config);
    if (options.workspace_id.empty()) {
        print_error("log_store.workspace_id is not configured", json_mode);
        return nullptr;
    }
    if (options.access_token.empty()) {
        print_error("no access token in $" + config.log_store.token_env, json_mode);
        return nullptr;
    }
    return std::make_unique<LogAnalyticsSource>(std::move(options));
}

void print_text_report(const BatchResult& batch) {
    for (const auto& analysis : batch.completed) {
        const auto& app = analysis.application;
        std::cout << (app.display_name.empty() ? app.id : app.display_name)
                  << " (" << app.id << ")" << std::endl;

        if (!analysis.ok) {
            std::cout << "  error: " << analysis.error << std::endl;
            continue;
        }

        std::cout << "  activities: " << analysis.selection.matched_activities << "/"
                  << analysis.selection.total_activities << " matched" << std::endl;
        for (const auto& s : analysis.selection.selected) {
            std::cout << "  + " << s.permission.name << " (" << s.marginal_coverage << ")"
                      << std::endl;
        }
        for (const auto& name : analysis.delta.excess) {
            std::cout << "  - " << name << " (unused)" << std::endl;
        }
        for (const auto& a : analysis.selection.unmatched_activities) {
            std::cout << "  ? " << a.method << " " << api_version_to_string(a.version) << a.path
                      << std::endl;
        }
    }

    if (batch.timed_out) {
        std::cout << "Timed out with " << batch.pending.size() << " application(s) pending:"
                  << std::endl;
        for (const auto& app : batch.pending) {
            std::cout << "  " << app.id << std::endl;
        }
    }
}

int cmd_analyze(const GlobalOptions& opts, const AnalyzeOptions& analyze_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto resolved = resolve_config(opts);
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return 1;
    }
    AnalyzerConfig config = resolved.config;
    configure_logging(config, opts);

    // Command-line overrides
    if (analyze_opts.workers > 0) config.collection.workers = analyze_opts.workers;
    if (analyze_opts.lookback_days > 0) config.collection.lookback_days = analyze_opts.lookback_days;
    if (analyze_opts.max_entries > 0) config.collection.max_entries = analyze_opts.max_entries;

    auto apps_content = fs::read_file(analyze_opts.apps);
    if (!apps_content) {
        print_error("failed to read applications: " + analyze_opts.apps, opts.json);
        return 1;
    }
    auto apps = json::parse_applications(*apps_content);
    if (!apps.ok) {
        print_error(analyze_opts.apps + ": " + apps.error, opts.json);
        return 1;
    }
    for (const auto& w : apps.warnings) {
        print_warning(analyze_opts.apps + ": " + w);
    }

    PermissionMapIndex index;
    if (!load_index(config, index, opts.json)) {
        return 1;
    }

    std::shared_ptr<const ActivityLogSource> source = make_source(config, analyze_opts, opts.json);
    if (!source) {
        return 1;
    }

    auto window = lookback_window(Clock::now(), config.collection.lookback_days,
                                  config.collection.max_entries);

    spdlog::info("Analyzing {} applications over [{}, {})", apps.value.size(),
                 format_timestamp(window.start), format_timestamp(window.end));

    auto context = std::make_shared<const AnalysisContext>(
        std::move(source), collector_options(config), std::move(index), window);

    CollectionScheduler scheduler(scheduler_options(config));
    auto batch = analyze_applications(apps.value, context, scheduler);

    auto report = json::to_json(batch);

    if (!analyze_opts.out.empty()) {
        if (!fs::write_file(analyze_opts.out, report.dump(2))) {
            print_error("failed to write report: " + analyze_opts.out, opts.json);
            return 1;
        }
        spdlog::info("Report written to {}", analyze_opts.out);
    }

    if (opts.json) {
        output_json(report);
    } else if (analyze_opts.out.empty() || opts.verbose) {
        print_text_report(batch);
    }

    return 0;
}

} // anonymous namespace

void setup_analyze(CLI::App* app, GlobalOptions& opts) {
    static AnalyzeOptions analyze_opts;

    app->add_option("--apps", analyze_opts.apps, "Application inventory (JSON)")->required();
    app->add_option("--export", analyze_opts.export_file,
                    "Replay an activity log export instead of querying the log store");
    app->add_option("--out", analyze_opts.out, "Write the JSON report to a file");
    app->add_option("--workers", analyze_opts.workers, "Concurrent collections")
        ->check(CLI::PositiveNumber);
    app->add_option("--lookback-days", analyze_opts.lookback_days, "Days of activity to collect")
        ->check(CLI::PositiveNumber);
    app->add_option("--max-entries", analyze_opts.max_entries, "Row budget for the first query")
        ->check(CLI::PositiveNumber);

    app->callback([&opts]() {
        std::exit(cmd_analyze(opts, analyze_opts));
    });
}

} // namespace leastpriv::cli::commands
