/**
 * leastpriv CLI - map command
 *
 * Summarize permission map coverage.
 */

#include "../common.hpp"
#include <leastpriv/json.hpp>
#include <leastpriv/permission_map.hpp>
#include <CLI/CLI.hpp>

#include <cstdio>

namespace leastpriv::cli::commands {

namespace {

struct MapOptions {
    std::string v1;
    std::string beta;
};

int cmd_map_summary(const GlobalOptions& opts, const MapOptions& map_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = resolve_config(opts);
    if (!config.ok) {
        print_error(config.error, opts.json);
        return 1;
    }
    configure_logging(config.config, opts);

    struct Source {
        ApiVersion version;
        std::string path;
    };
    std::vector<Source> sources = {
        {ApiVersion::V1, map_opts.v1.empty() ? config.config.permission_maps.v1 : map_opts.v1},
        {ApiVersion::Beta, map_opts.beta.empty() ? config.config.permission_maps.beta : map_opts.beta},
    };

    nlohmann::json result = nlohmann::json::array();
    std::vector<MapSummary> summaries;

    for (const auto& source : sources) {
        if (source.path.empty()) continue;

        auto loaded = json::load_permission_map(source.path, source.version);
        if (!loaded.ok) {
            print_error(loaded.error, opts.json);
            return 1;
        }
        for (const auto& w : loaded.warnings) {
            print_warning(source.path + ": " + w);
        }

        summaries.push_back(summarize_permission_map(source.version, loaded.value));
        result.push_back(json::to_json(summaries.back()));
    }

    if (summaries.empty()) {
        print_error("no permission map given (use --v1/--beta or permission_maps in the config)",
                    opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(result);
    } else {
        for (const auto& s : summaries) {
            char coverage[32];
            std::snprintf(coverage, sizeof(coverage), "%.2f", s.coverage_percent);
            std::cout << s.version << ":" << std::endl;
            std::cout << "  Endpoints:                  " << s.total_endpoints << std::endl;
            std::cout << "  Methods:                    " << s.total_methods << std::endl;
            std::cout << "  Permissions:                " << s.total_permissions << std::endl;
            std::cout << "  Endpoints with permissions: " << s.endpoints_with_permissions
                      << " (" << coverage << "%)" << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_map(CLI::App* app, GlobalOptions& opts) {
    static MapOptions map_opts;

    app->require_subcommand(1);

    auto* summary = app->add_subcommand("summary", "Endpoint, method and permission counts");
    summary->add_option("--v1", map_opts.v1, "v1.0 permission map");
    summary->add_option("--beta", map_opts.beta, "beta permission map");

    summary->callback([&opts]() {
        std::exit(cmd_map_summary(opts, map_opts));
    });
}

} // namespace leastpriv::cli::commands
