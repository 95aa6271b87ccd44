/**
 * leastpriv CLI - canonicalize command
 *
 * Print the canonical form of one or more request URIs.
 */

#include "../common.hpp"
#include <leastpriv/canonicalize.hpp>
#include <CLI/CLI.hpp>

namespace leastpriv::cli::commands {

namespace {

struct CanonicalizeOptions {
    std::vector<std::string> uris;
    std::string method = "GET";
};

int cmd_canonicalize(const GlobalOptions& opts, const CanonicalizeOptions& canon_opts) {
    init_warning_collector(opts.json, opts.quiet);

    nlohmann::json result = nlohmann::json::array();

    for (const auto& uri : canon_opts.uris) {
        nlohmann::json entry;
        entry["uri"] = uri;
        entry["canonical"] = canonicalize_uri(uri);

        auto activity = to_canonical_activity(canon_opts.method, uri);
        if (activity) {
            entry["version"] = api_version_to_string(activity->version);
            entry["path"] = activity->path;
        } else {
            entry["version"] = nullptr;
            entry["path"] = nullptr;
        }

        if (opts.json) {
            result.push_back(entry);
        } else {
            std::cout << entry["canonical"].get<std::string>() << std::endl;
        }
    }

    if (opts.json) {
        output_json(result);
    }
    return 0;
}

} // anonymous namespace

void setup_canonicalize(CLI::App* app, GlobalOptions& opts) {
    static CanonicalizeOptions canon_opts;

    app->add_option("uris", canon_opts.uris, "Request URIs")->required();
    app->add_option("--method", canon_opts.method, "HTTP method for the version/path split");

    app->callback([&opts]() {
        std::exit(cmd_canonicalize(opts, canon_opts));
    });
}

} // namespace leastpriv::cli::commands
