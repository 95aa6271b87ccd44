#include <doctest/doctest.h>
#include <leastpriv/config.hpp>
#include <leastpriv/fs.hpp>
#include <leastpriv/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>

#include <unistd.h>

using namespace leastpriv;

namespace {

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("leastpriv_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

bool has_warning(const ConfigParseResult& r, const std::string& w) {
    return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("get_default_config: collection defaults") {
    auto c = get_default_config();
    CHECK(c.schema == "leastpriv.config.v1");
    CHECK(c.collection.workers == 10);
    CHECK(c.collection.stall_timeout_seconds == 300);
    CHECK(c.collection.lookback_days == 30);
    CHECK(c.collection.max_entries == 100000);
    CHECK(c.collection.min_window_hours == 24);
    CHECK(c.log_store.endpoint == "https://api.loganalytics.io");
    CHECK(c.log_store.size_exceeded_codes.size() == 2);
    CHECK(c.log_level == "info");
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse_config: full document") {
    const char* doc = R"({
        "$schema": "leastpriv.config.v1",
        "collection": {"workers": 4, "stall_timeout_seconds": 60, "lookback_days": 7,
                       "max_entries": 5000, "min_window_hours": 6},
        "log_store": {"endpoint": "https://api.loganalytics.azure.us/", "workspace_id": " ws-1 ",
                      "token_env": "MY_TOKEN", "timeout_seconds": 120,
                      "size_exceeded_codes": ["TooBig"]},
        "permission_maps": {"v1.0": "maps/v1.json", "beta": "maps/beta.json"},
        "logging": {"level": "DEBUG"}
    })";

    auto r = parse_config(doc, "leastpriv.json");
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());

    const auto& c = r.config;
    CHECK(c.source_path == "leastpriv.json");
    CHECK(c.collection.workers == 4);
    CHECK(c.collection.stall_timeout_seconds == 60);
    CHECK(c.collection.lookback_days == 7);
    CHECK(c.collection.max_entries == 5000);
    CHECK(c.collection.min_window_hours == 6);
    CHECK(c.log_store.endpoint == "https://api.loganalytics.azure.us");
    CHECK(c.log_store.workspace_id == "ws-1");
    CHECK(c.log_store.token_env == "MY_TOKEN");
    CHECK(c.log_store.timeout_seconds == 120);
    REQUIRE(c.log_store.size_exceeded_codes.size() == 1);
    CHECK(c.log_store.size_exceeded_codes[0] == "TooBig");
    CHECK(c.permission_maps.v1 == "maps/v1.json");
    CHECK(c.permission_maps.beta == "maps/beta.json");
    CHECK(c.log_level == "debug");
}

TEST_CASE("parse_config: schema is required and must match") {
    auto missing = parse_config(R"({"collection": {}})");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto wrong = parse_config(R"({"$schema": "leastpriv.config.v2"})");
    CHECK_FALSE(wrong.ok);
    CHECK(wrong.error.find("mismatch") != std::string::npos);
}

TEST_CASE("parse_config: invalid values warn and keep defaults") {
    const char* doc = R"({
        "$schema": "leastpriv.config.v1",
        "collection": {"workers": 0, "lookback_days": "thirty", "max_entries": -5},
        "log_store": {"endpoint": "http://insecure", "size_exceeded_codes": []},
        "logging": {"level": "loud"}
    })";

    auto r = parse_config(doc);
    REQUIRE(r.ok);
    CHECK(r.config.collection.workers == 10);
    CHECK(r.config.collection.lookback_days == 30);
    CHECK(r.config.collection.max_entries == 100000);
    CHECK(r.config.log_store.endpoint == "https://api.loganalytics.io");
    CHECK(r.config.log_store.size_exceeded_codes.size() == 2);
    CHECK(r.config.log_level == "info");

    CHECK(has_warning(r, "invalid_configuration:collection.workers"));
    CHECK(has_warning(r, "invalid_configuration:collection.lookback_days"));
    CHECK(has_warning(r, "invalid_configuration:collection.max_entries"));
    CHECK(has_warning(r, "invalid_configuration:log_store.endpoint"));
    CHECK(has_warning(r, "invalid_configuration:log_store.size_exceeded_codes"));
    CHECK(has_warning(r, "invalid_configuration:logging.level"));
}

TEST_CASE("parse_config: malformed JSON") {
    CHECK_FALSE(parse_config("{").ok);
    CHECK_FALSE(parse_config("[]").ok);
}

TEST_CASE("load_config: missing file") {
    auto r = load_config("/nonexistent/leastpriv/config.json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("failed to read config") != std::string::npos);
}

TEST_CASE("load_config: reads the file and records its path") {
    TempDir tmp;
    std::string path = tmp.path() + "/leastpriv.json";
    REQUIRE(fs::write_file(path, R"({"$schema": "leastpriv.config.v1",
                                     "collection": {"workers": 2}})"));

    auto r = load_config(path);
    REQUIRE(r.ok);
    CHECK(r.config.source_path == path);
    CHECK(r.config.collection.workers == 2);
}

TEST_CASE("load_permission_map: configured map file is loaded") {
    TempDir tmp;
    std::string path = tmp.path() + "/v1.json";
    REQUIRE(fs::write_file(path, R"([{"Endpoint": "/users", "Version": "v1.0",
        "Method": {"GET": [{"value": "User.Read.All", "scopeType": "Application"}]}}])"));

    auto map = json::load_permission_map(path, ApiVersion::V1);
    REQUIRE(map.ok);
    REQUIRE(map.value.size() == 1);
    CHECK(map.value[0].canonical_path == "/users");
}

// ============================================================================
// Derived Options
// ============================================================================

TEST_CASE("scheduler_options and collector_options: unit conversion") {
    auto c = get_default_config();
    c.collection.workers = 3;
    c.collection.stall_timeout_seconds = 2;
    c.collection.min_window_hours = 12;

    auto s = scheduler_options(c);
    CHECK(s.workers == 3);
    CHECK(s.stall_timeout == std::chrono::milliseconds(2000));

    auto col = collector_options(c);
    CHECK(col.min_window == std::chrono::hours(12));
}

TEST_CASE("log_analytics_options: token comes from the named variable") {
    auto c = get_default_config();
    c.log_store.workspace_id = "ws-1";
    c.log_store.token_env = "LEASTPRIV_TEST_TOKEN";

    ::setenv("LEASTPRIV_TEST_TOKEN", "secret", 1);
    auto with = log_analytics_options(c);
    CHECK(with.workspace_id == "ws-1");
    CHECK(with.access_token == "secret");

    ::unsetenv("LEASTPRIV_TEST_TOKEN");
    auto without = log_analytics_options(c);
    CHECK(without.access_token.empty());
}

TEST_CASE("resolve_log_level: flags override the configured level") {
    auto c = get_default_config();
    c.log_level = "error";

    CHECK(resolve_log_level(c, false, false) == spdlog::level::err);
    CHECK(resolve_log_level(c, true, false) == spdlog::level::debug);
    CHECK(resolve_log_level(c, false, true) == spdlog::level::warn);
    // verbose wins when both are given
    CHECK(resolve_log_level(c, true, true) == spdlog::level::debug);
}
