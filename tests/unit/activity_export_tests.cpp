#include <doctest/doctest.h>
#include <leastpriv/activity_log.hpp>

using namespace leastpriv;

namespace {

Timestamp at(const std::string& s) {
    auto t = parse_timestamp(s);
    REQUIRE(t.has_value());
    return *t;
}

ActivityLogRow row(const std::string& principal, const std::string& time,
                   const std::string& method, const std::string& uri, int status = 200) {
    return ActivityLogRow{principal, at(time), method, uri, status};
}

ActivityWindow may_2024(size_t max_entries = 100) {
    return ActivityWindow{at("2024-05-01T00:00:00Z"), at("2024-06-01T00:00:00Z"), max_entries};
}

} // namespace

// ============================================================================
// Store-side URI cleanup
// ============================================================================

TEST_CASE("strip_uri_for_store: drops query and collapses path slashes") {
    CHECK(strip_uri_for_store("https://graph.microsoft.com//v1.0//users/42?$top=1") ==
          "https://graph.microsoft.com/v1.0/users/42");
    CHECK(strip_uri_for_store("/v1.0/users") == "/v1.0/users");
}

// ============================================================================
// Export Replay
// ============================================================================

TEST_CASE("ActivityExportSource::query: filters principal, window and status") {
    ActivityExportSource source({
        row("sp-1", "2024-05-02T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/users"),
        row("sp-2", "2024-05-02T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/groups"),
        row("sp-1", "2024-04-30T23:59:59Z", "GET", "https://graph.microsoft.com/v1.0/sites"),
        row("sp-1", "2024-06-01T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/drives"),
        row("sp-1", "2024-05-03T00:00:00Z", "POST", "https://graph.microsoft.com/v1.0/users", 403),
    });

    auto result = source.query("sp-1", may_2024());
    CHECK(result.error == QueryError::None);
    REQUIRE(result.rows.size() == 1);
    CHECK(result.rows[0].method == "GET");
    CHECK(result.rows[0].uri == "https://graph.microsoft.com/v1.0/users");
    CHECK(source.row_count() == 5);
}

TEST_CASE("ActivityExportSource::query: distinct on method and stripped uri") {
    ActivityExportSource source({
        row("sp-1", "2024-05-02T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/users?$top=1"),
        row("sp-1", "2024-05-03T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0//users"),
        row("sp-1", "2024-05-04T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/users/1"),
        row("sp-1", "2024-05-05T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/users/2"),
    });

    auto result = source.query("sp-1", may_2024());
    REQUIRE(result.error == QueryError::None);
    // identifiers are left for the collector to canonicalize
    CHECK(result.rows.size() == 3);
}

TEST_CASE("ActivityExportSource::query: too many distinct rows is SizeExceeded") {
    ActivityExportSource source({
        row("sp-1", "2024-05-02T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/users"),
        row("sp-1", "2024-05-03T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/groups"),
        row("sp-1", "2024-05-04T00:00:00Z", "GET", "https://graph.microsoft.com/v1.0/sites"),
    });

    auto exceeded = source.query("sp-1", may_2024(2));
    CHECK(exceeded.error == QueryError::SizeExceeded);
    CHECK(exceeded.rows.empty());
    CHECK(exceeded.message.find("2") != std::string::npos);

    auto fits = source.query("sp-1", may_2024(3));
    CHECK(fits.error == QueryError::None);
    CHECK(fits.rows.size() == 3);
}

TEST_CASE("ActivityExportSource::query: unknown principal returns an empty result") {
    ActivityExportSource source(std::vector<ActivityLogRow>{});
    auto result = source.query("sp-1", may_2024());
    CHECK(result.error == QueryError::None);
    CHECK(result.rows.empty());
}
