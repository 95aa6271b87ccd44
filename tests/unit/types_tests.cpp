#include <doctest/doctest.h>
#include <leastpriv/types.hpp>

using namespace leastpriv;

// ============================================================================
// Version and Scope Parsing
// ============================================================================

TEST_CASE("parse_api_version: accepts v1.0 and beta in any case") {
    CHECK(parse_api_version("v1.0") == ApiVersion::V1);
    CHECK(parse_api_version("V1.0") == ApiVersion::V1);
    CHECK(parse_api_version("beta") == ApiVersion::Beta);
    CHECK(parse_api_version("Beta") == ApiVersion::Beta);
}

TEST_CASE("parse_api_version: rejects other segments") {
    CHECK_FALSE(parse_api_version("v2.0").has_value());
    CHECK_FALSE(parse_api_version("users").has_value());
    CHECK_FALSE(parse_api_version("").has_value());
}

TEST_CASE("parse_scope_type: delegated variants map to Delegated") {
    CHECK(parse_scope_type("Application") == ScopeType::Application);
    CHECK(parse_scope_type("application") == ScopeType::Application);
    CHECK(parse_scope_type("Delegated") == ScopeType::Delegated);
    CHECK(parse_scope_type("DelegatedWork") == ScopeType::Delegated);
    CHECK(parse_scope_type("DelegatedPersonal") == ScopeType::Delegated);
    CHECK_FALSE(parse_scope_type("Unknown").has_value());
}

// ============================================================================
// Endpoint Entries
// ============================================================================

TEST_CASE("EndpointEntry::permissions_for: method lookup is case-insensitive") {
    EndpointEntry entry;
    entry.canonical_path = "/users";
    entry.methods.push_back({"GET", {{"User.Read.All", ScopeType::Application, true}}});

    auto* perms = entry.permissions_for("get");
    REQUIRE(perms != nullptr);
    CHECK(perms->size() == 1);
    CHECK(perms->front().name == "User.Read.All");

    CHECK(entry.permissions_for("POST") == nullptr);
}

TEST_CASE("ActivityKey: ordering covers method, version and path") {
    ActivityKey a{"GET", ApiVersion::V1, "/users"};
    ActivityKey b{"GET", ApiVersion::Beta, "/users"};
    ActivityKey c{"POST", ApiVersion::V1, "/users"};

    CHECK(a < b);
    CHECK(a < c);
    CHECK_FALSE(a == b);
    CHECK(a == ActivityKey{"GET", ApiVersion::V1, "/users"});
}

// ============================================================================
// Timestamps
// ============================================================================

TEST_CASE("parse_timestamp: RFC3339 UTC with and without fraction") {
    auto t = parse_timestamp("2024-05-01T10:30:00Z");
    REQUIRE(t.has_value());
    CHECK(format_timestamp(*t) == "2024-05-01T10:30:00Z");

    auto frac = parse_timestamp("2024-05-01T10:30:00.1234567Z");
    REQUIRE(frac.has_value());
    CHECK(*frac == *t);
}

TEST_CASE("parse_timestamp: rejects malformed input") {
    CHECK_FALSE(parse_timestamp("").has_value());
    CHECK_FALSE(parse_timestamp("2024-05-01").has_value());
    CHECK_FALSE(parse_timestamp("2024-05-01T10:30:00").has_value());
    CHECK_FALSE(parse_timestamp("2024-05-01T10:30:00+02:00").has_value());
    CHECK_FALSE(parse_timestamp("2024-13-01T10:30:00Z").has_value());
}

TEST_CASE("format_timestamp: epoch") {
    CHECK(format_timestamp(Clock::from_time_t(0)) == "1970-01-01T00:00:00Z");
}
