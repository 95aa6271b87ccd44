#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#ifndef LEASTPRIV_VERSION
#define LEASTPRIV_VERSION "0.0.0"
#endif

namespace leastpriv {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ============================================================================
// API Version
// ============================================================================

enum class ApiVersion {
    V1,
    Beta
};

inline const char* api_version_to_string(ApiVersion v) {
    switch (v) {
        case ApiVersion::V1: return "v1.0";
        case ApiVersion::Beta: return "beta";
        default: return "v1.0";
    }
}

// Parse a version path segment ("v1.0" or "beta", case-insensitive)
std::optional<ApiVersion> parse_api_version(const std::string& s);

// ============================================================================
// Scope Type
// ============================================================================

enum class ScopeType {
    Application,
    Delegated
};

inline const char* scope_type_to_string(ScopeType s) {
    switch (s) {
        case ScopeType::Application: return "Application";
        case ScopeType::Delegated: return "Delegated";
        default: return "Delegated";
    }
}

// "Application" maps to Application; "Delegated", "DelegatedWork" and
// "DelegatedPersonal" map to Delegated
std::optional<ScopeType> parse_scope_type(const std::string& s);

// ============================================================================
// Activities
// ============================================================================

// One observed successful call as returned by the log store
struct RawActivity {
    std::string method;
    std::string uri;
};

inline bool operator==(const RawActivity& a, const RawActivity& b) {
    return a.method == b.method && a.uri == b.uri;
}

// A call reduced to method + version + identifier-free path
struct CanonicalActivity {
    std::string method;     // upper case
    ApiVersion version = ApiVersion::V1;
    std::string path;       // path below the version segment, e.g. "/users/{id}"
    std::string uri;        // full canonical URI
};

// Unit of coverage identity
struct ActivityKey {
    std::string method;
    ApiVersion version = ApiVersion::V1;
    std::string path;
};

inline bool operator==(const ActivityKey& a, const ActivityKey& b) {
    return a.method == b.method && a.version == b.version && a.path == b.path;
}

inline bool operator<(const ActivityKey& a, const ActivityKey& b) {
    return std::tie(a.method, a.version, a.path) < std::tie(b.method, b.version, b.path);
}

inline ActivityKey activity_key(const CanonicalActivity& a) {
    return ActivityKey{a.method, a.version, a.path};
}

// ============================================================================
// Permission Map
// ============================================================================

struct PermissionDescriptor {
    std::string name;
    ScopeType scope_type = ScopeType::Application;
    bool is_least_privileged = false;
};

struct MethodPermissions {
    std::string method;
    std::vector<PermissionDescriptor> permissions;
};

struct EndpointEntry {
    std::string canonical_path;
    std::vector<MethodPermissions> methods;

    // Descriptor list for an HTTP method (case-insensitive), nullptr if absent
    const std::vector<PermissionDescriptor>* permissions_for(const std::string& method) const;
};

// ============================================================================
// Matching and Selection
// ============================================================================

struct MatchResult {
    CanonicalActivity activity;
    std::optional<std::string> matched_path;
    std::vector<PermissionDescriptor> candidate_permissions;
    bool is_matched = false;
};

struct SelectedPermission {
    PermissionDescriptor permission;
    int marginal_coverage = 0;   // activities newly covered when chosen
};

struct SelectionResult {
    std::vector<SelectedPermission> selected;
    std::vector<CanonicalActivity> unmatched_activities;
    int total_activities = 0;
    int matched_activities = 0;
};

// ============================================================================
// Collection
// ============================================================================

struct ActivityWindow {
    Timestamp start;
    Timestamp end;
    std::size_t max_entries = 0;
};

enum class QueryError {
    None,
    SizeExceeded,
    Other
};

inline const char* query_error_to_string(QueryError e) {
    switch (e) {
        case QueryError::None: return "none";
        case QueryError::SizeExceeded: return "size_exceeded";
        case QueryError::Other: return "other";
        default: return "other";
    }
}

struct QueryResult {
    QueryError error = QueryError::None;
    std::string message;
    std::vector<RawActivity> rows;
};

// ============================================================================
// Applications
// ============================================================================

struct Application {
    std::string id;                 // application (client) id
    std::string principal_id;       // service principal object id, queried in the log store
    std::string display_name;
    std::vector<std::string> current_permissions;
};

struct PermissionDelta {
    std::vector<std::string> excess;     // granted but not needed by observed activity
    std::vector<std::string> required;   // needed but not granted
};

// Per-application outcome handed to reporting
struct ApplicationAnalysis {
    Application application;
    bool ok = false;
    std::string error;

    std::vector<CanonicalActivity> activity;
    std::vector<MatchResult> activity_permissions;
    SelectionResult selection;
    bool matched_all_activity = false;
    PermissionDelta delta;

    size_t queries = 0;
    size_t dropped_windows = 0;
};

// ============================================================================
// Time helpers
// ============================================================================

// Format as RFC3339 UTC with seconds precision, e.g. "2024-05-01T00:00:00Z"
std::string format_timestamp(Timestamp t);

// Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z"; fractional seconds are truncated
std::optional<Timestamp> parse_timestamp(const std::string& s);

} // namespace leastpriv
