#pragma once

#include "leastpriv/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace leastpriv {

// ============================================================================
// Permission Map Index
// ============================================================================
//
// Read-only lookup of per-version, per-path, per-method permission
// descriptors. Built once from the v1.0 and beta endpoint collections and
// shared by all workers; there is no mutating API after construction.
//
// Endpoint paths are keyed by their canonical form (see canonicalize_path),
// so "{user-id}" style placeholders in the map line up with the "{id}"
// placeholders produced from observed URIs. Lookup is exact string equality
// on that form; nothing is matched by prefix.

class PermissionMapIndex {
public:
    PermissionMapIndex() = default;

    PermissionMapIndex(const std::vector<EndpointEntry>& v1_entries,
                       const std::vector<EndpointEntry>& beta_entries);

    // Entry for a canonical path, or nullptr if the version has no such path.
    // When method is non-empty the entry must also carry a descriptor list
    // for that method.
    const EndpointEntry* find(ApiVersion version,
                              const std::string& method,
                              const std::string& canonical_path) const;

    size_t endpoint_count(ApiVersion version) const;
    bool empty() const;

private:
    using PathTable = std::unordered_map<std::string, EndpointEntry>;

    static void insert_all(PathTable& table, const std::vector<EndpointEntry>& entries);

    const PathTable& table_for(ApiVersion version) const;

    PathTable v1_;
    PathTable beta_;
};

// ============================================================================
// Permission Map Summary
// ============================================================================

struct MapSummary {
    std::string version;
    size_t total_endpoints = 0;
    size_t total_methods = 0;
    size_t total_permissions = 0;
    size_t endpoints_with_permissions = 0;
    double coverage_percent = 0.0;   // endpoints_with_permissions / total_endpoints * 100
};

MapSummary summarize_permission_map(ApiVersion version,
                                    const std::vector<EndpointEntry>& entries);

} // namespace leastpriv
