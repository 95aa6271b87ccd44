/*
 * leastpriv JSON - document loading and report emission
 *
 * Reads permission-map documents, application inventories and activity log
 * exports, and writes per-application analysis reports. Requires nlohmann/json.
 */

#pragma once

#include "leastpriv/activity_log.hpp"
#include "leastpriv/permission_map.hpp"
#include "leastpriv/scheduler.hpp"
#include "leastpriv/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace leastpriv {
namespace json {

using json = nlohmann::json;

// ============================================================================
// PARSE RESULTS
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

// ============================================================================
// PERMISSION MAP DOCUMENTS
// ============================================================================
//
// [{"Endpoint": "/users/{user-id}", "Version": "v1.0",
//   "Method": {"GET": [{"value": "User.Read.All", "scopeType": "Application",
//                       "isLeastPrivilege": true}, ...]}}, ...]

ParseResult<std::vector<EndpointEntry>> parse_permission_map(const std::string& json_str,
                                                             ApiVersion version);

ParseResult<std::vector<EndpointEntry>> load_permission_map(const std::string& path,
                                                            ApiVersion version);

PermissionDescriptor parse_permission_descriptor(const json& j);

// ============================================================================
// APPLICATION INVENTORY
// ============================================================================
//
// [{"appId": "...", "principalId": "...", "displayName": "...",
//   "permissions": ["User.Read.All", ...]}, ...]

ParseResult<std::vector<Application>> parse_applications(const std::string& json_str);

// ============================================================================
// ACTIVITY LOG EXPORT
// ============================================================================

ParseResult<std::vector<ActivityLogRow>> parse_activity_export(const std::string& json_str);

// ============================================================================
// REPORTS
// ============================================================================

json to_json(const CanonicalActivity& activity);
json to_json(const PermissionDescriptor& permission);
json to_json(const MatchResult& match);
json to_json(const SelectedPermission& selected);
json to_json(const ApplicationAnalysis& analysis);
json to_json(const BatchResult& batch);
json to_json(const MapSummary& summary);

} // namespace json
} // namespace leastpriv
