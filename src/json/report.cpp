#include "leastpriv/json.hpp"

namespace leastpriv {
namespace json {

json to_json(const CanonicalActivity& activity) {
    json j;
    j["Method"] = activity.method;
    j["Version"] = api_version_to_string(activity.version);
    j["Path"] = activity.path;
    j["Uri"] = activity.uri;
    return j;
}

json to_json(const PermissionDescriptor& permission) {
    json j;
    j["Permission"] = permission.name;
    j["ScopeType"] = scope_type_to_string(permission.scope_type);
    j["IsLeastPrivileged"] = permission.is_least_privileged;
    return j;
}

json to_json(const MatchResult& match) {
    json j = to_json(match.activity);
    j["IsMatched"] = match.is_matched;
    j["MatchedPath"] = match.matched_path ? json(*match.matched_path) : json(nullptr);
    j["Permissions"] = json::array();
    for (const auto& p : match.candidate_permissions) {
        j["Permissions"].push_back(to_json(p));
    }
    return j;
}

json to_json(const SelectedPermission& selected) {
    json j = to_json(selected.permission);
    j["ActivitiesCovered"] = selected.marginal_coverage;
    return j;
}

json to_json(const ApplicationAnalysis& analysis) {
    json j;
    j["AppId"] = analysis.application.id;
    j["PrincipalId"] = analysis.application.principal_id;
    j["DisplayName"] = analysis.application.display_name;
    j["CurrentPermissions"] = analysis.application.current_permissions;

    if (!analysis.ok) {
        j["Error"] = analysis.error;
        return j;
    }

    j["Activity"] = json::array();
    for (const auto& a : analysis.activity) {
        j["Activity"].push_back(to_json(a));
    }

    j["ActivityPermissions"] = json::array();
    for (const auto& m : analysis.activity_permissions) {
        j["ActivityPermissions"].push_back(to_json(m));
    }

    j["OptimalPermissions"] = json::array();
    for (const auto& s : analysis.selection.selected) {
        j["OptimalPermissions"].push_back(to_json(s));
    }

    j["UnmatchedActivities"] = json::array();
    for (const auto& a : analysis.selection.unmatched_activities) {
        j["UnmatchedActivities"].push_back(to_json(a));
    }

    j["MatchedAllActivity"] = analysis.matched_all_activity;
    j["TotalActivities"] = analysis.selection.total_activities;
    j["MatchedActivities"] = analysis.selection.matched_activities;
    j["ExcessPermissions"] = analysis.delta.excess;
    j["RequiredPermissions"] = analysis.delta.required;

    if (analysis.dropped_windows > 0) {
        j["DroppedWindows"] = analysis.dropped_windows;
    }
    return j;
}

json to_json(const BatchResult& batch) {
    json j;
    j["Submitted"] = batch.submitted;
    j["TimedOut"] = batch.timed_out;

    j["Applications"] = json::array();
    for (const auto& a : batch.completed) {
        j["Applications"].push_back(to_json(a));
    }

    j["Pending"] = json::array();
    for (const auto& app : batch.pending) {
        j["Pending"].push_back(app.id);
    }
    return j;
}

json to_json(const MapSummary& summary) {
    json j;
    j["version"] = summary.version;
    j["totalEndpoints"] = summary.total_endpoints;
    j["totalMethods"] = summary.total_methods;
    j["totalPermissions"] = summary.total_permissions;
    j["endpointsWithPermissions"] = summary.endpoints_with_permissions;
    j["coveragePercent"] = summary.coverage_percent;
    return j;
}

} // namespace json
} // namespace leastpriv
