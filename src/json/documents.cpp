#include "leastpriv/json.hpp"
#include "leastpriv/fs.hpp"

#include <initializer_list>

#include <spdlog/spdlog.h>

namespace leastpriv {
namespace json {

namespace {

// First present string among alternative spellings of a key
std::string get_string_any(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string()) {
            return j[key].get<std::string>();
        }
    }
    return "";
}

bool get_bool_any(const json& j, std::initializer_list<const char*> keys, bool default_val) {
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_boolean()) {
            return j[key].get<bool>();
        }
    }
    return default_val;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

} // namespace

// ============================================================================
// PERMISSION MAP DOCUMENTS
// ============================================================================

PermissionDescriptor parse_permission_descriptor(const json& j) {
    PermissionDescriptor d;
    d.name = get_string_any(j, {"value", "name", "Name", "Value"});

    // Unknown or missing scope never surfaces as Application
    auto scope = parse_scope_type(get_string_any(j, {"scopeType", "ScopeType"}));
    d.scope_type = scope.value_or(ScopeType::Delegated);

    d.is_least_privileged = get_bool_any(
        j, {"isLeastPrivilege", "isLeastPrivileged", "IsLeastPrivilege", "IsLeastPrivileged"},
        false);
    return d;
}

ParseResult<std::vector<EndpointEntry>> parse_permission_map(const std::string& json_str,
                                                             ApiVersion version) {
    ParseResult<std::vector<EndpointEntry>> result;

    try {
        json j = json::parse(json_str);

        if (!j.is_array()) {
            result.error = "permission map must be a JSON array";
            return result;
        }

        const std::string wanted = api_version_to_string(version);

        for (size_t i = 0; i < j.size(); ++i) {
            const auto& item = j[i];
            if (!item.is_object()) {
                result.warnings.push_back("entry " + std::to_string(i) + ": not an object");
                continue;
            }

            std::string endpoint = get_string_any(item, {"Endpoint", "endpoint"});
            if (endpoint.empty()) {
                result.warnings.push_back("entry " + std::to_string(i) + ": missing Endpoint");
                continue;
            }

            std::string entry_version = get_string_any(item, {"Version", "version"});
            if (!entry_version.empty()) {
                auto parsed = parse_api_version(entry_version);
                if (!parsed || *parsed != version) {
                    result.warnings.push_back("entry " + std::to_string(i) + ": version " +
                                              entry_version + " is not " + wanted);
                    continue;
                }
            }

            EndpointEntry entry;
            entry.canonical_path = endpoint;

            const char* methods_key = item.contains("Method") ? "Method" : "methods";
            if (item.contains(methods_key) && item[methods_key].is_object()) {
                for (auto& [method, perms] : item[methods_key].items()) {
                    if (!perms.is_array()) continue;

                    MethodPermissions mp;
                    mp.method = method;
                    for (const auto& p : perms) {
                        if (!p.is_object()) continue;
                        auto descriptor = parse_permission_descriptor(p);
                        if (descriptor.name.empty()) {
                            result.warnings.push_back(endpoint + " " + method +
                                                      ": permission without a name");
                            continue;
                        }
                        mp.permissions.push_back(std::move(descriptor));
                    }
                    entry.methods.push_back(std::move(mp));
                }
            }

            result.value.push_back(std::move(entry));
        }

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ParseResult<std::vector<EndpointEntry>> load_permission_map(const std::string& path,
                                                            ApiVersion version) {
    auto content = fs::read_file(path);
    if (!content) {
        ParseResult<std::vector<EndpointEntry>> result;
        result.error = "failed to read permission map: " + path;
        return result;
    }

    auto result = parse_permission_map(*content, version);
    if (result.ok) {
        spdlog::debug("Loaded {} {} endpoints from {}", result.value.size(),
                      api_version_to_string(version), path);
        for (const auto& w : result.warnings) {
            spdlog::warn("{}: {}", path, w);
        }
    }
    return result;
}

// ============================================================================
// APPLICATION INVENTORY
// ============================================================================

ParseResult<std::vector<Application>> parse_applications(const std::string& json_str) {
    ParseResult<std::vector<Application>> result;

    try {
        json j = json::parse(json_str);

        // Accept a bare array or {"applications": [...]}
        if (j.is_object() && j.contains("applications")) {
            j = j["applications"];
        }
        if (!j.is_array()) {
            result.error = "application inventory must be a JSON array";
            return result;
        }

        for (size_t i = 0; i < j.size(); ++i) {
            const auto& item = j[i];
            if (!item.is_object()) {
                result.warnings.push_back("application " + std::to_string(i) + ": not an object");
                continue;
            }

            Application app;
            app.id = get_string_any(item, {"appId", "AppId", "id"});
            app.principal_id = get_string_any(item, {"principalId", "servicePrincipalId",
                                                     "PrincipalId", "ServicePrincipalId"});
            app.display_name = get_string_any(item, {"displayName", "DisplayName"});
            app.current_permissions = get_string_array(item, "permissions");

            if (app.principal_id.empty()) {
                app.principal_id = app.id;
            }
            if (app.principal_id.empty()) {
                result.warnings.push_back("application " + std::to_string(i) +
                                          ": missing appId and principalId");
                continue;
            }
            if (app.id.empty()) {
                app.id = app.principal_id;
            }

            result.value.push_back(std::move(app));
        }

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

// ============================================================================
// ACTIVITY LOG EXPORT
// ============================================================================

ParseResult<std::vector<ActivityLogRow>> parse_activity_export(const std::string& json_str) {
    ParseResult<std::vector<ActivityLogRow>> result;

    try {
        json j = json::parse(json_str);

        if (!j.is_array()) {
            result.error = "activity export must be a JSON array";
            return result;
        }

        for (size_t i = 0; i < j.size(); ++i) {
            const auto& item = j[i];
            if (!item.is_object()) continue;

            ActivityLogRow row;
            row.principal_id = get_string_any(item, {"principalId", "ServicePrincipalId", "AppId"});
            row.method = get_string_any(item, {"method", "RequestMethod"});
            row.uri = get_string_any(item, {"uri", "RequestUri"});

            std::string time = get_string_any(item, {"timeGenerated", "TimeGenerated"});
            auto ts = parse_timestamp(time);
            if (!ts) {
                result.warnings.push_back("row " + std::to_string(i) + ": invalid timeGenerated '" +
                                          time + "'");
                continue;
            }
            row.time_generated = *ts;

            for (const char* key : {"status", "ResponseStatusCode"}) {
                if (item.contains(key) && item[key].is_number_integer()) {
                    row.status = item[key].get<int>();
                    break;
                }
            }

            if (row.principal_id.empty() || row.method.empty() || row.uri.empty()) {
                result.warnings.push_back("row " + std::to_string(i) + ": incomplete");
                continue;
            }
            result.value.push_back(std::move(row));
        }

        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

} // namespace json
} // namespace leastpriv
