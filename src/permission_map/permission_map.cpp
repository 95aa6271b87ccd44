#include "leastpriv/permission_map.hpp"
#include "leastpriv/canonicalize.hpp"

#include <algorithm>
#include <cctype>

namespace leastpriv {

namespace {

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool same_permission(const PermissionDescriptor& a, const PermissionDescriptor& b) {
    return a.name == b.name && a.scope_type == b.scope_type;
}

void merge_method(EndpointEntry& target, const MethodPermissions& incoming) {
    std::string method = to_upper(incoming.method);
    for (auto& existing : target.methods) {
        if (existing.method != method) continue;
        for (const auto& perm : incoming.permissions) {
            auto it = std::find_if(existing.permissions.begin(), existing.permissions.end(),
                                   [&](const PermissionDescriptor& p) {
                                       return same_permission(p, perm);
                                   });
            if (it == existing.permissions.end()) {
                existing.permissions.push_back(perm);
            } else if (perm.is_least_privileged) {
                it->is_least_privileged = true;
            }
        }
        return;
    }
    target.methods.push_back(MethodPermissions{method, incoming.permissions});
}

} // namespace

PermissionMapIndex::PermissionMapIndex(const std::vector<EndpointEntry>& v1_entries,
                                       const std::vector<EndpointEntry>& beta_entries) {
    insert_all(v1_, v1_entries);
    insert_all(beta_, beta_entries);
}

void PermissionMapIndex::insert_all(PathTable& table, const std::vector<EndpointEntry>& entries) {
    for (const auto& entry : entries) {
        std::string key = canonicalize_path(entry.canonical_path);
        if (key.empty()) key = "/";

        auto it = table.find(key);
        if (it == table.end()) {
            EndpointEntry normalized;
            normalized.canonical_path = key;
            it = table.emplace(key, std::move(normalized)).first;
        }
        for (const auto& method : entry.methods) {
            merge_method(it->second, method);
        }
    }
}

const PermissionMapIndex::PathTable& PermissionMapIndex::table_for(ApiVersion version) const {
    return version == ApiVersion::Beta ? beta_ : v1_;
}

const EndpointEntry* PermissionMapIndex::find(ApiVersion version,
                                              const std::string& method,
                                              const std::string& canonical_path) const {
    const auto& table = table_for(version);

    std::string key = canonicalize_path(canonical_path);
    if (key.empty()) key = "/";

    auto it = table.find(key);
    if (it == table.end()) {
        return nullptr;
    }
    if (!method.empty() && it->second.permissions_for(method) == nullptr) {
        return nullptr;
    }
    return &it->second;
}

size_t PermissionMapIndex::endpoint_count(ApiVersion version) const {
    return table_for(version).size();
}

bool PermissionMapIndex::empty() const {
    return v1_.empty() && beta_.empty();
}

MapSummary summarize_permission_map(ApiVersion version,
                                    const std::vector<EndpointEntry>& entries) {
    MapSummary summary;
    summary.version = api_version_to_string(version);
    summary.total_endpoints = entries.size();

    for (const auto& entry : entries) {
        bool has_permissions = false;
        summary.total_methods += entry.methods.size();
        for (const auto& method : entry.methods) {
            summary.total_permissions += method.permissions.size();
            if (!method.permissions.empty()) has_permissions = true;
        }
        if (has_permissions) ++summary.endpoints_with_permissions;
    }

    if (summary.total_endpoints > 0) {
        summary.coverage_percent = 100.0 * static_cast<double>(summary.endpoints_with_permissions) /
                                   static_cast<double>(summary.total_endpoints);
    }
    return summary;
}

} // namespace leastpriv
