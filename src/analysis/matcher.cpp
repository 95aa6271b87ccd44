#include "leastpriv/matcher.hpp"
#include "leastpriv/canonicalize.hpp"

namespace leastpriv {

std::vector<PermissionDescriptor> least_privileged_candidates(
    const std::vector<PermissionDescriptor>& descriptors) {

    std::vector<PermissionDescriptor> flagged;
    std::vector<PermissionDescriptor> application;

    for (const auto& d : descriptors) {
        if (d.scope_type != ScopeType::Application) {
            continue;
        }
        application.push_back(d);
        if (d.is_least_privileged) {
            flagged.push_back(d);
        }
    }

    return flagged.empty() ? application : flagged;
}

MatchResult match_activity(const PermissionMapIndex& index, const CanonicalActivity& activity) {
    MatchResult result;
    result.activity = activity;

    const EndpointEntry* entry = index.find(activity.version, "", activity.path);
    if (!entry) {
        return result;
    }

    const auto* descriptors = entry->permissions_for(activity.method);
    if (!descriptors) {
        return result;
    }

    result.is_matched = true;
    result.matched_path = entry->canonical_path;
    result.candidate_permissions = least_privileged_candidates(*descriptors);
    return result;
}

std::vector<MatchResult> match_activities(const PermissionMapIndex& index,
                                          const std::vector<RawActivity>& activities) {
    std::vector<MatchResult> results;
    results.reserve(activities.size());

    for (const auto& raw : activities) {
        auto canonical = to_canonical_activity(raw);
        if (!canonical) {
            continue;
        }
        results.push_back(match_activity(index, *canonical));
    }
    return results;
}

std::vector<MatchResult> match_activities(const PermissionMapIndex& index,
                                          const std::vector<CanonicalActivity>& activities) {
    std::vector<MatchResult> results;
    results.reserve(activities.size());
    for (const auto& activity : activities) {
        results.push_back(match_activity(index, activity));
    }
    return results;
}

} // namespace leastpriv
