#include "leastpriv/selector.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace leastpriv {

namespace {

struct CoverageSet {
    PermissionDescriptor permission;
    std::set<ActivityKey> covers;
};

size_t count_uncovered(const CoverageSet& set, const std::set<ActivityKey>& uncovered) {
    size_t n = 0;
    for (const auto& key : set.covers) {
        if (uncovered.count(key)) ++n;
    }
    return n;
}

} // namespace

SelectionResult select_optimal_permissions(const std::vector<MatchResult>& results) {
    SelectionResult out;

    std::set<ActivityKey> all_keys;
    std::set<ActivityKey> coverable;

    // Coverage map, in first-appearance order
    std::vector<CoverageSet> sets;
    std::map<std::pair<std::string, ScopeType>, size_t> set_index;

    for (const auto& r : results) {
        ActivityKey key = activity_key(r.activity);
        all_keys.insert(key);

        if (!r.is_matched || r.candidate_permissions.empty()) {
            continue;
        }
        coverable.insert(key);

        for (const auto& perm : r.candidate_permissions) {
            auto id = std::make_pair(perm.name, perm.scope_type);
            auto it = set_index.find(id);
            if (it == set_index.end()) {
                it = set_index.emplace(id, sets.size()).first;
                sets.push_back(CoverageSet{perm, {}});
            }
            auto& set = sets[it->second];
            set.covers.insert(key);
            if (perm.is_least_privileged) {
                set.permission.is_least_privileged = true;
            }
        }
    }

    // Every key without a candidate is reported, once
    std::set<ActivityKey> reported;
    for (const auto& r : results) {
        ActivityKey key = activity_key(r.activity);
        if (coverable.count(key) || !reported.insert(key).second) {
            continue;
        }
        out.unmatched_activities.push_back(r.activity);
    }

    std::vector<size_t> order(sets.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return sets[a].covers.size() > sets[b].covers.size();
    });

    std::set<ActivityKey> uncovered = coverable;
    std::vector<bool> chosen(sets.size(), false);

    while (!uncovered.empty()) {
        size_t best = sets.size();
        size_t best_gain = 0;

        for (size_t idx : order) {
            if (chosen[idx]) continue;
            size_t gain = count_uncovered(sets[idx], uncovered);
            if (gain > best_gain) {
                best = idx;
                best_gain = gain;
            }
        }

        if (best == sets.size()) {
            break;
        }

        chosen[best] = true;
        for (const auto& key : sets[best].covers) {
            uncovered.erase(key);
        }
        out.selected.push_back(SelectedPermission{sets[best].permission,
                                                  static_cast<int>(best_gain)});
    }

    out.total_activities = static_cast<int>(all_keys.size());
    out.matched_activities = static_cast<int>(coverable.size() - uncovered.size());
    return out;
}

} // namespace leastpriv
