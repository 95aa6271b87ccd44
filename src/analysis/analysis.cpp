#include "leastpriv/analysis.hpp"
#include "leastpriv/matcher.hpp"
#include "leastpriv/selector.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace leastpriv {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> sorted_distinct(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

} // namespace

std::vector<std::string> selected_permission_names(const SelectionResult& selection) {
    std::vector<std::string> names;
    names.reserve(selection.selected.size());
    for (const auto& s : selection.selected) {
        names.push_back(s.permission.name);
    }
    return names;
}

PermissionDelta compute_permission_delta(const std::vector<std::string>& current,
                                         const SelectionResult& selection) {
    PermissionDelta delta;

    std::set<std::string> granted;
    for (const auto& name : current) {
        granted.insert(to_lower(name));
    }

    std::set<std::string> needed;
    for (const auto& name : selected_permission_names(selection)) {
        needed.insert(to_lower(name));
        if (!granted.count(to_lower(name))) {
            delta.required.push_back(name);
        }
    }

    for (const auto& name : current) {
        if (!needed.count(to_lower(name))) {
            delta.excess.push_back(name);
        }
    }

    delta.excess = sorted_distinct(std::move(delta.excess));
    delta.required = sorted_distinct(std::move(delta.required));
    return delta;
}

ApplicationAnalysis analyze_activity(const Application& application,
                                     const std::vector<RawActivity>& activities,
                                     const PermissionMapIndex& index) {
    ApplicationAnalysis analysis;
    analysis.application = application;

    analysis.activity_permissions = match_activities(index, activities);
    analysis.activity.reserve(analysis.activity_permissions.size());
    for (const auto& m : analysis.activity_permissions) {
        analysis.activity.push_back(m.activity);
    }

    analysis.selection = select_optimal_permissions(analysis.activity_permissions);
    analysis.matched_all_activity = analysis.selection.unmatched_activities.empty();
    analysis.delta = compute_permission_delta(application.current_permissions, analysis.selection);
    analysis.ok = true;
    return analysis;
}

ApplicationAnalysis analyze_application(const Application& application,
                                        const ActivityCollector& collector,
                                        const PermissionMapIndex& index,
                                        const ActivityWindow& window) {
    auto collected = collector.collect(application.principal_id, window);
    if (!collected.ok) {
        ApplicationAnalysis failed = failed_analysis(application, collected.error);
        failed.queries = collected.queries;
        return failed;
    }

    ApplicationAnalysis analysis = analyze_activity(application, collected.activities, index);
    analysis.queries = collected.queries;
    analysis.dropped_windows = collected.dropped_windows;
    return analysis;
}

AnalysisContext::AnalysisContext(std::shared_ptr<const ActivityLogSource> log_source,
                                 CollectorOptions collector_options,
                                 PermissionMapIndex permission_index,
                                 ActivityWindow collection_window)
    : source(std::move(log_source)),
      collector(*source, collector_options),
      index(std::move(permission_index)),
      window(collection_window) {}

BatchResult analyze_applications(const std::vector<Application>& applications,
                                 std::shared_ptr<const AnalysisContext> context,
                                 CollectionScheduler& scheduler) {
    return scheduler.run(applications, [context](const Application& app) {
        return analyze_application(app, context->collector, context->index, context->window);
    });
}

} // namespace leastpriv
