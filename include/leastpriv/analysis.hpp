#pragma once

#include "leastpriv/collector.hpp"
#include "leastpriv/permission_map.hpp"
#include "leastpriv/scheduler.hpp"
#include "leastpriv/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace leastpriv {

// ============================================================================
// Application Analysis
// ============================================================================

// Collect, canonicalize, match and select for one application.
// A collection failure yields ok = false with the collector's error; every
// later stage is pure and cannot fail.
ApplicationAnalysis analyze_application(const Application& application,
                                        const ActivityCollector& collector,
                                        const PermissionMapIndex& index,
                                        const ActivityWindow& window);

// Match and select over an already collected activity list
ApplicationAnalysis analyze_activity(const Application& application,
                                     const std::vector<RawActivity>& activities,
                                     const PermissionMapIndex& index);

// Everything an analysis task reads. Tasks hold a shared reference, so a
// worker detached after a stall keeps it alive.
struct AnalysisContext {
    AnalysisContext(std::shared_ptr<const ActivityLogSource> log_source,
                    CollectorOptions collector_options,
                    PermissionMapIndex permission_index,
                    ActivityWindow collection_window);

    AnalysisContext(const AnalysisContext&) = delete;
    AnalysisContext& operator=(const AnalysisContext&) = delete;

    std::shared_ptr<const ActivityLogSource> source;
    ActivityCollector collector;   // refers to *source
    PermissionMapIndex index;
    ActivityWindow window;
};

// Run analyze_application for every application through a scheduler
BatchResult analyze_applications(const std::vector<Application>& applications,
                                 std::shared_ptr<const AnalysisContext> context,
                                 CollectionScheduler& scheduler);

// ============================================================================
// Permission Delta
// ============================================================================

// excess: currently granted names that were not selected
// required: selected names that are not currently granted
// Names compare case-insensitively; both lists come back sorted and distinct.
PermissionDelta compute_permission_delta(const std::vector<std::string>& current,
                                         const SelectionResult& selection);

// Selected permission names, in selection order
std::vector<std::string> selected_permission_names(const SelectionResult& selection);

} // namespace leastpriv
