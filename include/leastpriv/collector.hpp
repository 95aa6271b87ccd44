#pragma once

#include "leastpriv/activity_log.hpp"
#include "leastpriv/types.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace leastpriv {

// ============================================================================
// Resilient Activity Collection
// ============================================================================

struct CollectorOptions {
    // Windows at or below this width are not split further
    std::chrono::seconds min_window = std::chrono::hours(24);
};

struct CollectionResult {
    bool ok = false;
    std::string error;
    std::vector<RawActivity> activities;   // distinct (method, canonical uri)
    size_t queries = 0;                    // store round trips
    size_t dropped_windows = 0;            // slices abandoned at the minimum width
};

// Collects one principal's distinct activity over a window.
//
// A SizeExceeded answer splits the window at its temporal midpoint, halves
// max_entries for each half (never below 1) and collects both halves; results
// are unioned on (method, uri). A window already at the minimum width that is
// still too large is logged and contributes nothing. Any other failure fails
// the whole collection without retry. An empty activity list with ok = true is
// a normal outcome.
class ActivityCollector {
public:
    explicit ActivityCollector(const ActivityLogSource& source, CollectorOptions options = {});

    CollectionResult collect(const std::string& principal_id, const ActivityWindow& window) const;

    const CollectorOptions& options() const { return options_; }

private:
    struct Fragment {
        QueryError error = QueryError::None;
        std::string message;
        std::vector<RawActivity> rows;
        size_t queries = 0;
        size_t dropped_windows = 0;
    };

    Fragment collect_window(const std::string& principal_id,
                            const ActivityWindow& window,
                            int depth) const;

    const ActivityLogSource& source_;
    CollectorOptions options_;
};

// Split [start, end) at its midpoint; each half gets max(1, max_entries / 2)
std::pair<ActivityWindow, ActivityWindow> bisect_window(const ActivityWindow& window);

// Union of two activity lists, distinct on (method, uri), first occurrence kept
std::vector<RawActivity> union_distinct(const std::vector<RawActivity>& a,
                                        const std::vector<RawActivity>& b);

// Canonicalize every uri and drop the (method, uri) duplicates this creates
std::vector<RawActivity> canonicalize_distinct(const std::vector<RawActivity>& rows);

// [now - days, now) with the given row budget
ActivityWindow lookback_window(Timestamp now, int days, size_t max_entries);

} // namespace leastpriv
