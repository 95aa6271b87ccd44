#include "leastpriv/collector.hpp"
#include "leastpriv/canonicalize.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace leastpriv {

namespace {

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

std::pair<ActivityWindow, ActivityWindow> bisect_window(const ActivityWindow& window) {
    auto mid = window.start + (window.end - window.start) / 2;
    size_t half = std::max<size_t>(1, window.max_entries / 2);

    ActivityWindow first{window.start, mid, half};
    ActivityWindow second{mid, window.end, half};
    return {first, second};
}

std::vector<RawActivity> union_distinct(const std::vector<RawActivity>& a,
                                        const std::vector<RawActivity>& b) {
    std::vector<RawActivity> out;
    out.reserve(a.size() + b.size());

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto* list : {&a, &b}) {
        for (const auto& row : *list) {
            if (seen.emplace(row.method, row.uri).second) {
                out.push_back(row);
            }
        }
    }
    return out;
}

std::vector<RawActivity> canonicalize_distinct(const std::vector<RawActivity>& rows) {
    std::vector<RawActivity> out;
    out.reserve(rows.size());

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& row : rows) {
        RawActivity canonical{to_upper(row.method), canonicalize_uri(row.uri)};
        if (seen.emplace(canonical.method, canonical.uri).second) {
            out.push_back(std::move(canonical));
        }
    }
    return out;
}

ActivityWindow lookback_window(Timestamp now, int days, size_t max_entries) {
    return ActivityWindow{now - std::chrono::hours(24) * days, now, max_entries};
}

ActivityCollector::ActivityCollector(const ActivityLogSource& source, CollectorOptions options)
    : source_(source), options_(options) {}

ActivityCollector::Fragment ActivityCollector::collect_window(const std::string& principal_id,
                                                              const ActivityWindow& window,
                                                              int depth) const {
    Fragment fragment;
    fragment.queries = 1;

    QueryResult answer = source_.query(principal_id, window);

    if (answer.error == QueryError::None) {
        fragment.rows = std::move(answer.rows);
        return fragment;
    }

    if (answer.error == QueryError::Other) {
        fragment.error = QueryError::Other;
        fragment.message = answer.message;
        return fragment;
    }

    // SizeExceeded
    if (window.end - window.start <= options_.min_window) {
        spdlog::warn("Activity for {} in [{}, {}) exceeds the store limit at minimum window width; "
                     "skipping this window",
                     principal_id, format_timestamp(window.start), format_timestamp(window.end));
        fragment.dropped_windows = 1;
        return fragment;
    }

    auto [first, second] = bisect_window(window);
    spdlog::debug("Splitting [{}, {}) for {} at depth {} (max entries {})",
                  format_timestamp(window.start), format_timestamp(window.end),
                  principal_id, depth, first.max_entries);

    Fragment left = collect_window(principal_id, first, depth + 1);
    if (left.error == QueryError::Other) {
        left.queries += fragment.queries;
        return left;
    }

    Fragment right = collect_window(principal_id, second, depth + 1);
    if (right.error == QueryError::Other) {
        right.queries += fragment.queries + left.queries;
        return right;
    }

    fragment.rows = union_distinct(left.rows, right.rows);
    fragment.queries += left.queries + right.queries;
    fragment.dropped_windows = left.dropped_windows + right.dropped_windows;
    return fragment;
}

CollectionResult ActivityCollector::collect(const std::string& principal_id,
                                            const ActivityWindow& window) const {
    CollectionResult result;

    if (window.end <= window.start) {
        result.error = "empty time window";
        return result;
    }
    if (window.max_entries == 0) {
        result.error = "max entries must be at least 1";
        return result;
    }

    Fragment fragment = collect_window(principal_id, window, 0);
    result.queries = fragment.queries;
    result.dropped_windows = fragment.dropped_windows;

    if (fragment.error == QueryError::Other) {
        spdlog::warn("Activity query failed for {}: {}", principal_id, fragment.message);
        result.error = fragment.message.empty() ? "activity query failed" : fragment.message;
        return result;
    }

    result.activities = canonicalize_distinct(fragment.rows);
    result.ok = true;
    return result;
}

} // namespace leastpriv
