#pragma once

#include "leastpriv/types.hpp"

#include <string>
#include <vector>

namespace leastpriv {

// ============================================================================
// Activity Log Source
// ============================================================================
//
// A time-series store of API call logs. One query returns the distinct
// (method, uri) pairs of successful calls made by a principal inside
// [window.start, window.end), at most window.max_entries rows. The store strips
// query strings and duplicate slashes before deduplicating; identifier
// tokens are left in place.
//
// Implementations are called concurrently from collection workers and must
// be safe for that.

class ActivityLogSource {
public:
    virtual ~ActivityLogSource() = default;

    virtual QueryResult query(const std::string& principal_id,
                              const ActivityWindow& window) const = 0;
};

// ============================================================================
// Activity Export Source
// ============================================================================
//
// Replays a JSON export of activity log rows:
//   [{"principalId": "...", "timeGenerated": "2024-05-01T10:00:00Z",
//     "method": "GET", "uri": "https://...", "status": 200}, ...]
// with the same contract as the remote store. When the distinct row count
// exceeds max_entries the query is answered with SizeExceeded rather than a
// truncated list.

struct ActivityLogRow {
    std::string principal_id;
    Timestamp time_generated;
    std::string method;
    std::string uri;
    int status = 200;
};

class ActivityExportSource : public ActivityLogSource {
public:
    explicit ActivityExportSource(std::vector<ActivityLogRow> rows);

    QueryResult query(const std::string& principal_id,
                      const ActivityWindow& window) const override;

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<ActivityLogRow> rows_;
};

// Remote-side URI cleanup: drop the query string, collapse duplicate slashes
// in the path
std::string strip_uri_for_store(const std::string& uri);

} // namespace leastpriv
