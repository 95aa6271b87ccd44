#include "leastpriv/activity_log.hpp"
#include "leastpriv/canonicalize.hpp"

#include <set>
#include <utility>

namespace leastpriv {

std::string strip_uri_for_store(const std::string& uri) {
    auto q = uri.find('?');
    std::string stripped = q == std::string::npos ? uri : uri.substr(0, q);

    auto parts = split_uri(stripped);
    std::string path;
    path.reserve(parts.path.size());
    for (char c : parts.path) {
        if (c == '/' && !path.empty() && path.back() == '/') continue;
        path.push_back(c);
    }
    return parts.origin + path;
}

ActivityExportSource::ActivityExportSource(std::vector<ActivityLogRow> rows)
    : rows_(std::move(rows)) {}

QueryResult ActivityExportSource::query(const std::string& principal_id,
                                        const ActivityWindow& window) const {
    QueryResult result;

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& row : rows_) {
        if (row.principal_id != principal_id) continue;
        if (row.time_generated < window.start || row.time_generated >= window.end) continue;
        if (row.status < 200 || row.status > 299) continue;

        std::string uri = strip_uri_for_store(row.uri);
        if (!seen.emplace(row.method, uri).second) continue;

        if (seen.size() > window.max_entries) {
            result.error = QueryError::SizeExceeded;
            result.message = "result set exceeds " + std::to_string(window.max_entries) + " rows";
            result.rows.clear();
            return result;
        }
        result.rows.push_back(RawActivity{row.method, uri});
    }

    return result;
}

} // namespace leastpriv
