#pragma once

#include "leastpriv/activity_log.hpp"
#include "leastpriv/types.hpp"

#include <string>
#include <vector>

namespace leastpriv {

// ============================================================================
// Log Analytics Activity Source
// ============================================================================
//
// Queries MicrosoftGraphActivityLogs through the Log Analytics query REST API:
//   POST {endpoint}/v1/workspaces/{workspace_id}/query
//   Authorization: Bearer <token>
//   {"query": "<KQL>", "timespan": "<start>/<end>"}
//
// The access token is supplied by the caller; acquiring it is not this
// module's concern. No retries are made here.

struct LogAnalyticsOptions {
    std::string endpoint = "https://api.loganalytics.io";
    std::string workspace_id;
    std::string access_token;
    long timeout_seconds = 300;
    // Error codes (top-level or nested innererror) that mean "result too large"
    std::vector<std::string> size_exceeded_codes = {"ResponseSizeError",
                                                    "E_QUERY_RESULT_SET_TOO_LARGE"};
};

class LogAnalyticsSource : public ActivityLogSource {
public:
    explicit LogAnalyticsSource(LogAnalyticsOptions options);

    QueryResult query(const std::string& principal_id,
                      const ActivityWindow& window) const override;

    const LogAnalyticsOptions& options() const { return options_; }

private:
    LogAnalyticsOptions options_;
};

// Quote a value as a KQL string literal
std::string kql_quote(const std::string& value);

// KQL for the distinct successful (method, uri) pairs of one principal
std::string build_activity_query(const std::string& principal_id, const ActivityWindow& window);

// Request body for the query endpoint
std::string build_query_body(const std::string& principal_id, const ActivityWindow& window);

// Classify a query response. size_exceeded_codes are compared exactly.
QueryResult parse_query_response(long http_status,
                                 const std::string& body,
                                 const std::vector<std::string>& size_exceeded_codes);

} // namespace leastpriv
