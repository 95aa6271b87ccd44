#include "leastpriv/log_analytics.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace leastpriv {

using json = nlohmann::json;

// ============================================================================
// Query Construction
// ============================================================================

std::string kql_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

std::string build_activity_query(const std::string& principal_id, const ActivityWindow& window) {
    std::string id = kql_quote(principal_id);
    std::string query;
    query += "MicrosoftGraphActivityLogs\n";
    query += "| where TimeGenerated >= datetime(" + format_timestamp(window.start) + ")"
             " and TimeGenerated < datetime(" + format_timestamp(window.end) + ")\n";
    query += "| where ServicePrincipalId == " + id + " or AppId == " + id + "\n";
    query += "| where ResponseStatusCode between (200 .. 299)\n";
    query += "| extend RequestUri = replace_regex(tostring(split(RequestUri, '?')[0]),"
             " @'([^:/])/{2,}', @'\\1/')\n";
    query += "| distinct RequestMethod, RequestUri\n";
    query += "| take " + std::to_string(window.max_entries);
    return query;
}

std::string build_query_body(const std::string& principal_id, const ActivityWindow& window) {
    json body;
    body["query"] = build_activity_query(principal_id, window);
    body["timespan"] = format_timestamp(window.start) + "/" + format_timestamp(window.end);
    return body.dump();
}

// ============================================================================
// Response Classification
// ============================================================================

namespace {

// error.code plus every nested innererror / details code
void collect_error_codes(const json& error, std::vector<std::string>& codes) {
    if (!error.is_object()) return;

    if (error.contains("code") && error["code"].is_string()) {
        codes.push_back(error["code"].get<std::string>());
    }
    if (error.contains("innererror")) {
        collect_error_codes(error["innererror"], codes);
    }
    if (error.contains("details") && error["details"].is_array()) {
        for (const auto& d : error["details"]) {
            collect_error_codes(d, codes);
        }
    }
}

QueryResult classify_error(const json& error, const std::vector<std::string>& size_exceeded_codes) {
    QueryResult result;
    result.error = QueryError::Other;

    std::vector<std::string> codes;
    collect_error_codes(error, codes);

    for (const auto& code : codes) {
        if (std::find(size_exceeded_codes.begin(), size_exceeded_codes.end(), code) !=
            size_exceeded_codes.end()) {
            result.error = QueryError::SizeExceeded;
            break;
        }
    }

    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        result.message = error["message"].get<std::string>();
    }
    if (!codes.empty()) {
        result.message = codes.front() + (result.message.empty() ? "" : ": " + result.message);
    }
    return result;
}

int column_index(const json& columns, const std::string& name) {
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& c = columns[i];
        if (c.is_object() && c.value("name", "") == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace

QueryResult parse_query_response(long http_status,
                                 const std::string& body,
                                 const std::vector<std::string>& size_exceeded_codes) {
    QueryResult result;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        result.error = QueryError::Other;
        result.message = "HTTP " + std::to_string(http_status) + ": unparsable response (" +
                         e.what() + ")";
        return result;
    }

    if (j.is_object() && j.contains("error")) {
        result = classify_error(j["error"], size_exceeded_codes);
        if (result.message.empty()) {
            result.message = "HTTP " + std::to_string(http_status);
        }
        return result;
    }

    if (http_status < 200 || http_status >= 300) {
        result.error = QueryError::Other;
        result.message = "HTTP " + std::to_string(http_status);
        return result;
    }

    if (!j.is_object() || !j.contains("tables") || !j["tables"].is_array() ||
        j["tables"].empty()) {
        result.error = QueryError::Other;
        result.message = "response has no result table";
        return result;
    }

    const auto& table = j["tables"][0];
    if (!table.contains("columns") || !table["columns"].is_array() ||
        !table.contains("rows") || !table["rows"].is_array()) {
        result.error = QueryError::Other;
        result.message = "result table is malformed";
        return result;
    }

    int method_col = column_index(table["columns"], "RequestMethod");
    int uri_col = column_index(table["columns"], "RequestUri");
    if (method_col < 0 || uri_col < 0) {
        result.error = QueryError::Other;
        result.message = "result table lacks RequestMethod/RequestUri columns";
        return result;
    }

    for (const auto& row : table["rows"]) {
        if (!row.is_array() || static_cast<int>(row.size()) <= std::max(method_col, uri_col)) {
            continue;
        }
        const auto& m = row[static_cast<size_t>(method_col)];
        const auto& u = row[static_cast<size_t>(uri_col)];
        if (!m.is_string() || !u.is_string()) continue;
        result.rows.push_back(RawActivity{m.get<std::string>(), u.get<std::string>()});
    }

    return result;
}

// ============================================================================
// HTTP Transport with libcurl
// ============================================================================

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const std::string& header) { list_ = curl_slist_append(list_, header.c_str()); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// curl_global_init is not thread-safe on every build; run it once, before workers start
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

LogAnalyticsSource::LogAnalyticsSource(LogAnalyticsOptions options)
    : options_(std::move(options)) {
    get_curl_init();
}

QueryResult LogAnalyticsSource::query(const std::string& principal_id,
                                      const ActivityWindow& window) const {
    QueryResult result;
    result.error = QueryError::Other;

    if (options_.workspace_id.empty()) {
        result.message = "log store workspace id is not configured";
        return result;
    }

    CurlHandle curl;
    if (!curl) {
        result.message = "failed to initialize CURL";
        return result;
    }

    std::string url = options_.endpoint + "/v1/workspaces/" + options_.workspace_id + "/query";
    std::string body = build_query_body(principal_id, window);
    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    CurlHeaders headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");
    if (!options_.access_token.empty()) {
        headers.append("Authorization: Bearer " + options_.access_token);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "leastpriv/" LEASTPRIV_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.message = std::string("HTTP request failed: ") +
                         (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

    return parse_query_response(http_status, response, options_.size_exceeded_codes);
}

} // namespace leastpriv
