#include "leastpriv/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace leastpriv {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ApiVersion> parse_api_version(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "v1.0") return ApiVersion::V1;
    if (lower == "beta") return ApiVersion::Beta;
    return std::nullopt;
}

std::optional<ScopeType> parse_scope_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "application") return ScopeType::Application;
    if (lower.rfind("delegated", 0) == 0) return ScopeType::Delegated;
    return std::nullopt;
}

const std::vector<PermissionDescriptor>* EndpointEntry::permissions_for(
    const std::string& method) const {
    std::string wanted = method;
    std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& m : methods) {
        if (m.method == wanted) {
            return &m.permissions;
        }
    }
    return nullptr;
}

std::string format_timestamp(Timestamp t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buffer);
}

std::optional<Timestamp> parse_timestamp(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    // Optional fraction, then a mandatory Z
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    }
    if (pos + 1 != s.size() || (s[pos] != 'Z' && s[pos] != 'z')) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t tt = timegm(&tm_buf);
    return Clock::from_time_t(tt);
}

} // namespace leastpriv
