#include "leastpriv/canonicalize.hpp"

#include <algorithm>
#include <cctype>

namespace leastpriv {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_uri_text(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) return false;
    }
    return true;
}

bool equals_ignore_case(const std::string& a, const char* b) {
    size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return i == a.size() && b[i] == '\0';
}

std::string strip_query(const std::string& s) {
    auto q = s.find('?');
    return q == std::string::npos ? s : s.substr(0, q);
}

// Non-empty '/'-separated segments; empty segments are what collapsing removes
std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) segments.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) segments.push_back(current);
    return segments;
}

bool carries_identifier(const std::string& segment) {
    for (char c : segment) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '{') return true;
    }
    return false;
}

std::vector<std::string> canonical_segments(const std::vector<std::string>& input) {
    const bool has_version = !input.empty() && parse_api_version(input.front()).has_value();

    std::vector<std::string> out;
    out.reserve(input.size() + 1);

    for (size_t i = 0; i < input.size(); ++i) {
        const std::string& seg = input[i];
        const bool is_last = (i + 1 == input.size());

        if (i == 0 && has_version) {
            out.push_back(seg);
            continue;
        }

        if (equals_ignore_case(seg, "me")) {
            out.push_back("users");
            out.push_back(kIdPlaceholder);
            continue;
        }

        if (is_email_like(seg)) {
            out.push_back(kIdPlaceholder);
            continue;
        }

        if (!carries_identifier(seg)) {
            out.push_back(seg);
            continue;
        }

        auto paren = seg.find('(');
        if (is_last && paren != std::string::npos) {
            // The kept name goes through the same rules as a whole segment
            std::string name = seg.substr(0, paren);
            if (equals_ignore_case(name, "me")) {
                out.push_back("users");
                out.push_back(kIdPlaceholder);
            } else if (is_email_like(name)) {
                out.push_back(kIdPlaceholder);
            } else if (!name.empty() && !carries_identifier(name)) {
                out.push_back(name);
            }
            out.push_back(kIdPlaceholder);
            continue;
        }

        out.push_back(kIdPlaceholder);
    }

    return out;
}

std::string join_segments(const std::vector<std::string>& segments, size_t first = 0) {
    std::string out;
    for (size_t i = first; i < segments.size(); ++i) {
        out += '/';
        out += segments[i];
    }
    return out;
}

} // namespace

bool is_email_like(const std::string& segment) {
    auto at = segment.find('@');
    if (at == std::string::npos || at == 0) return false;
    if (segment.find('@', at + 1) != std::string::npos) return false;

    auto dot = segment.find('.', at + 1);
    if (dot == std::string::npos) return false;
    // at least one char between '@' and '.', and after the '.'
    return dot > at + 1 && dot + 1 < segment.size();
}

UriParts split_uri(const std::string& uri) {
    UriParts parts;

    auto scheme_end = uri.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        parts.path = uri;
        return parts;
    }

    for (size_t i = 0; i < scheme_end; ++i) {
        auto c = static_cast<unsigned char>(uri[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            parts.path = uri;
            return parts;
        }
    }

    auto path_start = uri.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        parts.origin = uri;
        return parts;
    }

    parts.origin = uri.substr(0, path_start);
    parts.path = uri.substr(path_start);
    return parts;
}

std::string canonicalize_path(const std::string& path) {
    return join_segments(canonical_segments(split_segments(strip_query(path))));
}

std::string canonicalize_uri(const std::string& uri) {
    std::string trimmed = trim(uri);
    if (!is_uri_text(trimmed)) {
        return trimmed;
    }

    auto parts = split_uri(strip_query(trimmed));
    return parts.origin + canonicalize_path(parts.path);
}

std::optional<CanonicalActivity> to_canonical_activity(const std::string& method,
                                                       const std::string& uri) {
    std::string verb = trim(method);
    if (verb.empty()) return std::nullopt;
    std::transform(verb.begin(), verb.end(), verb.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string canonical = canonicalize_uri(uri);
    auto segments = split_segments(split_uri(canonical).path);
    if (segments.empty()) return std::nullopt;

    auto version = parse_api_version(segments.front());
    if (!version) return std::nullopt;

    CanonicalActivity activity;
    activity.method = verb;
    activity.version = *version;
    activity.path = segments.size() > 1 ? join_segments(segments, 1) : "/";
    activity.uri = canonical;
    return activity;
}

} // namespace leastpriv
