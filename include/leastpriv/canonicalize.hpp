#pragma once

#include "leastpriv/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace leastpriv {

// ============================================================================
// URI Canonicalization
// ============================================================================
//
// A canonical URI is version-stable and identifier-free:
//   https://graph.microsoft.com/v1.0/users/8f0c.../messages?$top=5
//   -> https://graph.microsoft.com/v1.0/users/{id}/messages
//
// Rules, applied in order:
//   1. drop everything from '?' onward
//   2. collapse runs of '/' in the path
//   3. a "me" segment becomes "users/{id}"
//   4. an email-like segment (<chars>@<chars>.<chars>) becomes "{id}"
//   5. any other segment carrying an identifier (a digit or a "{...}"
//      placeholder) becomes "{id}", except the version segment. When the
//      last segment is an OData function call, "name(args)" becomes
//      "name/{id}".
// A trailing slash is never emitted. The transformation is idempotent.

inline constexpr const char* kIdPlaceholder = "{id}";

struct UriParts {
    std::string origin;   // "https://graph.microsoft.com", empty for relative URIs
    std::string path;     // everything after the origin
};

// Split a URI into origin and path without any normalization
UriParts split_uri(const std::string& uri);

// Canonicalize a full or relative request URI. Never throws; input that is
// not a URI (embedded whitespace or control characters) is returned trimmed
// but otherwise unchanged.
std::string canonicalize_uri(const std::string& uri);

// Apply rules 1-5 to a bare path, e.g. a permission-map endpoint
// "/users/{user-id}/messages" -> "/users/{id}/messages"
std::string canonicalize_path(const std::string& path);

// Canonicalize a raw activity and split out its API version.
// Returns nullopt when the URI has no "v1.0"/"beta" version segment or the
// method is empty; such calls are not analyzable.
std::optional<CanonicalActivity> to_canonical_activity(const std::string& method,
                                                       const std::string& uri);

inline std::optional<CanonicalActivity> to_canonical_activity(const RawActivity& raw) {
    return to_canonical_activity(raw.method, raw.uri);
}

// True if the segment looks like an email address
bool is_email_like(const std::string& segment);

} // namespace leastpriv
