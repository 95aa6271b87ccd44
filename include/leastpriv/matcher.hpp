#pragma once

#include "leastpriv/permission_map.hpp"
#include "leastpriv/types.hpp"

#include <vector>

namespace leastpriv {

// ============================================================================
// Least-Privilege Matching
// ============================================================================

// Resolve one canonical activity against the index.
//
// Candidates are the Application-scope descriptors flagged least privileged;
// if none are flagged, every Application-scope descriptor is a candidate.
// Delegated descriptors are never returned. An activity without an endpoint
// entry, or whose entry has no list for the method, is reported with
// is_matched = false and no candidates.
MatchResult match_activity(const PermissionMapIndex& index, const CanonicalActivity& activity);

// Canonicalize and match a batch of raw activities. Calls without a v1.0/beta
// version segment are dropped before matching and do not appear in the output.
std::vector<MatchResult> match_activities(const PermissionMapIndex& index,
                                          const std::vector<RawActivity>& activities);

std::vector<MatchResult> match_activities(const PermissionMapIndex& index,
                                          const std::vector<CanonicalActivity>& activities);

// Application-scope candidates for one descriptor list (the filter and
// fallback used by match_activity)
std::vector<PermissionDescriptor> least_privileged_candidates(
    const std::vector<PermissionDescriptor>& descriptors);

} // namespace leastpriv
