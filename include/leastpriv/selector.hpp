#pragma once

#include "leastpriv/types.hpp"

#include <vector>

namespace leastpriv {

// ============================================================================
// Optimal Permission Selection
// ============================================================================
//
// Greedy approximation of minimum set cover. Elements are distinct activity
// keys; sets are the activity keys each candidate permission can satisfy.
//
// Permissions are ordered once by total coverage (descending, then by first
// appearance in the input). Each round picks the permission covering the most
// still-uncovered keys; on equal counts the earlier permission in that order
// wins. The loop stops when every key with a candidate is covered or no
// permission adds coverage.
//
// The result is not guaranteed to be the minimum set. Keys with no candidate
// (unmatched, or matched to an entry offering no Application permission) are
// reported in unmatched_activities, one entry per distinct key.

SelectionResult select_optimal_permissions(const std::vector<MatchResult>& results);

} // namespace leastpriv
