#pragma once

#include "search/search_context.hpp"

#include <vector>

namespace gearopt {

struct FallbackOutcome {
    std::vector<Candidate> candidates;   // sorted, at most topN
    long long processed_states = 0;
    bool timed_out = false;
};

/// Deterministic Fallback: depth-first search over rough-sorted pools that
/// prunes on set legality, attack and custom reachability and partial
/// skill-point feasibility. Stops at topN valid builds or the wall-clock cap.
class FallbackSearch {
public:
    FallbackOutcome search(const SearchContext& ctx);
};

} // namespace gearopt
