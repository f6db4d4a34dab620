#pragma once

#include "search/search_context.hpp"

#include <vector>

namespace gearopt {

struct ExactOutcome {
    std::vector<Candidate> candidates;   // sorted, truncated to topN
    RejectStats stats;
    long long processed_states = 0;
};

/// Exact Enumeration: depth-first walk over every combination of the slot
/// pools (skipping illegal set combos), finalizing each complete assignment.
/// Only used when the pool product is small, so the walk is not truncated.
class ExactSearch {
public:
    ExactOutcome search(const SearchContext& ctx);

    static constexpr long long kProgressInterval = 2000;
};

} // namespace gearopt
