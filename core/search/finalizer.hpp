#pragma once

#include "search/search_context.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace gearopt {

/// Re-validates complete assignments against the solve's constraints,
/// deduplicates them on canonical key and scores the survivors.
class Finalizer {
public:
    explicit Finalizer(const SearchContext& ctx) : ctx_(ctx) {}

    /// Returns true when the assignment became a candidate. Rejections are
    /// tallied in stats(). Polls cancellation.
    bool accept(const SlotAssignment& slots);

    const RejectStats& stats() const { return stats_; }
    size_t size() const { return candidates_.size(); }

    /// Candidates sorted by score desc, then item ids in slot order asc.
    std::vector<Candidate> takeSorted();

private:
    const SearchContext& ctx_;
    RejectStats stats_;
    std::unordered_set<std::string> seen_;
    std::vector<Candidate> candidates_;
};

/// Finalize every node of a completed beam.
std::vector<Candidate> finalizeBeam(const SearchContext& ctx,
                                    const std::vector<BeamNode>& beam,
                                    RejectStats& stats);

} // namespace gearopt
