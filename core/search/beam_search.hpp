#pragma once

#include "search/budget_manager.hpp"
#include "search/search_context.hpp"
#include "search/search_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gearopt {

enum class BeamMode : uint8_t {
    Fast,               // rough-score driven
    FeasibilityBiased   // ranks skill-point feasibility and focus support first
};

struct BeamOptions {
    BeamMode mode = BeamMode::Fast;
    int beam_width = 400;
    long long max_states = 150000;
    std::optional<Weights> preview_weights;   // defaults to the context's weights
};

struct BeamOutcome {
    std::vector<BeamNode> beam;     // complete assignments; empty when pruned out
    long long processed_states = 0;
    bool budget_hit = false;
    std::string detail;             // why the beam emptied, if it did
};

/// Beam Search: staged slot-by-slot expansion over the context's slot order.
/// At each stage, expands every surviving node by up to a branch cap of pool
/// entries, prunes children that can no longer satisfy the attack, overcap
/// or custom-range targets, and keeps a dual-lane merge of the best children.
class BeamSearch {
public:
    BeamOutcome search(const SearchContext& ctx, const BeamOptions& options);

private:
    /// Sort keys of one child, computed once per stage.
    struct RankedNode {
        double attack_bias = 0.0;
        int support_deficit = 0;
        double custom_deficit = 0.0;
        size_t index = 0;
    };

    std::vector<Candidate> buildPreview(const SearchContext& ctx,
                                        const std::vector<BeamNode>& beam,
                                        const Weights& weights) const;
};

} // namespace gearopt
