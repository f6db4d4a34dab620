#pragma once

#include "build/workbench.hpp"
#include "search/beam_search.hpp"
#include "search/exact_search.hpp"
#include "search/fallback_search.hpp"
#include "search/search_context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gearopt {

/// One optimization request. The catalog, evaluator and scorer must
/// outlive the run.
struct SearchRequest {
    SearchRequest(const Catalog& catalog_ref,
                  const BuildEvaluator& evaluator_ref,
                  const Scorer& scorer_ref)
        : catalog(catalog_ref), evaluator(evaluator_ref), scorer(scorer_ref) {}

    const Catalog& catalog;
    const BuildEvaluator& evaluator;
    const Scorer& scorer;
    Workbench workbench;
    Constraints constraints;
    const CancellationToken* cancel = nullptr;
    ProgressCallback on_progress;
};

struct OptimizeResult {
    std::vector<Candidate> candidates;     // best first, at most topN
    std::optional<ReasonCode> reason_code; // set when no candidate was found
    std::string detail;
    long long processed_states = 0;
    std::string attempt_label;
};

/// One rung of the attempt ladder. Budgets only ever grow from the base.
struct Attempt {
    std::string label;
    int top_k_per_slot = 80;
    int beam_width = 400;
    long long max_states = 150000;
    bool rescue_weights = false;
    std::optional<bool> use_exhaustive_small_pool;
    std::optional<long long> exhaustive_state_limit;

    Constraints apply(const Constraints& base) const;
};

/// Search Controller: drives the attempt ladder. Each attempt is one
/// solveOnce pass (static checks, exact enumeration or fast beam, then the
/// feasibility, threshold and deterministic rescues), stopping at the first
/// attempt that yields a valid build.
class SearchController {
public:
    static constexpr int kMaxThresholdRescueDepth = 1;

    /// Validates the constraints (std::invalid_argument on malformed values)
    /// and runs the ladder. Throws SearchCancelled when the token is set.
    OptimizeResult run(const SearchRequest& request);

    /// One complete solve under `constraints`. `rescue_depth` counts nested
    /// threshold rescues.
    OptimizeResult solveOnce(const SearchRequest& request,
                             const Constraints& constraints,
                             int rescue_depth);

    static std::vector<Attempt> buildAttemptPlan(const Constraints& base);

private:
    /// Fills base slots, pools, slot order and attack/custom inputs.
    /// Returns a failed result when a must-include cannot be placed.
    std::optional<OptimizeResult> prepare(const SearchRequest& request, SearchContext& ctx) const;

    /// Empty pool, inverted atkTier, unreachable custom range or attack target.
    std::optional<OptimizeResult> staticChecks(const SearchContext& ctx) const;

    BeamSearch beam_;
    ExactSearch exact_;
    FallbackSearch fallback_;
};

} // namespace gearopt
