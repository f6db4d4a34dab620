#include "search/finalizer.hpp"

namespace gearopt {

bool Finalizer::accept(const SlotAssignment& slots) {
    ctx_.checkCancelled();
    const Constraints& constraints = ctx_.constraints;

    if (!slotsSatisfyRequiredMajorIds(slots, ctx_.catalog, constraints.filters.required_major_ids)) {
        stats_.major_ids++;
        return false;
    }

    BuildSummary summary = ctx_.evaluator.evaluate(slots, ctx_.eval_ctx);
    if (!summary.derived.skillpoint_feasible) {
        stats_.sp_invalid++;
        return false;
    }

    HardCheck hard = validateFinalHardConstraints(slots, ctx_.catalog, constraints, summary);
    if (!hard.ok()) {
        stats_.hard_constraints++;
        switch (hard.failure) {
            case HardFailure::AttackSpeed:
                stats_.hard_attack_speed++;
                break;
            case HardFailure::Thresholds:
                stats_.hard_thresholds++;
                if (!stats_.threshold_failure_example && !hard.failed_checks.empty()) {
                    stats_.threshold_failure_example = hard.failed_checks.front();
                }
                break;
            default:
                stats_.hard_item++;
                break;
        }
        return false;
    }

    if (!seen_.insert(canonicalKey(slots)).second) {
        stats_.duplicate++;
        return false;
    }

    ScoredBuild scored = ctx_.scorer.score(summary, constraints.weights, constraints.target);
    Candidate candidate;
    candidate.slots = slots;
    candidate.score = scored.score;
    candidate.breakdown = scored.breakdown;
    candidate.summary = std::move(summary);
    candidates_.push_back(std::move(candidate));
    return true;
}

std::vector<Candidate> Finalizer::takeSorted() {
    std::vector<Candidate> out = std::move(candidates_);
    candidates_.clear();
    sortCandidates(out);
    return out;
}

std::vector<Candidate> finalizeBeam(const SearchContext& ctx,
                                    const std::vector<BeamNode>& beam,
                                    RejectStats& stats) {
    Finalizer finalizer(ctx);
    for (const auto& node : beam) finalizer.accept(node.slots);
    stats = finalizer.stats();
    return finalizer.takeSorted();
}

} // namespace gearopt
