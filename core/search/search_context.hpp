#pragma once

#include "build/build_evaluator.hpp"
#include "build/scorer.hpp"
#include "catalog/catalog.hpp"
#include "constraints/constraints.hpp"
#include "search/bounds.hpp"
#include "search/cancellation.hpp"
#include "search/legality.hpp"
#include "search/search_state.hpp"

#include <optional>
#include <vector>

namespace gearopt {

/// Everything one solve shares between its passes: the collaborators, the
/// constraints candidates are validated against, the base assignment, the
/// slot order with its pools and the attack/custom pruning inputs.
struct SearchContext {
    SearchContext(const Catalog& catalog_ref,
                  const BuildEvaluator& evaluator_ref,
                  const Scorer& scorer_ref,
                  const Constraints& constraints_ref)
        : catalog(catalog_ref), evaluator(evaluator_ref), scorer(scorer_ref),
          constraints(constraints_ref), eval_ctx(constraints_ref.evaluationContext()) {}

    const Catalog& catalog;
    const BuildEvaluator& evaluator;
    const Scorer& scorer;
    const Constraints& constraints;
    EvaluationContext eval_ctx;

    SlotAssignment base_slots{};
    std::vector<Slot> slot_order;
    SlotPools pools;

    std::vector<SkillStat> focus_stats;
    std::vector<int> overcap_need;

    std::optional<AttackSpeedContext> speed_ctx;
    AtkTierRequirement atk_requirement;
    int fixed_atk_tier_total = 0;
    std::vector<NumericRange> custom_specs;   // beam-pruning custom ranges

    const CancellationToken* cancel = nullptr;
    ProgressCallback on_progress;

    const CandidatePool& poolAt(size_t order_index) const {
        return pools[slotIndex(slot_order[order_index])];
    }

    /// Attack reachability only prunes with a fixed weapon or an atkTier range.
    bool hasAttackBounds() const { return speed_ctx.has_value() || atk_requirement.has_constraint; }
    bool hasAttackTarget() const {
        return !constraints.filters.weapon_attack_speeds.empty() || atk_requirement.has_constraint;
    }
    AttackBounds attackBounds() const;

    void checkCancelled() const { throwIfCancelled(cancel); }
    void emit(const ProgressEvent& event) const {
        if (on_progress) on_progress(event);
    }

    /// A diagnostics event pre-filled with the slot totals.
    ProgressEvent diagnostics(long long processed, int beam_size, int expanded_slots) const;
};

} // namespace gearopt
