#include "search/search_controller.hpp"
#include "search/candidate_pool.hpp"
#include "search/finalizer.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace gearopt {

namespace {

constexpr long long kThresholdRescueStateCap = 18000000;
constexpr long long kAttackRescueStateCap = 16000000;
constexpr long long kSupportRescueStateCap = 8000000;
constexpr int kThresholdRescueBeam = 3600;
constexpr int kAttackRescueBeam = 3200;
constexpr int kSupportRescueBeam = 1800;

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

OptimizeResult failure(ReasonCode code, std::string detail) {
    OptimizeResult result;
    result.reason_code = code;
    result.detail = std::move(detail);
    return result;
}

/// Emit a zero-result diagnostic and hand the result back.
OptimizeResult report(const SearchContext& ctx, OptimizeResult result, int beam_size, int expanded) {
    ProgressEvent event = ctx.diagnostics(result.processed_states, beam_size, expanded);
    event.reason_code = result.reason_code;
    event.detail = result.detail;
    ctx.emit(event);
    spdlog::warn("[SearchController] {}: {}",
                 result.reason_code ? reasonCodeName(*result.reason_code) : "no_result", result.detail);
    return result;
}

void truncateToTopN(std::vector<Candidate>& candidates, const Constraints& constraints) {
    size_t limit = static_cast<size_t>(std::max(1, constraints.budgets.top_n));
    if (candidates.size() > limit) candidates.resize(limit);
}

bool hasLadderRescueTargets(const TargetThresholds& target) {
    return target.min_dps_proxy || target.min_ehp_proxy || target.min_skill_point_total ||
           !target.custom_ranges.empty();
}

} // namespace

// ─── Attempt ladder ────────────────────────────────────────────

Constraints Attempt::apply(const Constraints& base) const {
    Constraints c = base;
    c.budgets.top_k_per_slot = top_k_per_slot;
    c.budgets.beam_width = beam_width;
    c.budgets.max_states = max_states;
    if (use_exhaustive_small_pool) c.budgets.use_exhaustive_small_pool = *use_exhaustive_small_pool;
    if (exhaustive_state_limit) c.budgets.exhaustive_state_limit = *exhaustive_state_limit;
    if (rescue_weights) c.weights = rescueWeights(base.weights);
    return c;
}

std::vector<Attempt> SearchController::buildAttemptPlan(const Constraints& base) {
    const SearchBudgets& b = base.budgets;
    auto grown = [&b](const char* label, int top_k, int beam, long long states, bool rescue) {
        Attempt a;
        a.label = label;
        a.top_k_per_slot = std::max(b.top_k_per_slot, top_k);
        a.beam_width = std::max(b.beam_width, beam);
        a.max_states = std::max(b.max_states, states);
        a.rescue_weights = rescue;
        return a;
    };

    const Attempt fast = grown("Fast pass", 0, 0, 0, false);
    const Attempt deep = grown("Deep pass", 140, 700, 900000, false);
    const Attempt bruteish = grown("Bruteforce-ish pass", 220, 1200, 4000000, false);
    const Attempt feasibility = grown("Feasibility rescue", 260, 1400, 4500000, true);
    const Attempt constraint_pass = grown("Constraint-first pass", 180, 1200, 2200000, true);
    Attempt constraint_deep = grown("Constraint rescue deep", 280, 2200, 9000000, true);
    constraint_deep.use_exhaustive_small_pool = true;
    constraint_deep.exhaustive_state_limit = std::max(b.exhaustive_state_limit, 1200000LL);
    Attempt exhaustive = grown("Exhaustive-ish pass", 300, 2600, 12000000, true);
    exhaustive.use_exhaustive_small_pool = true;
    exhaustive.exhaustive_state_limit = std::max(b.exhaustive_state_limit, 2000000LL);

    const bool deep_fallback = base.rescue.enabled;
    std::vector<Attempt> plan;
    for (SolverStrategy strategy : base.rescue.strategies) {
        switch (strategy) {
            case SolverStrategy::Fast:
                plan.push_back(fast);
                break;
            case SolverStrategy::ConstraintFirst:
                plan.push_back(constraint_pass);
                if (deep_fallback) {
                    plan.push_back(constraint_deep);
                    plan.push_back(exhaustive);
                }
                break;
            case SolverStrategy::Exhaustive:
                if (deep_fallback) plan.push_back(constraint_pass);
                plan.push_back(exhaustive);
                break;
            case SolverStrategy::Auto:
                plan.push_back(fast);
                if (deep_fallback) {
                    plan.push_back(deep);
                    plan.push_back(bruteish);
                    plan.push_back(feasibility);
                }
                break;
        }
    }
    return plan;
}

OptimizeResult SearchController::run(const SearchRequest& request) {
    validateConstraints(request.constraints);
    const Constraints& base = request.constraints;
    const std::vector<Attempt> plan = buildAttemptPlan(base);

    OptimizeResult last;
    long long total_states = 0;
    for (size_t i = 0; i < plan.size(); i++) {
        throwIfCancelled(request.cancel);
        const Attempt& attempt = plan[i];
        Constraints constraints = attempt.apply(base);
        spdlog::info("[SearchController] {} ({}/{}) topK {}, beam {}, maxStates {}",
                     attempt.label, i + 1, plan.size(), attempt.top_k_per_slot,
                     attempt.beam_width, attempt.max_states);

        last = solveOnce(request, constraints, 0);
        total_states += last.processed_states;
        last.attempt_label = attempt.label;
        if (!last.candidates.empty()) {
            last.processed_states = total_states;
            spdlog::info("[SearchController] {} found {} builds", attempt.label, last.candidates.size());
            return last;
        }
    }

    if (hasLadderRescueTargets(base.target)) {
        throwIfCancelled(request.cancel);
        Attempt rescue;
        rescue.label = "Threshold rescue pass";
        rescue.top_k_per_slot = std::max(base.budgets.top_k_per_slot, 180);
        rescue.beam_width = std::max(base.budgets.beam_width, 3600);
        rescue.max_states = std::max(base.budgets.max_states, 2200000LL);
        Constraints constraints = rescue.apply(base);
        constraints.weights = thresholdBiasedWeights(base.target, base.weights);
        spdlog::info("[SearchController] {} topK {}, beam {}, maxStates {}", rescue.label,
                     rescue.top_k_per_slot, rescue.beam_width, rescue.max_states);

        OptimizeResult rescued = solveOnce(request, constraints, 0);
        total_states += rescued.processed_states;
        rescued.attempt_label = rescue.label;
        if (!rescued.candidates.empty()) {
            rescued.processed_states = total_states;
            spdlog::info("[SearchController] {} found {} builds", rescue.label, rescued.candidates.size());
            return rescued;
        }
        last = std::move(rescued);
    }

    last.processed_states = total_states;
    spdlog::warn("[SearchController] No valid build after {} attempt(s): {}", plan.size(), last.detail);
    return last;
}

// ─── Single solve ──────────────────────────────────────────────

std::optional<OptimizeResult> SearchController::prepare(const SearchRequest& request,
                                                        SearchContext& ctx) const {
    const Catalog& catalog = ctx.catalog;
    const Constraints& c = ctx.constraints;

    SlotAssignment base = request.workbench.slots;
    for (Slot slot : kAllSlots) {
        if (!c.isLocked(slot)) itemAt(base, slot) = 0;
    }

    std::unordered_set<int> placed;
    for (int id : c.filters.must_include_ids) {
        if (!placed.insert(id).second) continue;
        const Item* item = catalog.find(id);
        if (!item) {
            return failure(ReasonCode::MustIncludeConflict,
                           "Must-include item " + std::to_string(id) + " does not exist in catalog.");
        }
        if (!itemMatchesGlobalConstraints(*item, c)) {
            return failure(ReasonCode::MustIncludeConflict,
                           "Must-include item " + item->name +
                           " is incompatible with current hard filters (class/level/tier/exclusions).");
        }
        if (containsItem(base, id)) continue;

        std::optional<Slot> target;
        for (Slot slot : kAllSlots) {
            if (itemAt(base, slot) == 0 && itemFitsSlot(*item, slot)) {
                target = slot;
                break;
            }
        }
        if (!target) {
            return failure(ReasonCode::MustIncludeConflict,
                           std::string("No free ") + categoryName(item->category) +
                           " slot available to place must-include item " + item->name + ".");
        }
        itemAt(base, *target) = id;
    }
    ctx.base_slots = base;

    ctx.focus_stats = collectRequirementFocusStats(base, catalog);
    ctx.overcap_need = collectOvercapNeeds(base, catalog, ctx.focus_stats);

    std::optional<std::array<std::unordered_set<int>, kSlotCount>> pinned;
    if (c.filters.only_pinned_items) pinned = buildPinnedAllowlist(request.workbench);

    std::vector<Slot> order;
    for (Slot slot : kAllSlots) {
        if (itemAt(base, slot) != 0) continue;
        order.push_back(slot);
        const std::unordered_set<int>* allow = pinned ? &(*pinned)[slotIndex(slot)] : nullptr;
        ctx.pools[slotIndex(slot)] = buildCandidatePool(slot, catalog, c, allow, ctx.focus_stats);
    }

    ctx.speed_ctx = buildAttackSpeedContext(base, catalog, c);
    ctx.atk_requirement = buildAtkTierRequirement(atkTierRangeSpecs(c));
    ctx.fixed_atk_tier_total = totalAtkTier(base, catalog);
    ctx.custom_specs = customRangeSpecsForBeamPruning(c);

    // ── Slot order ──
    const int direction = ctx.speed_ctx ? ctx.speed_ctx->preferred_direction : 0;
    const bool custom_mins = std::any_of(ctx.custom_specs.begin(), ctx.custom_specs.end(),
                                         [](const NumericRange& r) { return r.min.has_value(); });
    std::array<int, kSlotCount> attack_potential{};
    std::array<int, kSlotCount> focus_potential{};
    for (Slot slot : order) {
        const CandidatePool& pool = ctx.pools[slotIndex(slot)];
        if (direction != 0) attack_potential[slotIndex(slot)] = slotAttackPotential(pool, catalog, direction);
        focus_potential[slotIndex(slot)] = slotFocusSupportPotential(pool, catalog, ctx.focus_stats);
    }
    std::stable_sort(order.begin(), order.end(), [&](Slot a, Slot b) {
        size_t ia = slotIndex(a);
        size_t ib = slotIndex(b);
        if (attack_potential[ia] != attack_potential[ib]) return attack_potential[ia] > attack_potential[ib];
        if (focus_potential[ia] != focus_potential[ib]) return focus_potential[ia] > focus_potential[ib];
        if (custom_mins && isAccessorySlot(a) != isAccessorySlot(b)) return isAccessorySlot(a);
        if (ctx.pools[ia].size() != ctx.pools[ib].size()) return ctx.pools[ia].size() < ctx.pools[ib].size();
        return ia < ib;
    });
    ctx.slot_order = std::move(order);
    return std::nullopt;
}

std::optional<OptimizeResult> SearchController::staticChecks(const SearchContext& ctx) const {
    for (Slot slot : ctx.slot_order) {
        if (ctx.pools[slotIndex(slot)].empty()) {
            return failure(ReasonCode::EmptyPool,
                           std::string("No candidate items available for slot ") + slotName(slot) +
                           " under current hard filters.");
        }
    }

    const AtkTierRequirement& req = ctx.atk_requirement;
    if (req.inverted()) {
        return failure(ReasonCode::UnsatAttackTarget,
                       "Attack target is unsatisfiable: atkTier min (" + formatNumber(req.min_allowed) +
                       ") exceeds atkTier max (" + formatNumber(req.max_allowed) + ").");
    }

    const auto& specs = ctx.custom_specs;
    if (!specs.empty()) {
        CustomSuffixBounds bounds = buildCustomSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog, specs);
        std::vector<double> base = customTotals(ctx.base_slots, ctx.catalog, specs);
        for (size_t k = 0; k < specs.size(); k++) {
            double min_possible = base[k] + bounds.min_suffix[0][k];
            double max_possible = base[k] + bounds.max_suffix[0][k];
            if (specs[k].min && max_possible < *specs[k].min) {
                return failure(ReasonCode::UnsatThreshold,
                               "Unsatisfiable threshold: " + specs[k].key + " min " +
                               formatNumber(*specs[k].min) + " is above maximum reachable total " +
                               formatNumber(max_possible) + ".");
            }
            if (specs[k].max && min_possible > *specs[k].max) {
                return failure(ReasonCode::UnsatThreshold,
                               "Unsatisfiable threshold: " + specs[k].key + " max " +
                               formatNumber(*specs[k].max) + " is below minimum reachable total " +
                               formatNumber(min_possible) + ".");
            }
        }
    }

    if (ctx.hasAttackBounds()) {
        AtkTierSuffixBounds bounds = buildAtkTierSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog);
        if (!canStillSatisfyCombinedAttackConstraint(ctx.attackBounds(), 0, bounds.min_suffix[0],
                                                     bounds.max_suffix[0])) {
            return failure(ReasonCode::UnsatAttackTarget,
                           "Attack-speed / atkTier target cannot be reached from current candidate pools.");
        }
    }
    return std::nullopt;
}

OptimizeResult SearchController::solveOnce(const SearchRequest& request,
                                           const Constraints& constraints,
                                           int rescue_depth) {
    throwIfCancelled(request.cancel);
    SearchContext ctx(request.catalog, request.evaluator, request.scorer, constraints);
    ctx.cancel = request.cancel;
    ctx.on_progress = request.on_progress;

    if (auto failed = prepare(request, ctx)) return report(ctx, std::move(*failed), 0, 0);
    if (auto failed = staticChecks(ctx)) return report(ctx, std::move(*failed), 0, 0);

    const SearchBudgets& budgets = constraints.budgets;
    const int slot_count = static_cast<int>(ctx.slot_order.size());
    OptimizeResult result;

    // ── Exact enumeration ──
    if (budgets.use_exhaustive_small_pool && slot_count > 0) {
        long long combos = estimateCombinationCount(ctx.slot_order, ctx.pools,
                                                    budgets.exhaustive_state_limit + 1);
        if (combos > 0 && combos <= budgets.exhaustive_state_limit) {
            ProgressEvent start;
            start.phase = SearchPhase::ExactSearch;
            start.total_slots = slot_count;
            ctx.emit(start);
            spdlog::info("[SearchController] Exact enumeration over {} combinations", combos);

            ExactOutcome exact = exact_.search(ctx);
            result.processed_states = exact.processed_states;
            result.candidates = std::move(exact.candidates);
            if (result.candidates.empty()) {
                result.reason_code = exact.stats.dominantReason().value_or(ReasonCode::SearchPruned);
                result.detail = "Exact search produced 0 valid builds. " + exact.stats.describe();
            } else {
                result.detail = "Exact search produced " + std::to_string(result.candidates.size()) +
                                " valid builds.";
            }
            return result;
        }
    }

    // ── Fast beam ──
    BeamOptions fast;
    fast.mode = BeamMode::Fast;
    fast.beam_width = budgets.beam_width;
    fast.max_states = budgets.max_states;
    BeamOutcome pass = beam_.search(ctx, fast);
    result.processed_states = pass.processed_states;
    if (pass.beam.empty()) {
        result.reason_code = ReasonCode::SearchPruned;
        result.detail = pass.detail;
        return result;
    }

    RejectStats stats;
    std::vector<Candidate> candidates = finalizeBeam(ctx, pass.beam, stats);
    int finalization_beam = static_cast<int>(pass.beam.size());
    {
        ProgressEvent event = ctx.diagnostics(result.processed_states, finalization_beam, slot_count);
        if (candidates.empty()) {
            event.reason_code = stats.dominantReason();
            event.detail = "Final eval found 0 valid builds. " + stats.describe();
        } else {
            event.detail = "Final eval: " + std::to_string(candidates.size()) + " valid builds. " +
                           stats.describe();
        }
        ctx.emit(event);
    }

    // ── Feasibility-first rescue ──
    const bool has_attack_target = ctx.hasAttackTarget();
    if (candidates.empty() && slot_count > 0 &&
        (stats.sp_invalid > 0 || (has_attack_target && stats.hard_attack_speed > 0) ||
         stats.hard_thresholds > 0)) {
        const bool threshold_rescue = stats.hard_thresholds > 0;
        BeamOptions rescue;
        rescue.mode = BeamMode::FeasibilityBiased;
        if (threshold_rescue) {
            rescue.max_states = std::min(kThresholdRescueStateCap, budgets.max_states * 5);
            rescue.beam_width = kThresholdRescueBeam;
            rescue.preview_weights = thresholdBiasedWeights(constraints.target, constraints.weights);
        } else if (has_attack_target) {
            rescue.max_states = std::min(kAttackRescueStateCap, budgets.max_states * 4);
            rescue.beam_width = kAttackRescueBeam;
        } else {
            rescue.max_states = std::min(kSupportRescueStateCap, budgets.max_states * 2);
            rescue.beam_width = kSupportRescueBeam;
        }
        rescue.max_states = std::max(budgets.max_states, rescue.max_states);
        rescue.beam_width = std::max(budgets.beam_width, rescue.beam_width);

        ProgressEvent event = ctx.diagnostics(result.processed_states, finalization_beam, slot_count);
        event.detail = threshold_rescue && !constraints.target.custom_ranges.empty()
            ? "Retrying with threshold-aware rescue (custom range constraints + support-aware feasibility search)."
            : stats.hard_attack_speed > 0
            ? "Retrying with feasibility-first beam search (support-aware rescue + attack target reachability)."
            : "Retrying with feasibility-first beam search (support-aware rescue for high-skill requirements).";
        ctx.emit(event);
        spdlog::info("[SearchController] Feasibility-first rescue: beam {}, maxStates {}",
                     rescue.beam_width, rescue.max_states);

        BeamOutcome rescued = beam_.search(ctx, rescue);
        result.processed_states += rescued.processed_states;
        if (!rescued.beam.empty()) {
            finalization_beam = static_cast<int>(rescued.beam.size());
            candidates = finalizeBeam(ctx, rescued.beam, stats);
            ProgressEvent done = ctx.diagnostics(rescued.processed_states, finalization_beam, slot_count);
            done.detail = candidates.empty()
                ? "Feasibility-first eval still found 0 valid builds. " + stats.describe()
                : "Feasibility-first eval: " + std::to_string(candidates.size()) + " valid builds. " +
                      stats.describe();
            ctx.emit(done);
        }
    }

    // ── Threshold rescue ──
    if (candidates.empty() && stats.hard_thresholds > 0 &&
        rescue_depth < kMaxThresholdRescueDepth && constraints.target.hasAny()) {
        ProgressEvent event = ctx.diagnostics(result.processed_states, finalization_beam, slot_count);
        event.detail = "Retrying with threshold-biased beam search (weights tuned to target min/max).";
        ctx.emit(event);
        spdlog::info("[SearchController] Threshold rescue at depth {}", rescue_depth + 1);

        Constraints biased = constraints;
        biased.weights = thresholdBiasedWeights(constraints.target, constraints.weights);
        biased.budgets.beam_width = std::max(budgets.beam_width, kThresholdRescueBeam);
        biased.budgets.max_states = std::max(budgets.max_states,
                                             std::min(kThresholdRescueStateCap, budgets.max_states * 5));
        OptimizeResult nested = solveOnce(request, biased, rescue_depth + 1);
        result.processed_states += nested.processed_states;
        if (!nested.candidates.empty()) {
            ProgressEvent done = ctx.diagnostics(result.processed_states,
                                                 static_cast<int>(nested.candidates.size()), slot_count);
            done.detail = "Threshold rescue: " + std::to_string(nested.candidates.size()) + " valid builds.";
            ctx.emit(done);
            nested.processed_states = result.processed_states;
            nested.detail = done.detail;
            truncateToTopN(nested.candidates, constraints);
            return nested;
        }
    }

    // ── Deterministic fallback ──
    if (candidates.empty() && slot_count > 0) {
        const std::string cap = std::to_string(budgets.fallback_time_cap_ms) + " ms";
        ProgressEvent event = ctx.diagnostics(result.processed_states, finalization_beam, slot_count);
        event.reason_code = ReasonCode::SearchPruned;
        event.detail = "Running deterministic fallback search (" + cap + " cap) before returning no candidates.";
        ctx.emit(event);

        FallbackOutcome fallback = fallback_.search(ctx);
        result.processed_states += fallback.processed_states;
        if (!fallback.candidates.empty()) {
            candidates = std::move(fallback.candidates);
            ProgressEvent done = ctx.diagnostics(result.processed_states,
                                                 static_cast<int>(candidates.size()), slot_count);
            done.detail = "Deterministic fallback recovered " + std::to_string(candidates.size()) +
                          " valid build(s).";
            ctx.emit(done);
            result.detail = done.detail;
        } else {
            result.reason_code = fallback.timed_out
                ? ReasonCode::FallbackTimeout
                : stats.dominantReason().value_or(ReasonCode::SearchPruned);
            result.detail = fallback.timed_out
                ? "Deterministic fallback timed out after " + cap + " with no valid candidates."
                : "Deterministic fallback found 0 valid builds. " + stats.describe();
            return report(ctx, std::move(result), 0, slot_count);
        }
    }

    if (candidates.empty()) {
        result.reason_code = stats.dominantReason().value_or(ReasonCode::SearchPruned);
        result.detail = "Final eval found 0 valid builds. " + stats.describe();
        return report(ctx, std::move(result), finalization_beam, slot_count);
    }

    truncateToTopN(candidates, constraints);
    if (result.detail.empty()) {
        result.detail = std::to_string(candidates.size()) + " valid builds.";
    }
    result.candidates = std::move(candidates);
    return result;
}

} // namespace gearopt
