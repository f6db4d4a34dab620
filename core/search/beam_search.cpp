#include "search/beam_search.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <limits>
#include <optional>

namespace gearopt {

namespace {

std::string joinAttackSpeeds(const std::vector<AttackSpeed>& speeds) {
    std::string out;
    for (AttackSpeed speed : speeds) {
        if (!out.empty()) out += '/';
        out += attackSpeedName(speed);
    }
    return out;
}

std::string joinFocusStats(const std::vector<SkillStat>& stats) {
    std::string out;
    for (SkillStat stat : stats) {
        if (!out.empty()) out += '/';
        out += skillStatName(stat);
    }
    return out;
}

} // namespace

BeamOutcome BeamSearch::search(const SearchContext& ctx, const BeamOptions& options) {
    const bool feasibility = options.mode == BeamMode::FeasibilityBiased;
    const size_t stages = ctx.slot_order.size();
    const SearchBudgets& budgets = ctx.constraints.budgets;
    const auto& focus = ctx.focus_stats;
    const auto& specs = ctx.custom_specs;

    const std::vector<double> suffix_max = optimisticSuffixMax(ctx.slot_order, ctx.pools);
    std::optional<AtkTierSuffixBounds> atk_bounds;
    if (ctx.hasAttackBounds()) {
        atk_bounds = buildAtkTierSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog);
    }
    const CustomSuffixBounds custom_bounds =
        buildCustomSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog, specs);
    std::vector<std::vector<int>> support_suffix;
    if (feasibility) {
        support_suffix = buildFocusSupportSuffixMax(ctx.slot_order, ctx.pools, ctx.catalog, focus);
    }
    const AttackBounds attack = ctx.attackBounds();
    const AttackSpeedContext* speed_ctx = ctx.speed_ctx ? &*ctx.speed_ctx : nullptr;
    const double amplifier = ctx.constraints.constraint_only_mode ? 10.0 : 1.0;
    const int width = std::max(feasibility ? 40 : 20, options.beam_width);
    const Weights& preview_weights = options.preview_weights ? *options.preview_weights
                                                             : ctx.constraints.weights;

    BeamNode root;
    root.slots = ctx.base_slots;
    root.optimistic_bound = suffix_max[0];
    root.focus_support.assign(focus.size(), 0);
    root.custom_totals = customTotals(ctx.base_slots, ctx.catalog, specs);
    std::vector<BeamNode> beam{root};

    BudgetManager budget(options.max_states);
    budget.start();
    BeamOutcome outcome;

    for (size_t stage = 0; stage < stages; stage++) {
        ctx.checkCancelled();
        const Slot slot = ctx.slot_order[stage];
        const CandidatePool& pool = ctx.poolAt(stage);
        const size_t next = stage + 1;
        const int branch_cap = computePerNodeBranchCap(
            pool.size(), beam.size(), stages - stage, budget.expansions(), options.max_states,
            budgets.min_branch_cap, budgets.max_branch_cap);
        if (branch_cap <= 0) outcome.budget_hit = true;

        // ── Expand ──
        std::vector<BeamNode> children;
        for (const BeamNode& node : beam) {
            int branched = 0;
            for (const PoolEntry& entry : pool) {
                if (branched >= branch_cap) break;
                if (budget.isExpansionExhausted()) {
                    outcome.budget_hit = true;
                    break;
                }
                budget.recordExpansion();
                branched++;

                if (wouldCreateIllegalCombo(entry.id, node.slots, ctx.catalog)) continue;
                const Item* item = ctx.catalog.find(entry.id);

                BeamNode child;
                child.slots = node.slots;
                itemAt(child.slots, slot) = entry.id;
                child.order_index = static_cast<int>(next);
                child.atk_tier_assigned = node.atk_tier_assigned + (item ? item->atkTier() : 0);

                if (atk_bounds &&
                    !canStillSatisfyCombinedAttackConstraint(attack, child.atk_tier_assigned,
                                                             atk_bounds->min_suffix[next],
                                                             atk_bounds->max_suffix[next])) {
                    continue;
                }

                if (feasibility) {
                    child.focus_support = node.focus_support;
                    if (item) {
                        auto bonus = focusBonusVector(*item, focus);
                        for (size_t j = 0; j < bonus.size(); j++) child.focus_support[j] += bonus[j];
                    }
                    if (!focus.empty() &&
                        !canStillMeetOvercapNeed(child.focus_support, support_suffix[next], ctx.overcap_need)) {
                        continue;
                    }
                }

                child.custom_totals = node.custom_totals;
                if (item) {
                    for (size_t k = 0; k < specs.size(); k++) {
                        child.custom_totals[k] += item->numericValue(specs[k].key);
                    }
                }
                if (!specs.empty() && !customRangesReachable(child.custom_totals, specs, custom_bounds, next)) {
                    continue;
                }

                if (feasibility) {
                    SkillpointFeasibility partial = ctx.evaluator.skillpointFeasibility(child.slots, ctx.eval_ctx);
                    child.feasibility_assigned = partial.feasible
                        ? static_cast<double>(partial.assigned_total)
                        : std::numeric_limits<double>::infinity();
                }
                child.rough_score = node.rough_score + entry.rough;
                child.optimistic_bound = child.rough_score + suffix_max[next];
                children.push_back(std::move(child));
            }
            if (outcome.budget_hit) break;
        }

        if (children.empty()) {
            ProgressEvent event = ctx.diagnostics(budget.expansions(), static_cast<int>(beam.size()),
                                                  static_cast<int>(stage));
            event.reason_code = ReasonCode::SearchPruned;
            event.detail = outcome.budget_hit
                ? std::string("Search state budget exhausted before completing slot ") + slotName(slot) + "."
                : std::string("No expansions produced at slot ") + slotName(slot) + ".";
            ctx.emit(event);
            spdlog::warn("[BeamSearch] {}", event.detail);
            outcome.beam.clear();
            outcome.detail = event.detail;
            outcome.processed_states = budget.expansions();
            return outcome;
        }

        // ── Rank both lanes ──
        const int remaining_min = atk_bounds ? atk_bounds->min_suffix[next] : 0;
        const int remaining_max = atk_bounds ? atk_bounds->max_suffix[next] : 0;
        std::vector<RankedNode> keys(children.size());
        for (size_t i = 0; i < children.size(); i++) {
            const BeamNode& child = children[i];
            keys[i].index = i;
            if (speed_ctx) {
                keys[i].attack_bias = attackSpeedBiasValue(speed_ctx, child.atk_tier_assigned,
                                                           remaining_min, remaining_max, amplifier);
            }
            if (feasibility) keys[i].support_deficit = supportDeficit(child.focus_support, ctx.overcap_need);
            keys[i].custom_deficit = customRangeDeficit(child.custom_totals, specs);
        }

        std::vector<size_t> primary(children.size());
        for (size_t i = 0; i < primary.size(); i++) primary[i] = i;
        std::vector<size_t> hard = primary;

        std::stable_sort(primary.begin(), primary.end(), [&](size_t a, size_t b) {
            const RankedNode& ka = keys[a];
            const RankedNode& kb = keys[b];
            if (ka.attack_bias != kb.attack_bias) return ka.attack_bias > kb.attack_bias;
            if (feasibility) {
                if (ka.support_deficit != kb.support_deficit) return ka.support_deficit < kb.support_deficit;
                double fa = children[a].feasibility_assigned;
                double fb = children[b].feasibility_assigned;
                if (fa != fb) return fa < fb;
            }
            if (children[a].optimistic_bound != children[b].optimistic_bound) {
                return children[a].optimistic_bound > children[b].optimistic_bound;
            }
            return children[a].rough_score > children[b].rough_score;
        });
        std::stable_sort(hard.begin(), hard.end(), [&](size_t a, size_t b) {
            const RankedNode& ka = keys[a];
            const RankedNode& kb = keys[b];
            if (ka.custom_deficit != kb.custom_deficit) return ka.custom_deficit < kb.custom_deficit;
            if (ka.attack_bias != kb.attack_bias) return ka.attack_bias > kb.attack_bias;
            return children[a].optimistic_bound > children[b].optimistic_bound;
        });

        std::vector<size_t> picked = mergeBeamLanes(children, primary, hard, width,
                                                    budgets.primary_lane_share);
        beam.clear();
        beam.reserve(picked.size());
        for (size_t index : picked) beam.push_back(std::move(children[index]));

        spdlog::debug("[BeamSearch] stage {}/{} slot={} children={} kept={} branchCap={} states={}",
                      next, stages, slotName(slot), children.size(), beam.size(), branch_cap,
                      budget.expansions());

        if (ctx.on_progress) {
            ProgressEvent event;
            event.phase = SearchPhase::BeamSearch;
            event.processed_states = budget.expansions();
            event.beam_size = static_cast<int>(beam.size());
            event.total_slots = static_cast<int>(stages);
            event.expanded_slots = static_cast<int>(next);
            if (feasibility) {
                event.detail = "feasibility-first | branchCap=" + std::to_string(branch_cap);
                if (!focus.empty()) event.detail += " | focus=" + joinFocusStats(focus);
                if (speed_ctx) {
                    event.detail += " | atkSpeed=" + joinAttackSpeeds(ctx.constraints.filters.weapon_attack_speeds);
                }
            } else {
                event.detail = "branchCap=" + std::to_string(branch_cap);
                if (speed_ctx && speed_ctx->preferred_direction != 0) {
                    event.detail += " | atkSpeedTarget=" +
                                    joinAttackSpeeds(ctx.constraints.filters.weapon_attack_speeds);
                }
            }
            event.preview = buildPreview(ctx, beam, preview_weights);
            ctx.emit(event);
        }
    }

    outcome.beam = std::move(beam);
    outcome.processed_states = budget.expansions();
    return outcome;
}

std::vector<Candidate> BeamSearch::buildPreview(const SearchContext& ctx,
                                                const std::vector<BeamNode>& beam,
                                                const Weights& weights) const {
    const size_t limit = static_cast<size_t>(std::max(0, ctx.constraints.budgets.preview_size));
    if (beam.empty() || limit == 0) return {};

    std::vector<size_t> order(beam.size());
    for (size_t i = 0; i < order.size(); i++) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&beam](size_t a, size_t b) {
        return beam[a].rough_score > beam[b].rough_score;
    });
    if (order.size() > limit) order.resize(limit);

    std::vector<Candidate> preview;
    for (size_t index : order) {
        Candidate candidate;
        candidate.slots = beam[index].slots;
        candidate.summary = ctx.evaluator.evaluate(candidate.slots, ctx.eval_ctx);
        ScoredBuild scored = ctx.scorer.score(candidate.summary, weights, ctx.constraints.target);
        candidate.score = scored.score;
        candidate.breakdown = scored.breakdown;
        preview.push_back(std::move(candidate));
    }
    return preview;
}

} // namespace gearopt
