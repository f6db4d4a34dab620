#include "search/fallback_search.hpp"
#include "search/budget_manager.hpp"
#include "search/finalizer.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <limits>
#include <optional>

namespace gearopt {

FallbackOutcome FallbackSearch::search(const SearchContext& ctx) {
    struct Frame {
        size_t order_index;
        size_t next_entry;
        int atk_tier_assigned;
        std::vector<double> custom_totals;
    };

    const size_t depth = ctx.slot_order.size();
    const auto& specs = ctx.custom_specs;
    const size_t limit = static_cast<size_t>(std::max(1, ctx.constraints.budgets.top_n));

    std::vector<CandidatePool> sorted_pools;
    sorted_pools.reserve(depth);
    for (size_t i = 0; i < depth; i++) {
        CandidatePool pool = ctx.poolAt(i);
        std::sort(pool.begin(), pool.end(), [](const PoolEntry& a, const PoolEntry& b) {
            if (a.rough != b.rough) return a.rough > b.rough;
            return a.id < b.id;
        });
        sorted_pools.push_back(std::move(pool));
    }

    std::optional<AtkTierSuffixBounds> atk_bounds;
    if (ctx.hasAttackBounds()) {
        atk_bounds = buildAtkTierSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog);
    }
    const CustomSuffixBounds custom_bounds =
        buildCustomSuffixBounds(ctx.slot_order, ctx.pools, ctx.catalog, specs);
    const AttackBounds attack = ctx.attackBounds();

    BudgetManager clock(std::numeric_limits<long long>::max(),
                        ctx.constraints.budgets.fallback_time_cap_ms / 1000.0);
    clock.start();

    Finalizer finalizer(ctx);
    FallbackOutcome outcome;
    SlotAssignment slots = ctx.base_slots;

    std::vector<Frame> stack;
    stack.push_back({0, 0, 0, customTotals(ctx.base_slots, ctx.catalog, specs)});
    while (!stack.empty()) {
        ctx.checkCancelled();
        if (clock.isTimeExhausted()) {
            outcome.timed_out = true;
            break;
        }
        if (finalizer.size() >= limit) break;

        Frame& top = stack.back();
        if (top.order_index == depth) {
            finalizer.accept(slots);
            stack.pop_back();
            continue;
        }

        const Slot slot = ctx.slot_order[top.order_index];
        const CandidatePool& pool = sorted_pools[top.order_index];
        itemAt(slots, slot) = 0;
        if (top.next_entry >= pool.size()) {
            stack.pop_back();
            continue;
        }

        const PoolEntry& entry = pool[top.next_entry++];
        const size_t next = top.order_index + 1;
        outcome.processed_states++;
        if (wouldCreateIllegalCombo(entry.id, slots, ctx.catalog)) continue;

        const Item* item = ctx.catalog.find(entry.id);
        int atk_tier = top.atk_tier_assigned + (item ? item->atkTier() : 0);
        if (atk_bounds &&
            !canStillSatisfyCombinedAttackConstraint(attack, atk_tier, atk_bounds->min_suffix[next],
                                                     atk_bounds->max_suffix[next])) {
            continue;
        }

        std::vector<double> totals = top.custom_totals;
        if (item) {
            for (size_t k = 0; k < specs.size(); k++) totals[k] += item->numericValue(specs[k].key);
        }
        if (!specs.empty() && !customRangesReachable(totals, specs, custom_bounds, next)) continue;

        itemAt(slots, slot) = entry.id;
        if (!ctx.evaluator.skillpointFeasibility(slots, ctx.eval_ctx).feasible) {
            itemAt(slots, slot) = 0;
            continue;
        }
        stack.push_back({next, 0, atk_tier, std::move(totals)});
    }

    outcome.candidates = finalizer.takeSorted();
    if (outcome.candidates.size() > limit) outcome.candidates.resize(limit);
    spdlog::info("[FallbackSearch] {} states, {} valid builds{}", outcome.processed_states,
                 outcome.candidates.size(), outcome.timed_out ? " (timed out)" : "");
    return outcome;
}

} // namespace gearopt
