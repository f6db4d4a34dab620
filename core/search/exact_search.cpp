#include "search/exact_search.hpp"
#include "search/finalizer.hpp"
#include "util/log.hpp"
#include <algorithm>

namespace gearopt {

ExactOutcome ExactSearch::search(const SearchContext& ctx) {
    struct Frame {
        size_t order_index;
        size_t next_entry;
    };

    const size_t depth = ctx.slot_order.size();
    Finalizer finalizer(ctx);
    ExactOutcome outcome;
    SlotAssignment slots = ctx.base_slots;

    std::vector<Frame> stack;
    stack.push_back({0, 0});
    while (!stack.empty()) {
        ctx.checkCancelled();
        Frame& top = stack.back();
        if (top.order_index == depth) {
            finalizer.accept(slots);
            stack.pop_back();
            continue;
        }

        const Slot slot = ctx.slot_order[top.order_index];
        const CandidatePool& pool = ctx.poolAt(top.order_index);
        // Siblings are checked against the assignment without this slot.
        itemAt(slots, slot) = 0;
        if (top.next_entry >= pool.size()) {
            stack.pop_back();
            continue;
        }

        const PoolEntry& entry = pool[top.next_entry++];
        const size_t child_index = top.order_index + 1;
        outcome.processed_states++;
        if (outcome.processed_states % kProgressInterval == 0 && ctx.on_progress) {
            ProgressEvent event;
            event.phase = SearchPhase::ExactSearch;
            event.processed_states = outcome.processed_states;
            event.total_slots = static_cast<int>(depth);
            event.expanded_slots = static_cast<int>(child_index);
            ctx.emit(event);
        }
        if (wouldCreateIllegalCombo(entry.id, slots, ctx.catalog)) continue;

        itemAt(slots, slot) = entry.id;
        stack.push_back({child_index, 0});
    }

    outcome.stats = finalizer.stats();
    outcome.candidates = finalizer.takeSorted();

    ProgressEvent done = ctx.diagnostics(outcome.processed_states, 0, static_cast<int>(depth));
    done.detail = "Exact search produced " + std::to_string(outcome.candidates.size()) +
                  " valid builds. " + outcome.stats.describe();
    if (outcome.candidates.empty()) done.reason_code = outcome.stats.dominantReason();
    ctx.emit(done);
    spdlog::info("[ExactSearch] {} states, {} valid builds", outcome.processed_states,
                 outcome.candidates.size());

    const size_t limit = static_cast<size_t>(std::max(1, ctx.constraints.budgets.top_n));
    if (outcome.candidates.size() > limit) outcome.candidates.resize(limit);
    return outcome;
}

} // namespace gearopt
