#include "search/search_context.hpp"

namespace gearopt {

AttackBounds SearchContext::attackBounds() const {
    AttackBounds bounds;
    bounds.constraints = &constraints;
    bounds.speed_ctx = speed_ctx ? &*speed_ctx : nullptr;
    bounds.requirement = &atk_requirement;
    bounds.fixed_atk_tier_total = fixed_atk_tier_total;
    return bounds;
}

ProgressEvent SearchContext::diagnostics(long long processed, int beam_size, int expanded_slots) const {
    ProgressEvent event;
    event.phase = SearchPhase::Diagnostics;
    event.processed_states = processed;
    event.beam_size = beam_size;
    event.total_slots = static_cast<int>(slot_order.size());
    event.expanded_slots = expanded_slots;
    return event;
}

} // namespace gearopt
