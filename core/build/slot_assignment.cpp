#include "build/slot_assignment.hpp"
#include <algorithm>

namespace gearopt {

SlotAssignment emptyAssignment() {
    SlotAssignment slots{};
    slots.fill(0);
    return slots;
}

bool containsItem(const SlotAssignment& slots, int item_id) {
    return std::find(slots.begin(), slots.end(), item_id) != slots.end();
}

int filledSlotCount(const SlotAssignment& slots) {
    return static_cast<int>(std::count_if(slots.begin(), slots.end(),
                                          [](int id) { return id != 0; }));
}

std::string canonicalKey(const SlotAssignment& slots) {
    int ring_a = itemAt(slots, Slot::Ring1);
    int ring_b = itemAt(slots, Slot::Ring2);
    if (ring_b < ring_a) std::swap(ring_a, ring_b);

    std::string key;
    key.reserve(64);
    for (Slot slot : kAllSlots) {
        int id = itemAt(slots, slot);
        if (slot == Slot::Ring1) id = ring_a;
        else if (slot == Slot::Ring2) id = ring_b;
        if (!key.empty()) key += '|';
        key += std::to_string(id);
    }
    return key;
}

bool slotIdsLess(const SlotAssignment& a, const SlotAssignment& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

} // namespace gearopt
