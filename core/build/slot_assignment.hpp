#pragma once

#include "catalog/item.hpp"

#include <array>
#include <string>

namespace gearopt {

/// Item id per slot, indexed by Slot. 0 marks an empty slot.
using SlotAssignment = std::array<int, kSlotCount>;

inline int& itemAt(SlotAssignment& slots, Slot slot) { return slots[slotIndex(slot)]; }
inline int itemAt(const SlotAssignment& slots, Slot slot) { return slots[slotIndex(slot)]; }

SlotAssignment emptyAssignment();

bool containsItem(const SlotAssignment& slots, int item_id);
int filledSlotCount(const SlotAssignment& slots);

/// "h|c|l|b|r1|r2|br|n|w" with the two rings sorted ascending, so the key
/// is identical under a ring swap.
std::string canonicalKey(const SlotAssignment& slots);

/// Lexicographic comparison of item ids in slot order.
bool slotIdsLess(const SlotAssignment& a, const SlotAssignment& b);

} // namespace gearopt
