#pragma once

#include "build/slot_assignment.hpp"

#include <map>
#include <vector>

namespace gearopt {

/// The user's current loadout plus the items pinned per category.
/// Pinned bins feed the only-pinned-items filter.
struct Workbench {
    SlotAssignment slots{};
    std::map<ItemCategory, std::vector<int>> bins;
};

} // namespace gearopt
