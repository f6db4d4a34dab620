#pragma once

#include "build/workbench.hpp"
#include "catalog/catalog.hpp"
#include "constraints/constraints.hpp"
#include "search/search_state.hpp"

#include <array>
#include <optional>
#include <unordered_set>
#include <vector>

namespace gearopt {

/// Weighted linear score of an item's rough fields under the constraints.
double roughItemScore(const Item& item, const Constraints& constraints);

/// Bonus toward the focus stats minus the requirements that compete with them.
double computeSupportFocusScore(const Item& item, const std::vector<SkillStat>& focus_stats);

/// Stats whose highest base requirement exceeds 100, sorted desc; otherwise
/// the top two stats with a requirement of at least 70.
std::vector<SkillStat> collectRequirementFocusStats(const SlotAssignment& base_slots,
                                                    const Catalog& catalog);

/// Per focus stat, the requirement above 100 that item bonuses must cover.
std::vector<int> collectOvercapNeeds(const SlotAssignment& base_slots,
                                     const Catalog& catalog,
                                     const std::vector<SkillStat>& focus_stats);

/// Per slot, the pinned bin of its category plus the item already equipped.
std::array<std::unordered_set<int>, kSlotCount> buildPinnedAllowlist(const Workbench& workbench);

/// Legal, diversity-sampled candidates for one slot. Insertion order is
/// preserved so branch-capped expansion sees support items early.
CandidatePool buildCandidatePool(Slot slot,
                                 const Catalog& catalog,
                                 const Constraints& constraints,
                                 const std::unordered_set<int>* pinned_allowlist,
                                 const std::vector<SkillStat>& focus_stats);

} // namespace gearopt
