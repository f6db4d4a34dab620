#pragma once

#include "build/build_summary.hpp"
#include "build/slot_assignment.hpp"
#include "catalog/catalog.hpp"
#include "constraints/constraints.hpp"

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gearopt {

// ─── Item-level legality ───────────────────────────────────────

/// Class, level, tier, exclusion, excluded major ids, powder slots and
/// restricted/deprecated flags.
bool itemMatchesGlobalConstraints(const Item& item, const Constraints& constraints);

bool itemFitsSlot(const Item& item, Slot slot);

// ─── Set legality ──────────────────────────────────────────────

std::map<std::string, int> activeSetCounts(const SlotAssignment& slots, const Catalog& catalog);

/// Adding `item_id` would bring its set to a forbidden piece count.
bool wouldCreateIllegalCombo(int item_id, const SlotAssignment& slots, const Catalog& catalog);

bool slotsSatisfyRequiredMajorIds(const SlotAssignment& slots, const Catalog& catalog,
                                  const std::vector<std::string>& required);

// ─── Attack tier / speed ───────────────────────────────────────

int totalAtkTier(const SlotAssignment& slots, const Catalog& catalog);

/// Final weapon attack-speed index, or nullopt with no weapon equipped.
std::optional<int> finalAttackSpeedIndex(const SlotAssignment& slots, const Catalog& catalog);

/// Intersection of every atkTier custom range.
struct AtkTierRequirement {
    bool has_constraint = false;
    double min_allowed = -std::numeric_limits<double>::infinity();
    double max_allowed = std::numeric_limits<double>::infinity();

    bool satisfiedBy(int total_atk_tier) const;
    bool inverted() const { return has_constraint && min_allowed > max_allowed; }
};

AtkTierRequirement buildAtkTierRequirement(const std::vector<NumericRange>& rows);

// ─── Custom ranges ─────────────────────────────────────────────

constexpr const char* kAtkTierKey = "atkTier";

std::vector<NumericRange> customRangeSpecs(const Constraints& constraints, bool include_atk_tier);
std::vector<NumericRange> atkTierRangeSpecs(const Constraints& constraints);

/// atkTier rows are left out of beam pruning when attack speeds are
/// configured under Or: either sub-constraint may carry the build.
std::vector<NumericRange> customRangeSpecsForBeamPruning(const Constraints& constraints);

std::vector<double> customTotals(const SlotAssignment& slots, const Catalog& catalog,
                                 const std::vector<NumericRange>& specs);

// ─── Final checks ──────────────────────────────────────────────

struct AttackCheck {
    bool configured = false;
    bool ok = true;
    std::vector<std::string> failed_checks;
};

AttackCheck combinedAttackConstraintSatisfied(const Constraints& constraints,
                                              const SlotAssignment& slots,
                                              const Catalog& catalog,
                                              const AtkTierRequirement& requirement);

/// Named thresholds plus every non-atkTier custom range. Empty when all hold.
std::vector<std::string> thresholdFailures(const BuildSummary& summary,
                                           const Constraints& constraints,
                                           const SlotAssignment& slots,
                                           const Catalog& catalog);

enum class HardFailure : uint8_t { None, Item, AttackSpeed, Thresholds };

struct HardCheck {
    HardFailure failure = HardFailure::None;
    std::vector<std::string> failed_checks;

    bool ok() const { return failure == HardFailure::None; }
};

/// Must-include presence, item legality, set counts, attack target and
/// thresholds, checked in that order.
HardCheck validateFinalHardConstraints(const SlotAssignment& slots,
                                       const Catalog& catalog,
                                       const Constraints& constraints,
                                       const BuildSummary& summary);

} // namespace gearopt
