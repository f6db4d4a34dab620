#pragma once

#include "build/build_summary.hpp"
#include "build/slot_assignment.hpp"
#include "catalog/catalog.hpp"

#include <optional>
#include <vector>

namespace gearopt {

// ─── Skill Points ──────────────────────────────────────────────

enum class TomeMode : uint8_t { NoTomes, GuildRainbow, Flexible2 };

/// Extra skill points granted outside of gear.
struct SkillpointOptions {
    SkillVec extra_base{};        // counted as already-present points per stat
    int extra_available = 0;      // added to the level's assignable total
};

SkillpointOptions skillpointOptionsFromTomeMode(TomeMode mode);

struct SkillpointFeasibility {
    bool feasible = true;
    int assigned_total = 0;               // minimum assigned points, meaningful when feasible
    std::optional<SkillVec> assigned_by_stat;
};

constexpr int kMaxAssignedPerStat = 100;

int levelToAvailableSkillPoints(int level);
int levelToBaseHp(int level);

/// Damage/defence fraction granted by a skill point total (capped at 150).
double skillPointsToPercentage(double skill_points);

/// Defence multiplier of the class that wields the given weapon type.
double classDefenseMultiplier(const std::string& weapon_type);

/// Exact equip-order search: does some order of `items` exist in which each
/// item's requirements are met by earlier bonuses plus assigned points?
SkillpointFeasibility estimateEquipFeasibility(const std::vector<const Item*>& items,
                                               int level,
                                               const SkillpointOptions& options);

// ─── BuildEvaluator ────────────────────────────────────────────

struct EvaluationContext {
    int level = 106;
    std::optional<CharacterClass> character_class;
    SkillpointOptions skillpoints;
};

/// Abstract evaluator: turns a slot assignment into aggregated metrics.
class BuildEvaluator {
public:
    virtual ~BuildEvaluator() = default;

    /// Full evaluation of a (possibly partial) assignment.
    virtual BuildSummary evaluate(const SlotAssignment& slots,
                                  const EvaluationContext& ctx) const = 0;

    /// Skill-point feasibility of just the items placed so far.
    virtual SkillpointFeasibility skillpointFeasibility(const SlotAssignment& slots,
                                                        const EvaluationContext& ctx) const = 0;
};

class DefaultBuildEvaluator : public BuildEvaluator {
public:
    explicit DefaultBuildEvaluator(const Catalog& catalog) : catalog_(catalog) {}

    BuildSummary evaluate(const SlotAssignment& slots,
                          const EvaluationContext& ctx) const override;

    SkillpointFeasibility skillpointFeasibility(const SlotAssignment& slots,
                                                const EvaluationContext& ctx) const override;

private:
    std::vector<const Item*> equippedItems(const SlotAssignment& slots) const;

    const Catalog& catalog_;
};

} // namespace gearopt
