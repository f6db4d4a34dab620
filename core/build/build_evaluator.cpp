#include "build/build_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace gearopt {

namespace {

constexpr double kDefenseMultScale = 0.867;
constexpr double kAgilityMultScale = 0.951;
constexpr double kDefaultAgiDefCap = 90.0;

int clampLevel(int level) {
    return std::max(1, std::min(106, level));
}

struct ParetoState {
    SkillVec assigned{};
    int assigned_total = 0;
};

/// a needs no more assigned points than b on every stat.
bool dominates(const SkillVec& a, const SkillVec& b) {
    for (size_t i = 0; i < kSkillStatCount; i++) {
        if (a[i] > b[i]) return false;
    }
    return true;
}

void pushParetoState(std::vector<ParetoState>& frontier, const ParetoState& candidate) {
    for (const auto& existing : frontier) {
        if (dominates(existing.assigned, candidate.assigned)) return;
    }
    frontier.erase(std::remove_if(frontier.begin(), frontier.end(),
                                  [&](const ParetoState& s) {
                                      return dominates(candidate.assigned, s.assigned);
                                  }),
                   frontier.end());
    frontier.push_back(candidate);
}

struct LegacyEhp {
    double with_agi = 0.0;
    double no_agi = 0.0;
};

LegacyEhp computeLegacyEhp(double total_hp, double def_sp, double agi_sp,
                           const std::string& weapon_type) {
    total_hp = std::max(5.0, total_hp);
    double def_pct = skillPointsToPercentage(def_sp) * kDefenseMultScale;
    double agi_pct = skillPointsToPercentage(agi_sp) * kAgilityMultScale;
    double def_mult = 2.0 - classDefenseMultiplier(weapon_type);
    double agi_reduction = (100.0 - kDefaultAgiDefCap) / 100.0;
    double denom_with_agi = agi_reduction * agi_pct + (1.0 - agi_pct) * (1.0 - def_pct);
    double denom_no_agi = 1.0 - def_pct;

    LegacyEhp out;
    out.with_agi = total_hp / std::max(1e-9, denom_with_agi) / std::max(1e-9, def_mult);
    out.no_agi = total_hp / std::max(1e-9, denom_no_agi) / std::max(1e-9, def_mult);
    return out;
}

} // namespace

SkillpointOptions skillpointOptionsFromTomeMode(TomeMode mode) {
    SkillpointOptions options;
    switch (mode) {
        case TomeMode::NoTomes:
            break;
        case TomeMode::GuildRainbow:
            options.extra_base.fill(1);
            break;
        case TomeMode::Flexible2:
            options.extra_available = 2;
            break;
    }
    return options;
}

int levelToAvailableSkillPoints(int level) {
    int clamped = clampLevel(level);
    if (clamped >= 101) return 200;
    return (clamped - 1) * 2;
}

int levelToBaseHp(int level) {
    return clampLevel(level) * 5 + 5;
}

double skillPointsToPercentage(double skill_points) {
    double skp = std::isfinite(skill_points) ? skill_points : 0.0;
    if (skp <= 0.0) return 0.0;
    if (skp >= 150.0) skp = 150.0;
    const double r = 0.9908;
    return (r / (1.0 - r) * (1.0 - std::pow(r, skp))) / 100.0;
}

double classDefenseMultiplier(const std::string& weapon_type) {
    if (weapon_type == "relik") return 0.6;
    if (weapon_type == "bow") return 0.7;
    if (weapon_type == "wand") return 0.8;
    return 1.0;
}

SkillpointFeasibility estimateEquipFeasibility(const std::vector<const Item*>& items,
                                               int level,
                                               const SkillpointOptions& options) {
    SkillpointFeasibility result;
    if (items.empty()) {
        result.assigned_by_stat = SkillVec{};
        return result;
    }

    const int available = levelToAvailableSkillPoints(level) + options.extra_available;
    const size_t n = items.size();
    const size_t state_count = size_t{1} << n;

    std::vector<SkillVec> bonus_by_mask(state_count, SkillVec{});
    for (size_t mask = 1; mask < state_count; mask++) {
        size_t lsb = mask & (~mask + 1);
        size_t bit = 0;
        while ((size_t{1} << bit) != lsb) bit++;
        for (size_t j = 0; j < kSkillStatCount; j++) {
            bonus_by_mask[mask][j] = bonus_by_mask[mask ^ lsb][j] + items[bit]->stats.sp[j];
        }
    }

    std::vector<std::vector<ParetoState>> frontiers(state_count);
    frontiers[0].push_back(ParetoState{});

    for (size_t mask = 0; mask < state_count; mask++) {
        const auto& frontier = frontiers[mask];
        if (frontier.empty()) continue;
        const SkillVec& bonus = bonus_by_mask[mask];

        for (const auto& state : frontier) {
            for (size_t i = 0; i < n; i++) {
                if (mask & (size_t{1} << i)) continue;

                ParetoState next = state;
                bool valid = true;
                for (size_t j = 0; j < kSkillStatCount; j++) {
                    int current = state.assigned[j] + bonus[j] + options.extra_base[j];
                    int required = items[i]->stats.req[j];
                    if (required > current) next.assigned[j] += required - current;
                    if (next.assigned[j] > kMaxAssignedPerStat) {
                        valid = false;
                        break;
                    }
                }
                if (!valid) continue;

                next.assigned_total = 0;
                for (int v : next.assigned) next.assigned_total += v;
                if (next.assigned_total > available) continue;

                pushParetoState(frontiers[mask | (size_t{1} << i)], next);
            }
        }
    }

    const auto& finals = frontiers[state_count - 1];
    if (finals.empty()) {
        result.feasible = false;
        result.assigned_total = std::numeric_limits<int>::max();
        return result;
    }
    auto best = std::min_element(finals.begin(), finals.end(),
                                 [](const ParetoState& a, const ParetoState& b) {
                                     return a.assigned_total < b.assigned_total;
                                 });
    result.assigned_total = best->assigned_total;
    result.assigned_by_stat = best->assigned;
    return result;
}

// ─── DefaultBuildEvaluator ─────────────────────────────────────

std::vector<const Item*> DefaultBuildEvaluator::equippedItems(const SlotAssignment& slots) const {
    std::vector<const Item*> items;
    for (int id : slots) {
        if (id == 0) continue;
        if (const Item* item = catalog_.find(id)) items.push_back(item);
    }
    return items;
}

SkillpointFeasibility DefaultBuildEvaluator::skillpointFeasibility(
    const SlotAssignment& slots, const EvaluationContext& ctx) const {
    return estimateEquipFeasibility(equippedItems(slots), ctx.level, ctx.skillpoints);
}

BuildSummary DefaultBuildEvaluator::evaluate(const SlotAssignment& slots,
                                             const EvaluationContext& ctx) const {
    BuildSummary summary;
    AggregatedStats& agg = summary.aggregated;
    std::string weapon_type;
    std::optional<CharacterClass> cls = ctx.character_class;

    for (Slot slot : kAllSlots) {
        const Item* item = catalog_.find(itemAt(slots, slot));
        if (!item) continue;
        const ItemStats& s = item->stats;
        if (slot == Slot::Weapon) weapon_type = item->type;

        agg.hp_total += s.hp + s.hp_bonus;
        agg.hpr_total += s.hpr_raw + s.hpr_pct;
        agg.mr += s.mr;
        agg.ms += s.ms;
        agg.ls += s.ls;
        agg.speed += s.spd;
        for (size_t j = 0; j < kSkillStatCount; j++) {
            agg.skill_points[j] += s.sp[j];
            agg.skill_reqs[j] = std::max(agg.skill_reqs[j], s.req[j]);
        }
        for (size_t e = 0; e < 5; e++) {
            agg.defenses[e] += s.def[e];
            agg.offense.elem_dam_pct += s.elem_dam_pct[e];
        }
        agg.offense.base_dps += s.base_dps;
        agg.offense.spell_pct += s.sd_pct;
        agg.offense.spell_raw += s.sd_raw;
        agg.offense.melee_pct += s.md_pct;
        agg.offense.melee_raw += s.md_raw;
        agg.offense.generic_dam_pct += s.dam_pct + s.r_dam_pct + s.n_dam_pct;
        agg.offense.offense_score += item->rough.offense;

        SlotStatus& status = summary.slot_status[slotIndex(slot)];
        status.class_ok = itemWearableBy(*item, ctx.character_class);
        status.level_ok = item->level <= ctx.level;
        status.skill_reqs_met = std::all_of(s.req.begin(), s.req.end(),
                                            [](int r) { return r <= kMaxAssignedPerStat; });
    }

    if (!cls) {
        if (const Item* weapon = catalog_.find(itemAt(slots, Slot::Weapon))) {
            cls = weapon->class_req;
        }
    }

    for (Slot slot : kAllSlots) {
        const Item* item = catalog_.find(itemAt(slots, slot));
        if (!item) continue;
        if (slotCategory(slot) != item->category) {
            summary.warnings.push_back(std::string(slotName(slot)) +
                                       " contains incompatible item type (" + item->type + ").");
        }
        if (item->level > ctx.level) {
            summary.warnings.push_back(item->name + " requires level " +
                                       std::to_string(item->level) + ".");
        }
        if (!itemWearableBy(*item, cls)) {
            summary.warnings.push_back(item->name + " requires " +
                                       className(*item->class_req) + ".");
        }
        if (item->restricted || item->deprecated) {
            summary.warnings.push_back(item->name + " is restricted/deprecated.");
        }
    }

    DerivedMetrics& d = summary.derived;
    for (size_t j = 0; j < kSkillStatCount; j++) {
        d.req_total += agg.skill_reqs[j];
        d.skill_point_total += agg.skill_points[j];
    }

    SkillpointFeasibility feasibility = skillpointFeasibility(slots, ctx);

    const OffenseTotals& off = agg.offense;
    double skill_mult = 1.0 + skillPointsToPercentage(agg.skill_points[0]);
    d.spell_proxy = (off.base_dps * (1.0 + (off.spell_pct + off.elem_dam_pct + off.generic_dam_pct) / 100.0) +
                     off.spell_raw) * skill_mult;
    d.melee_proxy = (off.base_dps * (1.0 + (off.melee_pct + off.elem_dam_pct + off.generic_dam_pct) / 100.0) +
                     off.melee_raw) * skill_mult;
    d.dps_proxy = d.melee_proxy + d.spell_proxy + agg.speed * 0.8;

    double def_total = 0.0;
    for (double v : agg.defenses) def_total += v;
    d.ehp_proxy = agg.hp_total +
                  def_total * 0.45 +
                  agg.hpr_total * 2.0 +
                  std::max(0, agg.skill_points[3]) * 12.0 +
                  std::max(0, agg.skill_points[4]) * 10.0;

    d.legacy_base_dps = off.base_dps;
    LegacyEhp ehp = computeLegacyEhp(levelToBaseHp(ctx.level) + agg.hp_total,
                                     agg.skill_points[3], agg.skill_points[4], weapon_type);
    d.legacy_ehp = ehp.with_agi;
    d.legacy_ehp_no_agi = ehp.no_agi;
    d.skillpoint_feasible = feasibility.feasible;
    d.assigned_skill_points_required = feasibility.feasible ? feasibility.assigned_total : 0;

    if (!feasibility.feasible) {
        summary.warnings.push_back("Skill requirements are not satisfiable at level " +
                                   std::to_string(ctx.level) + ".");
    }
    return summary;
}

} // namespace gearopt
