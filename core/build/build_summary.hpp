#pragma once

#include "catalog/item.hpp"

#include <array>
#include <string>
#include <vector>

namespace gearopt {

struct OffenseTotals {
    double base_dps = 0.0;
    double spell_pct = 0.0;
    double spell_raw = 0.0;
    double melee_pct = 0.0;
    double melee_raw = 0.0;
    double elem_dam_pct = 0.0;
    double generic_dam_pct = 0.0;
    double offense_score = 0.0;
};

/// Plain sums over equipped items, except skill_reqs which holds maxima.
struct AggregatedStats {
    double hp_total = 0.0;
    double hpr_total = 0.0;
    double mr = 0.0;
    double ms = 0.0;
    double ls = 0.0;
    double speed = 0.0;
    SkillVec skill_points{};
    SkillVec skill_reqs{};
    std::array<double, 5> defenses{};
    OffenseTotals offense;
};

struct DerivedMetrics {
    double dps_proxy = 0.0;
    double spell_proxy = 0.0;
    double melee_proxy = 0.0;
    double ehp_proxy = 0.0;
    double req_total = 0.0;
    double skill_point_total = 0.0;
    double legacy_base_dps = 0.0;
    double legacy_ehp = 0.0;
    double legacy_ehp_no_agi = 0.0;
    bool skillpoint_feasible = true;
    int assigned_skill_points_required = 0;
};

struct SlotStatus {
    bool class_ok = true;
    bool level_ok = true;
    bool skill_reqs_met = true;
};

struct BuildSummary {
    AggregatedStats aggregated;
    DerivedMetrics derived;
    std::array<SlotStatus, kSlotCount> slot_status{};
    std::vector<std::string> warnings;
};

} // namespace gearopt
