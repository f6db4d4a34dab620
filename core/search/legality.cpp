#include "search/legality.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace gearopt {

namespace {

template <typename T>
bool contains(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

bool itemMatchesGlobalConstraints(const Item& item, const Constraints& constraints) {
    const ItemFilters& f = constraints.filters;
    if (!f.allow_restricted && (item.restricted || item.deprecated)) return false;
    if (item.level > f.level) return false;
    if (!itemWearableBy(item, f.character_class)) return false;
    if (contains(f.excluded_ids, item.id)) return false;
    if (!f.allowed_tiers.empty() && !contains(f.allowed_tiers, item.tier)) return false;
    if (f.min_powder_slots && item.powder_slots < *f.min_powder_slots) return false;
    for (const auto& major_id : f.excluded_major_ids) {
        if (item.hasMajorId(major_id)) return false;
    }
    return true;
}

bool itemFitsSlot(const Item& item, Slot slot) {
    return slotCategory(slot) == item.category;
}

std::map<std::string, int> activeSetCounts(const SlotAssignment& slots, const Catalog& catalog) {
    std::map<std::string, int> counts;
    for (int id : slots) {
        if (id == 0) continue;
        if (const std::string* set_name = catalog.setOf(id)) counts[*set_name]++;
    }
    return counts;
}

bool wouldCreateIllegalCombo(int item_id, const SlotAssignment& slots, const Catalog& catalog) {
    const std::string* set_name = catalog.setOf(item_id);
    if (!set_name) return false;
    const SetMeta* meta = catalog.setMeta(*set_name);
    if (!meta) return false;
    int existing = 0;
    for (int id : slots) {
        if (id == 0) continue;
        const std::string* other = catalog.setOf(id);
        if (other && *other == *set_name) existing++;
    }
    return meta->isIllegalCount(existing + 1);
}

bool slotsSatisfyRequiredMajorIds(const SlotAssignment& slots, const Catalog& catalog,
                                  const std::vector<std::string>& required) {
    if (required.empty()) return true;
    std::set<std::string> found;
    for (int id : slots) {
        const Item* item = id == 0 ? nullptr : catalog.find(id);
        if (!item) continue;
        for (const auto& major_id : item->major_ids) {
            if (contains(required, major_id)) found.insert(major_id);
        }
    }
    return std::all_of(required.begin(), required.end(),
                       [&](const std::string& m) { return found.count(m) > 0; });
}

int totalAtkTier(const SlotAssignment& slots, const Catalog& catalog) {
    int total = 0;
    for (int id : slots) {
        const Item* item = id == 0 ? nullptr : catalog.find(id);
        if (item) total += item->atkTier();
    }
    return total;
}

std::optional<int> finalAttackSpeedIndex(const SlotAssignment& slots, const Catalog& catalog) {
    const Item* weapon = catalog.find(itemAt(slots, Slot::Weapon));
    if (!weapon) return std::nullopt;
    return shiftedAttackSpeedIndex(static_cast<int>(weapon->atk_spd), totalAtkTier(slots, catalog));
}

bool AtkTierRequirement::satisfiedBy(int total_atk_tier) const {
    if (!has_constraint) return false;
    return total_atk_tier >= min_allowed && total_atk_tier <= max_allowed;
}

AtkTierRequirement buildAtkTierRequirement(const std::vector<NumericRange>& rows) {
    AtkTierRequirement req;
    if (rows.empty()) return req;
    req.has_constraint = true;
    for (const auto& row : rows) {
        if (row.min) req.min_allowed = std::max(req.min_allowed, *row.min);
        if (row.max) req.max_allowed = std::min(req.max_allowed, *row.max);
    }
    return req;
}

std::vector<NumericRange> customRangeSpecs(const Constraints& constraints, bool include_atk_tier) {
    std::vector<NumericRange> specs;
    for (const auto& row : constraints.target.custom_ranges) {
        if (row.key.empty() || (!row.min && !row.max)) continue;
        if (!include_atk_tier && row.key == kAtkTierKey) continue;
        specs.push_back(row);
    }
    return specs;
}

std::vector<NumericRange> atkTierRangeSpecs(const Constraints& constraints) {
    std::vector<NumericRange> specs;
    for (const auto& row : customRangeSpecs(constraints, true)) {
        if (row.key == kAtkTierKey) specs.push_back(row);
    }
    return specs;
}

std::vector<NumericRange> customRangeSpecsForBeamPruning(const Constraints& constraints) {
    bool skip_atk_tier = constraints.filters.attack_mode == AttackConstraintMode::Or &&
                         !constraints.filters.weapon_attack_speeds.empty();
    return customRangeSpecs(constraints, !skip_atk_tier);
}

std::vector<double> customTotals(const SlotAssignment& slots, const Catalog& catalog,
                                 const std::vector<NumericRange>& specs) {
    std::vector<double> totals(specs.size(), 0.0);
    if (specs.empty()) return totals;
    for (int id : slots) {
        const Item* item = id == 0 ? nullptr : catalog.find(id);
        if (!item) continue;
        for (size_t k = 0; k < specs.size(); k++) {
            totals[k] += item->numericValue(specs[k].key);
        }
    }
    return totals;
}

AttackCheck combinedAttackConstraintSatisfied(const Constraints& constraints,
                                              const SlotAssignment& slots,
                                              const Catalog& catalog,
                                              const AtkTierRequirement& requirement) {
    const auto& speeds = constraints.filters.weapon_attack_speeds;
    bool speed_configured = !speeds.empty();
    bool tier_configured = requirement.has_constraint;
    AttackCheck check;
    if (!speed_configured && !tier_configured) return check;
    check.configured = true;

    bool speed_ok = false;
    if (speed_configured) {
        auto final_index = finalAttackSpeedIndex(slots, catalog);
        speed_ok = final_index && contains(speeds, static_cast<AttackSpeed>(*final_index));
        if (!speed_ok) {
            std::string expected;
            for (AttackSpeed s : speeds) {
                if (!expected.empty()) expected += '/';
                expected += attackSpeedName(s);
            }
            check.failed_checks.push_back("attackSpeed (expected " + expected + ")");
        }
    }

    bool tier_ok = false;
    if (tier_configured) {
        int total = totalAtkTier(slots, catalog);
        tier_ok = requirement.satisfiedBy(total);
        if (!tier_ok) {
            std::string low = std::isfinite(requirement.min_allowed)
                                  ? formatNumber(requirement.min_allowed) : "-inf";
            std::string high = std::isfinite(requirement.max_allowed)
                                   ? formatNumber(requirement.max_allowed) : "+inf";
            check.failed_checks.push_back("atkTier (" + std::to_string(total) + " not in [" +
                                          low + ", " + high + "])");
        }
    }

    if (speed_configured && tier_configured) {
        check.ok = constraints.filters.attack_mode == AttackConstraintMode::And
                       ? (speed_ok && tier_ok)
                       : (speed_ok || tier_ok);
    } else {
        check.ok = speed_configured ? speed_ok : tier_ok;
    }
    if (check.ok) check.failed_checks.clear();
    return check;
}

std::vector<std::string> thresholdFailures(const BuildSummary& summary,
                                           const Constraints& constraints,
                                           const SlotAssignment& slots,
                                           const Catalog& catalog) {
    const TargetThresholds& t = constraints.target;
    const AggregatedStats& a = summary.aggregated;
    const DerivedMetrics& d = summary.derived;
    std::vector<std::string> failed;

    auto checkMin = [&failed](const char* name, const std::optional<double>& min, double value) {
        if (min && value < *min) {
            failed.push_back(std::string(name) + " (" + formatNumber(value) + " < " +
                             formatNumber(*min) + ")");
        }
    };
    checkMin("minLegacyBaseDps", t.min_legacy_base_dps, d.legacy_base_dps);
    checkMin("minLegacyEhp", t.min_legacy_ehp, d.legacy_ehp);
    checkMin("minDpsProxy", t.min_dps_proxy, d.dps_proxy);
    checkMin("minEhpProxy", t.min_ehp_proxy, d.ehp_proxy);
    checkMin("minMr", t.min_mr, a.mr);
    checkMin("minMs", t.min_ms, a.ms);
    checkMin("minSpeed", t.min_speed, a.speed);
    checkMin("minSkillPointTotal", t.min_skill_point_total, d.skill_point_total);
    if (t.max_req_total && d.req_total > *t.max_req_total) {
        failed.push_back("maxReqTotal (" + formatNumber(d.req_total) + " > " +
                         formatNumber(*t.max_req_total) + ")");
    }

    auto specs = customRangeSpecs(constraints, false);
    auto totals = customTotals(slots, catalog, specs);
    for (size_t k = 0; k < specs.size(); k++) {
        const NumericRange& spec = specs[k];
        if (spec.min && totals[k] < *spec.min) {
            failed.push_back(spec.key + " (" + formatNumber(totals[k]) + " < " +
                             formatNumber(*spec.min) + ")");
        }
        if (spec.max && totals[k] > *spec.max) {
            failed.push_back(spec.key + " (" + formatNumber(totals[k]) + " > " +
                             formatNumber(*spec.max) + ")");
        }
    }
    return failed;
}

HardCheck validateFinalHardConstraints(const SlotAssignment& slots,
                                       const Catalog& catalog,
                                       const Constraints& constraints,
                                       const BuildSummary& summary) {
    HardCheck check;
    for (int id : constraints.filters.must_include_ids) {
        if (!containsItem(slots, id)) {
            check.failure = HardFailure::Item;
            check.failed_checks.push_back("mustIncludeMissing (" + std::to_string(id) + ")");
            return check;
        }
    }

    for (int id : slots) {
        if (id == 0) continue;
        const Item* item = catalog.find(id);
        if (!item || !itemMatchesGlobalConstraints(*item, constraints)) {
            check.failure = HardFailure::Item;
            return check;
        }
    }

    for (const auto& [set_name, count] : activeSetCounts(slots, catalog)) {
        const SetMeta* meta = catalog.setMeta(set_name);
        if (meta && meta->isIllegalCount(count)) {
            check.failure = HardFailure::Item;
            check.failed_checks.push_back("illegalSetCount (" + set_name + ")");
            return check;
        }
    }

    AttackCheck attack = combinedAttackConstraintSatisfied(
        constraints, slots, catalog, buildAtkTierRequirement(atkTierRangeSpecs(constraints)));
    if (attack.configured && !attack.ok) {
        check.failure = HardFailure::AttackSpeed;
        check.failed_checks = std::move(attack.failed_checks);
        return check;
    }

    auto failures = thresholdFailures(summary, constraints, slots, catalog);
    if (!failures.empty()) {
        check.failure = HardFailure::Thresholds;
        check.failed_checks = std::move(failures);
    }
    return check;
}

} // namespace gearopt
