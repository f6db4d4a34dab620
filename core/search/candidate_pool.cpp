#include "search/candidate_pool.hpp"
#include "search/legality.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>

namespace gearopt {

namespace {

constexpr double kCustomMinWeight = 3.0;
constexpr double kCustomMinWeightStrong = 14.0;
constexpr double kCustomMaxWeight = 2.0;

/// Precomputed sort keys of one legal item.
struct PoolCandidate {
    const Item* item = nullptr;
    double rough = 0.0;
    double req_total = 0.0;
    double skill_point_total = 0.0;
    double utility = 0.0;
    int atk_tier = 0;
    double support_focus = 0.0;
};

using Comparator = std::function<bool(const PoolCandidate&, const PoolCandidate&)>;

struct SampleSource {
    std::vector<const PoolCandidate*> list;
    int remaining = 0;
    size_t cursor = 0;
};

std::vector<const PoolCandidate*> sortedView(const std::vector<PoolCandidate>& all,
                                             const Comparator& less) {
    std::vector<const PoolCandidate*> view;
    view.reserve(all.size());
    for (const auto& c : all) view.push_back(&c);
    std::sort(view.begin(), view.end(),
              [&less](const PoolCandidate* a, const PoolCandidate* b) { return less(*a, *b); });
    return view;
}

} // namespace

double roughItemScore(const Item& item, const Constraints& constraints) {
    const auto& ranges = constraints.target.custom_ranges;

    if (constraints.constraint_only_mode) {
        double score = 0.0;
        for (const auto& range : ranges) {
            if (range.key.empty()) continue;
            double v = item.numericValue(range.key);
            if (range.min) score += v * kCustomMinWeightStrong;
            if (range.max) score -= v * kCustomMaxWeight;
        }
        return score - item.rough.req_total * 0.05;
    }

    const Weights& w = constraints.weights;
    int custom_min_count = static_cast<int>(std::count_if(
        ranges.begin(), ranges.end(), [](const NumericRange& r) { return r.min.has_value(); }));
    bool has_custom_mins = custom_min_count > 0;
    double generic_scale = has_custom_mins ? std::max(0.15, 1.0 - custom_min_count * 0.2) : 1.0;
    double def_weight = (w.legacy_ehp + w.ehp_proxy) * generic_scale;

    double score = item.stats.base_dps * w.legacy_base_dps * generic_scale +
                   item.rough.ehp_proxy * def_weight +
                   item.rough.offense * w.dps_proxy * generic_scale +
                   item.stats.spd * w.speed +
                   item.rough.utility * w.sustain +
                   item.rough.skill_point_total * w.skill_point_total -
                   item.rough.req_total * w.req_total_penalty;

    double min_weight = has_custom_mins ? kCustomMinWeightStrong : kCustomMinWeight;
    for (const auto& range : ranges) {
        if (range.key.empty()) continue;
        double v = item.numericValue(range.key);
        if (range.min) score += v * min_weight;
        if (range.max) score -= v * kCustomMaxWeight;
    }
    return score;
}

double computeSupportFocusScore(const Item& item, const std::vector<SkillStat>& focus_stats) {
    if (focus_stats.empty()) return 0.0;
    double score = 0.0;
    for (SkillStat stat : focus_stats) {
        score += std::max(0, item.skillBonus(stat)) * 10.0;
        score -= std::max(0, item.req(stat)) * 0.7;
    }
    score -= std::max(0.0, item.rough.req_total) * 0.12;
    return score;
}

namespace {

SkillVec maxRequirements(const SlotAssignment& slots, const Catalog& catalog) {
    SkillVec max_req{};
    for (int id : slots) {
        const Item* item = id == 0 ? nullptr : catalog.find(id);
        if (!item) continue;
        for (size_t j = 0; j < kSkillStatCount; j++) {
            max_req[j] = std::max(max_req[j], item->stats.req[j]);
        }
    }
    return max_req;
}

} // namespace

std::vector<SkillStat> collectRequirementFocusStats(const SlotAssignment& base_slots,
                                                    const Catalog& catalog) {
    SkillVec max_req = maxRequirements(base_slots, catalog);
    auto by_req_desc = [&max_req](SkillStat a, SkillStat b) {
        return max_req[static_cast<size_t>(a)] > max_req[static_cast<size_t>(b)];
    };

    std::vector<SkillStat> focused;
    for (SkillStat stat : kAllSkillStats) {
        if (max_req[static_cast<size_t>(stat)] > 100) focused.push_back(stat);
    }
    if (!focused.empty()) {
        std::stable_sort(focused.begin(), focused.end(), by_req_desc);
        return focused;
    }

    for (SkillStat stat : kAllSkillStats) {
        if (max_req[static_cast<size_t>(stat)] >= 70) focused.push_back(stat);
    }
    std::stable_sort(focused.begin(), focused.end(), by_req_desc);
    if (focused.size() > 2) focused.resize(2);
    return focused;
}

std::vector<int> collectOvercapNeeds(const SlotAssignment& base_slots,
                                     const Catalog& catalog,
                                     const std::vector<SkillStat>& focus_stats) {
    std::vector<int> needs;
    if (focus_stats.empty()) return needs;
    SkillVec max_req = maxRequirements(base_slots, catalog);
    for (SkillStat stat : focus_stats) {
        needs.push_back(std::max(0, max_req[static_cast<size_t>(stat)] - 100));
    }
    return needs;
}

std::array<std::unordered_set<int>, kSlotCount> buildPinnedAllowlist(const Workbench& workbench) {
    std::array<std::unordered_set<int>, kSlotCount> allow;
    for (Slot slot : kAllSlots) {
        auto& ids = allow[slotIndex(slot)];
        auto it = workbench.bins.find(slotCategory(slot));
        if (it != workbench.bins.end()) ids.insert(it->second.begin(), it->second.end());
        int equipped = itemAt(workbench.slots, slot);
        if (equipped != 0) ids.insert(equipped);
    }
    return allow;
}

CandidatePool buildCandidatePool(Slot slot,
                                 const Catalog& catalog,
                                 const Constraints& constraints,
                                 const std::unordered_set<int>* pinned_allowlist,
                                 const std::vector<SkillStat>& focus_stats) {
    std::vector<PoolCandidate> all;
    for (int id : catalog.itemsInCategory(slotCategory(slot))) {
        const Item* item = catalog.find(id);
        if (!item || !itemFitsSlot(*item, slot)) continue;
        if (pinned_allowlist && !pinned_allowlist->count(id)) continue;
        if (!itemMatchesGlobalConstraints(*item, constraints)) continue;
        PoolCandidate c;
        c.item = item;
        c.rough = roughItemScore(*item, constraints);
        c.req_total = item->rough.req_total;
        c.skill_point_total = item->rough.skill_point_total;
        c.utility = item->rough.utility + item->stats.spd * 0.8;
        c.atk_tier = item->atkTier();
        c.support_focus = computeSupportFocusScore(*item, focus_stats);
        all.push_back(c);
    }

    auto id_of = [](const PoolCandidate& c) { return c.item->id; };
    const auto custom_specs = customRangeSpecs(constraints, true);

    // ── Ranked views ──
    auto rough_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
        if (a.rough != b.rough) return a.rough > b.rough;
        return id_of(a) < id_of(b);
    });
    auto low_req_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
        if (a.req_total != b.req_total) return a.req_total < b.req_total;
        if (a.item->level != b.item->level) return a.item->level < b.item->level;
        return id_of(a) < id_of(b);
    });
    auto sp_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
        if (a.skill_point_total != b.skill_point_total) return a.skill_point_total > b.skill_point_total;
        if (a.req_total != b.req_total) return a.req_total < b.req_total;
        return id_of(a) < id_of(b);
    });
    auto utility_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
        if (a.utility != b.utility) return a.utility > b.utility;
        if (a.req_total != b.req_total) return a.req_total < b.req_total;
        return id_of(a) < id_of(b);
    });

    const int target = std::max(10, constraints.budgets.top_k_per_slot);
    const int diversity = std::min(140, std::max(40, static_cast<int>(target * 0.8)));
    const int focus_extra = focus_stats.empty()
                                ? 0 : std::min(60, static_cast<int>(focus_stats.size()) * 12);
    const int custom_extra = std::min(80, static_cast<int>(custom_specs.size()) * 14);
    const size_t desired = std::min(all.size(),
                                    static_cast<size_t>(target + diversity + focus_extra + custom_extra));
    const int seed = std::min({12, static_cast<int>(target * 0.4),
                               static_cast<int>(rough_sorted.size())});

    std::vector<SampleSource> sources;
    sources.push_back({rough_sorted, std::max(0, target - seed), 0});
    sources.push_back({low_req_sorted, static_cast<int>(diversity * 0.28), 0});
    sources.push_back({sp_sorted, static_cast<int>(diversity * 0.24), 0});
    sources.push_back({utility_sorted, static_cast<int>(diversity * 0.18), 0});

    if (!constraints.filters.weapon_attack_speeds.empty()) {
        auto attack_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
            int a_pos = std::max(0, a.atk_tier);
            int b_pos = std::max(0, b.atk_tier);
            if (a_pos != b_pos) return a_pos > b_pos;
            if (a.atk_tier != b.atk_tier) return a.atk_tier > b.atk_tier;
            if (a.req_total != b.req_total) return a.req_total < b.req_total;
            if (a.skill_point_total != b.skill_point_total) return a.skill_point_total > b.skill_point_total;
            return id_of(a) < id_of(b);
        });
        sources.push_back({attack_sorted, std::max(18, static_cast<int>(diversity * 0.22)), 0});
    }
    if (!focus_stats.empty()) {
        auto focus_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
            if (a.support_focus != b.support_focus) return a.support_focus > b.support_focus;
            if (a.req_total != b.req_total) return a.req_total < b.req_total;
            if (a.skill_point_total != b.skill_point_total) return a.skill_point_total > b.skill_point_total;
            return id_of(a) < id_of(b);
        });
        sources.push_back({focus_sorted, std::max(16, static_cast<int>(diversity * 0.2)), 0});
    }
    for (SkillStat stat : focus_stats) {
        auto stat_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
            int av = a.item->skillBonus(stat);
            int bv = b.item->skillBonus(stat);
            if (av != bv) return av > bv;
            if (a.req_total != b.req_total) return a.req_total < b.req_total;
            if (a.support_focus != b.support_focus) return a.support_focus > b.support_focus;
            return id_of(a) < id_of(b);
        });
        sources.push_back({stat_sorted, 10, 0});
    }
    for (const auto& spec : custom_specs) {
        if (!spec.min) continue;
        auto min_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
            double av = a.item->numericValue(spec.key);
            double bv = b.item->numericValue(spec.key);
            if (av != bv) return av > bv;
            if (a.req_total != b.req_total) return a.req_total < b.req_total;
            if (a.skill_point_total != b.skill_point_total) return a.skill_point_total > b.skill_point_total;
            return id_of(a) < id_of(b);
        });
        sources.push_back({min_sorted, 35, 0});
    }
    for (const auto& spec : custom_specs) {
        if (!spec.max) continue;
        auto max_sorted = sortedView(all, [&](const PoolCandidate& a, const PoolCandidate& b) {
            double av = a.item->numericValue(spec.key);
            double bv = b.item->numericValue(spec.key);
            if (av != bv) return av < bv;
            if (a.req_total != b.req_total) return a.req_total < b.req_total;
            if (a.skill_point_total != b.skill_point_total) return a.skill_point_total > b.skill_point_total;
            return id_of(a) < id_of(b);
        });
        sources.push_back({max_sorted, 20, 0});
    }

    // ── Interleaved sampling ──
    CandidatePool pool;
    std::unordered_set<int> picked;
    auto pick = [&](const PoolCandidate& c) {
        picked.insert(c.item->id);
        pool.push_back(PoolEntry{c.item->id, c.rough});
    };

    for (int i = 0; i < seed; i++) pick(*rough_sorted[i]);

    while (pool.size() < desired) {
        bool progressed = false;
        for (auto& source : sources) {
            if (source.remaining <= 0) continue;
            while (source.cursor < source.list.size()) {
                const PoolCandidate& c = *source.list[source.cursor++];
                if (picked.count(c.item->id)) continue;
                pick(c);
                source.remaining--;
                progressed = true;
                break;
            }
        }
        if (!progressed) break;
    }

    for (const PoolCandidate* c : rough_sorted) {
        if (pool.size() >= desired) break;
        if (!picked.count(c->item->id)) pick(*c);
    }
    return pool;
}

} // namespace gearopt
