#include "search/bounds.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace gearopt {

namespace {

int clampSpeedIndex(int index) {
    return std::max(0, std::min(kAttackSpeedCount - 1, index));
}

} // namespace

// ─── Suffix tables ─────────────────────────────────────────────

std::vector<double> optimisticSuffixMax(const std::vector<Slot>& order, const SlotPools& pools) {
    std::vector<double> suffix(order.size() + 1, 0.0);
    for (size_t i = order.size(); i-- > 0;) {
        double best = 0.0;
        for (const auto& entry : pools[slotIndex(order[i])]) {
            best = std::max(best, entry.rough);
        }
        suffix[i] = suffix[i + 1] + best;
    }
    return suffix;
}

AtkTierSuffixBounds buildAtkTierSuffixBounds(const std::vector<Slot>& order,
                                             const SlotPools& pools,
                                             const Catalog& catalog) {
    AtkTierSuffixBounds bounds;
    bounds.min_suffix.assign(order.size() + 1, 0);
    bounds.max_suffix.assign(order.size() + 1, 0);
    for (size_t i = order.size(); i-- > 0;) {
        const auto& pool = pools[slotIndex(order[i])];
        int slot_min = 0;
        int slot_max = 0;
        if (!pool.empty()) {
            slot_min = std::numeric_limits<int>::max();
            slot_max = std::numeric_limits<int>::min();
            for (const auto& entry : pool) {
                const Item* item = catalog.find(entry.id);
                int tier = item ? item->atkTier() : 0;
                slot_min = std::min(slot_min, tier);
                slot_max = std::max(slot_max, tier);
            }
        }
        bounds.min_suffix[i] = bounds.min_suffix[i + 1] + slot_min;
        bounds.max_suffix[i] = bounds.max_suffix[i + 1] + slot_max;
    }
    return bounds;
}

CustomSuffixBounds buildCustomSuffixBounds(const std::vector<Slot>& order,
                                           const SlotPools& pools,
                                           const Catalog& catalog,
                                           const std::vector<NumericRange>& specs) {
    const size_t keys = specs.size();
    CustomSuffixBounds bounds;
    bounds.min_suffix.assign(order.size() + 1, std::vector<double>(keys, 0.0));
    bounds.max_suffix.assign(order.size() + 1, std::vector<double>(keys, 0.0));
    if (keys == 0) return bounds;

    for (size_t i = order.size(); i-- > 0;) {
        std::vector<double> slot_min(keys, std::numeric_limits<double>::infinity());
        std::vector<double> slot_max(keys, -std::numeric_limits<double>::infinity());
        for (const auto& entry : pools[slotIndex(order[i])]) {
            const Item* item = catalog.find(entry.id);
            if (!item) continue;
            for (size_t k = 0; k < keys; k++) {
                double v = item->numericValue(specs[k].key);
                slot_min[k] = std::min(slot_min[k], v);
                slot_max[k] = std::max(slot_max[k], v);
            }
        }
        for (size_t k = 0; k < keys; k++) {
            double lo = std::isfinite(slot_min[k]) ? slot_min[k] : 0.0;
            double hi = std::isfinite(slot_max[k]) ? slot_max[k] : 0.0;
            bounds.min_suffix[i][k] = bounds.min_suffix[i + 1][k] + lo;
            bounds.max_suffix[i][k] = bounds.max_suffix[i + 1][k] + hi;
        }
    }
    return bounds;
}

std::vector<int> focusBonusVector(const Item& item, const std::vector<SkillStat>& focus_stats) {
    std::vector<int> bonus;
    bonus.reserve(focus_stats.size());
    for (SkillStat stat : focus_stats) bonus.push_back(std::max(0, item.skillBonus(stat)));
    return bonus;
}

std::vector<std::vector<int>> buildFocusSupportSuffixMax(const std::vector<Slot>& order,
                                                         const SlotPools& pools,
                                                         const Catalog& catalog,
                                                         const std::vector<SkillStat>& focus_stats) {
    std::vector<std::vector<int>> suffix(order.size() + 1, std::vector<int>(focus_stats.size(), 0));
    for (size_t i = order.size(); i-- > 0;) {
        std::vector<int> slot_max(focus_stats.size(), 0);
        for (const auto& entry : pools[slotIndex(order[i])]) {
            const Item* item = catalog.find(entry.id);
            if (!item) continue;
            auto bonus = focusBonusVector(*item, focus_stats);
            for (size_t j = 0; j < bonus.size(); j++) slot_max[j] = std::max(slot_max[j], bonus[j]);
        }
        for (size_t j = 0; j < focus_stats.size(); j++) {
            suffix[i][j] = suffix[i + 1][j] + slot_max[j];
        }
    }
    return suffix;
}

// ─── Attack-speed reachability ─────────────────────────────────

bool AttackSpeedContext::allows(int final_index) const {
    return std::binary_search(allowed_final_indices.begin(), allowed_final_indices.end(), final_index);
}

std::optional<AttackSpeedContext> buildAttackSpeedContext(const SlotAssignment& base_slots,
                                                          const Catalog& catalog,
                                                          const Constraints& constraints) {
    const auto& speeds = constraints.filters.weapon_attack_speeds;
    if (speeds.empty()) return std::nullopt;
    const Item* weapon = catalog.find(itemAt(base_slots, Slot::Weapon));
    if (!weapon) return std::nullopt;

    AttackSpeedContext ctx;
    ctx.base_speed_index = static_cast<int>(weapon->atk_spd);
    for (AttackSpeed speed : speeds) ctx.allowed_final_indices.push_back(static_cast<int>(speed));
    std::sort(ctx.allowed_final_indices.begin(), ctx.allowed_final_indices.end());
    ctx.allowed_final_indices.erase(
        std::unique(ctx.allowed_final_indices.begin(), ctx.allowed_final_indices.end()),
        ctx.allowed_final_indices.end());

    ctx.fixed_atk_tier_total = totalAtkTier(base_slots, catalog);
    int current = clampSpeedIndex(ctx.base_speed_index + ctx.fixed_atk_tier_total);
    if (!ctx.allows(current)) {
        int nearest = ctx.allowed_final_indices.front();
        for (int idx : ctx.allowed_final_indices) {
            if (std::abs(idx - current) < std::abs(nearest - current)) nearest = idx;
        }
        ctx.preferred_direction = nearest > current ? 1 : (nearest < current ? -1 : 0);
    }
    return ctx;
}

bool canStillReachAllowedAttackSpeed(const AttackSpeedContext& ctx,
                                     int partial_atk_tier,
                                     int remaining_min,
                                     int remaining_max) {
    int min_total = ctx.fixed_atk_tier_total + partial_atk_tier + remaining_min;
    int max_total = ctx.fixed_atk_tier_total + partial_atk_tier + remaining_max;
    int low = std::min(min_total, max_total);
    int high = std::max(min_total, max_total);
    int lo_index = clampSpeedIndex(ctx.base_speed_index + low);
    int hi_index = clampSpeedIndex(ctx.base_speed_index + high);
    for (int idx = lo_index; idx <= hi_index; idx++) {
        if (ctx.allows(idx)) return true;
    }
    return false;
}

bool canStillReachAtkTierRequirement(const AtkTierRequirement& requirement,
                                     int fixed_atk_tier_total,
                                     int partial_atk_tier,
                                     int remaining_min,
                                     int remaining_max) {
    if (!requirement.has_constraint) return false;
    int min_total = fixed_atk_tier_total + partial_atk_tier + std::min(remaining_min, remaining_max);
    int max_total = fixed_atk_tier_total + partial_atk_tier + std::max(remaining_min, remaining_max);
    return min_total <= requirement.max_allowed && max_total >= requirement.min_allowed;
}

double attackSpeedBiasValue(const AttackSpeedContext* ctx,
                            int assigned_atk_tier,
                            int remaining_min,
                            int remaining_max,
                            double amplifier) {
    if (!ctx || ctx->preferred_direction == 0) return 0.0;
    int total = ctx->fixed_atk_tier_total + assigned_atk_tier;
    int min_final = clampSpeedIndex(ctx->base_speed_index + total + remaining_min);
    int max_final = clampSpeedIndex(ctx->base_speed_index + total + remaining_max);
    int low = std::min(min_final, max_final);
    int high = std::max(min_final, max_final);

    int best_distance = std::numeric_limits<int>::max();
    int worst_distance = 0;
    for (int idx = low; idx <= high; idx++) {
        int distance = std::numeric_limits<int>::max();
        for (int allowed : ctx->allowed_final_indices) {
            distance = std::min(distance, std::abs(allowed - idx));
        }
        best_distance = std::min(best_distance, distance);
        worst_distance = std::max(worst_distance, distance);
    }
    if (best_distance == std::numeric_limits<int>::max() || worst_distance == 0) return 0.0;

    int safety_progress = ctx->preferred_direction > 0 ? low : -high;
    return (-worst_distance * 1000.0 - best_distance * 100.0 + safety_progress) * amplifier;
}

bool canStillSatisfyCombinedAttackConstraint(const AttackBounds& bounds,
                                             int partial_atk_tier,
                                             int remaining_min,
                                             int remaining_max) {
    bool speed_configured = !bounds.constraints->filters.weapon_attack_speeds.empty();
    bool tier_configured = bounds.requirement && bounds.requirement->has_constraint;
    if (!speed_configured && !tier_configured) return true;

    // Without a fixed weapon the final speed is unknown until the weapon is placed.
    bool speed_reachable = speed_configured &&
        (!bounds.speed_ctx ||
         canStillReachAllowedAttackSpeed(*bounds.speed_ctx, partial_atk_tier, remaining_min, remaining_max));
    bool tier_reachable = tier_configured &&
        canStillReachAtkTierRequirement(*bounds.requirement, bounds.fixed_atk_tier_total,
                                        partial_atk_tier, remaining_min, remaining_max);

    if (speed_configured && tier_configured) {
        return bounds.constraints->filters.attack_mode == AttackConstraintMode::And
                   ? (speed_reachable && tier_reachable)
                   : (speed_reachable || tier_reachable);
    }
    return speed_configured ? speed_reachable : tier_reachable;
}

// ─── Support and custom deficits ───────────────────────────────

bool canStillMeetOvercapNeed(const std::vector<int>& current,
                             const std::vector<int>& remaining_max,
                             const std::vector<int>& need) {
    for (size_t i = 0; i < need.size(); i++) {
        int have = i < current.size() ? current[i] : 0;
        int more = i < remaining_max.size() ? remaining_max[i] : 0;
        if (have + more < need[i]) return false;
    }
    return true;
}

int supportDeficit(const std::vector<int>& current, const std::vector<int>& need) {
    int deficit = 0;
    for (size_t i = 0; i < need.size(); i++) {
        int have = i < current.size() ? current[i] : 0;
        deficit += std::max(0, need[i] - have);
    }
    return deficit;
}

double customRangeDeficit(const std::vector<double>& totals, const std::vector<NumericRange>& specs) {
    double deficit = 0.0;
    for (size_t k = 0; k < specs.size() && k < totals.size(); k++) {
        if (specs[k].min && totals[k] < *specs[k].min) deficit += *specs[k].min - totals[k];
        if (specs[k].max && totals[k] > *specs[k].max) deficit += totals[k] - *specs[k].max;
    }
    return deficit;
}

bool customRangesReachable(const std::vector<double>& totals,
                           const std::vector<NumericRange>& specs,
                           const CustomSuffixBounds& bounds,
                           size_t next_position) {
    for (size_t k = 0; k < specs.size(); k++) {
        if (specs[k].min && totals[k] + bounds.max_suffix[next_position][k] < *specs[k].min) return false;
        if (specs[k].max && totals[k] + bounds.min_suffix[next_position][k] > *specs[k].max) return false;
    }
    return true;
}

// ─── Slot order heuristics ─────────────────────────────────────

int slotAttackPotential(const CandidatePool& pool, const Catalog& catalog, int direction) {
    int best = 0;
    for (const auto& entry : pool) {
        const Item* item = catalog.find(entry.id);
        if (!item) continue;
        int tier = item->atkTier();
        best = std::max(best, direction > 0 ? std::max(0, tier) : std::max(0, -tier));
    }
    return best;
}

int slotFocusSupportPotential(const CandidatePool& pool,
                              const Catalog& catalog,
                              const std::vector<SkillStat>& focus_stats) {
    if (focus_stats.empty()) return 0;
    int best = 0;
    for (const auto& entry : pool) {
        const Item* item = catalog.find(entry.id);
        if (!item) continue;
        int score = 0;
        for (int bonus : focusBonusVector(*item, focus_stats)) score += bonus;
        best = std::max(best, score);
    }
    return best;
}

// ─── Budgets ───────────────────────────────────────────────────

int computePerNodeBranchCap(size_t pool_size,
                            size_t beam_size,
                            size_t remaining_stages,
                            long long processed_states,
                            long long max_states,
                            int min_cap,
                            int max_cap) {
    if (pool_size == 0) return 0;
    long long remaining = std::max(0LL, max_states - processed_states);
    long long denominator = std::max<long long>(
        1, static_cast<long long>(beam_size) * std::max<long long>(1, remaining_stages));
    long long per_node = remaining / denominator;
    long long cap = std::max<long long>(min_cap, std::min<long long>(max_cap, per_node));
    return static_cast<int>(std::min<long long>(static_cast<long long>(pool_size), cap));
}

long long estimateCombinationCount(const std::vector<Slot>& order,
                                   const SlotPools& pools,
                                   long long cap) {
    long long product = 1;
    for (Slot slot : order) {
        long long size = static_cast<long long>(pools[slotIndex(slot)].size());
        if (size == 0) return 0;
        product *= size;
        if (product > cap) return product;
    }
    return product;
}

std::vector<size_t> mergeBeamLanes(const std::vector<BeamNode>& nodes,
                                   const std::vector<size_t>& primary,
                                   const std::vector<size_t>& hard,
                                   int width,
                                   double primary_share) {
    const size_t limit = static_cast<size_t>(std::max(1, width));
    const size_t primary_target = static_cast<size_t>(std::max(
        1L, std::min(static_cast<long>(limit), std::lround(limit * primary_share))));

    std::vector<size_t> picked;
    picked.reserve(std::min(limit, nodes.size()));
    std::unordered_set<std::string> seen;
    auto tryPush = [&](size_t index) {
        const BeamNode& node = nodes[index];
        std::string key = std::to_string(node.order_index) + "|" + canonicalKey(node.slots);
        if (seen.insert(key).second) picked.push_back(index);
    };

    size_t i = 0;
    size_t j = 0;
    while (picked.size() < limit && (i < primary.size() || j < hard.size())) {
        if (picked.size() < primary_target && i < primary.size()) {
            tryPush(primary[i++]);
        } else if (j < hard.size()) {
            tryPush(hard[j++]);
        } else {
            tryPush(primary[i++]);
        }
    }
    return picked;
}

} // namespace gearopt
