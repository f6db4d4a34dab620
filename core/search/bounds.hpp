#pragma once

#include "catalog/catalog.hpp"
#include "constraints/constraints.hpp"
#include "search/legality.hpp"
#include "search/search_state.hpp"

#include <array>
#include <optional>
#include <vector>

namespace gearopt {

/// Candidate pools indexed by Slot. Slots that are already filled keep an
/// empty pool and never appear in the slot order.
using SlotPools = std::array<CandidatePool, kSlotCount>;

// ─── Suffix tables ─────────────────────────────────────────────
// Entry i covers positions i..n-1 of the slot order; entry n is zero.

/// Sum of the best rough score per remaining slot (a negative best counts as 0).
std::vector<double> optimisticSuffixMax(const std::vector<Slot>& order, const SlotPools& pools);

struct AtkTierSuffixBounds {
    std::vector<int> min_suffix;
    std::vector<int> max_suffix;
};

AtkTierSuffixBounds buildAtkTierSuffixBounds(const std::vector<Slot>& order,
                                             const SlotPools& pools,
                                             const Catalog& catalog);

/// Per position, per custom key: reachable min and max of the remaining slots.
struct CustomSuffixBounds {
    std::vector<std::vector<double>> min_suffix;
    std::vector<std::vector<double>> max_suffix;
};

CustomSuffixBounds buildCustomSuffixBounds(const std::vector<Slot>& order,
                                           const SlotPools& pools,
                                           const Catalog& catalog,
                                           const std::vector<NumericRange>& specs);

/// Per position, per focus stat: best positive skill bonus of the remaining slots.
std::vector<std::vector<int>> buildFocusSupportSuffixMax(const std::vector<Slot>& order,
                                                         const SlotPools& pools,
                                                         const Catalog& catalog,
                                                         const std::vector<SkillStat>& focus_stats);

std::vector<int> focusBonusVector(const Item& item, const std::vector<SkillStat>& focus_stats);

// ─── Attack-speed reachability ─────────────────────────────────

struct AttackSpeedContext {
    int base_speed_index = 0;
    int fixed_atk_tier_total = 0;
    std::vector<int> allowed_final_indices;   // sorted, unique
    int preferred_direction = 0;              // -1 slower, 0 already allowed, +1 faster

    bool allows(int final_index) const;
};

/// Only built when allowed speeds are configured and a weapon is fixed.
std::optional<AttackSpeedContext> buildAttackSpeedContext(const SlotAssignment& base_slots,
                                                          const Catalog& catalog,
                                                          const Constraints& constraints);

bool canStillReachAllowedAttackSpeed(const AttackSpeedContext& ctx,
                                     int partial_atk_tier,
                                     int remaining_min,
                                     int remaining_max);

bool canStillReachAtkTierRequirement(const AtkTierRequirement& requirement,
                                     int fixed_atk_tier_total,
                                     int partial_atk_tier,
                                     int remaining_min,
                                     int remaining_max);

/// Beam ordering bias toward an allowed final speed. 0 when no direction is
/// preferred or every reachable final speed is already allowed.
double attackSpeedBiasValue(const AttackSpeedContext* ctx,
                            int assigned_atk_tier,
                            int remaining_min,
                            int remaining_max,
                            double amplifier = 1.0);

/// Everything the attack reachability check needs, fixed for one search.
struct AttackBounds {
    const Constraints* constraints = nullptr;
    const AttackSpeedContext* speed_ctx = nullptr;
    const AtkTierRequirement* requirement = nullptr;
    int fixed_atk_tier_total = 0;
};

bool canStillSatisfyCombinedAttackConstraint(const AttackBounds& bounds,
                                             int partial_atk_tier,
                                             int remaining_min,
                                             int remaining_max);

// ─── Support and custom deficits ───────────────────────────────

bool canStillMeetOvercapNeed(const std::vector<int>& current,
                             const std::vector<int>& remaining_max,
                             const std::vector<int>& need);

int supportDeficit(const std::vector<int>& current, const std::vector<int>& need);

double customRangeDeficit(const std::vector<double>& totals, const std::vector<NumericRange>& specs);

/// Custom totals plus the reachable suffix still satisfy every min and max.
bool customRangesReachable(const std::vector<double>& totals,
                           const std::vector<NumericRange>& specs,
                           const CustomSuffixBounds& bounds,
                           size_t next_position);

// ─── Slot order heuristics ─────────────────────────────────────

/// Largest tier shift in the preferred direction available in the pool.
int slotAttackPotential(const CandidatePool& pool, const Catalog& catalog, int direction);

/// Largest summed positive focus-stat bonus available in the pool.
int slotFocusSupportPotential(const CandidatePool& pool,
                              const Catalog& catalog,
                              const std::vector<SkillStat>& focus_stats);

// ─── Budgets ───────────────────────────────────────────────────

int computePerNodeBranchCap(size_t pool_size,
                            size_t beam_size,
                            size_t remaining_stages,
                            long long processed_states,
                            long long max_states,
                            int min_cap,
                            int max_cap);

/// Product of pool sizes along the order. Stops early once it exceeds `cap`;
/// 0 when any pool is empty.
long long estimateCombinationCount(const std::vector<Slot>& order,
                                   const SlotPools& pools,
                                   long long cap);

/// Pick up to `width` nodes: round(width * share) from the primary lane
/// first, then the hard lane, then the primary remainder. Lanes are index
/// orderings over `nodes`. Picks are deduplicated on order index plus
/// canonical key. Returns the picked indices in pick order.
std::vector<size_t> mergeBeamLanes(const std::vector<BeamNode>& nodes,
                                   const std::vector<size_t>& primary,
                                   const std::vector<size_t>& hard,
                                   int width,
                                   double primary_share);

} // namespace gearopt
