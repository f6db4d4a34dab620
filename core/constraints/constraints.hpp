#pragma once

#include "build/build_evaluator.hpp"
#include "catalog/item.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace gearopt {

// ─── Weights ───────────────────────────────────────────────────

struct Weights {
    double legacy_base_dps = 1.0;
    double legacy_ehp = 0.7;
    double dps_proxy = 1.0;
    double spell_proxy = 0.0;
    double melee_proxy = 0.0;
    double ehp_proxy = 0.6;
    double speed = 0.4;
    double sustain = 0.35;
    double skill_point_total = 0.15;
    double req_total_penalty = 0.2;
};

// ─── Thresholds ────────────────────────────────────────────────

/// Min/max on the summed value of an arbitrary numeric key.
struct NumericRange {
    std::string key;
    std::optional<double> min;
    std::optional<double> max;
};

struct TargetThresholds {
    std::optional<double> min_legacy_base_dps;
    std::optional<double> min_legacy_ehp;
    std::optional<double> min_dps_proxy;
    std::optional<double> min_ehp_proxy;
    std::optional<double> min_mr;
    std::optional<double> min_ms;
    std::optional<double> min_speed;
    std::optional<double> min_skill_point_total;
    std::optional<double> max_req_total;
    std::vector<NumericRange> custom_ranges;

    /// Any named threshold or custom range is configured.
    bool hasAny() const;
};

// ─── Item filters ──────────────────────────────────────────────

enum class AttackConstraintMode : uint8_t { Or, And };

struct ItemFilters {
    std::optional<CharacterClass> character_class;
    int level = 106;
    std::vector<int> must_include_ids;
    std::vector<int> excluded_ids;
    std::vector<std::string> allowed_tiers;            // empty = any tier
    std::vector<std::string> required_major_ids;
    std::vector<std::string> excluded_major_ids;
    std::vector<AttackSpeed> weapon_attack_speeds;     // allowed final speeds
    AttackConstraintMode attack_mode = AttackConstraintMode::Or;
    std::optional<int> min_powder_slots;
    bool only_pinned_items = false;
    bool allow_restricted = true;
    TomeMode tome_mode = TomeMode::NoTomes;
};

// ─── Budgets ───────────────────────────────────────────────────

struct SearchBudgets {
    int top_n = 50;
    int top_k_per_slot = 80;
    int beam_width = 400;
    long long max_states = 150000;
    bool use_exhaustive_small_pool = true;
    long long exhaustive_state_limit = 250000;
    double primary_lane_share = 0.6;    // fraction of each beam taken from the primary lane
    int min_branch_cap = 8;
    int max_branch_cap = 96;
    int fallback_time_cap_ms = 2000;
    int preview_size = 2;               // candidates attached to progress events
};

// ─── Rescue policy ─────────────────────────────────────────────

enum class SolverStrategy : uint8_t { Auto, Fast, ConstraintFirst, Exhaustive };

struct RescuePolicy {
    bool enabled = true;
    std::vector<SolverStrategy> strategies = {SolverStrategy::Auto};
};

// ─── Constraints ───────────────────────────────────────────────

struct Constraints {
    Weights weights;
    TargetThresholds target;
    ItemFilters filters;
    SearchBudgets budgets;
    RescuePolicy rescue;
    std::array<bool, kSlotCount> locked_slots{};
    bool constraint_only_mode = false;   // score only the custom ranges

    bool isLocked(Slot slot) const { return locked_slots[slotIndex(slot)]; }
    EvaluationContext evaluationContext() const;
};

/// Throws std::invalid_argument for malformed values.
void validateConstraints(const Constraints& constraints);

/// Fluent, validated construction of Constraints.
class ConstraintsBuilder {
public:
    ConstraintsBuilder() = default;
    explicit ConstraintsBuilder(Constraints base) : c_(std::move(base)) {}

    ConstraintsBuilder& characterClass(CharacterClass cls);
    ConstraintsBuilder& level(int level);
    ConstraintsBuilder& mustInclude(int item_id);
    ConstraintsBuilder& exclude(int item_id);
    ConstraintsBuilder& allowTier(const std::string& tier);
    ConstraintsBuilder& requireMajorId(const std::string& major_id);
    ConstraintsBuilder& excludeMajorId(const std::string& major_id);
    ConstraintsBuilder& allowAttackSpeed(AttackSpeed speed);
    ConstraintsBuilder& attackMode(AttackConstraintMode mode);
    ConstraintsBuilder& minPowderSlots(int slots);
    ConstraintsBuilder& onlyPinnedItems(bool value);
    ConstraintsBuilder& allowRestricted(bool value);
    ConstraintsBuilder& tomeMode(TomeMode mode);
    ConstraintsBuilder& lockSlot(Slot slot);

    ConstraintsBuilder& weights(const Weights& weights);
    ConstraintsBuilder& target(const TargetThresholds& target);
    ConstraintsBuilder& customRange(const std::string& key,
                                    std::optional<double> min,
                                    std::optional<double> max);
    ConstraintsBuilder& budgets(const SearchBudgets& budgets);
    ConstraintsBuilder& rescue(const RescuePolicy& rescue);
    ConstraintsBuilder& constraintOnly(bool value);

    /// Validates and returns the constraints.
    Constraints build() const;

private:
    Constraints c_;
};

// ─── Weight presets ────────────────────────────────────────────

/// Raise the weight of every thresholded dimension to at least 2.5x its default.
Weights thresholdBiasedWeights(const TargetThresholds& target, const Weights& base);

/// Trade damage weight for defence, sustain and requirement frugality.
Weights rescueWeights(const Weights& base);

const char* strategyName(SolverStrategy strategy);

} // namespace gearopt
