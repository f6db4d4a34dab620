#include "constraints/constraints.hpp"
#include <algorithm>
#include <stdexcept>

namespace gearopt {

namespace {

constexpr double kThresholdWeightBoost = 2.5;

} // namespace

bool TargetThresholds::hasAny() const {
    return min_legacy_base_dps || min_legacy_ehp || min_dps_proxy || min_ehp_proxy ||
           min_mr || min_ms || min_speed || min_skill_point_total || max_req_total ||
           !custom_ranges.empty();
}

EvaluationContext Constraints::evaluationContext() const {
    EvaluationContext ctx;
    ctx.level = filters.level;
    ctx.character_class = filters.character_class;
    ctx.skillpoints = skillpointOptionsFromTomeMode(filters.tome_mode);
    return ctx;
}

void validateConstraints(const Constraints& c) {
    const SearchBudgets& b = c.budgets;
    if (b.top_n <= 0) throw std::invalid_argument("topN must be positive");
    if (b.top_k_per_slot <= 0) throw std::invalid_argument("topKPerSlot must be positive");
    if (b.beam_width <= 0) throw std::invalid_argument("beamWidth must be positive");
    if (b.max_states <= 0) throw std::invalid_argument("maxStates must be positive");
    if (b.exhaustive_state_limit < 0) {
        throw std::invalid_argument("exhaustiveStateLimit must not be negative");
    }
    if (!(b.primary_lane_share > 0.0 && b.primary_lane_share <= 1.0)) {
        throw std::invalid_argument("primary lane share must be in (0, 1]");
    }
    if (b.min_branch_cap <= 0 || b.min_branch_cap > b.max_branch_cap) {
        throw std::invalid_argument("branch cap bounds must satisfy 0 < min <= max");
    }
    if (b.fallback_time_cap_ms < 0) {
        throw std::invalid_argument("fallback time cap must not be negative");
    }
    if (b.preview_size < 0) throw std::invalid_argument("preview size must not be negative");
    if (c.filters.level < 1) throw std::invalid_argument("level must be at least 1");
    if (c.filters.min_powder_slots && *c.filters.min_powder_slots < 0) {
        throw std::invalid_argument("minPowderSlots must not be negative");
    }
    for (const auto& range : c.target.custom_ranges) {
        if (range.key.empty()) throw std::invalid_argument("custom range key must not be empty");
        if (!range.min && !range.max) {
            throw std::invalid_argument("custom range '" + range.key + "' needs a min or a max");
        }
    }
    if (c.rescue.strategies.empty()) {
        throw std::invalid_argument("rescue policy needs at least one strategy");
    }
}

// ─── ConstraintsBuilder ────────────────────────────────────────

ConstraintsBuilder& ConstraintsBuilder::characterClass(CharacterClass cls) {
    c_.filters.character_class = cls;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::level(int level) {
    c_.filters.level = level;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::mustInclude(int item_id) {
    if (item_id <= 0) throw std::invalid_argument("must-include id must be positive");
    c_.filters.must_include_ids.push_back(item_id);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::exclude(int item_id) {
    c_.filters.excluded_ids.push_back(item_id);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::allowTier(const std::string& tier) {
    c_.filters.allowed_tiers.push_back(tier);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::requireMajorId(const std::string& major_id) {
    c_.filters.required_major_ids.push_back(major_id);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::excludeMajorId(const std::string& major_id) {
    c_.filters.excluded_major_ids.push_back(major_id);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::allowAttackSpeed(AttackSpeed speed) {
    auto& speeds = c_.filters.weapon_attack_speeds;
    if (std::find(speeds.begin(), speeds.end(), speed) == speeds.end()) speeds.push_back(speed);
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::attackMode(AttackConstraintMode mode) {
    c_.filters.attack_mode = mode;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::minPowderSlots(int slots) {
    c_.filters.min_powder_slots = slots;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::onlyPinnedItems(bool value) {
    c_.filters.only_pinned_items = value;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::allowRestricted(bool value) {
    c_.filters.allow_restricted = value;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::tomeMode(TomeMode mode) {
    c_.filters.tome_mode = mode;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::lockSlot(Slot slot) {
    c_.locked_slots[slotIndex(slot)] = true;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::weights(const Weights& weights) {
    c_.weights = weights;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::target(const TargetThresholds& target) {
    c_.target = target;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::customRange(const std::string& key,
                                                    std::optional<double> min,
                                                    std::optional<double> max) {
    c_.target.custom_ranges.push_back(NumericRange{key, min, max});
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::budgets(const SearchBudgets& budgets) {
    c_.budgets = budgets;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::rescue(const RescuePolicy& rescue) {
    c_.rescue = rescue;
    return *this;
}

ConstraintsBuilder& ConstraintsBuilder::constraintOnly(bool value) {
    c_.constraint_only_mode = value;
    return *this;
}

Constraints ConstraintsBuilder::build() const {
    validateConstraints(c_);
    return c_;
}

// ─── Weight presets ────────────────────────────────────────────

Weights thresholdBiasedWeights(const TargetThresholds& target, const Weights& base) {
    const Weights defaults;
    Weights w = base;
    auto boost = [](double& field, double default_value) {
        field = std::max(field, default_value * kThresholdWeightBoost);
    };
    if (target.min_legacy_base_dps) boost(w.legacy_base_dps, defaults.legacy_base_dps);
    if (target.min_legacy_ehp) boost(w.legacy_ehp, defaults.legacy_ehp);
    if (target.min_dps_proxy) boost(w.dps_proxy, defaults.dps_proxy);
    if (target.min_ehp_proxy) boost(w.ehp_proxy, defaults.ehp_proxy);
    if (target.min_mr || target.min_ms) boost(w.sustain, defaults.sustain);
    if (target.min_speed) boost(w.speed, defaults.speed);
    if (target.min_skill_point_total) boost(w.skill_point_total, defaults.skill_point_total);
    if (target.max_req_total) boost(w.req_total_penalty, defaults.req_total_penalty);
    if (!target.custom_ranges.empty()) boost(w.sustain, defaults.sustain);
    return w;
}

Weights rescueWeights(const Weights& base) {
    Weights w = base;
    w.legacy_base_dps = base.legacy_base_dps * 0.6;
    w.dps_proxy = base.dps_proxy * 0.55;
    w.legacy_ehp = std::max(base.legacy_ehp, 1.0);
    w.ehp_proxy = std::max(base.ehp_proxy, 1.0);
    w.sustain = std::max(base.sustain, 0.8);
    w.skill_point_total = std::max(base.skill_point_total, 0.8);
    w.req_total_penalty = std::max(base.req_total_penalty, 1.8);
    return w;
}

const char* strategyName(SolverStrategy strategy) {
    switch (strategy) {
        case SolverStrategy::Auto:            return "auto";
        case SolverStrategy::Fast:            return "fast";
        case SolverStrategy::ConstraintFirst: return "constraint";
        case SolverStrategy::Exhaustive:      return "exhaustive";
    }
    return "unknown";
}

} // namespace gearopt
