#include <gtest/gtest.h>
#include "constraints/constraints.hpp"

using namespace gearopt;

// ─── Builder & validation ──────────────────────────────────────

TEST(ConstraintsTest, BuilderProducesValidatedConstraints) {
    Constraints c = ConstraintsBuilder()
        .characterClass(CharacterClass::Mage)
        .level(90)
        .mustInclude(801)
        .exclude(502)
        .allowAttackSpeed(AttackSpeed::Fast)
        .allowAttackSpeed(AttackSpeed::Fast)
        .customRange("mr", 5.0, std::nullopt)
        .lockSlot(Slot::Weapon)
        .tomeMode(TomeMode::GuildRainbow)
        .build();

    EXPECT_EQ(c.filters.character_class, CharacterClass::Mage);
    EXPECT_EQ(c.filters.level, 90);
    ASSERT_EQ(c.filters.must_include_ids.size(), 1u);
    EXPECT_EQ(c.filters.weapon_attack_speeds.size(), 1u);
    EXPECT_TRUE(c.isLocked(Slot::Weapon));
    EXPECT_FALSE(c.isLocked(Slot::Helmet));
    EXPECT_TRUE(c.target.hasAny());

    EvaluationContext ctx = c.evaluationContext();
    EXPECT_EQ(ctx.level, 90);
    EXPECT_EQ(ctx.skillpoints.extra_base[0], 1);
}

TEST(ConstraintsTest, RejectsMalformedValues) {
    SearchBudgets budgets;
    budgets.top_n = 0;
    EXPECT_THROW(ConstraintsBuilder().budgets(budgets).build(), std::invalid_argument);

    budgets = SearchBudgets{};
    budgets.min_branch_cap = 50;
    budgets.max_branch_cap = 10;
    EXPECT_THROW(ConstraintsBuilder().budgets(budgets).build(), std::invalid_argument);

    budgets = SearchBudgets{};
    budgets.primary_lane_share = 0.0;
    EXPECT_THROW(ConstraintsBuilder().budgets(budgets).build(), std::invalid_argument);

    EXPECT_THROW(ConstraintsBuilder().customRange("mr", std::nullopt, std::nullopt).build(),
                 std::invalid_argument);
    EXPECT_THROW(ConstraintsBuilder().customRange("", 1.0, std::nullopt).build(),
                 std::invalid_argument);
    EXPECT_THROW(ConstraintsBuilder().level(0).build(), std::invalid_argument);
    EXPECT_THROW(ConstraintsBuilder().mustInclude(0), std::invalid_argument);

    RescuePolicy rescue;
    rescue.strategies.clear();
    EXPECT_THROW(ConstraintsBuilder().rescue(rescue).build(), std::invalid_argument);

    EXPECT_NO_THROW(validateConstraints(Constraints{}));
}

TEST(ConstraintsTest, EmptyTargetHasNothing) {
    TargetThresholds target;
    EXPECT_FALSE(target.hasAny());
    target.max_req_total = 300;
    EXPECT_TRUE(target.hasAny());
}

// ─── Weight presets ────────────────────────────────────────────

TEST(ConstraintsTest, ThresholdBiasedWeightsBoostTargetedDimensions) {
    TargetThresholds target;
    target.min_dps_proxy = 5000;
    target.min_mr = 10;
    Weights base;
    Weights biased = thresholdBiasedWeights(target, base);

    EXPECT_DOUBLE_EQ(biased.dps_proxy, 2.5);
    EXPECT_DOUBLE_EQ(biased.sustain, 0.35 * 2.5);
    EXPECT_DOUBLE_EQ(biased.ehp_proxy, base.ehp_proxy);
    EXPECT_DOUBLE_EQ(biased.speed, base.speed);

    // Weights already above the boost are kept.
    base.dps_proxy = 9.0;
    EXPECT_DOUBLE_EQ(thresholdBiasedWeights(target, base).dps_proxy, 9.0);
}

TEST(ConstraintsTest, RescueWeightsFavourDefence) {
    Weights base;
    Weights rescue = rescueWeights(base);
    EXPECT_DOUBLE_EQ(rescue.dps_proxy, 0.55);
    EXPECT_DOUBLE_EQ(rescue.legacy_base_dps, 0.6);
    EXPECT_DOUBLE_EQ(rescue.ehp_proxy, 1.0);
    EXPECT_DOUBLE_EQ(rescue.legacy_ehp, 1.0);
    EXPECT_DOUBLE_EQ(rescue.sustain, 0.8);
    EXPECT_DOUBLE_EQ(rescue.skill_point_total, 0.8);
    EXPECT_DOUBLE_EQ(rescue.req_total_penalty, 1.8);
    EXPECT_DOUBLE_EQ(rescue.speed, base.speed);
}

TEST(ConstraintsTest, StrategyNames) {
    EXPECT_STREQ(strategyName(SolverStrategy::Auto), "auto");
    EXPECT_STREQ(strategyName(SolverStrategy::ConstraintFirst), "constraint");
    EXPECT_STREQ(strategyName(SolverStrategy::Exhaustive), "exhaustive");
}
