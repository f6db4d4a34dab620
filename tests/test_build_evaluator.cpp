#include <gtest/gtest.h>
#include "build/build_evaluator.hpp"
#include "test_fixtures.hpp"

using namespace gearopt;
using namespace gearopt::fixtures;

namespace {

Item requiring(int id, SkillVec req, SkillVec sp = SkillVec{}) {
    Item item = makeItem(id, ItemCategory::Ring);
    item.stats.req = req;
    item.stats.sp = sp;
    return item;
}

} // namespace

// ─── Level tables ──────────────────────────────────────────────

TEST(BuildEvaluatorTest, AvailableSkillPoints) {
    EXPECT_EQ(levelToAvailableSkillPoints(1), 0);
    EXPECT_EQ(levelToAvailableSkillPoints(50), 98);
    EXPECT_EQ(levelToAvailableSkillPoints(101), 200);
    EXPECT_EQ(levelToAvailableSkillPoints(400), 200);
    EXPECT_EQ(levelToBaseHp(106), 535);
}

TEST(BuildEvaluatorTest, SkillPointPercentageCaps) {
    EXPECT_DOUBLE_EQ(skillPointsToPercentage(0), 0.0);
    EXPECT_DOUBLE_EQ(skillPointsToPercentage(-20), 0.0);
    EXPECT_GT(skillPointsToPercentage(50), 0.0);
    EXPECT_DOUBLE_EQ(skillPointsToPercentage(400), skillPointsToPercentage(150));
}

// ─── Equip feasibility ─────────────────────────────────────────

TEST(BuildEvaluatorTest, EmptyLoadoutIsFeasible) {
    SkillpointFeasibility result = estimateEquipFeasibility({}, 106, SkillpointOptions{});
    EXPECT_TRUE(result.feasible);
    EXPECT_EQ(result.assigned_total, 0);
}

TEST(BuildEvaluatorTest, BonusesReduceAssignedPoints) {
    Item giver = requiring(1, {0, 0, 0, 0, 0}, {20, 0, 0, 0, 0});
    Item taker = requiring(2, {50, 0, 0, 0, 0});
    SkillpointFeasibility result = estimateEquipFeasibility({&taker, &giver}, 106, SkillpointOptions{});
    ASSERT_TRUE(result.feasible);
    EXPECT_EQ(result.assigned_total, 30);
    ASSERT_TRUE(result.assigned_by_stat.has_value());
    EXPECT_EQ((*result.assigned_by_stat)[0], 30);
}

TEST(BuildEvaluatorTest, PerStatCapMakesBuildInfeasible) {
    Item heavy = requiring(1, {120, 0, 0, 0, 0});
    SkillpointFeasibility result = estimateEquipFeasibility({&heavy}, 106, SkillpointOptions{});
    EXPECT_FALSE(result.feasible);

    Item booster = requiring(2, {0, 0, 0, 0, 0}, {25, 0, 0, 0, 0});
    result = estimateEquipFeasibility({&heavy, &booster}, 106, SkillpointOptions{});
    ASSERT_TRUE(result.feasible);
    EXPECT_EQ(result.assigned_total, 95);
}

TEST(BuildEvaluatorTest, LevelLimitsAvailablePoints) {
    Item item = requiring(1, {30, 30, 0, 0, 0});
    EXPECT_FALSE(estimateEquipFeasibility({&item}, 20, SkillpointOptions{}).feasible);
    EXPECT_TRUE(estimateEquipFeasibility({&item}, 40, SkillpointOptions{}).feasible);
}

TEST(BuildEvaluatorTest, TomeModes) {
    Item rainbow = requiring(1, {1, 1, 1, 1, 1});
    Item flexible = requiring(2, {2, 0, 0, 0, 0});
    Item greedy = requiring(3, {3, 0, 0, 0, 0});

    // Level 1 has no assignable points of its own.
    EXPECT_FALSE(estimateEquipFeasibility({&rainbow}, 1, SkillpointOptions{}).feasible);
    EXPECT_TRUE(estimateEquipFeasibility(
        {&rainbow}, 1, skillpointOptionsFromTomeMode(TomeMode::GuildRainbow)).feasible);

    SkillpointOptions flex = skillpointOptionsFromTomeMode(TomeMode::Flexible2);
    EXPECT_EQ(flex.extra_available, 2);
    EXPECT_TRUE(estimateEquipFeasibility({&flexible}, 1, flex).feasible);
    EXPECT_FALSE(estimateEquipFeasibility({&greedy}, 1, flex).feasible);
}

// ─── Evaluation ────────────────────────────────────────────────

TEST(BuildEvaluatorTest, AggregatesEquippedItems) {
    Catalog catalog = makeSmallCatalog();
    DefaultBuildEvaluator evaluator(catalog);
    EvaluationContext ctx;

    BuildSummary summary = evaluator.evaluate(fullBuild(), ctx);
    const AggregatedStats& agg = summary.aggregated;
    EXPECT_DOUBLE_EQ(agg.hp_total, 400 + 900 + 600 + 300 + 50);
    EXPECT_DOUBLE_EQ(agg.mr, 2.0);
    EXPECT_DOUBLE_EQ(agg.ms, 1.0);
    EXPECT_DOUBLE_EQ(agg.ls, 40.0);
    EXPECT_DOUBLE_EQ(agg.speed, 5.0);
    EXPECT_DOUBLE_EQ(agg.offense.base_dps, 220.0);
    EXPECT_DOUBLE_EQ(summary.derived.legacy_base_dps, 220.0);
    EXPECT_DOUBLE_EQ(summary.derived.ehp_proxy, 2250.0 + 100.0 * 0.45);
    EXPECT_TRUE(summary.derived.skillpoint_feasible);
    EXPECT_TRUE(summary.warnings.empty());
}

TEST(BuildEvaluatorTest, RequirementTotalsUseMaxima) {
    Catalog catalog;
    catalog.addItem(requiring(1, {40, 0, 10, 0, 0}));
    Item other = requiring(2, {60, 0, 0, 0, 0});
    catalog.addItem(other);
    DefaultBuildEvaluator evaluator(catalog);

    SlotAssignment slots = emptyAssignment();
    itemAt(slots, Slot::Ring1) = 1;
    itemAt(slots, Slot::Ring2) = 2;
    BuildSummary summary = evaluator.evaluate(slots, EvaluationContext{});
    EXPECT_EQ(summary.aggregated.skill_reqs[0], 60);
    EXPECT_DOUBLE_EQ(summary.derived.req_total, 70.0);
    EXPECT_EQ(summary.derived.assigned_skill_points_required, 70);
}

TEST(BuildEvaluatorTest, WarnsAboutLevelAndClass) {
    Catalog catalog;
    Item item = makeItem(1, ItemCategory::Helmet, "Crown");
    item.level = 100;
    item.class_req = CharacterClass::Mage;
    catalog.addItem(item);
    DefaultBuildEvaluator evaluator(catalog);

    SlotAssignment slots = emptyAssignment();
    itemAt(slots, Slot::Helmet) = 1;
    EvaluationContext ctx;
    ctx.level = 90;
    ctx.character_class = CharacterClass::Warrior;

    BuildSummary summary = evaluator.evaluate(slots, ctx);
    ASSERT_EQ(summary.warnings.size(), 2u);
    EXPECT_EQ(summary.warnings[0], "Crown requires level 100.");
    EXPECT_EQ(summary.warnings[1], "Crown requires Mage.");
    EXPECT_FALSE(summary.slot_status[slotIndex(Slot::Helmet)].level_ok);
    EXPECT_FALSE(summary.slot_status[slotIndex(Slot::Helmet)].class_ok);
}
