#include <gtest/gtest.h>
#include "search/bounds.hpp"
#include "test_fixtures.hpp"

#include <limits>

using namespace gearopt;
using namespace gearopt::fixtures;

// ─── Branch caps & combination counts ──────────────────────────

TEST(BoundsTest, PerNodeBranchCap) {
    EXPECT_EQ(computePerNodeBranchCap(0, 10, 3, 0, 1000, 8, 96), 0);
    EXPECT_EQ(computePerNodeBranchCap(50, 10, 2, 0, 1000, 8, 96), 50);
    EXPECT_EQ(computePerNodeBranchCap(50, 10, 2, 0, 100, 8, 96), 8);       // floor
    EXPECT_EQ(computePerNodeBranchCap(500, 1, 1, 0, 100000, 8, 96), 96);   // ceiling
    EXPECT_EQ(computePerNodeBranchCap(3, 1, 1, 0, 100000, 8, 96), 3);      // pool size
    EXPECT_EQ(computePerNodeBranchCap(50, 10, 2, 5000, 1000, 8, 96), 8);   // overspent
}

TEST(BoundsTest, CombinationCountStopsAtCap) {
    SlotPools pools;
    pools[slotIndex(Slot::Helmet)] = {{1, 0}, {2, 0}, {3, 0}};
    pools[slotIndex(Slot::Boots)] = {{4, 0}, {5, 0}};
    pools[slotIndex(Slot::Necklace)] = {{6, 0}, {7, 0}, {8, 0}, {9, 0}};
    std::vector<Slot> order = {Slot::Helmet, Slot::Boots, Slot::Necklace};

    EXPECT_EQ(estimateCombinationCount(order, pools, 1000), 24);
    EXPECT_EQ(estimateCombinationCount(order, pools, 5), 6);

    order.push_back(Slot::Weapon);   // empty pool
    EXPECT_EQ(estimateCombinationCount(order, pools, 1000), 0);
}

// ─── Suffix tables ─────────────────────────────────────────────

TEST(BoundsTest, SuffixTables) {
    Catalog catalog = makeSmallCatalog();
    SlotPools pools;
    pools[slotIndex(Slot::Helmet)] = {{101, 5.0}, {102, 9.0}};
    pools[slotIndex(Slot::Ring1)] = {{501, 1.0}, {502, 3.0}, {503, 2.0}};
    std::vector<Slot> order = {Slot::Helmet, Slot::Ring1};

    std::vector<double> suffix = optimisticSuffixMax(order, pools);
    ASSERT_EQ(suffix.size(), 3u);
    EXPECT_DOUBLE_EQ(suffix[0], 12.0);
    EXPECT_DOUBLE_EQ(suffix[1], 3.0);
    EXPECT_DOUBLE_EQ(suffix[2], 0.0);

    std::vector<NumericRange> specs = {NumericRange{"hp", 100.0, std::nullopt}};
    CustomSuffixBounds custom = buildCustomSuffixBounds(order, pools, catalog, specs);
    EXPECT_DOUBLE_EQ(custom.max_suffix[0][0], 400.0 + 50.0);
    EXPECT_DOUBLE_EQ(custom.min_suffix[0][0], 200.0 + 0.0);
    EXPECT_DOUBLE_EQ(custom.max_suffix[1][0], 50.0);

    EXPECT_TRUE(customRangesReachable({0.0}, specs, custom, 0));
    std::vector<NumericRange> tight = {NumericRange{"hp", 500.0, std::nullopt}};
    CustomSuffixBounds tight_bounds = buildCustomSuffixBounds(order, pools, catalog, tight);
    EXPECT_FALSE(customRangesReachable({0.0}, tight, tight_bounds, 0));
    EXPECT_TRUE(customRangesReachable({60.0}, tight, tight_bounds, 0));
}

// ─── Attack speed ──────────────────────────────────────────────

TEST(BoundsTest, AttackSpeedContextNeedsFixedWeapon) {
    Catalog catalog = makeSmallCatalog();
    Constraints c;
    c.filters.weapon_attack_speeds = {AttackSpeed::VeryFast, AttackSpeed::Fast};

    EXPECT_FALSE(buildAttackSpeedContext(emptyAssignment(), catalog, c).has_value());

    SlotAssignment base = emptyAssignment();
    itemAt(base, Slot::Weapon) = 801;   // NORMAL
    auto ctx = buildAttackSpeedContext(base, catalog, c);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->base_speed_index, 3);
    EXPECT_EQ(ctx->allowed_final_indices, (std::vector<int>{4, 5}));
    EXPECT_EQ(ctx->preferred_direction, 1);

    EXPECT_FALSE(canStillReachAllowedAttackSpeed(*ctx, 0, 0, 0));
    EXPECT_TRUE(canStillReachAllowedAttackSpeed(*ctx, 0, 0, 1));
    EXPECT_TRUE(canStillReachAllowedAttackSpeed(*ctx, 2, -1, 0));
    EXPECT_FALSE(canStillReachAllowedAttackSpeed(*ctx, -2, 0, 1));
}

TEST(BoundsTest, AttackSpeedBiasPrefersProgress) {
    AttackSpeedContext ctx;
    ctx.base_speed_index = 3;
    ctx.allowed_final_indices = {5};
    ctx.preferred_direction = 1;

    double stuck = attackSpeedBiasValue(&ctx, 0, 0, 0);
    double closer = attackSpeedBiasValue(&ctx, 1, 0, 0);
    double reached = attackSpeedBiasValue(&ctx, 2, 0, 0);
    EXPECT_LT(stuck, closer);
    EXPECT_DOUBLE_EQ(reached, 0.0);
    EXPECT_DOUBLE_EQ(attackSpeedBiasValue(nullptr, 0, 0, 0), 0.0);
    EXPECT_DOUBLE_EQ(attackSpeedBiasValue(&ctx, 1, 0, 0, 10.0), closer * 10.0);
}

TEST(BoundsTest, AtkTierReachability) {
    AtkTierRequirement req = buildAtkTierRequirement({NumericRange{kAtkTierKey, 2.0, 3.0}});
    EXPECT_TRUE(canStillReachAtkTierRequirement(req, 0, 0, 0, 2));
    EXPECT_FALSE(canStillReachAtkTierRequirement(req, 0, 0, 0, 1));
    EXPECT_FALSE(canStillReachAtkTierRequirement(req, 1, 3, 0, 0));
    EXPECT_TRUE(canStillReachAtkTierRequirement(req, 1, 3, -1, 0));
}

TEST(BoundsTest, CombinedReachabilityWithoutWeapon) {
    Constraints c;
    c.filters.weapon_attack_speeds = {AttackSpeed::SuperFast};
    AtkTierRequirement none;
    AttackBounds bounds;
    bounds.constraints = &c;
    bounds.requirement = &none;

    // Unknown weapon: the speed target stays open.
    EXPECT_TRUE(canStillSatisfyCombinedAttackConstraint(bounds, 0, 0, 0));

    Constraints free;
    AttackBounds open;
    open.constraints = &free;
    EXPECT_TRUE(canStillSatisfyCombinedAttackConstraint(open, -5, 0, 0));
}

// ─── Support & custom deficits ─────────────────────────────────

TEST(BoundsTest, SupportDeficits) {
    EXPECT_TRUE(canStillMeetOvercapNeed({5, 0}, {10, 20}, {15, 20}));
    EXPECT_FALSE(canStillMeetOvercapNeed({5, 0}, {9, 20}, {15, 20}));
    EXPECT_EQ(supportDeficit({5, 30}, {15, 20}), 10);

    std::vector<NumericRange> specs = {NumericRange{"mr", 5.0, std::nullopt},
                                       NumericRange{"ls", std::nullopt, 10.0}};
    EXPECT_DOUBLE_EQ(customRangeDeficit({2.0, 14.0}, specs), 3.0 + 4.0);
    EXPECT_DOUBLE_EQ(customRangeDeficit({6.0, 10.0}, specs), 0.0);
}

// ─── Lane merge ────────────────────────────────────────────────

TEST(BoundsTest, MergeBeamLanesSharesAndDeduplicates) {
    std::vector<BeamNode> nodes(6);
    for (size_t i = 0; i < nodes.size(); i++) {
        nodes[i].order_index = 1;
        nodes[i].slots = emptyAssignment();
        itemAt(nodes[i].slots, Slot::Helmet) = static_cast<int>(100 + i);
    }
    std::vector<size_t> primary = {0, 1, 2, 3, 4, 5};
    std::vector<size_t> hard = {5, 4, 3, 2, 1, 0};

    EXPECT_EQ(mergeBeamLanes(nodes, primary, hard, 4, 0.5), (std::vector<size_t>{0, 1, 5, 4}));

    nodes[1].slots = nodes[0].slots;   // duplicate of node 0
    EXPECT_EQ(mergeBeamLanes(nodes, primary, hard, 4, 0.5), (std::vector<size_t>{0, 2, 5, 4}));

    EXPECT_EQ(mergeBeamLanes(nodes, primary, hard, 10, 0.5).size(), 5u);
}
