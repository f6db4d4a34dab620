#include <gtest/gtest.h>
#include "build/build_evaluator.hpp"
#include "build/scorer.hpp"
#include "search/beam_search.hpp"
#include "search/budget_manager.hpp"
#include "search/candidate_pool.hpp"
#include "search/exact_search.hpp"
#include "search/fallback_search.hpp"
#include "search/finalizer.hpp"
#include "search/search_context.hpp"
#include "test_fixtures.hpp"

#include <set>

using namespace gearopt;
using namespace gearopt::fixtures;

namespace {

/// Catalog, collaborators and constraints for driving one engine directly.
struct Harness {
    Catalog catalog = makeSmallCatalog();
    DefaultBuildEvaluator evaluator{catalog};
    DefaultScorer scorer;
    Constraints constraints;

    /// Pools for every slot `base` leaves empty, in slot enum order.
    SearchContext context(const SlotAssignment& base = emptyAssignment()) const {
        SearchContext ctx(catalog, evaluator, scorer, constraints);
        ctx.base_slots = base;
        for (Slot slot : kAllSlots) {
            if (itemAt(base, slot) != 0) continue;
            ctx.slot_order.push_back(slot);
            ctx.pools[slotIndex(slot)] = buildCandidatePool(slot, catalog, constraints, nullptr, {});
        }
        ctx.speed_ctx = buildAttackSpeedContext(base, catalog, constraints);
        ctx.atk_requirement = buildAtkTierRequirement(atkTierRangeSpecs(constraints));
        ctx.fixed_atk_tier_total = totalAtkTier(base, catalog);
        ctx.custom_specs = customRangeSpecsForBeamPruning(constraints);
        return ctx;
    }
};

bool hasBothRings(const SlotAssignment& slots, int a, int b) {
    int r1 = itemAt(slots, Slot::Ring1);
    int r2 = itemAt(slots, Slot::Ring2);
    return (r1 == a && r2 == b) || (r1 == b && r2 == a);
}

} // namespace

// ─── Budget Manager ────────────────────────────────────────────

TEST(SearchTest, BudgetManagerExpansionLimit) {
    BudgetManager budget(5);
    budget.start();

    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(budget.canContinue());
        budget.recordExpansion();
    }
    EXPECT_FALSE(budget.canContinue());
    EXPECT_EQ(budget.maxExpansions(), 5);
    EXPECT_EQ(budget.remainingExpansions(), 0);
    EXPECT_FALSE(budget.isTimeExhausted());
}

TEST(SearchTest, BudgetManagerTime) {
    BudgetManager budget(1000, 0.0);
    budget.start();
    EXPECT_GE(budget.elapsedSeconds(), 0.0);
    EXPECT_TRUE(budget.isTimeExhausted());
}

// ─── Candidate ordering ────────────────────────────────────────

TEST(SearchTest, CandidatesSortByScoreThenIds) {
    std::vector<Candidate> candidates(3);
    candidates[0].score = 1.0;
    candidates[0].slots = fullBuild();
    candidates[1].score = 5.0;
    candidates[2].score = 1.0;
    candidates[2].slots = fullBuild();
    itemAt(candidates[2].slots, Slot::Helmet) = 100;

    sortCandidates(candidates);
    EXPECT_DOUBLE_EQ(candidates[0].score, 5.0);
    EXPECT_EQ(itemAt(candidates[1].slots, Slot::Helmet), 100);
    EXPECT_EQ(itemAt(candidates[2].slots, Slot::Helmet), 101);
}

TEST(SearchTest, RejectStatsDominantReason) {
    RejectStats stats;
    EXPECT_FALSE(stats.dominantReason().has_value());

    stats.sp_invalid = 3;
    EXPECT_EQ(stats.dominantReason(), ReasonCode::SpInfeasible);

    stats.hard_constraints = 1;
    stats.hard_attack_speed = 1;
    EXPECT_EQ(stats.dominantReason(), ReasonCode::UnsatAttackTarget);

    stats.hard_constraints = 2;
    stats.hard_thresholds = 1;
    stats.threshold_failure_example = "minMr (1 < 4)";
    EXPECT_EQ(stats.dominantReason(), ReasonCode::UnsatThreshold);
    EXPECT_NE(stats.describe().find("Example failure: minMr (1 < 4)."), std::string::npos);
}

// ─── Beam Search ───────────────────────────────────────────────

TEST(SearchTest, BeamSearchCompletesEveryNode) {
    Harness h;
    SearchContext ctx = h.context();
    std::vector<ProgressEvent> events;
    ctx.on_progress = [&events](const ProgressEvent& e) { events.push_back(e); };

    BeamOptions options;
    options.beam_width = 10;
    BeamSearch search;
    BeamOutcome outcome = search.search(ctx, options);

    ASSERT_FALSE(outcome.beam.empty());
    EXPECT_LE(outcome.beam.size(), 20u);   // width floor of the fast mode
    EXPECT_FALSE(outcome.budget_hit);
    EXPECT_GT(outcome.processed_states, 0);
    for (const BeamNode& node : outcome.beam) {
        EXPECT_EQ(filledSlotCount(node.slots), 9);
    }

    ASSERT_EQ(events.size(), 9u);
    EXPECT_EQ(events.front().phase, SearchPhase::BeamSearch);
    EXPECT_EQ(events.back().expanded_slots, 9);
    EXPECT_LE(events.back().preview.size(), 2u);
    EXPECT_EQ(events.back().detail.rfind("branchCap=", 0), 0u);
}

TEST(SearchTest, BeamWidthHoldsAtEveryStage) {
    for (BeamMode mode : {BeamMode::Fast, BeamMode::FeasibilityBiased}) {
        Harness h;
        h.catalog = makePressureCatalog();
        SearchContext ctx = h.context();
        std::vector<int> sizes;
        ctx.on_progress = [&sizes](const ProgressEvent& e) {
            if (e.phase == SearchPhase::BeamSearch) sizes.push_back(e.beam_size);
        };

        BeamOptions options;
        options.mode = mode;
        options.beam_width = 5;
        const int width = mode == BeamMode::Fast ? 20 : 40;   // per-mode width floor

        BeamSearch search;
        BeamOutcome outcome = search.search(ctx, options);
        ASSERT_FALSE(outcome.beam.empty());
        ASSERT_EQ(sizes.size(), 9u);
        for (int size : sizes) EXPECT_LE(size, width);
        EXPECT_EQ(sizes.front(), width);
        EXPECT_LE(outcome.beam.size(), static_cast<size_t>(width));
    }
}

TEST(SearchTest, BeamSearchStopsWhenBudgetRunsOut) {
    Harness h;
    SearchContext ctx = h.context();
    BeamOptions options;
    options.max_states = 1;

    BeamSearch search;
    BeamOutcome outcome = search.search(ctx, options);
    EXPECT_TRUE(outcome.beam.empty());
    EXPECT_TRUE(outcome.budget_hit);
    EXPECT_EQ(outcome.detail, "Search state budget exhausted before completing slot chestplate.");
}

TEST(SearchTest, BeamSearchPrunesUnreachableAttackSpeed) {
    Harness h;
    Catalog catalog;
    for (const Item& item : h.catalog.items()) {
        Item copy = item;
        if (copy.id == 102) copy.stats.atk_tier = 1;
        catalog.addItem(copy);
    }
    h.catalog = catalog;
    h.constraints.filters.weapon_attack_speeds = {AttackSpeed::Fast};

    SlotAssignment base = emptyAssignment();
    itemAt(base, Slot::Weapon) = 801;
    SearchContext ctx = h.context(base);
    ASSERT_TRUE(ctx.speed_ctx.has_value());

    BeamSearch search;
    BeamOutcome outcome = search.search(ctx, BeamOptions{});
    ASSERT_FALSE(outcome.beam.empty());
    for (const BeamNode& node : outcome.beam) {
        EXPECT_EQ(itemAt(node.slots, Slot::Helmet), 102);
        EXPECT_EQ(itemAt(node.slots, Slot::Weapon), 801);
    }
}

TEST(SearchTest, FeasibilityBiasedBeamReportsFocus) {
    Harness h;
    SearchContext ctx = h.context();
    std::string last_detail;
    ctx.on_progress = [&last_detail](const ProgressEvent& e) { last_detail = e.detail; };

    BeamOptions options;
    options.mode = BeamMode::FeasibilityBiased;
    options.preview_weights = rescueWeights(h.constraints.weights);
    BeamSearch search;
    BeamOutcome outcome = search.search(ctx, options);

    ASSERT_FALSE(outcome.beam.empty());
    EXPECT_EQ(last_detail.rfind("feasibility-first | branchCap=", 0), 0u);
}

TEST(SearchTest, BeamSearchHonorsCancellation) {
    Harness h;
    SearchContext ctx = h.context();
    CancellationToken token;
    token.cancel();
    ctx.cancel = &token;

    BeamSearch search;
    EXPECT_THROW(search.search(ctx, BeamOptions{}), SearchCancelled);
}

// ─── Exact Search ──────────────────────────────────────────────

TEST(SearchTest, ExactSearchEnumeratesDistinctBuilds) {
    Harness h;
    h.constraints.budgets.top_n = 100;
    SearchContext ctx = h.context();

    ExactSearch search;
    ExactOutcome outcome = search.search(ctx);

    // 2 helmets, 2 chestplates, 6 unordered ring pairs, 2 weapons
    EXPECT_EQ(outcome.candidates.size(), 48u);
    EXPECT_EQ(outcome.stats.duplicate, 24);
    EXPECT_EQ(outcome.processed_states, 206);
    for (size_t i = 1; i < outcome.candidates.size(); i++) {
        EXPECT_GE(outcome.candidates[i - 1].score, outcome.candidates[i].score);
    }
}

TEST(SearchTest, ExactSearchSkipsIllegalSets) {
    Harness h;
    h.catalog.addSet("Tide", {501, 502}, {2});
    h.constraints.budgets.top_n = 100;
    SearchContext ctx = h.context();

    ExactSearch search;
    ExactOutcome outcome = search.search(ctx);
    // A repeated ring counts twice toward the set.
    EXPECT_EQ(outcome.candidates.size(), 24u);
    for (const Candidate& c : outcome.candidates) {
        EXPECT_FALSE(hasBothRings(c.slots, 501, 502));
    }
}

TEST(SearchTest, ExactSearchTalliesThresholdRejections) {
    Harness h;
    h.constraints.target.min_mr = 100;
    SearchContext ctx = h.context();

    ExactSearch search;
    ExactOutcome outcome = search.search(ctx);
    EXPECT_TRUE(outcome.candidates.empty());
    EXPECT_EQ(outcome.stats.hard_thresholds, 72);
    EXPECT_EQ(outcome.stats.dominantReason(), ReasonCode::UnsatThreshold);
}

// ─── Fallback Search ───────────────────────────────────────────

TEST(SearchTest, FallbackStopsAtTopN) {
    Harness h;
    h.constraints.budgets.top_n = 3;
    SearchContext ctx = h.context();

    FallbackSearch search;
    FallbackOutcome outcome = search.search(ctx);
    EXPECT_EQ(outcome.candidates.size(), 3u);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_GE(outcome.candidates[0].score, outcome.candidates[2].score);
}

TEST(SearchTest, FallbackPrunesSkillPointInfeasiblePaths) {
    Harness h;
    Catalog catalog;
    for (const Item& item : h.catalog.items()) {
        Item copy = item;
        if (copy.category == ItemCategory::Weapon) copy.stats.req = {120, 0, 0, 0, 0};
        catalog.addItem(copy);
    }
    h.catalog = catalog;
    SearchContext ctx = h.context();

    FallbackSearch search;
    FallbackOutcome outcome = search.search(ctx);
    EXPECT_TRUE(outcome.candidates.empty());
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_GT(outcome.processed_states, 0);
}

// ─── Finalizer ─────────────────────────────────────────────────

TEST(SearchTest, FinalizerDeduplicatesRingSwaps) {
    Harness h;
    SearchContext ctx = h.context();
    Finalizer finalizer(ctx);

    SlotAssignment build = fullBuild();
    SlotAssignment swapped = build;
    std::swap(itemAt(swapped, Slot::Ring1), itemAt(swapped, Slot::Ring2));

    EXPECT_TRUE(finalizer.accept(build));
    EXPECT_FALSE(finalizer.accept(swapped));
    EXPECT_EQ(finalizer.stats().duplicate, 1);

    std::vector<Candidate> out = finalizer.takeSorted();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_GT(out[0].score, 0.0);
}
