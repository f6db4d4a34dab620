#include <gtest/gtest.h>
#include "build/scorer.hpp"
#include "build/build_evaluator.hpp"
#include "test_fixtures.hpp"

using namespace gearopt;
using namespace gearopt::fixtures;

namespace {

BuildSummary sampleSummary() {
    BuildSummary summary;
    summary.aggregated.hpr_total = 10;
    summary.aggregated.mr = 3;
    summary.aggregated.ms = 2;
    summary.aggregated.ls = 50;
    summary.aggregated.speed = 20;
    summary.derived.dps_proxy = 1000;
    summary.derived.ehp_proxy = 5000;
    summary.derived.skill_point_total = 40;
    summary.derived.req_total = 150;
    return summary;
}

} // namespace

TEST(ScorerTest, Sustain) {
    BuildSummary summary = sampleSummary();
    EXPECT_DOUBLE_EQ(computeSustain(summary), 10 * 0.9 + 3 * 14.0 + 2 * 10.0 + 50 * 9.0);
}

TEST(ScorerTest, ThresholdPenaltyOnlyCountsMisses) {
    BuildSummary summary = sampleSummary();
    TargetThresholds target;
    EXPECT_DOUBLE_EQ(computeThresholdPenalty(summary, target), 0.0);

    target.min_mr = 5;             // 2 short
    target.min_speed = 10;         // met
    target.max_req_total = 140;    // 10 over
    EXPECT_DOUBLE_EQ(computeThresholdPenalty(summary, target), 2 * 45.0 + 10 * 8.0);
}

TEST(ScorerTest, ScoreIsBreakdownTotal) {
    BuildSummary summary = sampleSummary();
    Weights weights;
    TargetThresholds target;
    target.min_dps_proxy = 1200;

    DefaultScorer scorer;
    ScoredBuild scored = scorer.score(summary, weights, target);
    EXPECT_DOUBLE_EQ(scored.score, scored.breakdown.total());
    EXPECT_DOUBLE_EQ(scored.breakdown.dps_proxy, 1000 * weights.dps_proxy);
    EXPECT_DOUBLE_EQ(scored.breakdown.req_penalty, 150 * weights.req_total_penalty);
    EXPECT_DOUBLE_EQ(scored.breakdown.threshold_penalty, 200 * 4.0);
}

TEST(ScorerTest, HigherDefenceScoresHigherUnderDefensiveWeights) {
    Catalog catalog = makeSmallCatalog();
    DefaultBuildEvaluator evaluator(catalog);
    DefaultScorer scorer;

    SlotAssignment tank = fullBuild();
    SlotAssignment glass = tank;
    itemAt(glass, Slot::Chestplate) = 202;

    Weights weights;
    weights.dps_proxy = 0.0;
    weights.legacy_base_dps = 0.0;
    EvaluationContext ctx;
    double tank_score = scorer.score(evaluator.evaluate(tank, ctx), weights, {}).score;
    double glass_score = scorer.score(evaluator.evaluate(glass, ctx), weights, {}).score;
    EXPECT_GT(tank_score, glass_score);
}
