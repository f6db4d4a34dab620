#include "build/scorer.hpp"

namespace gearopt {

double computeSustain(const BuildSummary& summary) {
    const AggregatedStats& a = summary.aggregated;
    return a.hpr_total * 0.9 + a.mr * 14.0 + a.ms * 10.0 + a.ls * 9.0;
}

double computeThresholdPenalty(const BuildSummary& summary, const TargetThresholds& target) {
    const AggregatedStats& a = summary.aggregated;
    const DerivedMetrics& d = summary.derived;
    double penalty = 0.0;

    auto below = [&penalty](const std::optional<double>& min, double value, double weight) {
        if (min && value < *min) penalty += (*min - value) * weight;
    };
    below(target.min_legacy_base_dps, d.legacy_base_dps, 4.0);
    below(target.min_legacy_ehp, d.legacy_ehp, 0.8);
    below(target.min_dps_proxy, d.dps_proxy, 4.0);
    below(target.min_ehp_proxy, d.ehp_proxy, 1.1);
    below(target.min_mr, a.mr, 45.0);
    below(target.min_ms, a.ms, 35.0);
    below(target.min_speed, a.speed, 12.0);
    below(target.min_skill_point_total, d.skill_point_total, 15.0);
    if (target.max_req_total && d.req_total > *target.max_req_total) {
        penalty += (d.req_total - *target.max_req_total) * 8.0;
    }
    return penalty;
}

ScoredBuild DefaultScorer::score(const BuildSummary& summary,
                                 const Weights& w,
                                 const TargetThresholds& target) const {
    const DerivedMetrics& d = summary.derived;
    ScoredBuild out;
    ScoreBreakdown& b = out.breakdown;
    b.legacy_base_dps = d.legacy_base_dps * w.legacy_base_dps;
    b.legacy_ehp = d.legacy_ehp * w.legacy_ehp;
    b.dps_proxy = d.dps_proxy * w.dps_proxy;
    b.spell_proxy = d.spell_proxy * w.spell_proxy;
    b.melee_proxy = d.melee_proxy * w.melee_proxy;
    b.ehp_proxy = d.ehp_proxy * w.ehp_proxy;
    b.speed = summary.aggregated.speed * w.speed;
    b.sustain = computeSustain(summary) * w.sustain;
    b.skill_point_total = d.skill_point_total * w.skill_point_total;
    b.req_penalty = d.req_total * w.req_total_penalty;
    b.threshold_penalty = computeThresholdPenalty(summary, target);
    out.score = b.total();
    return out;
}

} // namespace gearopt
