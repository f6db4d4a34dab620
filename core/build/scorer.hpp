#pragma once

#include "build/build_summary.hpp"
#include "constraints/constraints.hpp"

namespace gearopt {

/// Weighted contribution of each dimension to a build's score.
struct ScoreBreakdown {
    double legacy_base_dps = 0.0;
    double legacy_ehp = 0.0;
    double dps_proxy = 0.0;
    double spell_proxy = 0.0;
    double melee_proxy = 0.0;
    double ehp_proxy = 0.0;
    double speed = 0.0;
    double sustain = 0.0;
    double skill_point_total = 0.0;
    double req_penalty = 0.0;
    double threshold_penalty = 0.0;

    double total() const {
        return legacy_base_dps + legacy_ehp + dps_proxy + spell_proxy + melee_proxy +
               ehp_proxy + speed + sustain + skill_point_total -
               req_penalty - threshold_penalty;
    }
};

struct ScoredBuild {
    double score = 0.0;
    ScoreBreakdown breakdown;
};

/// Abstract scorer: summary + weights + thresholds -> scalar score.
class Scorer {
public:
    virtual ~Scorer() = default;
    virtual ScoredBuild score(const BuildSummary& summary,
                              const Weights& weights,
                              const TargetThresholds& target) const = 0;
};

class DefaultScorer : public Scorer {
public:
    ScoredBuild score(const BuildSummary& summary,
                      const Weights& weights,
                      const TargetThresholds& target) const override;
};

/// 0.9 hpr + 14 mr + 10 ms + 9 ls.
double computeSustain(const BuildSummary& summary);

/// Weighted deficit of every unmet named threshold.
double computeThresholdPenalty(const BuildSummary& summary, const TargetThresholds& target);

} // namespace gearopt
