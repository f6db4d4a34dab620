#include "search/search_state.hpp"
#include <algorithm>

namespace gearopt {

void sortCandidates(std::vector<Candidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return slotIdsLess(a.slots, b.slots);
        });
}

const char* phaseName(SearchPhase phase) {
    switch (phase) {
        case SearchPhase::BeamSearch:  return "beam-search";
        case SearchPhase::ExactSearch: return "exact-search";
        case SearchPhase::Diagnostics: return "diagnostics";
    }
    return "unknown";
}

const char* reasonCodeName(ReasonCode code) {
    switch (code) {
        case ReasonCode::MustIncludeConflict: return "must_include_conflict";
        case ReasonCode::EmptyPool:           return "empty_pool";
        case ReasonCode::UnsatAttackTarget:   return "unsat_attack_target";
        case ReasonCode::UnsatThreshold:      return "unsat_threshold";
        case ReasonCode::SpInfeasible:        return "sp_infeasible";
        case ReasonCode::SearchPruned:        return "search_pruned";
        case ReasonCode::FallbackTimeout:     return "fallback_timeout";
    }
    return "unknown";
}

std::optional<ReasonCode> RejectStats::dominantReason() const {
    if (sp_invalid > 0 && hard_constraints == 0) return ReasonCode::SpInfeasible;
    if (hard_thresholds > 0) return ReasonCode::UnsatThreshold;
    if (hard_attack_speed > 0) return ReasonCode::UnsatAttackTarget;
    return std::nullopt;
}

std::string RejectStats::describe() const {
    std::string out = "Rejected SP-invalid=" + std::to_string(sp_invalid) +
                      ", majorID=" + std::to_string(major_ids) +
                      ", duplicates=" + std::to_string(duplicate) +
                      ", hard=" + std::to_string(hard_constraints) +
                      " (speed=" + std::to_string(hard_attack_speed) +
                      ", thresholds=" + std::to_string(hard_thresholds) +
                      ", item=" + std::to_string(hard_item) + ").";
    if (threshold_failure_example) {
        out += " Example failure: " + *threshold_failure_example + ".";
    }
    return out;
}

} // namespace gearopt
