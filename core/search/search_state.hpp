#pragma once

#include "build/build_summary.hpp"
#include "build/scorer.hpp"
#include "build/slot_assignment.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gearopt {

/// One candidate item for a slot with its rough (pre-evaluation) score.
struct PoolEntry {
    int id = 0;
    double rough = 0.0;
};

using CandidatePool = std::vector<PoolEntry>;

/// A partial assignment inside one beam stage. Every running total is the
/// exact sum over the items placed so far (custom totals also include the
/// fixed base items).
struct BeamNode {
    SlotAssignment slots{};
    int order_index = 0;
    double rough_score = 0.0;
    double optimistic_bound = 0.0;
    double feasibility_assigned = 0.0;    // +inf when the partial build is SP-infeasible
    std::vector<int> focus_support;
    int atk_tier_assigned = 0;
    std::vector<double> custom_totals;
};

/// A complete, validated, scored assignment.
struct Candidate {
    SlotAssignment slots{};
    double score = 0.0;
    ScoreBreakdown breakdown;
    BuildSummary summary;
};

/// Score desc, then item ids in slot order asc.
void sortCandidates(std::vector<Candidate>& candidates);

// ─── Diagnostics ───────────────────────────────────────────────

enum class SearchPhase : uint8_t { BeamSearch, ExactSearch, Diagnostics };

enum class ReasonCode : uint8_t {
    MustIncludeConflict,
    EmptyPool,
    UnsatAttackTarget,
    UnsatThreshold,
    SpInfeasible,
    SearchPruned,
    FallbackTimeout
};

const char* phaseName(SearchPhase phase);
const char* reasonCodeName(ReasonCode code);

struct ProgressEvent {
    SearchPhase phase = SearchPhase::Diagnostics;
    long long processed_states = 0;
    int beam_size = 0;
    int total_slots = 0;
    int expanded_slots = 0;
    std::string detail;
    std::optional<ReasonCode> reason_code;
    std::vector<Candidate> preview;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/// Why complete assignments were dropped during finalization.
struct RejectStats {
    int major_ids = 0;
    int sp_invalid = 0;
    int duplicate = 0;
    int hard_constraints = 0;
    int hard_attack_speed = 0;
    int hard_thresholds = 0;
    int hard_item = 0;
    std::optional<std::string> threshold_failure_example;

    /// Reason code implied by the tallies, if any.
    std::optional<ReasonCode> dominantReason() const;
    std::string describe() const;
};

} // namespace gearopt
