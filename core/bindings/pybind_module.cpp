// PyBind11 bindings for the gearopt C++ core.
// Exposes the catalog, constraints, evaluator and search controller to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DGEAROPT_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "catalog/catalog.hpp"
#include "build/build_evaluator.hpp"
#include "build/scorer.hpp"
#include "build/workbench.hpp"
#include "constraints/constraints.hpp"
#include "search/cancellation.hpp"
#include "search/search_controller.hpp"
#include "util/log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(gearopt_bindings, m) {
    m.doc() = "gearopt C++ Core Bindings";

    // ── Enums ──
    py::enum_<gearopt::Slot>(m, "Slot")
        .value("HELMET", gearopt::Slot::Helmet)
        .value("CHESTPLATE", gearopt::Slot::Chestplate)
        .value("LEGGINGS", gearopt::Slot::Leggings)
        .value("BOOTS", gearopt::Slot::Boots)
        .value("RING1", gearopt::Slot::Ring1)
        .value("RING2", gearopt::Slot::Ring2)
        .value("BRACELET", gearopt::Slot::Bracelet)
        .value("NECKLACE", gearopt::Slot::Necklace)
        .value("WEAPON", gearopt::Slot::Weapon);

    py::enum_<gearopt::ItemCategory>(m, "ItemCategory")
        .value("HELMET", gearopt::ItemCategory::Helmet)
        .value("CHESTPLATE", gearopt::ItemCategory::Chestplate)
        .value("LEGGINGS", gearopt::ItemCategory::Leggings)
        .value("BOOTS", gearopt::ItemCategory::Boots)
        .value("RING", gearopt::ItemCategory::Ring)
        .value("BRACELET", gearopt::ItemCategory::Bracelet)
        .value("NECKLACE", gearopt::ItemCategory::Necklace)
        .value("WEAPON", gearopt::ItemCategory::Weapon);

    py::enum_<gearopt::CharacterClass>(m, "CharacterClass")
        .value("WARRIOR", gearopt::CharacterClass::Warrior)
        .value("ASSASSIN", gearopt::CharacterClass::Assassin)
        .value("MAGE", gearopt::CharacterClass::Mage)
        .value("ARCHER", gearopt::CharacterClass::Archer)
        .value("SHAMAN", gearopt::CharacterClass::Shaman);

    py::enum_<gearopt::AttackSpeed>(m, "AttackSpeed")
        .value("SUPER_SLOW", gearopt::AttackSpeed::SuperSlow)
        .value("VERY_SLOW", gearopt::AttackSpeed::VerySlow)
        .value("SLOW", gearopt::AttackSpeed::Slow)
        .value("NORMAL", gearopt::AttackSpeed::Normal)
        .value("FAST", gearopt::AttackSpeed::Fast)
        .value("VERY_FAST", gearopt::AttackSpeed::VeryFast)
        .value("SUPER_FAST", gearopt::AttackSpeed::SuperFast);

    py::enum_<gearopt::TomeMode>(m, "TomeMode")
        .value("NO_TOMES", gearopt::TomeMode::NoTomes)
        .value("GUILD_RAINBOW", gearopt::TomeMode::GuildRainbow)
        .value("FLEXIBLE_2", gearopt::TomeMode::Flexible2);

    py::enum_<gearopt::AttackConstraintMode>(m, "AttackConstraintMode")
        .value("OR", gearopt::AttackConstraintMode::Or)
        .value("AND", gearopt::AttackConstraintMode::And);

    py::enum_<gearopt::SolverStrategy>(m, "SolverStrategy")
        .value("AUTO", gearopt::SolverStrategy::Auto)
        .value("FAST", gearopt::SolverStrategy::Fast)
        .value("CONSTRAINT_FIRST", gearopt::SolverStrategy::ConstraintFirst)
        .value("EXHAUSTIVE", gearopt::SolverStrategy::Exhaustive);

    py::enum_<gearopt::ReasonCode>(m, "ReasonCode")
        .value("MUST_INCLUDE_CONFLICT", gearopt::ReasonCode::MustIncludeConflict)
        .value("EMPTY_POOL", gearopt::ReasonCode::EmptyPool)
        .value("UNSAT_ATTACK_TARGET", gearopt::ReasonCode::UnsatAttackTarget)
        .value("UNSAT_THRESHOLD", gearopt::ReasonCode::UnsatThreshold)
        .value("SP_INFEASIBLE", gearopt::ReasonCode::SpInfeasible)
        .value("SEARCH_PRUNED", gearopt::ReasonCode::SearchPruned)
        .value("FALLBACK_TIMEOUT", gearopt::ReasonCode::FallbackTimeout);

    py::enum_<gearopt::SearchPhase>(m, "SearchPhase")
        .value("BEAM_SEARCH", gearopt::SearchPhase::BeamSearch)
        .value("EXACT_SEARCH", gearopt::SearchPhase::ExactSearch)
        .value("DIAGNOSTICS", gearopt::SearchPhase::Diagnostics);

    // ── ItemStats ──
    py::class_<gearopt::ItemStats>(m, "ItemStats")
        .def(py::init<>())
        .def_readwrite("hp", &gearopt::ItemStats::hp)
        .def_readwrite("hp_bonus", &gearopt::ItemStats::hp_bonus)
        .def_readwrite("hpr_raw", &gearopt::ItemStats::hpr_raw)
        .def_readwrite("hpr_pct", &gearopt::ItemStats::hpr_pct)
        .def_readwrite("mr", &gearopt::ItemStats::mr)
        .def_readwrite("ms", &gearopt::ItemStats::ms)
        .def_readwrite("ls", &gearopt::ItemStats::ls)
        .def_readwrite("sd_pct", &gearopt::ItemStats::sd_pct)
        .def_readwrite("sd_raw", &gearopt::ItemStats::sd_raw)
        .def_readwrite("md_pct", &gearopt::ItemStats::md_pct)
        .def_readwrite("md_raw", &gearopt::ItemStats::md_raw)
        .def_readwrite("poison", &gearopt::ItemStats::poison)
        .def_readwrite("spd", &gearopt::ItemStats::spd)
        .def_readwrite("atk_tier", &gearopt::ItemStats::atk_tier)
        .def_readwrite("base_dps", &gearopt::ItemStats::base_dps)
        .def_readwrite("req", &gearopt::ItemStats::req)
        .def_readwrite("sp", &gearopt::ItemStats::sp)
        .def_readwrite("def_", &gearopt::ItemStats::def)
        .def_readwrite("elem_dam_pct", &gearopt::ItemStats::elem_dam_pct)
        .def_readwrite("dam_pct", &gearopt::ItemStats::dam_pct)
        .def_readwrite("r_dam_pct", &gearopt::ItemStats::r_dam_pct)
        .def_readwrite("n_dam_pct", &gearopt::ItemStats::n_dam_pct);

    // ── Item ──
    py::class_<gearopt::Item>(m, "Item")
        .def(py::init<>())
        .def_readwrite("id", &gearopt::Item::id)
        .def_readwrite("name", &gearopt::Item::name)
        .def_readwrite("category", &gearopt::Item::category)
        .def_readwrite("type", &gearopt::Item::type)
        .def_readwrite("tier", &gearopt::Item::tier)
        .def_readwrite("level", &gearopt::Item::level)
        .def_readwrite("class_req", &gearopt::Item::class_req)
        .def_readwrite("major_ids", &gearopt::Item::major_ids)
        .def_readwrite("powder_slots", &gearopt::Item::powder_slots)
        .def_readwrite("atk_spd", &gearopt::Item::atk_spd)
        .def_readwrite("restricted", &gearopt::Item::restricted)
        .def_readwrite("deprecated", &gearopt::Item::deprecated)
        .def_readwrite("stats", &gearopt::Item::stats)
        .def_readwrite("extra_numeric", &gearopt::Item::extra_numeric)
        .def("numeric_value", &gearopt::Item::numericValue);

    // ── Catalog ──
    py::class_<gearopt::Catalog>(m, "Catalog")
        .def(py::init<>())
        .def("add_item", &gearopt::Catalog::addItem)
        .def("add_set", &gearopt::Catalog::addSet,
             py::arg("name"), py::arg("member_ids"), py::arg("illegal_counts"))
        .def("find", &gearopt::Catalog::find, py::return_value_policy::reference_internal)
        .def("size", &gearopt::Catalog::size);

    // ── Workbench ──
    py::class_<gearopt::Workbench>(m, "Workbench")
        .def(py::init<>())
        .def_readwrite("slots", &gearopt::Workbench::slots)
        .def_readwrite("bins", &gearopt::Workbench::bins);

    // ── Constraints ──
    py::class_<gearopt::Weights>(m, "Weights")
        .def(py::init<>())
        .def_readwrite("legacy_base_dps", &gearopt::Weights::legacy_base_dps)
        .def_readwrite("legacy_ehp", &gearopt::Weights::legacy_ehp)
        .def_readwrite("dps_proxy", &gearopt::Weights::dps_proxy)
        .def_readwrite("spell_proxy", &gearopt::Weights::spell_proxy)
        .def_readwrite("melee_proxy", &gearopt::Weights::melee_proxy)
        .def_readwrite("ehp_proxy", &gearopt::Weights::ehp_proxy)
        .def_readwrite("speed", &gearopt::Weights::speed)
        .def_readwrite("sustain", &gearopt::Weights::sustain)
        .def_readwrite("skill_point_total", &gearopt::Weights::skill_point_total)
        .def_readwrite("req_total_penalty", &gearopt::Weights::req_total_penalty);

    py::class_<gearopt::NumericRange>(m, "NumericRange")
        .def(py::init<>())
        .def_readwrite("key", &gearopt::NumericRange::key)
        .def_readwrite("min", &gearopt::NumericRange::min)
        .def_readwrite("max", &gearopt::NumericRange::max);

    py::class_<gearopt::TargetThresholds>(m, "TargetThresholds")
        .def(py::init<>())
        .def_readwrite("min_legacy_base_dps", &gearopt::TargetThresholds::min_legacy_base_dps)
        .def_readwrite("min_legacy_ehp", &gearopt::TargetThresholds::min_legacy_ehp)
        .def_readwrite("min_dps_proxy", &gearopt::TargetThresholds::min_dps_proxy)
        .def_readwrite("min_ehp_proxy", &gearopt::TargetThresholds::min_ehp_proxy)
        .def_readwrite("min_mr", &gearopt::TargetThresholds::min_mr)
        .def_readwrite("min_ms", &gearopt::TargetThresholds::min_ms)
        .def_readwrite("min_speed", &gearopt::TargetThresholds::min_speed)
        .def_readwrite("min_skill_point_total", &gearopt::TargetThresholds::min_skill_point_total)
        .def_readwrite("max_req_total", &gearopt::TargetThresholds::max_req_total)
        .def_readwrite("custom_ranges", &gearopt::TargetThresholds::custom_ranges);

    py::class_<gearopt::ItemFilters>(m, "ItemFilters")
        .def(py::init<>())
        .def_readwrite("character_class", &gearopt::ItemFilters::character_class)
        .def_readwrite("level", &gearopt::ItemFilters::level)
        .def_readwrite("must_include_ids", &gearopt::ItemFilters::must_include_ids)
        .def_readwrite("excluded_ids", &gearopt::ItemFilters::excluded_ids)
        .def_readwrite("allowed_tiers", &gearopt::ItemFilters::allowed_tiers)
        .def_readwrite("required_major_ids", &gearopt::ItemFilters::required_major_ids)
        .def_readwrite("excluded_major_ids", &gearopt::ItemFilters::excluded_major_ids)
        .def_readwrite("weapon_attack_speeds", &gearopt::ItemFilters::weapon_attack_speeds)
        .def_readwrite("attack_mode", &gearopt::ItemFilters::attack_mode)
        .def_readwrite("min_powder_slots", &gearopt::ItemFilters::min_powder_slots)
        .def_readwrite("only_pinned_items", &gearopt::ItemFilters::only_pinned_items)
        .def_readwrite("allow_restricted", &gearopt::ItemFilters::allow_restricted)
        .def_readwrite("tome_mode", &gearopt::ItemFilters::tome_mode);

    py::class_<gearopt::SearchBudgets>(m, "SearchBudgets")
        .def(py::init<>())
        .def_readwrite("top_n", &gearopt::SearchBudgets::top_n)
        .def_readwrite("top_k_per_slot", &gearopt::SearchBudgets::top_k_per_slot)
        .def_readwrite("beam_width", &gearopt::SearchBudgets::beam_width)
        .def_readwrite("max_states", &gearopt::SearchBudgets::max_states)
        .def_readwrite("use_exhaustive_small_pool", &gearopt::SearchBudgets::use_exhaustive_small_pool)
        .def_readwrite("exhaustive_state_limit", &gearopt::SearchBudgets::exhaustive_state_limit)
        .def_readwrite("fallback_time_cap_ms", &gearopt::SearchBudgets::fallback_time_cap_ms);

    py::class_<gearopt::RescuePolicy>(m, "RescuePolicy")
        .def(py::init<>())
        .def_readwrite("enabled", &gearopt::RescuePolicy::enabled)
        .def_readwrite("strategies", &gearopt::RescuePolicy::strategies);

    py::class_<gearopt::Constraints>(m, "Constraints")
        .def(py::init<>())
        .def_readwrite("weights", &gearopt::Constraints::weights)
        .def_readwrite("target", &gearopt::Constraints::target)
        .def_readwrite("filters", &gearopt::Constraints::filters)
        .def_readwrite("budgets", &gearopt::Constraints::budgets)
        .def_readwrite("rescue", &gearopt::Constraints::rescue)
        .def_readwrite("locked_slots", &gearopt::Constraints::locked_slots)
        .def_readwrite("constraint_only_mode", &gearopt::Constraints::constraint_only_mode);

    // ── Results ──
    py::class_<gearopt::ScoreBreakdown>(m, "ScoreBreakdown")
        .def(py::init<>())
        .def_readwrite("dps_proxy", &gearopt::ScoreBreakdown::dps_proxy)
        .def_readwrite("ehp_proxy", &gearopt::ScoreBreakdown::ehp_proxy)
        .def_readwrite("speed", &gearopt::ScoreBreakdown::speed)
        .def_readwrite("sustain", &gearopt::ScoreBreakdown::sustain)
        .def_readwrite("skill_point_total", &gearopt::ScoreBreakdown::skill_point_total)
        .def_readwrite("req_penalty", &gearopt::ScoreBreakdown::req_penalty)
        .def_readwrite("threshold_penalty", &gearopt::ScoreBreakdown::threshold_penalty);

    py::class_<gearopt::DerivedMetrics>(m, "DerivedMetrics")
        .def(py::init<>())
        .def_readwrite("dps_proxy", &gearopt::DerivedMetrics::dps_proxy)
        .def_readwrite("ehp_proxy", &gearopt::DerivedMetrics::ehp_proxy)
        .def_readwrite("req_total", &gearopt::DerivedMetrics::req_total)
        .def_readwrite("skill_point_total", &gearopt::DerivedMetrics::skill_point_total)
        .def_readwrite("skillpoint_feasible", &gearopt::DerivedMetrics::skillpoint_feasible);

    py::class_<gearopt::BuildSummary>(m, "BuildSummary")
        .def(py::init<>())
        .def_readwrite("derived", &gearopt::BuildSummary::derived)
        .def_readwrite("warnings", &gearopt::BuildSummary::warnings);

    py::class_<gearopt::Candidate>(m, "Candidate")
        .def(py::init<>())
        .def_readwrite("slots", &gearopt::Candidate::slots)
        .def_readwrite("score", &gearopt::Candidate::score)
        .def_readwrite("breakdown", &gearopt::Candidate::breakdown)
        .def_readwrite("summary", &gearopt::Candidate::summary);

    py::class_<gearopt::ProgressEvent>(m, "ProgressEvent")
        .def(py::init<>())
        .def_readwrite("phase", &gearopt::ProgressEvent::phase)
        .def_readwrite("processed_states", &gearopt::ProgressEvent::processed_states)
        .def_readwrite("beam_size", &gearopt::ProgressEvent::beam_size)
        .def_readwrite("total_slots", &gearopt::ProgressEvent::total_slots)
        .def_readwrite("expanded_slots", &gearopt::ProgressEvent::expanded_slots)
        .def_readwrite("detail", &gearopt::ProgressEvent::detail)
        .def_readwrite("reason_code", &gearopt::ProgressEvent::reason_code)
        .def_readwrite("preview", &gearopt::ProgressEvent::preview);

    py::class_<gearopt::OptimizeResult>(m, "OptimizeResult")
        .def(py::init<>())
        .def_readwrite("candidates", &gearopt::OptimizeResult::candidates)
        .def_readwrite("reason_code", &gearopt::OptimizeResult::reason_code)
        .def_readwrite("detail", &gearopt::OptimizeResult::detail)
        .def_readwrite("processed_states", &gearopt::OptimizeResult::processed_states)
        .def_readwrite("attempt_label", &gearopt::OptimizeResult::attempt_label);

    // ── Cancellation ──
    py::register_exception<gearopt::SearchCancelled>(m, "SearchCancelled");

    py::class_<gearopt::CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel", &gearopt::CancellationToken::cancel)
        .def("reset", &gearopt::CancellationToken::reset)
        .def("is_cancelled", &gearopt::CancellationToken::isCancelled);

    // ── Search ──
    m.def("optimize", [](const gearopt::Catalog& catalog,
                         const gearopt::Workbench& workbench,
                         const gearopt::Constraints& constraints,
                         const gearopt::ProgressCallback& on_progress,
                         const gearopt::CancellationToken* cancel) {
        gearopt::DefaultBuildEvaluator evaluator(catalog);
        gearopt::DefaultScorer scorer;
        gearopt::SearchRequest request(catalog, evaluator, scorer);
        request.workbench = workbench;
        request.constraints = constraints;
        request.on_progress = on_progress;
        request.cancel = cancel;
        gearopt::SearchController controller;
        py::gil_scoped_release release;
        return controller.run(request);
    }, py::arg("catalog"), py::arg("workbench"), py::arg("constraints"),
       py::arg("on_progress") = gearopt::ProgressCallback{}, py::arg("cancel") = nullptr);

    m.def("evaluate", [](const gearopt::Catalog& catalog,
                         const gearopt::SlotAssignment& slots,
                         const gearopt::Constraints& constraints) {
        gearopt::DefaultBuildEvaluator evaluator(catalog);
        return evaluator.evaluate(slots, constraints.evaluationContext());
    }, py::arg("catalog"), py::arg("slots"), py::arg("constraints"));

    m.def("set_log_level", [](const std::string& level) {
        gearopt::configureLogging(spdlog::level::from_str(level));
    }, py::arg("level"));
}
