// Unit tests for the curve workspace: history, log-phase policies, payload

#include "growthfit/curve_workspace.hpp"
#include "growthfit/refinement.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace growthfit;

// Two wells, 6 points each over 120 minutes, OD rising 0.05 -> 0.5.
static SampleInput linear_sample(const std::string& name) {
    SampleInput s;
    s.name = name;
    s.color = "#1f77b4";
    for (int rep = 1; rep <= 2; ++rep) {
        ReplicateWell w;
        w.well_id = (rep == 1 ? "A1" : "A2");
        w.replicate_index = rep;
        for (int i = 0; i < 6; ++i) {
            double t = i * 24.0;
            w.points.push_back({t, 0.05 + 0.45 * t / 120.0 + 0.005 * (rep - 1)});
        }
        s.wells.push_back(w);
    }
    return s;
}

// One well with a logistic curve that has a clear exponential phase.
static SampleInput logistic_sample(const std::string& name) {
    SampleInput s;
    s.name = name;
    ReplicateWell w;
    w.well_id = "B1";
    for (int t = 0; t <= 300; t += 5) {
        w.points.push_back({double(t), 1.0 / (1.0 + 99.0 * std::exp(-0.05 * t))});
    }
    s.wells.push_back(w);
    return s;
}

static SmoothingParameters e2e_params() {
    SmoothingParameters p;
    p.span = 0.6;
    p.degree = 1;
    p.robust_iterations = 1;
    p.max_refinements = 1;
    return p;
}

static SmoothingParameters logistic_params() {
    SmoothingParameters p;
    p.span = 5.0;
    p.degree = 2;
    return p;
}

static WorkspaceConfig window8() {
    WorkspaceConfig cfg;
    cfg.detection.window_size = 8;
    return cfg;
}

static bool same_state(const SmoothingState& a, const SmoothingState& b) {
    if (a.label != b.label || a.points.size() != b.points.size()) return false;
    for (size_t i = 0; i < a.points.size(); ++i) {
        if (a.points[i].x != b.points[i].x || a.points[i].y != b.points[i].y) return false;
    }
    return a.diagnostics.residuals == b.diagnostics.residuals &&
           a.diagnostics.robustness_weights == b.diagnostics.robustness_weights &&
           a.diagnostics.window_size == b.diagnostics.window_size &&
           a.diagnostics.passes == b.diagnostics.passes;
}

static bool same_history(const std::vector<SmoothingState>& a,
                         const std::vector<SmoothingState>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!same_state(a[i], b[i])) return false;
    }
    return true;
}

void test_add_sample() {
    std::cout << "Testing add_sample... ";
    CurveWorkspace ws;
    SampleInput in = linear_sample("S1");
    in.wells[0].points.push_back({NAN, 1.0});
    const Sample& s = ws.add_sample(in);
    assert(s.raw_points.size() == 12);
    assert(s.wells[0].points.size() == 6);
    assert(s.history.size() == 1);
    assert(s.history.raw().label == "raw");
    for (size_t i = 1; i < s.raw_points.size(); ++i) {
        assert(s.raw_points[i - 1].x <= s.raw_points[i].x);
    }
    // Stable: well A1 before A2 at equal times.
    assert(s.raw_points[0].y == 0.05);
    assert(s.raw_points[1].y == 0.055);

    auto expect_invalid = [&](SampleInput bad) {
        bool threw = false;
        try {
            ws.add_sample(bad);
        } catch (const InvalidParameter&) {
            threw = true;
        }
        assert(threw);
    };
    expect_invalid(linear_sample("S1"));
    expect_invalid(linear_sample(""));
    SampleInput empty;
    empty.name = "E";
    expect_invalid(empty);
    assert(ws.size() == 1);
    std::cout << "PASSED\n";
}

void test_end_to_end_two_wells() {
    std::cout << "Testing end-to-end two-well sample... ";
    CurveWorkspace ws;
    ws.add_sample(linear_sample("S1"));

    ApplyReport report = ws.apply_smoothing({"S1"}, e2e_params());
    assert(report.applied == 1);
    assert(report.skipped == 0);
    assert(report.total_loops == 1);
    const Sample* s = ws.find("S1");
    assert(s && s->history.size() == 2);
    assert(s->history.latest().points.size() == 12);
    assert(s->history.latest().label == "LOESS span 0.6");

    BandOptions opts;
    opts.mode = BandMode::POINTWISE;
    auto band = ws.compute_band("S1", opts);
    assert(band.has_value());
    assert(band->compositions == 3);
    for (size_t i = 0; i < band->band.points.size(); ++i) {
        assert(band->band.points[i].low <= band->main_prediction[i]);
        assert(band->main_prediction[i] <= band->band.points[i].high);
    }
    std::cout << "PASSED\n";
}

void test_apply_and_step_back() {
    std::cout << "Testing apply / step back history... ";
    CurveWorkspace ws;
    ws.add_sample(linear_sample("S1"));
    ws.add_sample(linear_sample("S2"));

    ws.apply_smoothing({"S1", "S2"}, e2e_params());
    std::vector<Point> first = ws.find("S1")->history.latest().points;
    const std::vector<SmoothingState> s2_before = ws.find("S2")->history.entries();
    const SmoothingState s1_raw = ws.find("S1")->history.raw();

    SmoothingParameters wider = e2e_params();
    wider.span = 1.0;
    wider.max_refinements = 3;
    ApplyReport second = ws.apply_smoothing({"S1"}, wider);
    assert(second.applied == 1);
    assert(second.converged == 1);
    assert(ws.find("S1")->history.size() == 3);
    assert(ws.find("S1")->history.latest().label == "LOESS span 1 (passes: 2, converged)");
    assert(same_history(ws.find("S2")->history.entries(), s2_before));
    assert(same_state(ws.find("S1")->history.raw(), s1_raw));

    StepBackReport back = ws.step_back({"S1"});
    assert(back.reverted == 1);
    assert(same_history(ws.find("S2")->history.entries(), s2_before));
    assert(same_state(ws.find("S1")->history.raw(), s1_raw));
    const auto& restored = ws.find("S1")->history.latest().points;
    assert(restored.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(restored[i].x == first[i].x && restored[i].y == first[i].y);
    }

    back = ws.step_back({"S1", "S2"});
    assert(back.reverted == 2);
    assert(same_state(ws.find("S2")->history.raw(), s2_before.front()));
    assert(same_state(ws.find("S1")->history.raw(), s1_raw));
    back = ws.step_back({"S1", "S2", "missing"});
    assert(back.reverted == 0);
    assert(back.skipped == 2);
    assert(back.not_found == 1);
    assert(ws.find("S1")->history.size() == 1);
    assert(same_state(ws.find("S1")->history.latest(), s1_raw));
    std::cout << "PASSED\n";
}

void test_batch_order_and_progress() {
    std::cout << "Testing batch order and progress... ";
    CurveWorkspace ws;
    ws.add_sample(linear_sample("S1"));
    ws.add_sample(linear_sample("S2"));
    ws.add_sample(linear_sample("S3"));
    const std::vector<SmoothingState> s2_before = ws.find("S2")->history.entries();

    std::vector<std::string> seen;
    size_t last_total = 0;
    ApplyReport r = ws.apply_smoothing({"S3", "S1", "S3", "nope"}, e2e_params(),
                                       [&](size_t done, size_t total, const std::string& name) {
                                           assert(done == seen.size() + 1);
                                           last_total = total;
                                           seen.push_back(name);
                                       });
    assert(r.applied == 2);
    assert(r.not_found == 1);
    assert(last_total == 2);
    assert(seen.size() == 2 && seen[0] == "S1" && seen[1] == "S3");
    assert(same_history(ws.find("S2")->history.entries(), s2_before));
    std::cout << "PASSED\n";
}

void test_insufficient_and_invalid() {
    std::cout << "Testing skipped and rejected smoothing... ";
    CurveWorkspace ws;
    SampleInput tiny;
    tiny.name = "T";
    ReplicateWell w;
    w.well_id = "C1";
    w.points = {{0, 0.1}, {10, 0.2}};
    tiny.wells.push_back(w);
    ws.add_sample(tiny);
    ws.add_sample(linear_sample("S1"));

    SmoothingParameters quad = e2e_params();
    quad.degree = 2;
    ApplyReport r = ws.apply_smoothing({"T", "S1"}, quad);
    assert(r.applied == 1);
    assert(r.skipped == 1);
    assert(ws.find("T")->history.size() == 1);

    SmoothingParameters bad = e2e_params();
    bad.span = 0.0;
    bool threw = false;
    try {
        ws.apply_smoothing({"S1"}, bad);
    } catch (const InvalidParameter&) {
        threw = true;
    }
    assert(threw);
    assert(ws.find("S1")->history.size() == 2);
    std::cout << "PASSED\n";
}

void test_auto_detection_and_policies() {
    std::cout << "Testing automatic log phases and policies... ";
    CurveWorkspace ws(window8());
    ws.add_sample(logistic_sample("L"));

    ApplyReport r = ws.apply_smoothing({"L"}, logistic_params());
    assert(r.phases.detected == 1);
    const LogPhaseSelection* sel = ws.log_phase("L");
    assert(sel && !sel->manual);
    assert(sel->start < sel->end);
    assert(sel->end <= 110.0);
    assert(!sel->points.empty());
    for (const auto& p : sel->points) {
        assert(p.t_min >= sel->start && p.t_min <= sel->end);
    }

    // Manual selection survives smoothing under PRESERVE_MANUAL.
    ws.set_manual_log_phase("L", 200.0, 100.0);
    sel = ws.log_phase("L");
    assert(sel->manual && sel->start == 100.0 && sel->end == 200.0);
    assert(sel->points.size() == 21);
    r = ws.apply_smoothing({"L"}, logistic_params());
    assert(r.phases.preserved == 1);
    assert(ws.log_phase("L")->manual);

    // DISABLED leaves everything alone, including step back.
    ws.set_auto_phase_policy(AutoPhasePolicy::DISABLED);
    StepBackReport b = ws.step_back({"L"});
    assert(b.phases.detected == 0 && b.phases.cleared == 0);
    assert(ws.log_phase("L")->manual);

    // REPLACE_ALL overwrites the manual range.
    ws.set_auto_phase_policy(AutoPhasePolicy::REPLACE_ALL);
    r = ws.apply_smoothing({"L"}, logistic_params());
    assert(r.phases.detected == 1);
    assert(!ws.log_phase("L")->manual);

    // Explicit re-detection replaces a manual range too.
    ws.set_manual_log_phase("L", 0.0, 50.0);
    PhaseUpdateCounts c = ws.redetect_log_phases({"L"});
    assert(c.detected == 1);
    assert(!ws.log_phase("L")->manual);

    assert(ws.clear_log_phase("L"));
    assert(!ws.clear_log_phase("L"));
    assert(ws.log_phase("L") == nullptr);
    std::cout << "PASSED\n";
}

void test_detection_clears_stale_selection() {
    std::cout << "Testing stale automatic selection is cleared... ";
    CurveWorkspace ws(window8());
    ws.add_sample(logistic_sample("L"));
    ws.apply_smoothing({"L"}, logistic_params());
    assert(ws.log_phase("L"));

    // A stricter detector finds nothing on the next apply.
    LogPhaseDetectionOptions strict = ws.config().detection;
    strict.window_size = 1000;
    ws.set_detection_options(strict);
    ApplyReport r = ws.apply_smoothing({"L"}, logistic_params());
    assert(r.phases.cleared == 1);
    assert(ws.log_phase("L") == nullptr);
    std::cout << "PASSED\n";
}

void test_manual_selection_errors() {
    std::cout << "Testing manual selection errors... ";
    CurveWorkspace ws;
    ws.add_sample(linear_sample("S1"));
    auto expect_invalid = [&](const std::string& sample, double a, double b) {
        bool threw = false;
        try {
            ws.set_manual_log_phase(sample, a, b);
        } catch (const InvalidParameter&) {
            threw = true;
        }
        assert(threw);
    };
    expect_invalid("S1", 10.0, 10.0);
    expect_invalid("S1", NAN, 10.0);
    expect_invalid("nope", 0.0, 10.0);
    assert(ws.log_phase("S1") == nullptr);
    std::cout << "PASSED\n";
}

void test_payload_and_helpers() {
    std::cout << "Testing payload and helpers... ";
    CurveWorkspace ws(window8());
    ws.add_sample(linear_sample("S1"));
    ws.add_sample(logistic_sample("L"));
    ws.apply_smoothing({"S1", "L"}, logistic_params());

    SmoothedCurvesPayload p = ws.build_payload();
    assert(p.span == 5.0 && p.degree == 2);
    assert(p.samples.size() == 2);
    assert(p.samples[0].sample == "S1" && p.samples[1].sample == "L");
    assert(p.samples[0].color == "#1f77b4");
    assert(p.samples[0].wells.size() == 2 && p.samples[0].wells[1].replicate == 2);
    assert(p.samples[0].history.size() == 2);
    assert(p.samples[0].history[0].label == "raw");
    assert(p.log_phases.size() == 1 && p.log_phases[0].sample == "L");
    assert(p.bands.empty());

    assert(smoothing_label(0.6, 1, false) == "LOESS span 0.6");
    assert(smoothing_label(0.6, 3, false) == "LOESS span 0.6 (passes: 3)");
    assert(smoothing_label(60, 2, true) == "LOESS span 60 (passes: 2, converged)");

    auto in = points_in_range({{0, 1}, {5, 2}, {10, 3}, {NAN, 4}}, 10.0, 5.0);
    assert(in.size() == 2 && in[0].t_min == 5.0 && in[1].od600 == 3.0);

    AutoPhasePolicy policy = AutoPhasePolicy::DISABLED;
    assert(parse_auto_phase_policy("replace-all", policy) && policy == AutoPhasePolicy::REPLACE_ALL);
    assert(!parse_auto_phase_policy("always", policy));
    assert(std::string(auto_phase_policy_to_string(AutoPhasePolicy::PRESERVE_MANUAL)) == "preserve-manual");
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Curve Workspace Tests ===\n\n";

    test_add_sample();
    test_end_to_end_two_wells();
    test_apply_and_step_back();
    test_batch_order_and_progress();
    test_insufficient_and_invalid();
    test_auto_detection_and_policies();
    test_detection_clears_stale_selection();
    test_manual_selection_errors();
    test_payload_and_helpers();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
