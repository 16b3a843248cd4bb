#include "growthfit/curve_workspace.hpp"
#include "growthfit/refinement.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace growthfit {

const char* auto_phase_policy_to_string(AutoPhasePolicy policy) {
    switch (policy) {
        case AutoPhasePolicy::DISABLED: return "off";
        case AutoPhasePolicy::REPLACE_ALL: return "replace-all";
        default: return "preserve-manual";
    }
}

bool parse_auto_phase_policy(const std::string& text, AutoPhasePolicy& policy) {
    if (text == "off") {
        policy = AutoPhasePolicy::DISABLED;
    } else if (text == "preserve-manual") {
        policy = AutoPhasePolicy::PRESERVE_MANUAL;
    } else if (text == "replace-all") {
        policy = AutoPhasePolicy::REPLACE_ALL;
    } else {
        return false;
    }
    return true;
}

SmoothingHistory::SmoothingHistory(SmoothingState raw) {
    entries_.push_back(std::move(raw));
}

void SmoothingHistory::append(SmoothingState state) {
    entries_.push_back(std::move(state));
}

bool SmoothingHistory::pop() {
    if (entries_.size() <= 1) return false;
    entries_.pop_back();
    return true;
}

std::string smoothing_label(double span, int loops, bool converged) {
    std::ostringstream oss;
    oss << "LOESS span " << span;
    if (loops > 1) {
        oss << " (passes: " << loops;
        if (converged) oss << ", converged";
        oss << ")";
    }
    return oss.str();
}

std::vector<LogPhasePoint> points_in_range(const std::vector<Point>& curve,
                                           double start, double end) {
    const double lo = std::min(start, end);
    const double hi = std::max(start, end);
    std::vector<LogPhasePoint> out;
    for (const auto& p : curve) {
        if (!is_finite(p)) continue;
        if (p.x >= lo && p.x <= hi) out.push_back(LogPhasePoint{p.x, p.y});
    }
    return out;
}

CurveWorkspace::CurveWorkspace(WorkspaceConfig config)
    : config_(std::move(config)) {
    config_.detection = clamp_detection_options(config_.detection);
}

void CurveWorkspace::set_detection_options(const LogPhaseDetectionOptions& options) {
    config_.detection = clamp_detection_options(options);
}

const Sample& CurveWorkspace::add_sample(SampleInput input) {
    if (input.name.empty()) {
        throw InvalidParameter("Sample name must not be empty");
    }
    if (index_.count(input.name)) {
        throw InvalidParameter("Duplicate sample: " + input.name);
    }
    if (input.wells.empty()) {
        throw InvalidParameter("Sample " + input.name + " has no replicate wells");
    }

    std::vector<Point> all;
    for (auto& well : input.wells) {
        well.points.erase(std::remove_if(well.points.begin(), well.points.end(),
                                         [](const Point& p) { return !is_finite(p); }),
                          well.points.end());
        all.insert(all.end(), well.points.begin(), well.points.end());
    }
    std::vector<Point> raw = finite_sorted(all);

    SmoothingState raw_state;
    raw_state.label = "raw";
    raw_state.points = raw;

    index_[input.name] = samples_.size();
    samples_.push_back(Sample{std::move(input.name), std::move(input.color),
                              std::move(input.wells), std::move(raw),
                              SmoothingHistory(std::move(raw_state))});
    return samples_.back();
}

const Sample* CurveWorkspace::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &samples_[it->second];
}

std::vector<std::string> CurveWorkspace::sample_names() const {
    std::vector<std::string> names;
    names.reserve(samples_.size());
    for (const auto& s : samples_) names.push_back(s.name);
    return names;
}

std::vector<size_t> CurveWorkspace::resolve(const std::vector<std::string>& sample_ids,
                                            size_t& not_found) const {
    std::unordered_set<std::string> wanted;
    not_found = 0;
    for (const auto& id : sample_ids) {
        if (!wanted.insert(id).second) continue;
        if (!index_.count(id)) not_found++;
    }
    // Load order, not request order.
    std::vector<size_t> targets;
    for (size_t i = 0; i < samples_.size(); ++i) {
        if (wanted.count(samples_[i].name)) targets.push_back(i);
    }
    return targets;
}

ApplyReport CurveWorkspace::apply_smoothing(const std::vector<std::string>& sample_ids,
                                            const SmoothingParameters& params,
                                            const SampleProgressCallback& progress) {
    validate(params);
    const auto now = std::chrono::system_clock::now();

    ApplyReport report;
    std::vector<size_t> targets = resolve(sample_ids, report.not_found);
    std::vector<size_t> changed;

    for (size_t t = 0; t < targets.size(); ++t) {
        Sample& sample = samples_[targets[t]];
        try {
            RefinementResult fit = refine(sample.history.raw().points, params);
            SmoothingState state;
            state.label = smoothing_label(params.span, fit.loops, fit.converged);
            state.points = std::move(fit.result.points);
            state.diagnostics = std::move(fit.result.diagnostics);
            sample.history.append(std::move(state));

            report.applied++;
            report.total_loops += static_cast<size_t>(fit.loops);
            if (fit.converged) report.converged++;
            changed.push_back(targets[t]);
        } catch (const InsufficientData&) {
            report.skipped++;
        }
        if (progress) progress(t + 1, targets.size(), sample.name);
    }

    config_.smoothing = params;
    report.phases = update_phases(changed, config_.auto_phase, now);
    return report;
}

StepBackReport CurveWorkspace::step_back(const std::vector<std::string>& sample_ids,
                                         const SampleProgressCallback& progress) {
    const auto now = std::chrono::system_clock::now();

    StepBackReport report;
    std::vector<size_t> targets = resolve(sample_ids, report.not_found);
    std::vector<size_t> changed;

    for (size_t t = 0; t < targets.size(); ++t) {
        Sample& sample = samples_[targets[t]];
        if (sample.history.pop()) {
            report.reverted++;
            changed.push_back(targets[t]);
        } else {
            report.skipped++;
        }
        if (progress) progress(t + 1, targets.size(), sample.name);
    }

    report.phases = update_phases(changed, config_.auto_phase, now);
    return report;
}

PhaseUpdateCounts CurveWorkspace::update_phases(const std::vector<size_t>& targets,
                                                AutoPhasePolicy policy,
                                                std::chrono::system_clock::time_point now) {
    PhaseUpdateCounts counts;
    if (policy == AutoPhasePolicy::DISABLED) return counts;

    for (size_t idx : targets) {
        const Sample& sample = samples_[idx];
        auto it = phases_.find(sample.name);
        if (policy == AutoPhasePolicy::PRESERVE_MANUAL && it != phases_.end() && it->second.manual) {
            counts.preserved++;
            continue;
        }

        const std::vector<Point>& latest = sample.history.latest().points;
        LogPhaseDetection det = detect_log_phase(latest, config_.detection);
        if (!det.detected()) {
            if (it != phases_.end()) {
                phases_.erase(it);
                counts.cleared++;
            }
            continue;
        }

        LogPhaseSelection sel;
        sel.sample = sample.name;
        sel.start = *det.start_time;
        sel.end = *det.end_time;
        sel.created_at = now;
        sel.manual = false;
        sel.points = points_in_range(latest, sel.start, sel.end);
        phases_[sample.name] = std::move(sel);
        counts.detected++;
    }
    return counts;
}

const LogPhaseSelection& CurveWorkspace::set_manual_log_phase(const std::string& sample,
                                                              double start, double end) {
    const Sample* s = find(sample);
    if (!s) {
        throw InvalidParameter("Unknown sample: " + sample);
    }
    if (!std::isfinite(start) || !std::isfinite(end) || start == end) {
        throw InvalidParameter("Log phase range for " + sample + " must be finite and non-empty");
    }

    LogPhaseSelection sel;
    sel.sample = sample;
    sel.start = std::min(start, end);
    sel.end = std::max(start, end);
    sel.created_at = std::chrono::system_clock::now();
    sel.manual = true;
    sel.points = points_in_range(s->history.latest().points, sel.start, sel.end);

    auto& slot = phases_[sample];
    slot = std::move(sel);
    return slot;
}

bool CurveWorkspace::clear_log_phase(const std::string& sample) {
    return phases_.erase(sample) > 0;
}

PhaseUpdateCounts CurveWorkspace::redetect_log_phases(const std::vector<std::string>& sample_ids) {
    size_t not_found = 0;
    std::vector<size_t> targets = resolve(sample_ids, not_found);
    return update_phases(targets, AutoPhasePolicy::REPLACE_ALL, std::chrono::system_clock::now());
}

const LogPhaseSelection* CurveWorkspace::log_phase(const std::string& sample) const {
    auto it = phases_.find(sample);
    return it == phases_.end() ? nullptr : &it->second;
}

std::vector<LogPhaseSelection> CurveWorkspace::log_phases() const {
    std::vector<LogPhaseSelection> out;
    for (const auto& s : samples_) {
        auto it = phases_.find(s.name);
        if (it != phases_.end()) out.push_back(it->second);
    }
    return out;
}

std::optional<BandResult> CurveWorkspace::compute_band(const std::string& sample,
                                                       const BandOptions& options) const {
    const Sample* s = find(sample);
    if (!s) {
        throw InvalidParameter("Unknown sample: " + sample);
    }
    return estimate_band(s->name, s->raw_points, s->wells, config_.smoothing, options);
}

SmoothedCurvesPayload CurveWorkspace::build_payload() const {
    SmoothedCurvesPayload payload;
    payload.span = config_.smoothing.span;
    payload.degree = config_.smoothing.degree;
    payload.samples.reserve(samples_.size());
    for (const auto& s : samples_) {
        PayloadSample ps;
        ps.sample = s.name;
        ps.color = s.color;
        for (const auto& w : s.wells) ps.wells.push_back(PayloadWell{w.well_id, w.replicate_index});
        for (const auto& state : s.history.entries()) {
            ps.history.push_back(PayloadHistoryEntry{state.label, state.points});
        }
        payload.samples.push_back(std::move(ps));
    }
    payload.log_phases = log_phases();
    return payload;
}

}  // namespace growthfit
