#pragma once

/**
 * @file curve_workspace.hpp
 * @brief Per-sample smoothing history and log-phase selections
 *
 * Each sample keeps an append-only history of immutable smoothing states.
 * history[0] is the raw aggregated curve and is never removed; apply
 * appends one state, step back pops one. Batch operations visit samples in
 * load order and report progress between samples so a host can stay
 * responsive. One writer per sample history at a time.
 */

#include "growthfit/bootstrap_band.hpp"
#include "growthfit/log_phase.hpp"
#include "growthfit/payload.hpp"
#include "growthfit/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace growthfit {

// What automatic detection may do to an existing selection after a
// smoothing change.
enum class AutoPhasePolicy {
    DISABLED,         // never touch selections
    PRESERVE_MANUAL,  // overwrite or clear automatic selections only
    REPLACE_ALL       // overwrite or clear every affected selection
};

const char* auto_phase_policy_to_string(AutoPhasePolicy policy);
bool parse_auto_phase_policy(const std::string& text, AutoPhasePolicy& policy);

class SmoothingHistory {
public:
    explicit SmoothingHistory(SmoothingState raw);

    size_t size() const { return entries_.size(); }
    const SmoothingState& raw() const { return entries_.front(); }
    const SmoothingState& latest() const { return entries_.back(); }
    const std::vector<SmoothingState>& entries() const { return entries_; }

    void append(SmoothingState state);

    // Removes the newest entry; false (no-op) when only the raw state is left.
    bool pop();

private:
    std::vector<SmoothingState> entries_;
};

struct SampleInput {
    std::string name;
    std::string color;
    std::vector<ReplicateWell> wells;
};

struct Sample {
    std::string name;
    std::string color;
    std::vector<ReplicateWell> wells;  // finite points only
    std::vector<Point> raw_points;     // union of wells, stable-sorted by x
    SmoothingHistory history;
};

struct WorkspaceConfig {
    SmoothingParameters smoothing;
    LogPhaseDetectionOptions detection;
    AutoPhasePolicy auto_phase = AutoPhasePolicy::PRESERVE_MANUAL;
};

struct PhaseUpdateCounts {
    size_t detected = 0;
    size_t cleared = 0;
    size_t preserved = 0;  // manual selections left alone
};

struct ApplyReport {
    size_t applied = 0;
    size_t skipped = 0;    // insufficient data
    size_t not_found = 0;  // ids with no matching sample
    size_t total_loops = 0;
    size_t converged = 0;
    PhaseUpdateCounts phases;

    double average_loops() const {
        return applied > 0 ? static_cast<double>(total_loops) / static_cast<double>(applied) : 0.0;
    }
};

struct StepBackReport {
    size_t reverted = 0;
    size_t skipped = 0;    // already at the raw state
    size_t not_found = 0;
    PhaseUpdateCounts phases;
};

// (done, total, sample) after each visited sample.
using SampleProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

class CurveWorkspace {
public:
    explicit CurveWorkspace(WorkspaceConfig config = {});

    const WorkspaceConfig& config() const { return config_; }
    void set_detection_options(const LogPhaseDetectionOptions& options);
    void set_auto_phase_policy(AutoPhasePolicy policy) { config_.auto_phase = policy; }

    // Throws InvalidParameter for an empty or duplicate name or no wells.
    const Sample& add_sample(SampleInput input);

    size_t size() const { return samples_.size(); }
    const std::vector<Sample>& samples() const { return samples_; }
    const Sample* find(const std::string& name) const;
    std::vector<std::string> sample_names() const;

    // Smooths the raw curve of every targeted sample and appends the result.
    // Parameters are validated up front (InvalidParameter).
    ApplyReport apply_smoothing(const std::vector<std::string>& sample_ids,
                                const SmoothingParameters& params,
                                const SampleProgressCallback& progress = nullptr);

    StepBackReport step_back(const std::vector<std::string>& sample_ids,
                             const SampleProgressCallback& progress = nullptr);

    // Explicit user range. Reversed bounds are swapped; equal or non-finite
    // bounds and unknown samples throw InvalidParameter.
    const LogPhaseSelection& set_manual_log_phase(const std::string& sample,
                                                  double start, double end);
    bool clear_log_phase(const std::string& sample);

    // User-triggered detection; overwrites manual selections too.
    PhaseUpdateCounts redetect_log_phases(const std::vector<std::string>& sample_ids);

    const LogPhaseSelection* log_phase(const std::string& sample) const;
    std::vector<LogPhaseSelection> log_phases() const;  // workspace order

    std::optional<BandResult> compute_band(const std::string& sample,
                                           const BandOptions& options) const;

    SmoothedCurvesPayload build_payload() const;

private:
    std::vector<size_t> resolve(const std::vector<std::string>& sample_ids,
                                size_t& not_found) const;
    PhaseUpdateCounts update_phases(const std::vector<size_t>& targets,
                                    AutoPhasePolicy policy,
                                    std::chrono::system_clock::time_point now);

    WorkspaceConfig config_;
    std::vector<Sample> samples_;
    std::unordered_map<std::string, size_t> index_;
    std::map<std::string, LogPhaseSelection> phases_;
};

// Label for a new history entry, e.g. "LOESS span 0.6 (passes: 2, converged)".
std::string smoothing_label(double span, int loops, bool converged);

// Points of `curve` with start <= x <= end, as log-phase points.
std::vector<LogPhasePoint> points_in_range(const std::vector<Point>& curve,
                                           double start, double end);

}  // namespace growthfit
