#pragma once

#include <cstdint>
#include <vector>

#include "ControllerConfig.h"
#include "ControllerState.h"

namespace afc {

// ============================================================
// Fixed-rate adaptive feedback controller.
//
// One observation in, one actuator command out, once per sample interval.
// Synchronous and single-threaded: callers serialize advance() calls.
// Per-step cost is O(L) plus O(1) scalar work; nothing allocates except the
// append to the telemetry log.
// ============================================================

enum class StepStatus : std::uint32_t {
    Ok                    = 0,
    InvalidObservation    = 1, // NaN or +/-inf
    ObservationOutOfRange = 2, // |y| > observation_abs_max
};

struct StepResult {
    StepStatus status = StepStatus::Ok;
    double command = 0.0; // waveform sample; 0.0 when rejected
};

class Controller {
public:
    Controller();
    // An invalid configuration is replaced by the HighTorque preset and
    // reported through configAccepted() and Warn_ConfigRejected.
    explicit Controller(const ControllerConfigV1& cfg);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    // Rejected observations leave every piece of state untouched.
    StepResult advance(double observation);

    bool configAccepted() const noexcept { return config_accepted_; }
    const ControllerConfigV1& config() const noexcept { return cfg_; }
    int exportConfigText(char* buf, int cap) const;

    // Read-only state inspection
    const ControllerState& state() const noexcept { return state_; }
    double heat() const noexcept { return state_.heat; }
    double viscosity() const noexcept { return state_.viscosity; }
    Phase phase() const noexcept { return state_.phase; }
    double amplitude() const noexcept { return state_.amplitude; }
    double frequency_hz() const noexcept { return state_.frequency_hz; }
    double targetLevel() const noexcept { return state_.target_level_0_1; }
    double observedLevel() const noexcept { return state_.observed_level_0_1; }
    std::uint64_t stepIndex() const noexcept { return state_.step_index; }
    double time_s() const noexcept { return static_cast<double>(state_.step_index) * state_.sample_dt_s; }
    const std::vector<double>& filterWeights() const noexcept { return state_.filter_weights; }
    const StepTrace& lastStep() const noexcept { return state_.last; }

    // Output history entry k (0 = most recent amplitude pushed).
    double outputHistory(int k) const { return state_.output_history.newest(k); }

    // RMS of the residual window (about one second).
    double residualRms() const;

    const std::vector<CieuRecord>& telemetry() const noexcept { return state_.telemetry_log; }
    std::uint64_t rejectedCount() const noexcept { return rejected_count_; }

    RunSignatures getRunSignatures() const { return run_signatures_; }
    // Returns and clears the latched event bits.
    std::uint32_t getLatestEvents();

private:
    void latchEvents(Phase prev_phase, double prev_artifact);

    ControllerConfigV1 cfg_{};
    bool config_accepted_ = true;

    ControllerState state_{};

    RunSignatures run_signatures_{};
    std::uint32_t latest_events_bits_ = 0;
    bool filter_armed_seen_ = false;
    std::uint64_t rejected_count_ = 0;
};

} // namespace afc
