// Controller.cpp
// Notes:
// - Step order is fixed: cancel -> shear/artifact -> rheology -> resonance ->
//   thermodynamics -> synthesizer -> telemetry. Reordering changes results.
// - Resonance uses the amplitude emitted by the previous step.

#include "Controller.h"
#include "Checksum.h"
#include "EchoCanceller.h"
#include "Rheology.h"
#include "TelemetryRecorder.h"
#include "Thermodynamics.h"
#include "WaveformSynth.h"

#include <cmath>

namespace afc {

Controller::Controller()
    : Controller(makePresetConfig(ControllerPreset::HighTorque)) {}

Controller::Controller(const ControllerConfigV1& cfg) {
    // Deterministic contract enforcement: a rejected config never reaches the math.
    if (validateConfig(cfg)) {
        cfg_ = cfg;
    } else {
        cfg_ = makePresetConfig(ControllerPreset::HighTorque);
        config_accepted_ = false;
        latest_events_bits_ |= Warn_ConfigRejected;
    }
    cfg_.fnv_hash_u32 = hashConfig(cfg_);

    state_ = makeInitialState(cfg_);
    run_signatures_.run_param_hash_u32 = cfg_.fnv_hash_u32;
    run_signatures_.state_digest_u32 = checksum::fnv1a32_begin();
}

StepResult Controller::advance(double observation) {
    StepResult out;

    // Reject before touching anything: LMS is unstable under unbounded input.
    if (!std::isfinite(observation)) {
        out.status = StepStatus::InvalidObservation;
        latest_events_bits_ |= Warn_InvalidObservation;
        rejected_count_++;
        return out;
    }
    if (std::abs(observation) > cfg_.observation_abs_max) {
        out.status = StepStatus::ObservationOutOfRange;
        latest_events_bits_ |= Warn_ObservationOutOfRange;
        rejected_count_++;
        return out;
    }

    const Phase prev_phase = state_.phase;
    const double prev_artifact = state_.last.artifact;
    // Resonance correlates the residual with the drive that produced it.
    const double prev_amplitude = state_.amplitude;

    const double e = cancelEcho(state_, cfg_, observation);
    const double shear = shearProxy(state_.residual_history);
    const double artifact = artifactFlag(cfg_, e);

    updateRheology(state_, cfg_, shear);

    const double resonance = resonanceEstimate(cfg_, e, prev_amplitude);
    state_.observed_level_0_1 = resonance;
    updateThermodynamics(state_, cfg_, resonance, artifact);

    const double u = synthesizeWaveform(state_, cfg_);

    const CieuRecord rec = makeCieuRecord(state_, u);
    recordStep(state_, rec);
    run_signatures_.telemetry_crc_u32 = foldRecordCrc(run_signatures_.telemetry_crc_u32, rec);
    run_signatures_.state_digest_u32 = foldStateDigest(run_signatures_.state_digest_u32, state_);

    latchEvents(prev_phase, prev_artifact);
    state_.step_index++;

    out.command = u;
    return out;
}

void Controller::latchEvents(Phase prev_phase, double prev_artifact) {
    std::uint32_t events = 0u;
    if (state_.phase != prev_phase) {
        switch (state_.phase) {
        case Phase::Warmup: events |= Event_PhaseWarmupEnter; break;
        case Phase::Climb:  events |= Event_PhaseClimbEnter; break;
        case Phase::Peak:   events |= Event_PhasePeakEnter; break;
        }
    }
    if (prev_artifact < 0.5 && state_.last.artifact >= 0.5) events |= Event_ArtifactOnset;
    if (!filter_armed_seen_ && state_.last.filter_updated) {
        filter_armed_seen_ = true;
        events |= Event_FilterArmed;
    }
    latest_events_bits_ |= events;
}

std::uint32_t Controller::getLatestEvents() {
    const std::uint32_t out = latest_events_bits_;
    latest_events_bits_ = 0;
    return out;
}

double Controller::residualRms() const {
    return std::sqrt(state_.residual_history.meanSquare());
}

int Controller::exportConfigText(char* buf, int cap) const {
    return afc::exportConfigText(cfg_, buf, cap);
}

} // namespace afc
