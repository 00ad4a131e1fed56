#pragma once

#include <cstdint>
#include <vector>

#include "ControllerConfig.h"
#include "HistoryRing.h"

namespace afc {

// Discrete engagement stage. Always derived from heat, never set directly.
enum class Phase : std::uint32_t {
    Warmup = 0,
    Climb  = 1,
    Peak   = 2,
};

const char* phaseName(Phase p);

// ============================================================
// CIEU telemetry record (context, intervention, target/observation, reward)
// Immutable once appended to the log.
// ============================================================
struct CieuContext {
    double heat = 0.0;
    double viscosity = 0.0;
    Phase phase = Phase::Warmup;
};

struct CieuAction {
    double amplitude = 0.0;
    double frequency_hz = 0.0;
    double waveform_sample = 0.0;
};

struct CieuRecord {
    CieuContext context{};
    CieuAction action{};
    double target_0_1 = 0.0;
    double observation_0_1 = 0.0;
    double reward = 0.0; // -|target - observation|, never positive
};

// Event / warning bitmask (developer-visible; must not affect control results).
enum TelemetryEventBits : std::uint32_t {
    Event_None                 = 0u,
    Event_PhaseWarmupEnter     = 1u << 0,
    Event_PhaseClimbEnter      = 1u << 1,
    Event_PhasePeakEnter       = 1u << 2,
    Event_ArtifactOnset        = 1u << 3,
    Event_FilterArmed          = 1u << 4,
    // Contract violations (warnings)
    Warn_InvalidObservation    = 1u << 16,
    Warn_ObservationOutOfRange = 1u << 17,
    Warn_ConfigRejected        = 1u << 18,
};

struct RunSignatures {
    std::uint32_t run_param_hash_u32 = 0; // FNV-1a32 over effective configuration
    std::uint32_t telemetry_crc_u32  = 0; // CRC32 over the CIEU record stream
    std::uint32_t state_digest_u32   = 0; // FNV-1a32 over heat, viscosity and filter weights per step
};

// Intermediate values of the most recent step (audit only).
struct StepTrace {
    double prediction = 0.0;  // y_hat
    double residual = 0.0;    // e
    double shear = 0.0;       // |e_k - e_{k-2}|
    double resonance = 0.0;   // r
    double artifact = 0.0;    // 0 or 1
    bool filter_updated = false;
};

// ============================================================
// Per-session controller state.
//
// One instance, exclusively owned by the Controller, passed by reference
// into each component update. Mutated exactly once per accepted step.
// ============================================================
struct ControllerState {
    // Fixed at construction
    double sample_rate_hz = 100.0;
    double sample_dt_s = 0.01;

    // Rheology
    double viscosity = 6.0;      // eta, always within [eta_min, eta_max]
    double shear_memory = 0.0;

    // Thermodynamics
    double heat = 0.0;           // [0, 100]
    Phase phase = Phase::Warmup;

    // Echo filter
    std::vector<double> filter_weights{};
    HistoryRing output_history{};   // last L amplitudes, newest first
    HistoryRing residual_history{}; // last sample_rate residuals

    // Setpoint / response
    double target_level_0_1 = 0.0;
    double observed_level_0_1 = 0.0;

    // Synthesizer
    double frequency_hz = 0.5;
    double amplitude = 0.0;

    std::uint64_t step_index = 0;
    StepTrace last{};

    std::vector<CieuRecord> telemetry_log{};
};

// Fresh state for a validated configuration: zeroed weights and histories,
// viscosity at eta_initial (clamped), frequency at freq_base_hz.
ControllerState makeInitialState(const ControllerConfigV1& cfg);

} // namespace afc
