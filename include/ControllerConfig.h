#pragma once

#include <cstdint>
#include <string>

namespace afc {

// ============================================================
// Controller configuration contract (versioned, hashable, auditable)
//
// Rules:
// - Every tuning constant of the step lives here; nothing is hardcoded
//   in the component math except the heat range [0,100] and the phase
//   thresholds/targets, which are structural.
// - Fixed before the first step; the controller copies it at construction.
// ============================================================
struct ControllerConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ControllerConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // Sampling
    double sample_rate_hz = 100.0;

    // Self-interference cancellation (LMS echo filter)
    std::uint32_t filter_order_u32 = 5;   // L
    double lms_mu = 0.01;

    // Virtual rheology (dimensionless viscosity)
    double eta_min = 0.5;
    double eta_max = 6.0;
    double eta_initial = 6.0;             // clamped into [eta_min, eta_max]
    double eta_smoothing = 0.1;           // beta
    double shear_memory_alpha = 0.05;
    double shear_gain = 2.0;              // targetEta = eta_max / (1 + gain * shear^exponent)
    double shear_exponent = 1.5;

    // Thermodynamic phase model (heat units per second before acceleration)
    double heating_gain = 0.3;            // c1
    double cooling_base = 0.05;           // c2
    double cooling_artifact = 0.2;        // c3
    double heat_accel = 20.0;             // k

    // Calibration heuristics
    double resonance_gain = 5.0;          // r = clip(|e * amp| * gain, 0, 1)
    double artifact_threshold = 0.8;      // a = |e| > threshold

    // Target-seeking synthesizer
    double drive_base = 2.0;              // c4
    double drive_span = 3.0;              // c5
    double drive_sigmoid_gain = 2.0;      // c6
    double amp_smoothing = 0.02;          // gamma_a
    double freq_smoothing = 0.01;         // gamma_f
    double freq_base_hz = 0.5;            // f0
    double freq_span_hz = 3.0;            // delta f

    // Input contract: |observation| above this is rejected.
    double observation_abs_max = 1.0e6;
};

enum class ControllerPreset : int {
    HighTorque = 0, // current tuning (eta_max 6, drive 2 + 3*sigmoid)
    Gentle     = 1, // earlier tuning (eta_max 12, drive 0.2 + 0.8*sigmoid)
};

constexpr std::uint32_t kMaxFilterOrder = 64;
constexpr double kMinSampleRateHz = 3.0;
// Residual history holds one second of samples; bounds its allocation.
constexpr double kMaxSampleRateHz = 1.0e5;

ControllerConfigV1 makePresetConfig(ControllerPreset preset);

// Returns false and fills *why (if non-null) on the first violated rule.
bool validateConfig(const ControllerConfigV1& cfg, std::string* why = nullptr);

// FNV-1a 32 over the explicit field list (fixed order, header hash excluded).
std::uint32_t hashConfig(const ControllerConfigV1& cfg);

// Stable key=value export (deterministic order). Returns bytes written.
int exportConfigText(const ControllerConfigV1& cfg, char* buf, int cap);

// Parses the export format back into *out. Lines without '=' and the hash
// lines are ignored; unknown keys or malformed numbers fail with *why set.
// Fields not mentioned keep the value already in *out.
bool parseConfigText(const std::string& text, ControllerConfigV1* out, std::string* why = nullptr);

} // namespace afc
