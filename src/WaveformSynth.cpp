#include "WaveformSynth.h"

#include <cmath>

namespace afc {

namespace {

static constexpr double kPI = 3.14159265358979323846;

static inline double ema(double prev, double x, double alpha) {
    return (1.0 - alpha) * prev + alpha * x;
}

} // namespace

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

double driveForce(const ControllerConfigV1& cfg, double gap) {
    return cfg.drive_base + cfg.drive_span * sigmoid(gap * cfg.drive_sigmoid_gain);
}

double dampingFactor(const ControllerConfigV1& cfg, double viscosity) {
    if (!std::isfinite(viscosity) || viscosity < cfg.eta_min) return 1.0;
    return cfg.eta_min / viscosity;
}

double synthesizeWaveform(ControllerState& s, const ControllerConfigV1& cfg) {
    // Slow path: frequency follows heat.
    const double target_freq_hz = cfg.freq_base_hz + (s.heat / 100.0) * cfg.freq_span_hz;
    s.frequency_hz = ema(s.frequency_hz, target_freq_hz, cfg.freq_smoothing);

    // Fast path: amplitude follows the tracking gap, scaled by damping.
    const double gap = s.target_level_0_1 - s.observed_level_0_1;
    const double target_amp = driveForce(cfg, gap) * dampingFactor(cfg, s.viscosity);
    s.amplitude = ema(s.amplitude, target_amp, cfg.amp_smoothing);

    const double t_s = static_cast<double>(s.step_index) * s.sample_dt_s;
    return s.amplitude * std::sin(2.0 * kPI * s.frequency_hz * t_s);
}

} // namespace afc
