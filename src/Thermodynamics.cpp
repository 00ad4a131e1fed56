#include "Thermodynamics.h"

#include <algorithm>
#include <cmath>

namespace afc {

Phase phaseFromHeat(double heat) {
    if (heat < kClimbThresholdHeat) return Phase::Warmup;
    if (heat < kPeakThresholdHeat) return Phase::Climb;
    return Phase::Peak;
}

double targetLevelForPhase(Phase p) {
    switch (p) {
    case Phase::Warmup: return 0.3;
    case Phase::Climb:  return 0.6;
    case Phase::Peak:
    default:            return 0.9;
    }
}

double resonanceEstimate(const ControllerConfigV1& cfg, double residual, double amplitude) {
    const double r = std::abs(residual * amplitude) * cfg.resonance_gain;
    if (!std::isfinite(r)) return 1.0;
    return std::clamp(r, 0.0, 1.0);
}

double artifactFlag(const ControllerConfigV1& cfg, double residual) {
    return (std::abs(residual) > cfg.artifact_threshold) ? 1.0 : 0.0;
}

void updateThermodynamics(ControllerState& s, const ControllerConfigV1& cfg,
                          double resonance, double artifact) {
    const double heating = cfg.heating_gain * resonance * (1.0 - artifact);
    const double cooling = cfg.cooling_base + cfg.cooling_artifact * artifact;
    const double delta = (heating - cooling) * s.sample_dt_s * cfg.heat_accel;

    s.heat = std::clamp(s.heat + delta, kHeatMin, kHeatMax);
    s.phase = phaseFromHeat(s.heat);
    s.target_level_0_1 = targetLevelForPhase(s.phase);

    s.last.resonance = resonance;
    s.last.artifact = artifact;
}

} // namespace afc
