#pragma once

#include "ControllerConfig.h"
#include "ControllerState.h"

namespace afc {

constexpr double kHeatMin = 0.0;
constexpr double kHeatMax = 100.0;
// Strict '<' boundaries: heat == 30 is Climb, heat == 80 is Peak.
constexpr double kClimbThresholdHeat = 30.0;
constexpr double kPeakThresholdHeat = 80.0;

Phase phaseFromHeat(double heat);
double targetLevelForPhase(Phase p);

// clip(|e * amplitude| * resonance_gain, 0, 1)
double resonanceEstimate(const ControllerConfigV1& cfg, double residual, double amplitude);

// 1.0 when |e| exceeds artifact_threshold, else 0.0.
double artifactFlag(const ControllerConfigV1& cfg, double residual);

// Integrates heating - cooling into heat (clamped to [0,100]) and re-derives
// phase and target level.
void updateThermodynamics(ControllerState& s, const ControllerConfigV1& cfg,
                          double resonance, double artifact);

} // namespace afc
