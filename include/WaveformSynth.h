#pragma once

// WaveformSynth.h
//
// Target-seeking synthesizer. Couples a slow heat-driven frequency ramp with a
// fast gap-driven amplitude response; both are first-order smoothed so the
// commanded waveform never jumps in amplitude or frequency. No output ceiling
// is enforced here; hardware limits belong to the actuator driver.

#include "ControllerConfig.h"
#include "ControllerState.h"

namespace afc {

double sigmoid(double x);

// drive_base + drive_span * sigmoid(gap * drive_sigmoid_gain)
double driveForce(const ControllerConfigV1& cfg, double gap);

// eta_min / eta, in (0, 1] for any in-range viscosity.
double dampingFactor(const ControllerConfigV1& cfg, double viscosity);

// Updates frequency, then amplitude, and returns the waveform sample at
// t = step_index * sample_dt_s.
double synthesizeWaveform(ControllerState& s, const ControllerConfigV1& cfg);

} // namespace afc
