#pragma once

// EchoCanceller.h
//
// Self-interference cancellation: an LMS estimate of the structural echo path
// from the controller's own recent amplitudes to the sensor reading.
//
//   y_hat = sum_i w[i] * u[i]          (u = output history, newest first)
//   e     = y - y_hat
//   w[i] += mu * e * u[i]
//
// The filter is "armed" once L amplitudes have been pushed; before that
// y_hat = 0 and the weights are not touched.

#include "ControllerConfig.h"
#include "ControllerState.h"

namespace afc {

bool echoFilterArmed(const ControllerState& s);

// Dot product of weights and output history, 0 while unarmed.
double predictEcho(const ControllerState& s);

// Runs one cancellation update and returns the residual e.
// Side effects: adapts filter_weights (when armed), pushes e into
// residual_history, pushes the live amplitude into output_history.
// Fills s.last.prediction / residual / filter_updated.
double cancelEcho(ControllerState& s, const ControllerConfigV1& cfg, double observation);

} // namespace afc
