#pragma once

#include "ControllerConfig.h"
#include "ControllerState.h"

namespace afc {

// Shear proxy |e_k - e_{k-2}| from the residual history; 0 until three
// residuals have been recorded.
double shearProxy(const HistoryRing& residuals);

// Viscosity the medium relaxes toward for a given (smoothed) shear,
// clamped to [eta_min, eta_max]. Monotonically non-increasing in shear.
double targetViscosity(const ControllerConfigV1& cfg, double shear);

// Folds the shear proxy into shear_memory, then relaxes viscosity toward
// targetViscosity(shear_memory). Viscosity stays in [eta_min, eta_max].
void updateRheology(ControllerState& s, const ControllerConfigV1& cfg, double shear);

} // namespace afc
