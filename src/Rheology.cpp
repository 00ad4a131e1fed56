#include "Rheology.h"

#include <algorithm>
#include <cmath>

namespace afc {

namespace {

static inline double ema(double prev, double x, double alpha) {
    return (1.0 - alpha) * prev + alpha * x;
}

} // namespace

double shearProxy(const HistoryRing& residuals) {
    if (residuals.count() < 3) return 0.0;
    return std::abs(residuals.newest(0) - residuals.newest(2));
}

double targetViscosity(const ControllerConfigV1& cfg, double shear) {
    if (!std::isfinite(shear) || shear < 0.0) shear = 0.0;
    const double eta = cfg.eta_max / (1.0 + cfg.shear_gain * std::pow(shear, cfg.shear_exponent));
    if (!std::isfinite(eta)) return cfg.eta_min;
    return std::clamp(eta, cfg.eta_min, cfg.eta_max);
}

void updateRheology(ControllerState& s, const ControllerConfigV1& cfg, double shear) {
    s.shear_memory = ema(s.shear_memory, shear, cfg.shear_memory_alpha);
    const double target = targetViscosity(cfg, s.shear_memory);
    // Convex blend of two in-range values; clamp only absorbs rounding.
    s.viscosity = std::clamp(ema(s.viscosity, target, cfg.eta_smoothing), cfg.eta_min, cfg.eta_max);
    s.last.shear = shear;
}

} // namespace afc
