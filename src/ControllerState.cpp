#include "ControllerState.h"

#include <algorithm>

namespace afc {

const char* phaseName(Phase p) {
    switch (p) {
    case Phase::Warmup: return "warmup";
    case Phase::Climb:  return "climb";
    case Phase::Peak:   return "peak";
    default:            return "unknown";
    }
}

ControllerState makeInitialState(const ControllerConfigV1& cfg) {
    ControllerState s;
    s.sample_rate_hz = cfg.sample_rate_hz;
    s.sample_dt_s = 1.0 / cfg.sample_rate_hz;

    s.viscosity = std::clamp(cfg.eta_initial, cfg.eta_min, cfg.eta_max);
    s.shear_memory = 0.0;

    s.heat = 0.0;
    s.phase = Phase::Warmup;

    const int order = static_cast<int>(cfg.filter_order_u32);
    s.filter_weights.assign(static_cast<std::size_t>(order), 0.0);
    s.output_history = HistoryRing(order);
    // Roughly one second of residuals.
    s.residual_history = HistoryRing(static_cast<int>(cfg.sample_rate_hz));

    s.target_level_0_1 = 0.0;
    s.observed_level_0_1 = 0.0;
    s.frequency_hz = cfg.freq_base_hz;
    s.amplitude = 0.0;
    s.step_index = 0;
    s.last = {};
    s.telemetry_log.clear();
    return s;
}

} // namespace afc
