#include "EchoCanceller.h"

namespace afc {

bool echoFilterArmed(const ControllerState& s) {
    return s.output_history.count() >= static_cast<int>(s.filter_weights.size());
}

double predictEcho(const ControllerState& s) {
    if (!echoFilterArmed(s)) return 0.0;
    double y_hat = 0.0;
    for (std::size_t i = 0; i < s.filter_weights.size(); ++i) {
        y_hat += s.filter_weights[i] * s.output_history.newest(static_cast<int>(i));
    }
    return y_hat;
}

double cancelEcho(ControllerState& s, const ControllerConfigV1& cfg, double observation) {
    const bool armed = echoFilterArmed(s);
    const double y_hat = predictEcho(s);
    const double e = observation - y_hat;

    if (armed) {
        const double g = cfg.lms_mu * e;
        for (std::size_t i = 0; i < s.filter_weights.size(); ++i) {
            s.filter_weights[i] += g * s.output_history.newest(static_cast<int>(i));
        }
    }

    s.residual_history.push(e);
    // Amplitude emitted by the previous step (the synthesizer has not run yet).
    s.output_history.push(s.amplitude);

    s.last.prediction = y_hat;
    s.last.residual = e;
    s.last.filter_updated = armed;
    return e;
}

} // namespace afc
